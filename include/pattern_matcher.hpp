#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Glob and .gitignore style path matching against '/' separated relative paths
class PatternMatcher {
public:
    enum class Match {
        None,       // No rule matched
        Ignored,    // Last matching rule excludes the path
        Included    // Last matching rule is a negation ("!pattern")
    };

    PatternMatcher() = default;

    // Constructor with exclude patterns; throws ScanError on an invalid pattern
    explicit PatternMatcher(const std::vector<std::string>& ignorePatterns);

    // Add an exclude glob. Patterns without '/' match the base name at any depth.
    void addIgnorePattern(const std::string& pattern);

    // Load rules from a .gitignore file; paths are then matched relative to its directory
    bool loadGitignore(const fs::path& gitignorePath);

    // Parse a single .gitignore line
    void addGitignoreLine(const std::string& line);

    // Evaluate all rules, last match wins
    Match match(const std::string& relativePath, bool isDirectory = false) const;

    // Check if a path is excluded by the rules
    bool isIgnored(const std::string& relativePath, bool isDirectory = false) const {
        return match(relativePath, isDirectory) == Match::Ignored;
    }

    bool empty() const { return rules_.empty(); }
    size_t size() const { return rules_.size(); }

    // Convert a glob to an anchored regex; throws ScanError for malformed globs
    static std::regex patternToRegex(const std::string& pattern);

private:
    struct Rule {
        std::string pattern;
        std::regex regex;
        bool negated = false;
        bool directoryOnly = false;
        bool matchBasename = false;   // Pattern has no '/' and applies at any depth
    };

    std::vector<Rule> rules_;

    void addRule(std::string pattern, bool negated, bool directoryOnly);
    bool ruleMatches(const Rule& rule, const std::string& relativePath, bool isDirectory) const;
};
