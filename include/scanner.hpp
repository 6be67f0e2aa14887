#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include "file_metrics.hpp"
#include "pattern_matcher.hpp"
#include "parser_registry.hpp"

namespace fs = std::filesystem;

struct ScanStats {
    size_t directories = 0;   // Directories visited, the root included
    size_t pruned = 0;        // Excluded or ignored directories skipped without opening
    size_t tooLarge = 0;
    size_t unreadable = 0;
};

struct ScanResult {
    std::vector<std::string> files;          // '/' separated paths relative to the root, sorted
    std::vector<AnalysisWarning> warnings;   // Entries skipped while walking
    ScanStats stats;
};

// Recursive directory walk producing the files to analyze.
//
// Excluded and git-ignored directories are pruned before they are opened, hidden
// entries and symlinks are skipped, and only extensions known to the parser
// registry are kept.
class Scanner {
public:
    explicit Scanner(const ParserRegistry& registry = ParserRegistry::instance());

    void setMaxFileSize(uint64_t bytes) { maxFileSize_ = bytes; }
    void setRespectGitignore(bool respect) { respectGitignore_ = respect; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

    // Throws ScanError if the root is missing, not a directory or unreadable, or if
    // an exclude pattern is malformed. Per-entry problems become warnings.
    ScanResult scan(const fs::path& root, const std::vector<std::string>& excludePatterns) const;

private:
    // Rules of one .gitignore, applied to paths below `prefix`
    struct IgnoreScope {
        std::string prefix;       // Directory holding the .gitignore, "" for the root
        PatternMatcher matcher;
    };

    const ParserRegistry& registry_;
    uint64_t maxFileSize_ = 10 * 1024 * 1024;
    bool respectGitignore_ = true;
    bool verbose_ = false;

    void walk(const fs::path& dir, const std::string& relativeDir,
              const PatternMatcher& excludes, std::vector<IgnoreScope>& scopes,
              ScanResult& result) const;

    bool isExcluded(const std::string& relativePath, bool isDirectory,
                    const PatternMatcher& excludes,
                    const std::vector<IgnoreScope>& scopes) const;
};
