#include "pattern_matcher.hpp"
#include "analysis_error.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace {

bool isRegexSpecial(char c) {
    return c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
           c == '+' || c == '^' || c == '$' || c == '|' || c == '\\' || c == '*' || c == '?';
}

void appendLiteral(std::string& regexStr, char c) {
    if (isRegexSpecial(c)) {
        regexStr += '\\';
    }
    regexStr += c;
}

std::string basenameOf(const std::string& relativePath) {
    const auto slash = relativePath.find_last_of('/');
    return slash == std::string::npos ? relativePath : relativePath.substr(slash + 1);
}

ScanError invalidPattern(const std::string& pattern, const std::string& reason) {
    return ScanError(ScanError::Kind::InvalidPattern,
                     "Invalid exclude pattern '" + pattern + "': " + reason);
}

} // namespace

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns) {
    for (const auto& pattern : ignorePatterns) {
        addIgnorePattern(pattern);
    }
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw invalidPattern(pattern, "empty pattern");
    }
    addRule(pattern, false, false);
}

bool PatternMatcher::loadGitignore(const fs::path& gitignorePath) {
    std::ifstream file(gitignorePath);
    if (!file) {
        std::cerr << "Warning: Failed to open .gitignore file: " << gitignorePath << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        try {
            addGitignoreLine(line);
        } catch (const ScanError& e) {
            // A broken line in a user's .gitignore is not a configuration error of ours
            std::cerr << "Warning: Skipping rule in " << gitignorePath << ": " << e.what() << std::endl;
        }
    }
    return true;
}

void PatternMatcher::addGitignoreLine(const std::string& rawLine) {
    std::string line = rawLine;

    // Trim trailing whitespace (and the '\r' of CRLF files)
    line.erase(std::find_if(line.rbegin(), line.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), line.end());

    if (line.empty() || line[0] == '#') {
        return;
    }

    bool negated = false;
    if (line[0] == '!') {
        negated = true;
        line.erase(0, 1);
    } else if (line.size() > 1 && line[0] == '\\' && (line[1] == '!' || line[1] == '#')) {
        line.erase(0, 1);
    }

    bool directoryOnly = false;
    if (!line.empty() && line.back() == '/') {
        directoryOnly = true;
        line.pop_back();
    }

    if (line.empty()) {
        return;
    }

    addRule(line, negated, directoryOnly);
}

void PatternMatcher::addRule(std::string pattern, bool negated, bool directoryOnly) {
    Rule rule;
    rule.negated = negated;
    rule.directoryOnly = directoryOnly;
    rule.matchBasename = pattern.find('/') == std::string::npos;

    // A leading '/' anchors the pattern to the matcher's root
    if (!pattern.empty() && pattern[0] == '/') {
        pattern.erase(0, 1);
    }

    rule.pattern = pattern;
    rule.regex = patternToRegex(pattern);
    rules_.push_back(std::move(rule));
}

PatternMatcher::Match PatternMatcher::match(const std::string& relativePath, bool isDirectory) const {
    Match result = Match::None;

    for (const auto& rule : rules_) {
        if (rule.directoryOnly && !isDirectory) {
            continue;
        }
        if (ruleMatches(rule, relativePath, isDirectory)) {
            result = rule.negated ? Match::Included : Match::Ignored;
        }
    }

    return result;
}

bool PatternMatcher::ruleMatches(const Rule& rule, const std::string& relativePath, bool isDirectory) const {
    if (rule.matchBasename) {
        return std::regex_match(basenameOf(relativePath), rule.regex);
    }

    if (std::regex_match(relativePath, rule.regex)) {
        return true;
    }

    // "dir/**" must prune "dir" itself before anything below it is opened
    return isDirectory && std::regex_match(relativePath + "/", rule.regex);
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    int braceDepth = 0;

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    // Trailing ** matches anything
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '[') {
            size_t j = i + 1;
            bool negatedClass = false;
            if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
                negatedClass = true;
                ++j;
            }

            std::string body;
            // A ']' right after the opening bracket is a literal
            if (j < pattern.size() && pattern[j] == ']') {
                body += "\\]";
                ++j;
            }
            while (j < pattern.size() && pattern[j] != ']') {
                const char member = pattern[j];
                if (member == '\\' || member == '[' || member == '^') {
                    body += '\\';
                }
                body += member;
                ++j;
            }
            if (j >= pattern.size()) {
                throw invalidPattern(pattern, "unterminated character class");
            }
            if (body.empty()) {
                throw invalidPattern(pattern, "empty character class");
            }

            regexStr += negatedClass ? "[^/" : "[";
            regexStr += body;
            regexStr += "]";
            i = j;
        } else if (c == '{') {
            regexStr += "(?:";
            ++braceDepth;
        } else if (c == ',' && braceDepth > 0) {
            regexStr += "|";
        } else if (c == '}' && braceDepth > 0) {
            regexStr += ")";
            --braceDepth;
        } else if (c == '\\') {
            if (i + 1 >= pattern.size()) {
                throw invalidPattern(pattern, "dangling escape");
            }
            appendLiteral(regexStr, pattern[++i]);
        } else {
            appendLiteral(regexStr, c);
        }
    }

    if (braceDepth != 0) {
        throw invalidPattern(pattern, "unterminated alternation");
    }

    regexStr += "$";

    try {
        return std::regex(regexStr, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw invalidPattern(pattern, e.what());
    }
}
