#include "scanner.hpp"
#include "analysis_error.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>

namespace {

void addWarning(ScanResult& result, const std::string& path, WarningKind kind, const std::string& message) {
    std::cerr << "Warning: " << (path.empty() ? "." : path) << ": " << message << std::endl;
    result.warnings.push_back({path, kind, message});
}

WarningKind warningKindFor(const std::error_code& ec) {
    return ec == std::errc::permission_denied ? WarningKind::PermissionDenied : WarningKind::ReadFailed;
}

std::string joinRelative(const std::string& dir, const std::string& name) {
    return dir.empty() ? name : dir + "/" + name;
}

} // namespace

Scanner::Scanner(const ParserRegistry& registry)
    : registry_(registry) {}

ScanResult Scanner::scan(const fs::path& root, const std::vector<std::string>& excludePatterns) const {
    std::error_code ec;
    const auto rootStatus = fs::status(root, ec);
    if (!fs::exists(rootStatus)) {
        if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
            throw ScanError(ScanError::Kind::Unreadable,
                            "Cannot access root " + root.string() + ": " + ec.message());
        }
        throw ScanError(ScanError::Kind::NotFound, "Root does not exist: " + root.string());
    }
    if (!fs::is_directory(rootStatus)) {
        throw ScanError(ScanError::Kind::NotADirectory, "Root is not a directory: " + root.string());
    }

    // Malformed patterns fail here, before any I/O
    const PatternMatcher excludes(excludePatterns);

    {
        fs::directory_iterator probe(root, ec);
        if (ec) {
            throw ScanError(ScanError::Kind::Unreadable,
                            "Cannot read root " + root.string() + ": " + ec.message());
        }
    }

    ScanResult result;
    std::vector<IgnoreScope> scopes;
    walk(root, "", excludes, scopes, result);

    // Plain byte order on the '/' separated form; the only source of output order
    std::sort(result.files.begin(), result.files.end());
    std::stable_sort(result.warnings.begin(), result.warnings.end(),
                     [](const AnalysisWarning& a, const AnalysisWarning& b) { return a.path < b.path; });

    if (verbose_) {
        const ScanStats& stats = result.stats;
        std::cout << "Scanned " << stats.directories << " directories: "
                  << result.files.size() << " files, "
                  << stats.pruned << " pruned, "
                  << stats.tooLarge << " too large, "
                  << stats.unreadable << " unreadable" << std::endl;
    }

    return result;
}

void Scanner::walk(const fs::path& dir, const std::string& relativeDir,
                   const PatternMatcher& excludes, std::vector<IgnoreScope>& scopes,
                   ScanResult& result) const {
    std::error_code ec;
    ++result.stats.directories;

    bool pushedScope = false;
    if (respectGitignore_) {
        const fs::path gitignorePath = dir / ".gitignore";
        if (fs::is_regular_file(gitignorePath, ec)) {
            IgnoreScope scope{relativeDir, PatternMatcher()};
            if (scope.matcher.loadGitignore(gitignorePath) && !scope.matcher.empty()) {
                scopes.push_back(std::move(scope));
                pushedScope = true;
            }
        }
    }

    // Read the whole listing first so no directory handle stays open while recursing
    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        ++result.stats.unreadable;
        addWarning(result, relativeDir, warningKindFor(ec), "Cannot open directory: " + ec.message());
    } else {
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            entries.push_back(*it);
        }
        if (ec) {
            ++result.stats.unreadable;
            addWarning(result, relativeDir, warningKindFor(ec), "Failed to list directory: " + ec.message());
        }
    }

    for (const auto& entry : entries) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }

        const std::string relativePath = joinRelative(relativeDir, name);

        const auto status = entry.symlink_status(ec);
        if (ec) {
            addWarning(result, relativePath, warningKindFor(ec), "Cannot stat entry: " + ec.message());
            continue;
        }
        if (fs::is_symlink(status)) {
            continue;
        }

        if (fs::is_directory(status)) {
            if (isExcluded(relativePath, true, excludes, scopes)) {
                ++result.stats.pruned;
                continue;
            }
            walk(entry.path(), relativePath, excludes, scopes, result);
            continue;
        }

        if (!fs::is_regular_file(status)) {
            continue;
        }
        if (!registry_.supportsExtension(entry.path())) {
            continue;
        }
        if (isExcluded(relativePath, false, excludes, scopes)) {
            continue;
        }

        const auto size = entry.file_size(ec);
        if (ec) {
            ++result.stats.unreadable;
            addWarning(result, relativePath, warningKindFor(ec), "Cannot read file size: " + ec.message());
            continue;
        }
        if (size > maxFileSize_) {
            ++result.stats.tooLarge;
            addWarning(result, relativePath, WarningKind::FileTooLarge,
                       "File too large (" + std::to_string(size) + " bytes, limit " +
                       std::to_string(maxFileSize_) + "), skipping");
            continue;
        }

        result.files.push_back(relativePath);
    }

    if (pushedScope) {
        scopes.pop_back();
    }
}

bool Scanner::isExcluded(const std::string& relativePath, bool isDirectory,
                         const PatternMatcher& excludes,
                         const std::vector<IgnoreScope>& scopes) const {
    if (excludes.isIgnored(relativePath, isDirectory)) {
        return true;
    }

    // Scopes run from the root down, so a deeper .gitignore overrides an outer one
    PatternMatcher::Match state = PatternMatcher::Match::None;
    for (const auto& scope : scopes) {
        std::string local;
        if (scope.prefix.empty()) {
            local = relativePath;
        } else if (relativePath.compare(0, scope.prefix.size() + 1, scope.prefix + "/") == 0) {
            local = relativePath.substr(scope.prefix.size() + 1);
        } else {
            continue;
        }

        const auto match = scope.matcher.match(local, isDirectory);
        if (match != PatternMatcher::Match::None) {
            state = match;
        }
    }

    return state == PatternMatcher::Match::Ignored;
}
