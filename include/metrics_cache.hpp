#pragma once

#include <string>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include "file_metrics.hpp"

namespace fs = std::filesystem;

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// Disk-resident memo of FileMetrics, one entry file per source file.
//
// Entries live in `cacheDir` and are keyed by a stable hash of the path relative to
// `projectRoot`. An entry is only trusted while the file's modification time equals
// the one stored with it. Distinct keys never share a file, so concurrent workers
// can read and write different entries without coordination.
class MetricsCache {
public:
    // Bumped whenever the entry layout changes; older entries become misses
    static constexpr int kFormatVersion = 1;

    struct Stats {
        size_t hits = 0;
        size_t misses = 0;
        size_t writeFailures = 0;
    };

    MetricsCache(const fs::path& projectRoot, const fs::path& cacheDir);

    // Default location: <projectRoot>/.code-viz/cache
    static fs::path defaultCacheDir(const fs::path& projectRoot);

    // Cached metrics if the stored modification time matches the file's current one.
    // Missing, stale and unreadable entries are all reported as std::nullopt.
    std::optional<FileMetrics> get(const std::string& relativePath) const;

    // Store metrics under metrics.path; throws CacheError on failure
    void set(const FileMetrics& metrics);

    // Remove the entry for a path; removing a missing entry is not an error
    void invalidate(const std::string& relativePath);

    // Remove every entry
    void clear();

    Stats stats() const;

    const fs::path& directory() const { return cacheDir_; }

    // File that holds the entry for a path
    fs::path entryPath(const std::string& relativePath) const;

    // 64-bit FNV-1a of the relative path, as 16 lower case hex digits
    static std::string keyFor(const std::string& relativePath);

private:
    fs::path projectRoot_;
    fs::path cacheDir_;

    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
    std::atomic<size_t> writeFailures_{0};
    std::atomic<uint64_t> tempCounter_{0};

    void ensureDirectory();
    std::optional<FileMetrics> miss() const;
};
