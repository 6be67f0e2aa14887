#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

// Metrics for a single analyzed source file
struct FileMetrics {
    std::string path;                    // Path relative to the analysis root, '/' separated
    std::string language;                // Language tag ("typescript", "python", ...)
    size_t loc = 0;                      // Lines of code, comments and blank lines excluded
    uint64_t sizeBytes = 0;              // Raw byte length of the source
    size_t functionCount = 0;            // Functions/methods reported by the parser
    fs::file_time_type lastModified{};   // Modification time observed when the file was read

    bool operator==(const FileMetrics& other) const {
        return path == other.path &&
               language == other.language &&
               loc == other.loc &&
               sizeBytes == other.sizeBytes &&
               functionCount == other.functionCount &&
               lastModified == other.lastModified;
    }

    bool operator!=(const FileMetrics& other) const { return !(*this == other); }
};

// Aggregate statistics derived from the per-file metrics
struct Summary {
    size_t totalFiles = 0;
    size_t totalLoc = 0;
    size_t totalFunctions = 0;
    std::vector<std::string> largestFiles;   // Top 10 paths by LOC, ties broken by path
};

// Category of a per-file problem. All but CacheFailed mean the file was skipped.
enum class WarningKind {
    PermissionDenied,
    FileTooLarge,
    ReadFailed,
    InvalidEncoding,
    UnsupportedLanguage,
    ParseFailed,
    ParseTimeout,
    CacheFailed
};

// A per-file problem recorded during analysis
struct AnalysisWarning {
    std::string path;
    WarningKind kind = WarningKind::ReadFailed;
    std::string message;
};

struct AnalysisResult {
    Summary summary;
    std::vector<FileMetrics> files;          // Sorted by path
    std::vector<AnalysisWarning> warnings;   // Sorted by path
    std::chrono::system_clock::time_point timestamp;
};

struct AnalysisConfig {
    // Glob patterns relative to the root; matching files and directories are skipped
    std::vector<std::string> excludePatterns = {
        "node_modules/**",
        "target/**",
        ".git/**",
        "dist/**",
        "build/**"
    };
    bool useCache = true;                 // Reuse metrics of unchanged files
    bool respectGitignore = true;         // Honour .gitignore files found while scanning
    fs::path cacheDir;                    // Empty means <root>/.code-viz/cache
    unsigned int numThreads = 0;          // 0 means one worker per hardware thread
    std::chrono::milliseconds parseTimeout{5000};
    uint64_t maxFileSize = 10 * 1024 * 1024;
    bool verbose = false;
};

// Top `limit` files by descending LOC, ties broken by ascending path
std::vector<std::string> largestFiles(const std::vector<FileMetrics>& files, size_t limit = 10);

// Build the summary for an already sorted list of files
Summary calculateSummary(const std::vector<FileMetrics>& files);

const char* warningKindName(WarningKind kind);

// Milliseconds since the Unix epoch; the file clock's own epoch is unspecified
int64_t toUnixMillis(fs::file_time_type time);

// JSON conversions of the result consumed downstream
void to_json(nlohmann::json& j, const FileMetrics& metrics);
void to_json(nlohmann::json& j, const Summary& summary);
void to_json(nlohmann::json& j, const AnalysisWarning& warning);
void to_json(nlohmann::json& j, const AnalysisResult& result);
