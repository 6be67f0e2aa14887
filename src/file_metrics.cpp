#include "file_metrics.hpp"
#include <algorithm>

std::vector<std::string> largestFiles(const std::vector<FileMetrics>& files, size_t limit) {
    std::vector<const FileMetrics*> ranked;
    ranked.reserve(files.size());
    for (const auto& file : files) {
        ranked.push_back(&file);
    }

    std::sort(ranked.begin(), ranked.end(), [](const FileMetrics* a, const FileMetrics* b) {
        if (a->loc != b->loc) {
            return a->loc > b->loc;
        }
        return a->path < b->path;
    });

    std::vector<std::string> result;
    const size_t count = std::min(limit, ranked.size());
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(ranked[i]->path);
    }
    return result;
}

Summary calculateSummary(const std::vector<FileMetrics>& files) {
    Summary summary;
    summary.totalFiles = files.size();
    for (const auto& file : files) {
        summary.totalLoc += file.loc;
        summary.totalFunctions += file.functionCount;
    }
    summary.largestFiles = largestFiles(files);
    return summary;
}

const char* warningKindName(WarningKind kind) {
    switch (kind) {
        case WarningKind::PermissionDenied:    return "permission_denied";
        case WarningKind::FileTooLarge:        return "file_too_large";
        case WarningKind::ReadFailed:          return "read_failed";
        case WarningKind::InvalidEncoding:     return "invalid_encoding";
        case WarningKind::UnsupportedLanguage: return "unsupported_language";
        case WarningKind::ParseFailed:         return "parse_failed";
        case WarningKind::ParseTimeout:        return "parse_timeout";
        case WarningKind::CacheFailed:         return "cache_failed";
    }
    return "unknown";
}

int64_t toUnixMillis(fs::file_time_type time) {
    // No clock_cast before C++20: shift by the offset between the two clocks' "now"
    const auto fileNow = fs::file_time_type::clock::now();
    const auto systemNow = std::chrono::system_clock::now();
    const auto systemTime = systemNow + std::chrono::duration_cast<std::chrono::system_clock::duration>(
        time - fileNow);
    return std::chrono::duration_cast<std::chrono::milliseconds>(systemTime.time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const FileMetrics& metrics) {
    j = nlohmann::json{
        {"path", metrics.path},
        {"language", metrics.language},
        {"loc", metrics.loc},
        {"size_bytes", metrics.sizeBytes},
        {"function_count", metrics.functionCount},
        {"last_modified", toUnixMillis(metrics.lastModified)}
    };
}

void to_json(nlohmann::json& j, const Summary& summary) {
    j = nlohmann::json{
        {"total_files", summary.totalFiles},
        {"total_loc", summary.totalLoc},
        {"total_functions", summary.totalFunctions},
        {"largest_files", summary.largestFiles}
    };
}

void to_json(nlohmann::json& j, const AnalysisWarning& warning) {
    j = nlohmann::json{
        {"path", warning.path},
        {"kind", warningKindName(warning.kind)},
        {"message", warning.message}
    };
}

void to_json(nlohmann::json& j, const AnalysisResult& result) {
    j = nlohmann::json{
        {"summary", result.summary},
        {"files", result.files},
        {"warnings", result.warnings},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
            result.timestamp.time_since_epoch()).count()}
    };
}
