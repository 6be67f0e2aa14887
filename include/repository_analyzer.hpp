#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <optional>
#include <functional>
#include <filesystem>
#include "file_metrics.hpp"
#include "analysis_error.hpp"
#include "parser_registry.hpp"
#include "metrics_cache.hpp"
#include "metrics_calculator.hpp"

namespace fs = std::filesystem;

class RepositoryAnalyzer {
public:
    struct ProgressInfo {
        size_t totalFiles = 0;
        size_t processedFiles = 0;
        bool isComplete = false;

        double getPercentage() const {
            return totalFiles > 0 ? (static_cast<double>(processedFiles) / totalFiles) * 100.0 : 100.0;
        }
    };

    using ProgressCallback = std::function<void(const ProgressInfo&)>;

    explicit RepositoryAnalyzer(const AnalysisConfig& config,
                                ParserRegistry& registry = ParserRegistry::instance());

    // Called after every file and once more when the run completes. Calls are
    // serialized, never concurrent. A std::exception thrown by the callback is
    // logged and does not stop the analysis.
    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }

    // Analyze every source file below `root`.
    // Throws ScanError for a missing root or an invalid exclude pattern; every
    // per-file problem is reported in AnalysisResult::warnings instead.
    AnalysisResult analyze(const fs::path& root);

    const AnalysisConfig& config() const { return config_; }

private:
    // Outcome of one file. A failed cache write leaves both members set.
    struct FileOutcome {
        std::optional<FileMetrics> metrics;
        std::vector<AnalysisWarning> warnings;
    };

    AnalysisConfig config_;
    ParserRegistry& registry_;
    MetricsCalculator calculator_;
    ProgressCallback progressCallback_;

    std::mutex progressMutex_;
    size_t processedFiles_ = 0;
    size_t totalFiles_ = 0;

    FileOutcome processFile(const fs::path& root, const std::string& relativePath,
                            MetricsCache* cache);

    void processAll(const fs::path& root, const std::vector<std::string>& files,
                    MetricsCache* cache, std::vector<FileOutcome>& outcomes);

    void reportProgress(bool complete);
    unsigned int workerCount(size_t fileCount) const;
};

// Analyze `root` with the process-wide parser registry
AnalysisResult analyze(const fs::path& root, const AnalysisConfig& config = AnalysisConfig());
