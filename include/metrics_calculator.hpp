#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>
#include "file_metrics.hpp"
#include "language_parser.hpp"

class MetricsError : public std::runtime_error {
public:
    enum class Kind {
        ParseFailed,
        Timeout
    };

    MetricsError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Computes FileMetrics from source text that the caller has already read.
// Performs no I/O of its own.
class MetricsCalculator {
public:
    explicit MetricsCalculator(std::chrono::milliseconds parseTimeout = std::chrono::milliseconds(5000))
        : parseTimeout_(parseTimeout) {}

    // Parse `source` and measure it. `lastModified` is the modification time the caller
    // captured when it read the file. Throws MetricsError if the parser fails or times out.
    FileMetrics calculate(const std::string& path,
                          const std::string& source,
                          fs::file_time_type lastModified,
                          const LanguageParser& parser) const;

    // Count non-blank physical lines that hold at least one character outside every comment
    static size_t countLinesOfCode(const std::string& source,
                                   const std::vector<SourceRange>& commentRanges);

private:
    std::chrono::milliseconds parseTimeout_;
};
