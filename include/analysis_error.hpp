#pragma once

#include <stdexcept>
#include <string>

// Failure that makes a whole analysis run meaningless
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& message) : std::runtime_error(message) {}
};

// Configuration problem detected while scanning: bad root or bad exclude pattern
class ScanError : public AnalysisError {
public:
    enum class Kind {
        NotFound,
        NotADirectory,
        Unreadable,       // Root exists but cannot be listed
        InvalidPattern
    };

    ScanError(Kind kind, const std::string& message)
        : AnalysisError(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};
