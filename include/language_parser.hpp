#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <stdexcept>

// Opaque tree-sitter type, keeps tree_sitter/api.h out of the public headers
typedef struct TSTree TSTree;

// Span of source text; rows are zero based, columns are byte offsets within the row.
// The end position is exclusive.
struct SourceRange {
    uint32_t startRow = 0;
    uint32_t startColumn = 0;
    uint32_t endRow = 0;
    uint32_t endColumn = 0;
};

// Fatal parser failure. A file that merely contains syntax errors does not raise this.
class ParseError : public std::runtime_error {
public:
    enum class Kind {
        EngineFailure,
        Timeout
    };

    ParseError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class UnsupportedLanguageError : public std::runtime_error {
public:
    explicit UnsupportedLanguageError(const std::string& language)
        : std::runtime_error("Unsupported language: " + language), language_(language) {}

    const std::string& language() const { return language_; }

private:
    std::string language_;
};

// Owning handle to a parsed tree. Move-only.
class SyntaxTree {
public:
    explicit SyntaxTree(TSTree* tree);
    ~SyntaxTree();

    SyntaxTree(SyntaxTree&& other) noexcept;
    SyntaxTree& operator=(SyntaxTree&& other) noexcept;
    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;

    TSTree* get() const { return tree_; }

    // True if the best-effort tree contains ERROR or MISSING nodes
    bool hasErrors() const;

private:
    TSTree* tree_;
};

// Per-language syntax capability: parsing plus the two structural queries
// the metrics need. Implementations must be safe to call from several threads.
class LanguageParser {
public:
    virtual ~LanguageParser() = default;

    // Canonical language tag, e.g. "typescript"
    virtual const std::string& language() const = 0;

    // Parse source text. Throws ParseError on a fatal engine failure or when
    // parsing takes longer than `timeout` (zero disables the limit).
    virtual SyntaxTree parse(const std::string& source, std::chrono::milliseconds timeout) const = 0;

    // Ranges covered by comment nodes, in document order
    virtual std::vector<SourceRange> commentRanges(const SyntaxTree& tree) const = 0;

    // Number of function, method and lambda definitions
    virtual size_t functionCount(const SyntaxTree& tree) const = 0;
};
