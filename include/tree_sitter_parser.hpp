#pragma once

#include <string>
#include <vector>
#include <memory>
#include "language_parser.hpp"

typedef struct TSLanguage TSLanguage;

// Everything needed to build a parser for one language
struct LanguageDescriptor {
    std::string name;                       // Canonical tag
    std::vector<std::string> aliases;       // Other accepted tags ("ts", "py", ...)
    std::vector<std::string> extensions;    // Lower case, without the dot
    const TSLanguage* (*grammar)() = nullptr;
    std::string commentQuery;               // Every match is one comment node
    std::string functionQuery;              // Every match is one function-like node
};

// Built-in grammars: typescript, tsx, javascript, python, rust, go, cpp, c
const std::vector<LanguageDescriptor>& builtinLanguages();

// LanguageParser backed by a tree-sitter grammar.
//
// Queries are compiled once in the constructor and shared by all callers.
// TSParser objects are not reentrant, so they are kept in a small pool:
// each parse leases one, and it returns to the pool when the parse is done.
class TreeSitterParser : public LanguageParser {
public:
    // Throws std::runtime_error if the grammar is incompatible or a query does not compile
    explicit TreeSitterParser(LanguageDescriptor descriptor);
    ~TreeSitterParser() override;

    const std::string& language() const override { return descriptor_.name; }

    SyntaxTree parse(const std::string& source, std::chrono::milliseconds timeout) const override;
    std::vector<SourceRange> commentRanges(const SyntaxTree& tree) const override;
    size_t functionCount(const SyntaxTree& tree) const override;

    // Number of engine instances created so far (bounded by peak concurrency)
    size_t parserInstances() const;

private:
    LanguageDescriptor descriptor_;

    struct TreeSitterImpl;
    std::unique_ptr<TreeSitterImpl> impl_;
};
