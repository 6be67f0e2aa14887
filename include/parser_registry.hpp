#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <filesystem>
#include <unordered_map>
#include "language_parser.hpp"
#include "tree_sitter_parser.hpp"

namespace fs = std::filesystem;

using ParserHandle = std::shared_ptr<const LanguageParser>;

// Maps language tags and file extensions to shared, lazily built parsers.
//
// A parser is constructed the first time its language is requested and then
// reused for every file of that language. All methods are thread safe.
class ParserRegistry {
public:
    // Registry preloaded with the built-in language table
    ParserRegistry();

    // Empty registry; languages must be registered explicitly
    struct Empty {};
    explicit ParserRegistry(Empty);

    // Process-wide registry used when no other is supplied
    static ParserRegistry& instance();

    // Get the parser for a language tag or alias; throws UnsupportedLanguageError
    ParserHandle getParser(const std::string& language);

    // Add a tree-sitter language; its parser is built on first use
    void registerLanguage(LanguageDescriptor descriptor);

    // Add or replace a ready-made parser under its language() tag
    void registerParser(std::shared_ptr<const LanguageParser> parser,
                        const std::vector<std::string>& extensions = {});

    // Language tag for a path based on its extension; empty if unrecognized
    std::string detectLanguage(const fs::path& path) const;

    bool supportsExtension(const fs::path& path) const { return !detectLanguage(path).empty(); }
    bool supportsLanguage(const std::string& language) const;

    std::vector<std::string> languages() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LanguageDescriptor> descriptors_;
    std::unordered_map<std::string, ParserHandle> parsers_;
    std::unordered_map<std::string, std::string> aliases_;      // alias -> canonical tag
    std::unordered_map<std::string, std::string> extensions_;   // extension -> canonical tag

    std::string canonicalName(const std::string& language) const;
};
