#include "tree_sitter_parser.hpp"
#include <tree_sitter/api.h>
#include <mutex>
#include <limits>
#include <functional>

// SyntaxTree

SyntaxTree::SyntaxTree(TSTree* tree) : tree_(tree) {}

SyntaxTree::~SyntaxTree() {
    if (tree_) {
        ts_tree_delete(tree_);
    }
}

SyntaxTree::SyntaxTree(SyntaxTree&& other) noexcept : tree_(other.tree_) {
    other.tree_ = nullptr;
}

SyntaxTree& SyntaxTree::operator=(SyntaxTree&& other) noexcept {
    if (this != &other) {
        if (tree_) {
            ts_tree_delete(tree_);
        }
        tree_ = other.tree_;
        other.tree_ = nullptr;
    }
    return *this;
}

bool SyntaxTree::hasErrors() const {
    return tree_ && ts_node_has_error(ts_tree_root_node(tree_));
}

// TreeSitterParser

namespace {

const char* queryErrorName(TSQueryError error) {
    switch (error) {
        case TSQueryErrorSyntax:    return "syntax error";
        case TSQueryErrorNodeType:  return "unknown node type";
        case TSQueryErrorField:     return "unknown field";
        case TSQueryErrorCapture:   return "unknown capture";
        case TSQueryErrorStructure: return "impossible pattern";
        case TSQueryErrorLanguage:  return "incompatible language";
        default:                    return "unknown error";
    }
}

// Owns a query cursor for the duration of one query execution
struct CursorGuard {
    TSQueryCursor* cursor = ts_query_cursor_new();
    ~CursorGuard() { ts_query_cursor_delete(cursor); }
};

} // namespace

struct TreeSitterParser::TreeSitterImpl {
    const TSLanguage* language = nullptr;
    TSQuery* commentQuery = nullptr;
    TSQuery* functionQuery = nullptr;

    std::mutex poolMutex;
    std::vector<TSParser*> idleParsers;
    size_t createdParsers = 0;

    ~TreeSitterImpl() {
        for (auto* parser : idleParsers) {
            ts_parser_delete(parser);
        }
        if (commentQuery) {
            ts_query_delete(commentQuery);
        }
        if (functionQuery) {
            ts_query_delete(functionQuery);
        }
        // Languages are static grammar tables, not owned by us
    }

    TSQuery* compileQuery(const std::string& languageName, const std::string& source) const {
        uint32_t errorOffset = 0;
        TSQueryError errorType = TSQueryErrorNone;
        TSQuery* query = ts_query_new(language, source.c_str(),
                                      static_cast<uint32_t>(source.size()),
                                      &errorOffset, &errorType);
        if (!query) {
            throw std::runtime_error("Failed to compile " + languageName + " query at offset " +
                                     std::to_string(errorOffset) + ": " + queryErrorName(errorType));
        }
        return query;
    }

    TSParser* acquire() {
        {
            std::lock_guard<std::mutex> lock(poolMutex);
            if (!idleParsers.empty()) {
                TSParser* parser = idleParsers.back();
                idleParsers.pop_back();
                return parser;
            }
            ++createdParsers;
        }

        // Create outside the lock; the language was validated in the constructor
        TSParser* parser = ts_parser_new();
        if (!ts_parser_set_language(parser, language)) {
            ts_parser_delete(parser);
            throw ParseError(ParseError::Kind::EngineFailure, "Failed to set parser language");
        }
        return parser;
    }

    void release(TSParser* parser) {
        std::lock_guard<std::mutex> lock(poolMutex);
        idleParsers.push_back(parser);
    }
};

namespace {

// Returns a leased parser to its pool when the parse is over, even on exceptions
class ParserLease {
public:
    ParserLease(TSParser* parser, std::function<void(TSParser*)> release)
        : parser_(parser), release_(std::move(release)) {}
    ~ParserLease() { release_(parser_); }

    ParserLease(const ParserLease&) = delete;
    ParserLease& operator=(const ParserLease&) = delete;

    TSParser* get() const { return parser_; }

private:
    TSParser* parser_;
    std::function<void(TSParser*)> release_;
};

} // namespace

TreeSitterParser::TreeSitterParser(LanguageDescriptor descriptor)
    : descriptor_(std::move(descriptor)), impl_(std::make_unique<TreeSitterImpl>()) {
    if (!descriptor_.grammar) {
        throw std::runtime_error("No grammar for language " + descriptor_.name);
    }
    impl_->language = descriptor_.grammar();

    // Probe the grammar once so ABI mismatches surface here rather than per file
    TSParser* probe = ts_parser_new();
    if (!ts_parser_set_language(probe, impl_->language)) {
        ts_parser_delete(probe);
        throw std::runtime_error("Grammar for " + descriptor_.name +
                                 " is incompatible with the tree-sitter runtime");
    }
    impl_->idleParsers.push_back(probe);
    impl_->createdParsers = 1;

    impl_->commentQuery = impl_->compileQuery(descriptor_.name, descriptor_.commentQuery);
    impl_->functionQuery = impl_->compileQuery(descriptor_.name, descriptor_.functionQuery);
}

TreeSitterParser::~TreeSitterParser() = default;

SyntaxTree TreeSitterParser::parse(const std::string& source, std::chrono::milliseconds timeout) const {
    if (source.size() > std::numeric_limits<uint32_t>::max()) {
        throw ParseError(ParseError::Kind::EngineFailure, "Source exceeds the parser's 4 GiB limit");
    }

    TreeSitterImpl* impl = impl_.get();
    ParserLease lease(impl->acquire(), [impl](TSParser* parser) { impl->release(parser); });

    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
    ts_parser_set_timeout_micros(lease.get(), micros > 0 ? static_cast<uint64_t>(micros) : 0);

    TSTree* tree = ts_parser_parse_string(lease.get(), nullptr, source.data(),
                                          static_cast<uint32_t>(source.size()));
    if (!tree) {
        // A halted parse leaves resumable state behind; clear it before the parser is reused
        ts_parser_reset(lease.get());
        if (micros > 0) {
            throw ParseError(ParseError::Kind::Timeout,
                             "Parsing exceeded " + std::to_string(timeout.count()) + " ms");
        }
        throw ParseError(ParseError::Kind::EngineFailure, "Parser returned no tree");
    }

    return SyntaxTree(tree);
}

std::vector<SourceRange> TreeSitterParser::commentRanges(const SyntaxTree& tree) const {
    std::vector<SourceRange> ranges;
    if (!tree.get()) {
        return ranges;
    }

    CursorGuard guard;
    ts_query_cursor_exec(guard.cursor, impl_->commentQuery, ts_tree_root_node(tree.get()));

    TSQueryMatch match;
    while (ts_query_cursor_next_match(guard.cursor, &match)) {
        for (uint16_t i = 0; i < match.capture_count; ++i) {
            const TSNode node = match.captures[i].node;
            const TSPoint start = ts_node_start_point(node);
            const TSPoint end = ts_node_end_point(node);

            SourceRange range;
            range.startRow = start.row;
            range.startColumn = start.column;
            range.endRow = end.row;
            range.endColumn = end.column;
            ranges.push_back(range);
        }
    }

    return ranges;
}

size_t TreeSitterParser::functionCount(const SyntaxTree& tree) const {
    if (!tree.get()) {
        return 0;
    }

    CursorGuard guard;
    ts_query_cursor_exec(guard.cursor, impl_->functionQuery, ts_tree_root_node(tree.get()));

    size_t count = 0;
    TSQueryMatch match;
    while (ts_query_cursor_next_match(guard.cursor, &match)) {
        ++count;
    }
    return count;
}

size_t TreeSitterParser::parserInstances() const {
    std::lock_guard<std::mutex> lock(impl_->poolMutex);
    return impl_->createdParsers;
}
