#include "tree_sitter_parser.hpp"

// Grammar entry points exported by the tree-sitter grammar libraries
extern "C" {
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_rust();
    const TSLanguage* tree_sitter_go();
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_c();
}

namespace {

const char* const kCommentQuery = "(comment) @comment";

// Declarations, arrow functions and class/object methods
const char* const kEcmaScriptFunctionQuery =
    "(function_declaration) @function "
    "(arrow_function) @function "
    "(method_definition) @function";

std::vector<LanguageDescriptor> makeBuiltinLanguages() {
    std::vector<LanguageDescriptor> languages;

    languages.push_back({"typescript", {"ts"}, {"ts"},
                         tree_sitter_typescript, kCommentQuery, kEcmaScriptFunctionQuery});

    languages.push_back({"tsx", {}, {"tsx"},
                         tree_sitter_tsx, kCommentQuery, kEcmaScriptFunctionQuery});

    languages.push_back({"javascript", {"js", "jsx"}, {"js", "jsx", "mjs", "cjs"},
                         tree_sitter_javascript, kCommentQuery, kEcmaScriptFunctionQuery});

    languages.push_back({"python", {"py"}, {"py"},
                         tree_sitter_python, kCommentQuery,
                         "(function_definition) @function"});

    languages.push_back({"rust", {"rs"}, {"rs"},
                         tree_sitter_rust,
                         "(line_comment) @comment (block_comment) @comment",
                         "(function_item) @function"});

    languages.push_back({"go", {"golang"}, {"go"},
                         tree_sitter_go, kCommentQuery,
                         "(function_declaration) @function "
                         "(method_declaration) @function "
                         "(func_literal) @function"});

    // Plain .h headers are parsed as C++, which accepts nearly all C headers
    languages.push_back({"cpp", {"c++", "cxx", "cc", "hpp"}, {"cpp", "cc", "cxx", "hpp", "hh", "hxx", "h"},
                         tree_sitter_cpp, kCommentQuery,
                         "(function_definition) @function"});

    languages.push_back({"c", {}, {"c"},
                         tree_sitter_c, kCommentQuery,
                         "(function_definition) @function"});

    return languages;
}

} // namespace

const std::vector<LanguageDescriptor>& builtinLanguages() {
    static const std::vector<LanguageDescriptor> languages = makeBuiltinLanguages();
    return languages;
}
