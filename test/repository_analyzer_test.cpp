#include <catch2/catch_test_macros.hpp>
#include "repository_analyzer.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Forwards to a real parser and counts how often it is asked to parse
class CountingParser : public LanguageParser {
public:
    explicit CountingParser(ParserHandle inner) : inner_(std::move(inner)) {}

    const std::string& language() const override { return inner_->language(); }

    SyntaxTree parse(const std::string& source, std::chrono::milliseconds timeout) const override {
        ++parses_;
        return inner_->parse(source, timeout);
    }

    std::vector<SourceRange> commentRanges(const SyntaxTree& tree) const override {
        return inner_->commentRanges(tree);
    }

    size_t functionCount(const SyntaxTree& tree) const override {
        return inner_->functionCount(tree);
    }

    size_t parses() const { return parses_.load(); }

private:
    ParserHandle inner_;
    mutable std::atomic<size_t> parses_{0};
};

// Fails every file whose source contains a marker
class SelectiveFailingParser : public LanguageParser {
public:
    explicit SelectiveFailingParser(ParserHandle inner) : inner_(std::move(inner)) {}

    const std::string& language() const override { return inner_->language(); }

    SyntaxTree parse(const std::string& source, std::chrono::milliseconds timeout) const override {
        if (source.find("@@explode@@") != std::string::npos) {
            throw ParseError(ParseError::Kind::EngineFailure, "simulated engine failure");
        }
        return inner_->parse(source, timeout);
    }

    std::vector<SourceRange> commentRanges(const SyntaxTree& tree) const override {
        return inner_->commentRanges(tree);
    }

    size_t functionCount(const SyntaxTree& tree) const override {
        return inner_->functionCount(tree);
    }

private:
    ParserHandle inner_;
};

AnalysisConfig uncachedConfig(const std::vector<std::string>& excludes = {}) {
    AnalysisConfig config;
    config.excludePatterns = excludes;
    config.useCache = false;
    return config;
}

bool hasWarning(const AnalysisResult& result, const std::string& path, WarningKind kind) {
    return std::any_of(result.warnings.begin(), result.warnings.end(), [&](const AnalysisWarning& warning) {
        return warning.path == path && warning.kind == kind;
    });
}

std::vector<std::string> pathsOf(const AnalysisResult& result) {
    std::vector<std::string> paths;
    for (const auto& file : result.files) {
        paths.push_back(file.path);
    }
    return paths;
}

} // namespace

TEST_CASE("RepositoryAnalyzer summarizes a repository", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    tempDir.writeFile("a.ts", codeLines(10));
    tempDir.writeFile("b.ts", codeLines(5) + commentLines(5));
    tempDir.writeFile("excluded/c.ts", codeLines(50));

    auto result = analyze(tempDir.path(), uncachedConfig({"excluded/**"}));

    REQUIRE(result.summary.totalFiles == 2);
    REQUIRE(result.summary.totalLoc == 15);
    REQUIRE(result.summary.largestFiles == std::vector<std::string>{"a.ts", "b.ts"});
    REQUIRE(pathsOf(result) == std::vector<std::string>{"a.ts", "b.ts"});
    REQUIRE(result.warnings.empty());

    REQUIRE(result.files[0].language == "typescript");
    REQUIRE(result.files[0].loc == 10);
    REQUIRE(result.files[1].loc == 5);
    REQUIRE(result.files[1].sizeBytes == (codeLines(5) + commentLines(5)).size());
}

TEST_CASE("RepositoryAnalyzer handles an empty root", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");

    auto result = analyze(tempDir.path(), uncachedConfig());

    REQUIRE(result.summary.totalFiles == 0);
    REQUIRE(result.summary.totalLoc == 0);
    REQUIRE(result.summary.totalFunctions == 0);
    REQUIRE(result.summary.largestFiles.empty());
    REQUIRE(result.files.empty());
}

TEST_CASE("RepositoryAnalyzer fails only on configuration errors", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    tempDir.writeFile("a.ts", codeLines(1));

    REQUIRE_THROWS_AS(analyze(tempDir.path() / "missing", uncachedConfig()), ScanError);
    REQUIRE_THROWS_AS(analyze(tempDir.path(), uncachedConfig({"src/[bad"})), ScanError);
    // ScanError is an AnalysisError
    REQUIRE_THROWS_AS(analyze(tempDir.path() / "missing", uncachedConfig()), AnalysisError);
}

TEST_CASE("RepositoryAnalyzer output is sorted and deterministic", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    tempDir.writeFile("zeta.ts", codeLines(3));
    tempDir.writeFile("alpha.py", "def f():\n    return 1\n");
    tempDir.writeFile("src/main.rs", "fn main() {}\n");
    tempDir.writeFile("src/lib/util.go", "package lib\nfunc Util() {}\n");
    tempDir.writeFile("Beta.js", "function b() {}\n");
    tempDir.writeFile("src/app.tsx", "const App = () => <div />;\n");
    tempDir.writeFile("mid/x.c", "int x(void) { return 0; }\n");
    tempDir.writeFile("mid/y.cpp", "int y() { return 1; }\n");

    auto config = uncachedConfig();
    config.numThreads = 1;
    auto sequential = analyze(tempDir.path(), config);

    config.numThreads = 8;
    auto parallel = analyze(tempDir.path(), config);

    REQUIRE(sequential.files.size() == 8);
    for (size_t i = 0; i + 1 < sequential.files.size(); ++i) {
        REQUIRE(sequential.files[i].path < sequential.files[i + 1].path);
    }

    REQUIRE(sequential.files == parallel.files);
    REQUIRE(sequential.summary.largestFiles == parallel.summary.largestFiles);

    for (int run = 0; run < 3; ++run) {
        REQUIRE(analyze(tempDir.path(), config).files == sequential.files);
    }

    REQUIRE(sequential.summary.totalFunctions == 7);
}

TEST_CASE("RepositoryAnalyzer reuses cached metrics", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    tempDir.writeFile("a.ts", codeLines(4));
    const auto touched = tempDir.writeFile("b.ts", "function f() {}\n" + codeLines(2));

    ParserRegistry registry;
    auto counting = std::make_shared<CountingParser>(registry.getParser("typescript"));
    registry.registerParser(counting);

    AnalysisConfig config;
    config.excludePatterns = {};
    config.useCache = true;
    config.cacheDir = tempDir.path() / ".code-viz" / "cache";

    RepositoryAnalyzer analyzer(config, registry);

    auto first = analyzer.analyze(tempDir.path());
    REQUIRE(first.files.size() == 2);
    REQUIRE(counting->parses() == 2);

    SECTION("Unchanged files are not parsed again") {
        auto second = analyzer.analyze(tempDir.path());
        REQUIRE(counting->parses() == 2);
        REQUIRE(second.files == first.files);
        REQUIRE(second.summary.totalLoc == first.summary.totalLoc);
    }

    SECTION("Touching a file forces recomputation") {
        fs::last_write_time(touched, fs::last_write_time(touched) + std::chrono::seconds(1));

        auto second = analyzer.analyze(tempDir.path());
        REQUIRE(counting->parses() == 3);
        REQUIRE(second.files[0] == first.files[0]);
        REQUIRE(second.files[1].loc == first.files[1].loc);
        REQUIRE(second.files[1].lastModified != first.files[1].lastModified);
    }

    SECTION("Disabling the cache always parses") {
        config.useCache = false;
        RepositoryAnalyzer uncached(config, registry);
        uncached.analyze(tempDir.path());
        REQUIRE(counting->parses() == 4);
    }

    SECTION("The cache directory is not analyzed") {
        auto second = analyzer.analyze(tempDir.path());
        REQUIRE(pathsOf(second) == std::vector<std::string>{"a.ts", "b.ts"});
    }
}

TEST_CASE("RepositoryAnalyzer isolates per-file failures", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    for (int i = 0; i < 5; ++i) {
        tempDir.writeFile("ok" + std::to_string(i) + ".ts", codeLines(2));
    }

    SECTION("Binary content") {
        tempDir.writeFile("binary.ts", std::string("let a\0\0\0 = 1;\n", 14));

        auto result = analyze(tempDir.path(), uncachedConfig());
        REQUIRE(result.summary.totalFiles == 5);
        REQUIRE(hasWarning(result, "binary.ts", WarningKind::InvalidEncoding));
    }

    SECTION("Invalid UTF-8") {
        tempDir.writeFile("latin1.ts", "let caf\xe9 = 1;\n");

        auto result = analyze(tempDir.path(), uncachedConfig());
        REQUIRE(result.summary.totalFiles == 5);
        REQUIRE(hasWarning(result, "latin1.ts", WarningKind::InvalidEncoding));
    }

    SECTION("Parser failure") {
        tempDir.writeFile("boom.ts", "let a = '@@explode@@';\n");

        ParserRegistry registry;
        registry.registerParser(std::make_shared<SelectiveFailingParser>(registry.getParser("typescript")));

        RepositoryAnalyzer analyzer(uncachedConfig(), registry);
        auto result = analyzer.analyze(tempDir.path());

        REQUIRE(result.summary.totalFiles == 5);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(hasWarning(result, "boom.ts", WarningKind::ParseFailed));
    }

    SECTION("Oversized file") {
        tempDir.writeFile("huge.ts", codeLines(200));

        auto config = uncachedConfig();
        config.maxFileSize = 1024;
        auto result = analyze(tempDir.path(), config);

        REQUIRE(result.summary.totalFiles == 5);
        REQUIRE(hasWarning(result, "huge.ts", WarningKind::FileTooLarge));
    }

    SECTION("Language without a parser") {
        tempDir.writeFile("script.py", "x = 1\n");

        ParserRegistry registry(ParserRegistry::Empty{});
        for (const auto& descriptor : builtinLanguages()) {
            if (descriptor.name != "python") {
                registry.registerLanguage(descriptor);
            }
        }

        RepositoryAnalyzer analyzer(uncachedConfig(), registry);
        auto result = analyzer.analyze(tempDir.path());

        // Without a python entry the scanner no longer picks up .py files at all
        REQUIRE(result.summary.totalFiles == 5);
        REQUIRE(result.warnings.empty());
    }

    SECTION("Warnings are sorted by path") {
        tempDir.writeFile("z_bin.ts", std::string("\0\0", 2));
        tempDir.writeFile("a_bin.ts", std::string("\0\0", 2));

        auto result = analyze(tempDir.path(), uncachedConfig());
        REQUIRE(result.warnings.size() == 2);
        REQUIRE(result.warnings[0].path == "a_bin.ts");
        REQUIRE(result.warnings[1].path == "z_bin.ts");
    }
}

TEST_CASE("RepositoryAnalyzer reports progress", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    for (int i = 0; i < 6; ++i) {
        tempDir.writeFile("f" + std::to_string(i) + ".ts", codeLines(1));
    }

    auto config = uncachedConfig();
    config.numThreads = 3;
    RepositoryAnalyzer analyzer(config);

    std::vector<RepositoryAnalyzer::ProgressInfo> updates;
    analyzer.setProgressCallback([&](const RepositoryAnalyzer::ProgressInfo& progress) {
        updates.push_back(progress);
    });

    analyzer.analyze(tempDir.path());

    REQUIRE(updates.size() == 7);
    for (size_t i = 0; i < 6; ++i) {
        REQUIRE(updates[i].totalFiles == 6);
        REQUIRE(updates[i].processedFiles == i + 1);
        REQUIRE_FALSE(updates[i].isComplete);
    }
    REQUIRE(updates.back().isComplete);
    REQUIRE(updates.back().processedFiles == 6);
    REQUIRE(updates.back().getPercentage() == 100.0);
}

TEST_CASE("RepositoryAnalyzer serializes results as JSON", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    tempDir.writeFile("a.ts", "function a() {}\n");

    auto result = analyze(tempDir.path(), uncachedConfig());
    nlohmann::json j = result;

    REQUIRE(j["summary"]["total_files"] == 1);
    REQUIRE(j["summary"]["largest_files"][0] == "a.ts");
    REQUIRE(j["files"][0]["path"] == "a.ts");
    REQUIRE(j["files"][0]["function_count"] == 1);
    REQUIRE(j["files"][0]["size_bytes"] == 16);
    REQUIRE(j["warnings"].empty());

    REQUIRE(j["files"][0]["language"] == "typescript");
    REQUIRE(j["files"][0]["loc"] == 1);

    // Unix milliseconds, comparable with the system clock
    const auto nowMillis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const auto lastModified = j["files"][0]["last_modified"].get<int64_t>();
    REQUIRE(lastModified <= nowMillis + 1000);
    REQUIRE(lastModified >= nowMillis - 60 * 1000);
}

TEST_CASE("Summary keeps the ten largest files", "[Summary]") {
    std::vector<FileMetrics> files;
    for (int i = 0; i < 12; ++i) {
        FileMetrics metrics;
        metrics.path = "f" + std::string(i < 10 ? "0" : "") + std::to_string(i) + ".ts";
        metrics.loc = 5;
        metrics.functionCount = 1;
        files.push_back(metrics);
    }
    FileMetrics big;
    big.path = "z_big.ts";
    big.loc = 50;
    files.push_back(big);

    const Summary summary = calculateSummary(files);

    REQUIRE(summary.totalFiles == 13);
    REQUIRE(summary.totalLoc == 110);
    REQUIRE(summary.totalFunctions == 12);
    REQUIRE(summary.largestFiles.size() == 10);
    REQUIRE(summary.largestFiles[0] == "z_big.ts");
    // Equal LOC: ascending path, so f09, f10 and f11 fall off
    for (size_t i = 1; i < 10; ++i) {
        REQUIRE(summary.largestFiles[i] == "f0" + std::to_string(i - 1) + ".ts");
    }
}

TEST_CASE("Summary ranking ignores input order", "[Summary]") {
    std::vector<FileMetrics> files(3);
    files[0].path = "c.ts";
    files[0].loc = 2;
    files[1].path = "a.ts";
    files[1].loc = 7;
    files[2].path = "b.ts";
    files[2].loc = 7;

    const std::vector<std::string> expected = {"a.ts", "b.ts", "c.ts"};
    REQUIRE(largestFiles(files) == expected);
    REQUIRE(largestFiles(files, 1) == std::vector<std::string>(1, "a.ts"));
    REQUIRE(largestFiles({}).empty());
}

TEST_CASE("RepositoryAnalyzer survives a throwing progress callback", "[RepositoryAnalyzer]") {
    TempDirectory tempDir("analyzer_test");
    for (int i = 0; i < 4; ++i) {
        tempDir.writeFile("f" + std::to_string(i) + ".ts", codeLines(2));
    }

    auto config = uncachedConfig();
    config.numThreads = 2;
    RepositoryAnalyzer analyzer(config);

    std::atomic<size_t> calls{0};
    analyzer.setProgressCallback([&](const RepositoryAnalyzer::ProgressInfo&) {
        ++calls;
        throw std::runtime_error("progress sink closed");
    });

    AnalysisResult result;
    REQUIRE_NOTHROW(result = analyzer.analyze(tempDir.path()));
    REQUIRE(result.files.size() == 4);
    REQUIRE(result.summary.totalLoc == 8);
    REQUIRE(calls.load() == 5);
}
