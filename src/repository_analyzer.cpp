#include "repository_analyzer.hpp"
#include "scanner.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <iostream>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <unistd.h>

namespace {

constexpr size_t FILE_BUFFER_SIZE = 128 * 1024;

// Bytes inspected for NUL when deciding whether a file is binary
constexpr size_t BINARY_PROBE_SIZE = 8 * 1024;

std::string readSource(const fs::path& filePath) {
    int fd = ::open(filePath.c_str(), O_RDONLY);
    if (fd == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to open file");
    }

    std::string content;
    std::vector<char> buffer(FILE_BUFFER_SIZE);
    for (;;) {
        const ssize_t bytesRead = ::read(fd, buffer.data(), buffer.size());
        if (bytesRead < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            ::close(fd);
            throw std::system_error(error, std::generic_category(), "Failed to read file");
        }
        if (bytesRead == 0) {
            break;
        }
        content.append(buffer.data(), static_cast<size_t>(bytesRead));
    }

    ::close(fd);
    return content;
}

bool looksBinary(const std::string& content) {
    const auto probeEnd = content.begin() + std::min(content.size(), BINARY_PROBE_SIZE);
    return std::find(content.begin(), probeEnd, '\0') != probeEnd;
}

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
bool isValidUtf8(const std::string& content) {
    const size_t size = content.size();
    auto byteAt = [&content](size_t index) { return static_cast<unsigned char>(content[index]); };
    size_t i = 0;

    while (i < size) {
        const unsigned char lead = byteAt(i);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                low = 0xA0;
            } else if (lead == 0xED) {
                high = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                low = 0x90;
            } else if (lead == 0xF4) {
                high = 0x8F;
            }
        } else {
            return false;
        }

        if (i + length > size) {
            return false;
        }
        if (byteAt(i + 1) < low || byteAt(i + 1) > high) {
            return false;
        }
        for (size_t k = 2; k < length; ++k) {
            if (byteAt(i + k) < 0x80 || byteAt(i + k) > 0xBF) {
                return false;
            }
        }
        i += length;
    }

    return true;
}

WarningKind warningKindFor(const std::error_code& ec) {
    return ec == std::errc::permission_denied ? WarningKind::PermissionDenied : WarningKind::ReadFailed;
}

} // namespace

RepositoryAnalyzer::RepositoryAnalyzer(const AnalysisConfig& config, ParserRegistry& registry)
    : config_(config),
      registry_(registry),
      calculator_(config.parseTimeout) {}

AnalysisResult RepositoryAnalyzer::analyze(const fs::path& root) {
    const auto startTime = std::chrono::steady_clock::now();

    if (config_.verbose) {
        std::cout << "Analyzing directory: " << root << std::endl;
    }

    Scanner scanner(registry_);
    scanner.setMaxFileSize(config_.maxFileSize);
    scanner.setRespectGitignore(config_.respectGitignore);
    scanner.setVerbose(config_.verbose);

    ScanResult scan = scanner.scan(root, config_.excludePatterns);

    const auto scanEnd = std::chrono::steady_clock::now();
    if (config_.verbose) {
        std::cout << "Scan duration: "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(scanEnd - startTime).count()
                  << " ms" << std::endl;
    }

    std::unique_ptr<MetricsCache> cache;
    if (config_.useCache) {
        const fs::path cacheDir = config_.cacheDir.empty() ? MetricsCache::defaultCacheDir(root)
                                                           : config_.cacheDir;
        cache = std::make_unique<MetricsCache>(root, cacheDir);
    }

    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        totalFiles_ = scan.files.size();
        processedFiles_ = 0;
    }

    // One slot per scanned path; workers never touch each other's slots
    std::vector<FileOutcome> outcomes(scan.files.size());
    processAll(root, scan.files, cache.get(), outcomes);

    const auto processEnd = std::chrono::steady_clock::now();

    // Reduce in scan order, which is already sorted by path
    AnalysisResult result;
    result.files.reserve(outcomes.size());
    result.warnings = std::move(scan.warnings);
    for (auto& outcome : outcomes) {
        if (outcome.metrics) {
            result.files.push_back(std::move(*outcome.metrics));
        }
        for (auto& warning : outcome.warnings) {
            result.warnings.push_back(std::move(warning));
        }
    }
    std::stable_sort(result.warnings.begin(), result.warnings.end(),
                     [](const AnalysisWarning& a, const AnalysisWarning& b) { return a.path < b.path; });

    result.summary = calculateSummary(result.files);
    result.timestamp = std::chrono::system_clock::now();

    reportProgress(true);

    if (config_.verbose) {
        const auto endTime = std::chrono::steady_clock::now();
        std::cout << "Files processed: " << result.files.size()
                  << " (" << result.warnings.size() << " warnings)" << std::endl;
        std::cout << "Processing duration: "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(processEnd - scanEnd).count()
                  << " ms" << std::endl;
        if (cache) {
            const auto stats = cache->stats();
            std::cout << "Cache: " << stats.hits << " hits, " << stats.misses << " misses, "
                      << stats.writeFailures << " write failures" << std::endl;
        }
        std::cout << "Total time: "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count()
                  << " ms" << std::endl;
    }

    return result;
}

void RepositoryAnalyzer::processAll(const fs::path& root, const std::vector<std::string>& files,
                                    MetricsCache* cache, std::vector<FileOutcome>& outcomes) {
    if (files.empty()) {
        return;
    }

    std::atomic<size_t> nextIndex{0};

    auto worker = [&]() {
        for (;;) {
            const size_t index = nextIndex.fetch_add(1);
            if (index >= files.size()) {
                return;
            }

            try {
                outcomes[index] = processFile(root, files[index], cache);
            } catch (const std::exception& e) {
                std::cerr << "Warning: " << files[index] << ": Error processing file: " << e.what() << std::endl;
                FileOutcome failed;
                failed.warnings.push_back({files[index], WarningKind::ReadFailed,
                                           std::string("Error processing file: ") + e.what()});
                outcomes[index] = std::move(failed);
            }

            reportProgress(false);
        }
    };

    const unsigned int threadCount = workerCount(files.size());
    std::vector<std::thread> workers;

    if (threadCount > 1) {
        try {
            for (unsigned int i = 0; i < threadCount; ++i) {
                workers.emplace_back(worker);
            }
        } catch (const std::system_error& e) {
            // Threads already started keep draining the queue
            std::cerr << "Warning: Could not create worker thread: " << e.what() << std::endl;
            if (workers.empty()) {
                std::cerr << "Falling back to single-threaded processing" << std::endl;
            }
        }
    }

    if (workers.empty()) {
        worker();
    }

    for (auto& thread : workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

RepositoryAnalyzer::FileOutcome RepositoryAnalyzer::processFile(const fs::path& root,
                                                                const std::string& relativePath,
                                                                MetricsCache* cache) {
    FileOutcome outcome;

    auto warn = [&](WarningKind kind, const std::string& message) {
        std::cerr << "Warning: " << relativePath << ": " << message << std::endl;
        outcome.warnings.push_back({relativePath, kind, message});
    };

    if (cache) {
        if (auto cached = cache->get(relativePath)) {
            outcome.metrics = std::move(cached);
            return outcome;
        }
    }

    const fs::path filePath = root / relativePath;

    // Taken before the read: a write racing with the read leaves an older time in
    // the entry, and the next run re-parses instead of trusting stale metrics
    std::error_code ec;
    const auto lastModified = fs::last_write_time(filePath, ec);
    if (ec) {
        warn(warningKindFor(ec), "Cannot read modification time: " + ec.message());
        return outcome;
    }

    std::string source;
    try {
        source = readSource(filePath);
    } catch (const std::system_error& e) {
        warn(warningKindFor(e.code()), e.what());
        return outcome;
    }

    if (looksBinary(source)) {
        warn(WarningKind::InvalidEncoding, "Binary file detected, skipping");
        return outcome;
    }
    if (!isValidUtf8(source)) {
        warn(WarningKind::InvalidEncoding, "File is not valid UTF-8, skipping");
        return outcome;
    }

    const std::string language = registry_.detectLanguage(filePath);
    if (language.empty()) {
        warn(WarningKind::UnsupportedLanguage, "No language registered for extension " +
             filePath.extension().string());
        return outcome;
    }

    ParserHandle parser;
    try {
        parser = registry_.getParser(language);
    } catch (const UnsupportedLanguageError& e) {
        warn(WarningKind::UnsupportedLanguage, e.what());
        return outcome;
    } catch (const std::runtime_error& e) {
        warn(WarningKind::ParseFailed, std::string("Failed to load parser: ") + e.what());
        return outcome;
    }

    FileMetrics metrics;
    try {
        metrics = calculator_.calculate(relativePath, source, lastModified, *parser);
    } catch (const MetricsError& e) {
        warn(e.kind() == MetricsError::Kind::Timeout ? WarningKind::ParseTimeout : WarningKind::ParseFailed,
             e.what());
        return outcome;
    }

    if (cache) {
        try {
            cache->set(metrics);
        } catch (const CacheError& e) {
            // The metrics are still correct; only the memo is lost
            warn(WarningKind::CacheFailed, e.what());
        }
    }

    outcome.metrics = std::move(metrics);
    return outcome;
}

void RepositoryAnalyzer::reportProgress(bool complete) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    if (!complete) {
        ++processedFiles_;
    }

    if (progressCallback_) {
        ProgressInfo info;
        info.totalFiles = totalFiles_;
        info.processedFiles = processedFiles_;
        info.isComplete = complete;
        try {
            progressCallback_(info);
        } catch (const std::exception& e) {
            // Runs on worker threads: nothing may escape
            std::cerr << "Warning: Progress callback failed: " << e.what() << std::endl;
        }
    }
}

unsigned int RepositoryAnalyzer::workerCount(size_t fileCount) const {
    unsigned int threads = config_.numThreads;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
    }
    if (threads == 0) {
        threads = 1;
    }
    return static_cast<unsigned int>(std::min<size_t>(threads, fileCount));
}

AnalysisResult analyze(const fs::path& root, const AnalysisConfig& config) {
    RepositoryAnalyzer analyzer(config);
    return analyzer.analyze(root);
}
