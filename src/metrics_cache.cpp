#include "metrics_cache.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <iterator>
#include <vector>
#include <unistd.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

constexpr const char* kEntryExtension = ".bin";

int64_t ticksOf(fs::file_time_type time) {
    return static_cast<int64_t>(time.time_since_epoch().count());
}

// Entries keep raw file clock ticks so a round trip compares equal to the file's time
json encodeMetrics(const FileMetrics& metrics) {
    return json{
        {"path", metrics.path},
        {"language", metrics.language},
        {"loc", metrics.loc},
        {"size_bytes", metrics.sizeBytes},
        {"function_count", metrics.functionCount},
        {"last_modified", ticksOf(metrics.lastModified)}
    };
}

FileMetrics decodeMetrics(const json& j) {
    FileMetrics metrics;
    j.at("path").get_to(metrics.path);
    j.at("language").get_to(metrics.language);
    j.at("loc").get_to(metrics.loc);
    j.at("size_bytes").get_to(metrics.sizeBytes);
    j.at("function_count").get_to(metrics.functionCount);
    metrics.lastModified = fs::file_time_type(
        fs::file_time_type::duration(j.at("last_modified").get<int64_t>()));
    return metrics;
}

} // namespace

MetricsCache::MetricsCache(const fs::path& projectRoot, const fs::path& cacheDir)
    : projectRoot_(projectRoot), cacheDir_(cacheDir) {}

fs::path MetricsCache::defaultCacheDir(const fs::path& projectRoot) {
    return projectRoot / ".code-viz" / "cache";
}

std::string MetricsCache::keyFor(const std::string& relativePath) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : relativePath) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    std::ostringstream key;
    key << std::hex << std::setw(16) << std::setfill('0') << hash;
    return key.str();
}

fs::path MetricsCache::entryPath(const std::string& relativePath) const {
    return cacheDir_ / (keyFor(relativePath) + kEntryExtension);
}

std::optional<FileMetrics> MetricsCache::miss() const {
    ++misses_;
    return std::nullopt;
}

std::optional<FileMetrics> MetricsCache::get(const std::string& relativePath) const {
    std::error_code ec;
    const auto currentModified = fs::last_write_time(projectRoot_ / relativePath, ec);
    if (ec) {
        return miss();
    }

    std::ifstream in(entryPath(relativePath), std::ios::binary);
    if (!in) {
        return miss();
    }
    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        return miss();
    }

    try {
        const json entry = json::from_msgpack(bytes);

        if (entry.at("version").get<int>() != kFormatVersion) {
            return miss();
        }
        // A different path means two paths share a hash
        if (entry.at("path").get<std::string>() != relativePath) {
            return miss();
        }
        if (entry.at("last_modified").get<int64_t>() != ticksOf(currentModified)) {
            return miss();
        }

        FileMetrics metrics = decodeMetrics(entry.at("metrics"));
        if (metrics.path != relativePath || metrics.lastModified != currentModified) {
            return miss();
        }

        ++hits_;
        return metrics;
    } catch (const json::exception&) {
        // Corrupt or truncated entry: recompute rather than trust it
        return miss();
    }
}

void MetricsCache::ensureDirectory() {
    std::error_code ec;
    fs::create_directories(cacheDir_, ec);
    if (ec) {
        ++writeFailures_;
        throw CacheError("Failed to create cache directory " + cacheDir_.string() + ": " + ec.message());
    }
}

void MetricsCache::set(const FileMetrics& metrics) {
    ensureDirectory();

    json entry;
    try {
        entry = {
            {"version", kFormatVersion},
            {"path", metrics.path},
            {"last_modified", ticksOf(metrics.lastModified)},
            {"metrics", encodeMetrics(metrics)}
        };
    } catch (const json::exception& e) {
        ++writeFailures_;
        throw CacheError("Failed to serialize cache entry for " + metrics.path + ": " + e.what());
    }

    const fs::path target = entryPath(metrics.path);
    fs::path temp = target;
    temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(tempCounter_++);

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (out) {
            json::to_msgpack(entry, out);
        }
        out.close();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            ++writeFailures_;
            throw CacheError("Failed to write cache entry " + temp.string());
        }
    }

    // rename() replaces the old entry atomically, readers see either version whole
    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        ++writeFailures_;
        throw CacheError("Failed to commit cache entry " + target.string() + ": " + ec.message());
    }
}

void MetricsCache::invalidate(const std::string& relativePath) {
    std::error_code ec;
    fs::remove(entryPath(relativePath), ec);
    if (ec) {
        throw CacheError("Failed to invalidate cache entry for " + relativePath + ": " + ec.message());
    }
}

void MetricsCache::clear() {
    std::error_code ec;
    if (!fs::exists(cacheDir_, ec)) {
        return;
    }

    fs::directory_iterator it(cacheDir_, ec);
    if (ec) {
        throw CacheError("Failed to open cache directory " + cacheDir_.string() + ": " + ec.message());
    }

    std::vector<fs::path> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string name = it->path().filename().string();
        if (it->path().extension() == kEntryExtension || name.find(".tmp.") != std::string::npos) {
            entries.push_back(it->path());
        }
    }
    if (ec) {
        throw CacheError("Failed to list cache directory " + cacheDir_.string() + ": " + ec.message());
    }

    for (const auto& entry : entries) {
        fs::remove(entry, ec);
        if (ec) {
            throw CacheError("Failed to remove cache entry " + entry.string() + ": " + ec.message());
        }
    }
}

MetricsCache::Stats MetricsCache::stats() const {
    Stats result;
    result.hits = hits_.load();
    result.misses = misses_.load();
    result.writeFailures = writeFailures_.load();
    return result;
}
