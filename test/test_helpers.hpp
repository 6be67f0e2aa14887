#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <string>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed with everything in it on destruction
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "codeviz_test") {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const fs::path& path() const { return path_; }

    // Create a file (and its parent directories) relative to the temp dir
    fs::path writeFile(const std::string& relativePath, const std::string& content) const {
        const fs::path filePath = path_ / relativePath;
        fs::create_directories(filePath.parent_path());
        std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
        file << content;
        file.close();
        return filePath;
    }

    fs::path makeDirectory(const std::string& relativePath) const {
        const fs::path dirPath = path_ / relativePath;
        fs::create_directories(dirPath);
        return dirPath;
    }

private:
    fs::path path_;
};

// `count` lines of plain code
inline std::string codeLines(size_t count) {
    std::string content;
    for (size_t i = 0; i < count; ++i) {
        content += "const v" + std::to_string(i) + " = " + std::to_string(i) + ";\n";
    }
    return content;
}

// `count` single-line comments
inline std::string commentLines(size_t count) {
    std::string content;
    for (size_t i = 0; i < count; ++i) {
        content += "// comment " + std::to_string(i) + "\n";
    }
    return content;
}
