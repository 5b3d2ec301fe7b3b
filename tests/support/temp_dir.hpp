#pragma once

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace psync::test {

namespace fs = std::filesystem;

/**
 * @brief Fresh directory under temp_directory_path(), removed on destruction
 *
 * The pid is part of the name because gtest_discover_tests runs every test
 * in its own process.
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "psync_test") {
        static std::atomic<std::uint64_t> counter{0};
        const auto id = counter.fetch_add(1);
        path_ = fs::temp_directory_path() /
                (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(id));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }
    fs::path operator/(const std::string& relative) const { return path_ / relative; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

/// Number of entries below `root`, root excluded
inline std::size_t count_entries(const fs::path& root) {
    std::size_t count = 0;
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

} // namespace psync::test
