#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace geoinsight {
namespace testutil {

// Directory name unique to the running test and process; gtest_discover_tests
// runs each test in its own process, possibly in parallel.
inline std::filesystem::path UniqueTempPath(const std::string& prefix) {
    std::string name = prefix;
    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        name += "_" + std::string(info->test_suite_name()) + "_" + info->name();
    }
#if defined(__unix__) || defined(__APPLE__)
    name += "_pid" + std::to_string(static_cast<long long>(::getpid()));
#endif
    name += "_t" + std::to_string(
        static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count()));

    for (auto& ch : name) {
        if (ch == '/' || ch == '\\' || ch == ' ' || ch == ':') ch = '_';
    }
    return std::filesystem::temp_directory_path() / name;
}

/**
 * Scratch directory for dataset, config and cache files; removed with its
 * contents on destruction.
 */
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix) : path_(UniqueTempPath(prefix)) {
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Path of `name` inside the directory; the file need not exist.
    std::string file(const std::string& name) const { return (path_ / name).string(); }

    // Writes `contents` to `name` (replacing it) and returns the full path.
    std::string write_file(const std::string& name, const std::string& contents) const {
        const std::string target = file(name);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << contents;
        EXPECT_TRUE(out.good()) << "could not write " << target;
        return target;
    }

private:
    std::filesystem::path path_;
};

} // namespace testutil
} // namespace geoinsight
