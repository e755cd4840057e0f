// ==============================================================================
// test_temp_dir.hpp - Временный каталог теста (GoogleTest)
// ==============================================================================

#ifndef GUIDSCAN_TEST_TEMP_DIR_HPP
#define GUIDSCAN_TEST_TEMP_DIR_HPP

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace guidscan::test {

/// Каталог <temp>/<prefix><имя теста>_<pid>, удаляется в деструкторе
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix) {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = test_info != nullptr ? test_info->name() : "shared";
        path_ = std::filesystem::temp_directory_path() /
                (prefix + name + "_" +
                 std::to_string(
#ifdef _WIN32
                     GetCurrentProcessId()
#else
                     getpid()
#endif
                         ));

        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

}  // namespace guidscan::test

#endif  // GUIDSCAN_TEST_TEMP_DIR_HPP
