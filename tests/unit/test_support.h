#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace sift::testing {

namespace fs = std::filesystem;

// Fresh scratch directory per test, removed afterwards.
class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("sift_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(root_);
        root_ = fs::canonical(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(root_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(root_, ec);
    }

    fs::path MakeDir(const fs::path& relative) const {
        fs::path dir = root_ / relative;
        fs::create_directories(dir);
        return dir;
    }

    fs::path WriteFile(const fs::path& relative, const std::string& content) const {
        fs::path file = root_ / relative;
        if (file.has_parent_path()) {
            fs::create_directories(file.parent_path());
        }
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file;
    }

    // Sparse file of the given size.
    fs::path MakeSizedFile(const fs::path& relative, std::uintmax_t size) const {
        fs::path file = WriteFile(relative, "");
        fs::resize_file(file, size);
        return file;
    }

    static void SetAge(const fs::path& path, std::chrono::hours age) {
        fs::last_write_time(path, fs::file_time_type::clock::now() - age);
    }

    fs::path root_;
};

inline std::chrono::hours Days(int count) {
    return std::chrono::hours(24 * count);
}

} // namespace sift::testing
