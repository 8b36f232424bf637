#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/core/entry_lister.h"

TEST(entry_lister_test, empty_root) {
    const auto dir = make_tmp_dir("entries-empty");
    EXPECT_TRUE(core::listEntries(dir).empty());
    std::filesystem::remove_all(dir);
}

TEST(entry_lister_test, keeps_empty_directories) {
    const auto dir = make_tmp_dir("entries-tree");
    write_file((std::filesystem::path(dir) / "a" / "b.txt").string(), "hello");
    std::filesystem::create_directories(std::filesystem::path(dir) / "c");
    std::filesystem::create_directories(std::filesystem::path(dir) / "d" / "e");
    write_file((std::filesystem::path(dir) / "top.bin").string());

    auto entries = core::listEntries(dir);
    std::sort(entries.begin(), entries.end());
    const std::vector<core::Entry> expected = { "a/", "a/b.txt", "c/", "d/", "d/e/", "top.bin" };
    EXPECT_EQ(entries, expected);
    std::filesystem::remove_all(dir);
}

TEST(entry_lister_test, directory_precedes_its_contents) {
    const auto dir = make_tmp_dir("entries-order");
    write_file((std::filesystem::path(dir) / "x" / "y" / "z.txt").string());

    const auto entries = core::listEntries(dir);
    const std::vector<core::Entry> expected = { "x/", "x/y/", "x/y/z.txt" };
    EXPECT_EQ(entries, expected);
    std::filesystem::remove_all(dir);
}

TEST(entry_lister_test, symlink_to_directory_is_not_followed) {
    const auto dir = make_tmp_dir("entries-symlink");
    write_file((std::filesystem::path(dir) / "real" / "f.txt").string());
    std::error_code ec;
    std::filesystem::create_directory_symlink("real", std::filesystem::path(dir) / "link", ec);
    if (ec) {
        std::filesystem::remove_all(dir);
        GTEST_SKIP() << "symlinks not available: " << ec.message();
    }

    auto entries = core::listEntries(dir);
    std::sort(entries.begin(), entries.end());
    const std::vector<core::Entry> expected = { "link", "real/", "real/f.txt" };
    EXPECT_EQ(entries, expected);
    std::filesystem::remove_all(dir);
}
