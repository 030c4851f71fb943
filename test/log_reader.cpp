#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "log_reader.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;
using sidecar::testing::TempDir;

// NOLINTNEXTLINE
TEST(log_reader, missing_directory) {
    ASSERT_EQ(sidecar::read_log_contents("/nonexistent/sidecar/logs"), "No logs available.");
}

// NOLINTNEXTLINE
TEST(log_reader, empty_directory) {
    TempDir dir;
    dir.write_file("notes.txt", "not a log");
    ASSERT_EQ(sidecar::read_log_contents(dir.path().string()), "No logs available.");
}

// NOLINTNEXTLINE
TEST(log_reader, concatenates_by_modification_time) {
    TempDir dir;
    auto newer = dir.write_file("b-newer.log", "second\n");
    auto older = dir.write_file("z-older.log", "first\n");
    dir.write_file("ignored.txt", "nope");

    auto now = fs::file_time_type::clock::now();
    fs::last_write_time(older, now - std::chrono::hours(2));
    fs::last_write_time(newer, now - std::chrono::hours(1));

    ASSERT_EQ(sidecar::read_log_contents(dir.path().string()),
              "=== z-older.log ===\nfirst\n\n=== b-newer.log ===\nsecond\n");
}

// NOLINTNEXTLINE
TEST(log_reader, skips_directories_and_dangling_links) {
    TempDir dir;
    dir.write_file("worker.log", "ok\n");
    fs::create_directory(dir.path() / "archive.log");
    fs::create_symlink(dir.path() / "gone", dir.path() / "zz-dangling.log");

    ASSERT_EQ(sidecar::read_log_contents(dir.path().string()), "=== worker.log ===\nok\n");
}

// NOLINTNEXTLINE
TEST(log_reader, invalid_utf8_is_replaced) {
    TempDir dir;
    dir.write_file("worker.log", "caf\xe9 latin1 line\n");

    ASSERT_EQ(sidecar::read_log_contents(dir.path().string()),
              "=== worker.log ===\ncaf\xEF\xBF\xBD latin1 line\n");
}
