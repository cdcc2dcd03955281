// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

using namespace draftops::util;

TEST_CASE("File utilities", "[files]") {
    // Create a temporary test directory
    auto test_dir = std::filesystem::temp_directory_path() / "draftops_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        // Already present is fine
        REQUIRE(ensure_directory(subdir));
    }

    SECTION("atomic_write_file creates file") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "draft_state.json";

        REQUIRE(atomic_write_file(file_path, "{\"current_pick\": 4}\n"));
        REQUIRE(std::filesystem::exists(file_path));
        REQUIRE(read_file_string(file_path) == std::optional<std::string>("{\"current_pick\": 4}\n"));
    }

    SECTION("atomic_write_file overwrites existing file") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "state.json";

        REQUIRE(atomic_write_file(file_path, "first version, longer than the second"));
        REQUIRE(atomic_write_file(file_path, "second"));
        REQUIRE(read_file_string(file_path) == std::optional<std::string>("second"));

        // No temporary files left behind
        size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            (void)entry;
            entries++;
        }
        REQUIRE(entries == 1);
    }

    SECTION("atomic_write_file applies the requested mode") {
        ensure_directory(test_dir);
        auto file_path = test_dir / "private.json";
        REQUIRE(atomic_write_file(file_path, "{}", 0600));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("atomic_write_file fails without a parent directory") {
        REQUIRE_FALSE(atomic_write_file(test_dir / "missing" / "state.json", "{}"));
    }

    SECTION("read_file_string returns nullopt on non-existent file") {
        REQUIRE_FALSE(read_file_string(test_dir / "nonexistent.json").has_value());
    }

    SECTION("get_default_datadir returns valid path") {
        auto datadir = get_default_datadir();
        REQUIRE(!datadir.empty());
        REQUIRE(datadir.filename().string() == ".draftops");
    }

    // Cleanup
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Data directory lock", "[files][lock]") {
    auto test_dir = std::filesystem::temp_directory_path() / "draftops_lock_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(ensure_directory(test_dir));

    SECTION("Acquire and release") {
        DataDirLock lock(test_dir);
        REQUIRE_FALSE(lock.IsHeld());
        REQUIRE(lock.Acquire() == LockResult::Success);
        REQUIRE(lock.IsHeld());
        REQUIRE(std::filesystem::exists(test_dir / ".lock"));

        // Re-acquiring a held lock is a no-op
        REQUIRE(lock.Acquire() == LockResult::Success);

        lock.Release();
        REQUIRE_FALSE(lock.IsHeld());
        REQUIRE(lock.Acquire() == LockResult::Success);
    }

    SECTION("Custom lock file name") {
        DataDirLock lock(test_dir, "draftopsd.lock");
        REQUIRE(lock.LockFilePath() == test_dir / "draftopsd.lock");
        REQUIRE(lock.Acquire() == LockResult::Success);
    }

    SECTION("Missing directory reports a write error") {
        DataDirLock lock(test_dir / "does" / "not" / "exist");
        REQUIRE(lock.Acquire() == LockResult::ErrorWrite);
        REQUIRE_FALSE(lock.IsHeld());
        REQUIRE_FALSE(lock.GetReason().empty());
    }

    std::filesystem::remove_all(test_dir);
}
