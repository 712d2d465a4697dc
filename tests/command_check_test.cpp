#include "common/command_check.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Fixture ───────────────────────────────────────────────────────────────────

class CommandCheckTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("zsend_command_check_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path make_file(const std::string& name, bool executable) {
        const auto p = dir_ / name;
        std::ofstream(p) << "#!/bin/sh\nexit 0\n";
        ::chmod(p.c_str(), executable ? 0755 : 0644);
        return p;
    }

    fs::path dir_;
};

// ── find_in_path ──────────────────────────────────────────────────────────────

TEST_F(CommandCheckTest, FindsExecutableInGivenPath) {
    const auto tool = make_file("zfs", true);
    const std::string path = "/nonexistent-dir:" + dir_.string();

    const auto found = zsend::find_in_path("zfs", path);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, tool);
}

TEST_F(CommandCheckTest, IgnoresNonExecutableFiles) {
    make_file("zfs", false);
    EXPECT_FALSE(zsend::find_in_path("zfs", dir_.string()).has_value());
}

TEST_F(CommandCheckTest, IgnoresDirectories) {
    fs::create_directories(dir_ / "ssh");
    EXPECT_FALSE(zsend::find_in_path("ssh", dir_.string()).has_value());
}

TEST_F(CommandCheckTest, NamesWithSlashAreCheckedDirectly) {
    const auto tool = make_file("tool", true);
    const auto found = zsend::find_in_path(tool.string(), std::string_view{"/nonexistent-dir"});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, tool);
}

TEST_F(CommandCheckTest, EmptyNameIsNeverFound) {
    EXPECT_FALSE(zsend::find_in_path("", dir_.string()).has_value());
}

// ── missing_commands ──────────────────────────────────────────────────────────

TEST_F(CommandCheckTest, ReportsOnlyMissingCommands) {
    const auto missing = zsend::missing_commands({"sh", "zsend-no-such-tool-xyz"});
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0], "zsend-no-such-tool-xyz");
}
