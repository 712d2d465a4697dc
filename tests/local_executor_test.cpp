#include "exec/local_executor.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using namespace zsend::exec;

class LocalExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        zsend::init_default_logger(spdlog::level::warn);
    }
};

TEST_F(LocalExecutorTest, RunsCommandsOnThisHost) {
    LocalExecutor local{spdlog::default_logger()};
    const auto r = local.run(Command{"/bin/sh", "-c", "echo tank/data"}, 5000ms);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.out, "tank/data\n");
}

TEST_F(LocalExecutorTest, WrapIsIdentity) {
    LocalExecutor local{spdlog::default_logger()};
    const Command cmd{"zfs", "receive", "-u", "backup/data"};
    EXPECT_EQ(local.wrap(cmd), cmd);
    EXPECT_FALSE(local.is_remote());
    EXPECT_EQ(local.describe(), "localhost");
}

TEST_F(LocalExecutorTest, UsesInjectedRunFunction) {
    std::vector<std::pair<Command, std::chrono::milliseconds>> seen;
    LocalExecutor local{spdlog::default_logger(),
        [&seen](const Command& c, std::chrono::milliseconds t) {
            seen.emplace_back(c, t);
            CommandResult r;
            r.exit_status = 1;
            r.err = "cannot open\n";
            return r;
        }};

    const auto r = local.run(Command{"zfs", "list", "tank/x"}, 180s);
    EXPECT_EQ(r.exit_status, 1);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].first, (Command{"zfs", "list", "tank/x"}));
    EXPECT_EQ(seen[0].second, 180s);
}
