#include "exec/ssh_executor.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

using namespace std::chrono_literals;
using namespace zsend;
using namespace zsend::exec;

using Argv = std::vector<std::string>;

// ════════════════════════════════════════════════════════════════════════════
//  Fake ssh: records every invocation, answers from a script
// ════════════════════════════════════════════════════════════════════════════

struct FakeSsh {
    struct Call {
        Command                   cmd;
        std::chrono::milliseconds timeout;
    };

    // Next results for -O check, master open, and everything else.
    std::deque<CommandResult> check_results;
    std::deque<CommandResult> open_results;
    std::deque<CommandResult> remote_results;
    bool                      open_throws = false;

    std::vector<Call> calls;

    static bool has(const Command& c, const std::string& a) {
        for (const auto& x : c.argv) {
            if (x == a) return true;
        }
        return false;
    }

    static CommandResult pop(std::deque<CommandResult>& q) {
        if (q.empty()) return {};
        auto r = q.front();
        q.pop_front();
        return r;
    }

    CommandResult operator()(const Command& cmd, std::chrono::milliseconds timeout) {
        calls.push_back({cmd, timeout});
        if (has(cmd, "-O") && has(cmd, "check")) return pop(check_results);
        if (has(cmd, "ControlMaster=yes")) {
            if (open_throws) {
                throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                        "fork");
            }
            return pop(open_results);
        }
        if (!remote_results.empty()) return pop(remote_results);
        CommandResult r;
        r.out = "remote-ok\n";
        return r;
    }

    std::size_t count(const std::string& marker) const {
        std::size_t n = 0;
        for (const auto& c : calls) {
            if (has(c.cmd, marker)) ++n;
        }
        return n;
    }
};

static CommandResult failed(int status, std::string err = {}) {
    CommandResult r;
    r.exit_status = status;
    r.err = std::move(err);
    return r;
}

// ════════════════════════════════════════════════════════════════════════════
//  Fixture
// ════════════════════════════════════════════════════════════════════════════

class SshExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_default_logger(spdlog::level::warn);
        fake_ = std::make_shared<FakeSsh>();
    }

    std::unique_ptr<SshExecutor> make(SshTarget target = {"nas", "backup", 2222, "/tmp/cm-%h"}) {
        auto fake = fake_;
        return std::make_unique<SshExecutor>(
            std::move(target), 30s, spdlog::default_logger(),
            [fake](const Command& c, std::chrono::milliseconds t) { return (*fake)(c, t); });
    }

    std::shared_ptr<FakeSsh> fake_;
};

// ────────────────────────────────────────────────────────────────────────────
//  Command builders
// ────────────────────────────────────────────────────────────────────────────

TEST_F(SshExecutorTest, CheckMasterCommand) {
    auto ssh = make();
    EXPECT_EQ(ssh->check_master_command().argv,
              (Argv{"ssh", "-p", "2222", "-o", "ControlPath=/tmp/cm-%h", "-l", "backup",
                    "-O", "check", "nas"}));
}

TEST_F(SshExecutorTest, OpenMasterCommand) {
    auto ssh = make();
    EXPECT_EQ(ssh->open_master_command().argv,
              (Argv{"ssh", "-p", "2222", "-o", "ControlPath=/tmp/cm-%h", "-l", "backup",
                    "-N", "-f", "-q",
                    "-o", "ControlMaster=yes",
                    "-o", "ControlPersist=yes",
                    "-o", "StrictHostKeyChecking=accept-new",
                    "-o", "ConnectTimeout=30",
                    "nas"}));
}

TEST_F(SshExecutorTest, ExitMasterCommand) {
    auto ssh = make();
    EXPECT_EQ(ssh->exit_master_command().argv,
              (Argv{"ssh", "-p", "2222", "-o", "ControlPath=/tmp/cm-%h", "-l", "backup",
                    "-O", "exit", "nas"}));
}

TEST_F(SshExecutorTest, RemoteCommandQuotesArguments) {
    auto ssh = make();
    const auto cmd = ssh->remote_command(Command{"zfs", "list", "-H", "tank/my data"});
    EXPECT_EQ(cmd.argv,
              (Argv{"ssh", "-p", "2222", "-o", "ControlPath=/tmp/cm-%h", "-l", "backup",
                    "-o", "ControlMaster=no", "-o", "BatchMode=yes",
                    "nas", "--", "zfs list -H 'tank/my data'"}));
}

TEST_F(SshExecutorTest, NoUserMeansNoLoginFlag) {
    auto ssh = make(SshTarget{"nas", "", 22, "/tmp/cm"});
    EXPECT_EQ(ssh->check_master_command().argv,
              (Argv{"ssh", "-p", "22", "-o", "ControlPath=/tmp/cm", "-O", "check", "nas"}));
    EXPECT_EQ(ssh->describe(), "nas");
}

TEST_F(SshExecutorTest, Describe) {
    EXPECT_EQ(make()->describe(), "backup@nas");
    EXPECT_TRUE(make()->is_remote());
}

// ────────────────────────────────────────────────────────────────────────────
//  Session lifecycle
// ────────────────────────────────────────────────────────────────────────────

TEST_F(SshExecutorTest, SessionIsOpenedLazilyAndOnlyOnce) {
    fake_->check_results.push_back(failed(255, "Control socket connect: No such file"));
    auto ssh = make();
    EXPECT_EQ(ssh->session_state(), SessionState::Closed);
    EXPECT_TRUE(fake_->calls.empty());

    const auto r1 = ssh->run(Command{"zfs", "list"}, 1000ms);
    const auto r2 = ssh->run(Command{"zfs", "list"}, 1000ms);
    (void)ssh->wrap(Command{"zfs", "send", "tank/data@s1"});

    EXPECT_EQ(r1.out, "remote-ok\n");
    EXPECT_EQ(r2.out, "remote-ok\n");
    EXPECT_EQ(ssh->session_state(), SessionState::Owned);
    EXPECT_EQ(fake_->count("check"), 1u);
    EXPECT_EQ(fake_->count("ControlMaster=yes"), 1u);
    EXPECT_EQ(fake_->count("ControlMaster=no"), 2u);
}

TEST_F(SshExecutorTest, OpenIsBoundedByConnectTimeout) {
    fake_->check_results.push_back(failed(255));
    auto ssh = make();
    ssh->ensure_session();

    ASSERT_EQ(fake_->calls.size(), 2u);
    EXPECT_EQ(fake_->calls[1].timeout, 30s);
}

TEST_F(SshExecutorTest, CommandTimeoutIsPassedThrough) {
    auto ssh = make();
    (void)ssh->run(Command{"zfs", "list"}, 180s);
    EXPECT_EQ(fake_->calls.back().timeout, 180s);
}

TEST_F(SshExecutorTest, ExistingMasterIsReusedAndLeftRunning) {
    // check succeeds (default result)
    {
        auto ssh = make();
        ssh->ensure_session();
        EXPECT_EQ(ssh->session_state(), SessionState::Reused);
    }
    EXPECT_EQ(fake_->count("ControlMaster=yes"), 0u);
    EXPECT_EQ(fake_->count("exit"), 0u);
}

TEST_F(SshExecutorTest, OwnedMasterIsClosedOnDestruction) {
    fake_->check_results.push_back(failed(255));
    {
        auto ssh = make();
        ssh->ensure_session();
        EXPECT_EQ(ssh->session_state(), SessionState::Owned);
    }
    EXPECT_EQ(fake_->count("exit"), 1u);
    EXPECT_EQ(fake_->calls.back().cmd.argv[fake_->calls.back().cmd.argv.size() - 2], "exit");
}

TEST_F(SshExecutorTest, CloseIsIdempotent) {
    fake_->check_results.push_back(failed(255));
    auto ssh = make();
    ssh->ensure_session();
    ssh->close();
    ssh->close();
    EXPECT_EQ(ssh->session_state(), SessionState::Closed);
    EXPECT_EQ(fake_->count("exit"), 1u);
}

// ────────────────────────────────────────────────────────────────────────────
//  Connection failures
// ────────────────────────────────────────────────────────────────────────────

TEST_F(SshExecutorTest, AuthenticationFailureIsConnectionError) {
    fake_->check_results.push_back(failed(255));
    fake_->open_results.push_back(failed(255, "Permission denied (publickey).\n"));
    auto ssh = make();

    try {
        (void)ssh->run(Command{"zfs", "list"}, 1000ms);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.phase(), "connect");
        EXPECT_EQ(e.host(), "backup@nas");
        EXPECT_NE(std::string(e.what()).find("Permission denied"), std::string::npos);
    }
    EXPECT_EQ(ssh->session_state(), SessionState::Closed);
    EXPECT_EQ(fake_->count("ControlMaster=no"), 0u);
}

TEST_F(SshExecutorTest, ConnectTimeoutIsConnectionError) {
    fake_->check_results.push_back(failed(255));
    auto timed_out = failed(137);
    timed_out.timed_out = true;
    fake_->open_results.push_back(timed_out);
    auto ssh = make();

    try {
        ssh->ensure_session();
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_NE(std::string(e.what()).find("within 30s"), std::string::npos);
    }
}

TEST_F(SshExecutorTest, SpawnFailureIsConnectionError) {
    fake_->check_results.push_back(failed(255));
    fake_->open_throws = true;
    auto ssh = make();
    EXPECT_THROW(ssh->ensure_session(), ConnectionError);
}

TEST_F(SshExecutorTest, FailedOpenIsRetriedOnNextUse) {
    fake_->check_results.push_back(failed(255));
    fake_->open_results.push_back(failed(255, "Connection refused"));
    fake_->check_results.push_back(failed(255));
    auto ssh = make();

    EXPECT_THROW(ssh->ensure_session(), ConnectionError);
    EXPECT_NO_THROW(ssh->ensure_session());
    EXPECT_EQ(ssh->session_state(), SessionState::Owned);
}

TEST_F(SshExecutorTest, RemoteCommandFailureIsReturnedNotThrown) {
    fake_->remote_results.push_back(failed(1, "cannot open 'tank/x': dataset does not exist\n"));
    auto ssh = make();

    CommandResult r;
    EXPECT_NO_THROW(r = ssh->run(Command{"zfs", "list", "tank/x"}, 1000ms));
    EXPECT_EQ(r.exit_status, 1);
    EXPECT_NE(r.err.find("dataset does not exist"), std::string::npos);
    EXPECT_THROW(r.check("listing tank/x"), CommandError);
}
