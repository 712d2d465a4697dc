#include "exec/pipeline.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace zsend::exec;

// ── Helpers ───────────────────────────────────────────────────────────────────

static Command sh(const std::string& script) {
    return Command{"/bin/sh", "-c", script};
}

// ── ProcessPipeline ───────────────────────────────────────────────────────────

class ProcessPipelineTest : public ::testing::Test {
protected:
    StreamResult run(const Command& producer, const Command& consumer) {
        return pipeline_.run(producer, consumer, [this](std::size_t n) {
            ++callbacks_;
            counted_ += n;
            largest_chunk_ = std::max(largest_chunk_, n);
        });
    }

    ProcessPipeline pipeline_;
    uint64_t        counted_ = 0;
    std::size_t     callbacks_ = 0;
    std::size_t     largest_chunk_ = 0;
};

TEST_F(ProcessPipelineTest, MovesEveryByteAndCountsIt) {
    // The consumer checks the byte count itself and fails on a mismatch.
    const auto r = run(sh("head -c 1000000 /dev/zero"),
                       sh("test \"$(wc -c | tr -d ' ')\" = 1000000"));

    EXPECT_TRUE(r.ok()) << r.producer.err << r.consumer.err << r.io_error;
    EXPECT_EQ(r.bytes, 1000000u);
    EXPECT_EQ(counted_, 1000000u);
    EXPECT_GT(callbacks_, 1u);
    EXPECT_LE(largest_chunk_, ProcessPipeline::kChunkSize);
}

TEST_F(ProcessPipelineTest, EmptyStream) {
    const auto r = run(sh("true"), Command{"cat"});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.bytes, 0u);
    EXPECT_EQ(callbacks_, 0u);
}

TEST_F(ProcessPipelineTest, ProducerFailureIsReported) {
    const auto r = run(sh("echo 'cannot open tank/data@s9' >&2; exit 1"), Command{"cat"});

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.producer.exit_status, 1);
    EXPECT_EQ(r.producer.err, "cannot open tank/data@s9\n");
    EXPECT_EQ(r.consumer.exit_status, 0);
}

TEST_F(ProcessPipelineTest, ConsumerFailureIsReported) {
    const auto r = run(sh("head -c 100 /dev/zero"),
                       sh("cat >/dev/null; echo 'cannot receive' >&2; exit 2"));

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.producer.exit_status, 0);
    EXPECT_EQ(r.consumer.exit_status, 2);
    EXPECT_EQ(r.consumer.err, "cannot receive\n");
}

TEST_F(ProcessPipelineTest, ConsumerDyingMidStreamDoesNotKillUs) {
    // The consumer exits without reading; the endless producer must be
    // stopped and the failure surfaced, not hang or raise SIGPIPE here.
    const auto r = run(Command{"cat", "/dev/zero"}, sh("exit 3"));

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.consumer.exit_status, 3);
    EXPECT_NE(r.producer.exit_status, 0);
}

TEST_F(ProcessPipelineTest, UnknownProgramInEitherStage) {
    const auto r = run(Command{"zsend-no-such-program-xyz"}, Command{"cat"});
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.producer.exit_status, 127);

    const auto r2 = run(sh("echo data"), Command{"zsend-no-such-program-xyz"});
    EXPECT_FALSE(r2.ok());
    EXPECT_EQ(r2.consumer.exit_status, 127);
}

TEST_F(ProcessPipelineTest, NullCallbackIsAllowed) {
    const auto r = pipeline_.run(sh("echo hello"), Command{"cat"}, ByteCallback{});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.bytes, 6u);
}
