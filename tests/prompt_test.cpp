#include "cli/prompt.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <sstream>
#include <string>

using namespace zsend::cli;

// ── Fixture ───────────────────────────────────────────────────────────────────

class ConfirmProceedTest : public ::testing::Test {
protected:
    bool answer(const std::string& typed) {
        std::istringstream in{typed};
        return confirm_proceed(in, out_);
    }

    std::size_t times_asked() const {
        std::size_t n = 0;
        const std::string text = out_.str();
        for (auto pos = text.find("Would you like to proceed");
             pos != std::string::npos;
             pos = text.find("Would you like to proceed", pos + 1)) {
            ++n;
        }
        return n;
    }

    std::ostringstream out_;
};

// ── confirm_proceed ───────────────────────────────────────────────────────────

TEST_F(ConfirmProceedTest, LowercaseYesAccepts) {
    EXPECT_TRUE(answer("y\n"));
    EXPECT_EQ(out_.str(), "Would you like to proceed? (y/n) ");
}

TEST_F(ConfirmProceedTest, UppercaseYesAccepts) {
    EXPECT_TRUE(answer("Y\n"));
}

TEST_F(ConfirmProceedTest, NoDeclines) {
    EXPECT_FALSE(answer("n\n"));
    EXPECT_FALSE(answer("N\n"));
}

TEST_F(ConfirmProceedTest, InvalidAnswersAreAskedAgain) {
    EXPECT_TRUE(answer("yes\nmaybe\n\ny\n"));
    EXPECT_EQ(times_asked(), 4u);
    EXPECT_NE(out_.str().find("Would you like to proceed (y/n only)?"), std::string::npos);
}

TEST_F(ConfirmProceedTest, InvalidThenNoDeclines) {
    EXPECT_FALSE(answer("q\nn\ny\n"));
    EXPECT_EQ(times_asked(), 2u);
}

TEST_F(ConfirmProceedTest, EndOfInputDeclines) {
    EXPECT_FALSE(answer(""));
    EXPECT_FALSE(answer("what\n"));
}

TEST_F(ConfirmProceedTest, AnswerWithoutTrailingNewline) {
    EXPECT_TRUE(answer("y"));
}

// ── prompt_line ───────────────────────────────────────────────────────────────

TEST(PromptLine, ReturnsTypedLine) {
    std::istringstream in{"tank/data\nignored\n"};
    std::ostringstream out;
    EXPECT_EQ(prompt_line(in, out, "Enter the SOURCE dataset:"), "tank/data");
    EXPECT_EQ(out.str(), "Enter the SOURCE dataset: ");
}

TEST(PromptLine, EndOfInputIsNullopt) {
    std::istringstream in;
    std::ostringstream out;
    EXPECT_FALSE(prompt_line(in, out, "Enter the DESTINATION dataset:").has_value());
    EXPECT_EQ(out.str(), "Enter the DESTINATION dataset: \n");
}
