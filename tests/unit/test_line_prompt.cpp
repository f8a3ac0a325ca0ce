#include <gtest/gtest.h>
#include "handoff/core/line_prompt.hpp"
#include "../test_helpers.hpp"
#include <sstream>
#include <unistd.h>

using namespace handoff::core;
using handoff::testing::run_until;
using handoff::testing::run_for;

class LinePromptTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(fds), 0);
        prompt = LinePrompt::create(io, fds[0], out);
    }
    
    void TearDown() override {
        prompt.reset();
        ::close(fds[0]);
        close_writer();
    }
    
    void type(const std::string& text) {
        ASSERT_EQ(::write(fds[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    }
    
    void close_writer() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
    
    boost::asio::io_context io;
    std::ostringstream out;
    int fds[2] = {-1, -1};
    std::shared_ptr<LinePrompt> prompt;
};

TEST_F(LinePromptTest, AnswersTheOpenPrompt) {
    std::optional<std::string> answer;
    bool answered = false;
    prompt->ask("Accept? [y/N] ", [&](std::optional<std::string> line) {
        answer = std::move(line);
        answered = true;
    });
    EXPECT_EQ(out.str(), "Accept? [y/N] ");
    EXPECT_TRUE(prompt->is_waiting());
    
    type("  yes \n");
    ASSERT_TRUE(run_until(io, [&] { return answered; }));
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(*answer, "yes");
    EXPECT_FALSE(prompt->is_waiting());
}

TEST_F(LinePromptTest, NewPromptTakesOverUnansweredOne) {
    int first_calls = 0;
    std::optional<std::string> second;
    prompt->ask("first? ", [&](std::optional<std::string>) { ++first_calls; });
    run_for(io, std::chrono::milliseconds(20));
    
    prompt->ask("second? ", [&](std::optional<std::string> line) { second = std::move(line); });
    type("y\n");
    ASSERT_TRUE(run_until(io, [&] { return second.has_value(); }));
    
    EXPECT_EQ(*second, "y");
    EXPECT_EQ(first_calls, 0);
}

TEST_F(LinePromptTest, InputWithoutPromptIsDiscarded) {
    type("stray\n");
    run_for(io, std::chrono::milliseconds(30));
    
    std::optional<std::string> answer;
    prompt->ask("PIN: ", [&](std::optional<std::string> line) { answer = std::move(line); });
    type("1234\n");
    ASSERT_TRUE(run_until(io, [&] { return answer.has_value(); }));
    EXPECT_EQ(*answer, "1234");
}

TEST_F(LinePromptTest, ClosedInputAnswersWithNothing) {
    bool answered = false;
    std::optional<std::string> answer = "unset";
    prompt->ask("Accept? ", [&](std::optional<std::string> line) {
        answer = std::move(line);
        answered = true;
    });
    
    close_writer();
    ASSERT_TRUE(run_until(io, [&] { return answered; }));
    EXPECT_FALSE(answer.has_value());
    EXPECT_TRUE(prompt->is_closed());
    
    bool again = false;
    prompt->ask("PIN: ", [&](std::optional<std::string> line) { again = !line.has_value(); });
    ASSERT_TRUE(run_until(io, [&] { return again; }));
}

TEST_F(LinePromptTest, DestroyingPromptDropsPendingHandler) {
    int calls = 0;
    prompt->ask("Accept? ", [&](std::optional<std::string>) { ++calls; });
    prompt.reset();
    
    type("y\n");
    run_for(io, std::chrono::milliseconds(30));
    EXPECT_EQ(calls, 0);
}
