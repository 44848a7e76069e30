#include "csvsed/io/shell_command_runner.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace csvsed {

class ShellCommandRunnerTest : public ::testing::Test {
protected:
    ShellCommandRunner runner_;
    std::chrono::milliseconds timeout_{5000};
};

TEST_F(ShellCommandRunnerTest, PipesInputThroughCommand)
{
    auto result = runner_.run("tr ab xy", "b,a,c", timeout_);

    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.output, "y,x,c");
    EXPECT_FALSE(result.timed_out);
}

TEST_F(ShellCommandRunnerTest, RunsShellPipelines)
{
    auto result = runner_.run("cut -f2 -d\" \" | tr . ,", "field 1.4", timeout_);

    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.output, "1,4\n");
}

TEST_F(ShellCommandRunnerTest, CapturesStderrAndExitStatus)
{
    auto result = runner_.run("echo oops >&2; exit 3", "", timeout_);

    EXPECT_EQ(result.exit_status, 3);
    EXPECT_EQ(result.error_output, "oops\n");
    EXPECT_TRUE(result.output.empty());
}

TEST_F(ShellCommandRunnerTest, LargeInputDoesNotDeadlock)
{
    std::string input(1 << 20, 'a');
    auto result = runner_.run("cat", input, timeout_);

    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.output.size(), input.size());
}

TEST_F(ShellCommandRunnerTest, CommandIgnoringInputSucceeds)
{
    std::string input(1 << 20, 'a');
    auto result = runner_.run("echo done", input, timeout_);

    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.output, "done\n");
}

TEST_F(ShellCommandRunnerTest, TimesOutHungCommand)
{
    auto start = std::chrono::steady_clock::now();
    auto result = runner_.run("sleep 10", "", std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ShellCommandRunnerTest, UnknownCommandFails)
{
    auto result = runner_.run("csvsed-no-such-command-xyz", "", timeout_);

    EXPECT_EQ(result.exit_status, 127);
    EXPECT_THAT(result.error_output, testing::HasSubstr("not found"));
}

} // namespace csvsed
