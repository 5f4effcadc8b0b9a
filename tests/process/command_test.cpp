#include "mist/process/command.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using mist::CancellationToken;
using mist::ErrorCode;
using mist::process::CommandOptions;
using mist::process::format_command;
using mist::process::kExecFailedStatus;
using mist::process::run_command;

TEST(CommandTest, CapturesOutput) {
    auto result = run_command({"echo", "hello", "world"});
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_TRUE(result.value().success());
    EXPECT_EQ(result.value().output, "hello world\n");
}

TEST(CommandTest, CapturesStderrToo) {
    auto result = run_command({"sh", "-c", "echo oops >&2; exit 3"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().success());
    EXPECT_EQ(result.value().exit_code, 3);
    EXPECT_EQ(result.value().output, "oops\n");
}

TEST(CommandTest, ArgumentsAreNotShellExpanded) {
    auto result = run_command({"echo", "$HOME;", "*"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().output, "$HOME; *\n");
}

TEST(CommandTest, MissingProgramReportsExecFailure) {
    auto result = run_command({"/nonexistent/mist-program"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().exit_code, kExecFailedStatus);
}

TEST(CommandTest, EmptyCommandIsRejected) {
    auto result = run_command({});
    ASSERT_TRUE(result.is_error());
}

TEST(CommandTest, CancellationTerminatesChild) {
    CancellationToken token;
    CommandOptions options;
    options.cancel = &token;
    options.poll_interval = std::chrono::milliseconds(10);

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.request();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = run_command({"sleep", "5"}, options);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(CommandTest, CancellationWithoutCapture) {
    CancellationToken token;
    token.request();
    CommandOptions options;
    options.capture_output = false;
    options.cancel = &token;

    auto result = run_command({"sleep", "5"}, options);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
}

TEST(CommandTest, FormatCommand) {
    EXPECT_EQ(format_command({"rsync", "-a", "src/", "dst/"}), "rsync -a src/ dst/");
    EXPECT_EQ(format_command({}), "");
}
