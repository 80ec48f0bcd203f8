/**
 * @file Process_uTest.cpp
 * @brief Unit tests for cpufetch::helpers::process::runCommand.
 *
 * Notes:
 *  - Uses standard POSIX utilities (echo, sh, sleep) found on any Linux host.
 */

#include "src/helpers/inc/Process.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using cpufetch::helpers::process::CommandResult;
using cpufetch::helpers::process::CommandStatus;
using cpufetch::helpers::process::runCommand;
using namespace std::chrono_literals;

#if !defined(_WIN32)

/* ----------------------------- Success ----------------------------- */

/** @test stdout of a successful command is captured. */
TEST(ProcessTest, CapturesOutput) {
  const CommandResult RESULT = runCommand({"echo", "hello"}, 2000ms);
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.exitCode, 0);
  EXPECT_EQ(RESULT.output, "hello\n");
}

/** @test The child runs in the C locale. */
TEST(ProcessTest, ChildUsesCLocale) {
  const CommandResult RESULT = runCommand({"sh", "-c", "echo $LC_ALL"}, 2000ms);
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.output, "C\n");
}

/* ----------------------------- Failures ----------------------------- */

/** @test Empty argv is rejected without spawning. */
TEST(ProcessTest, EmptyArgv) {
  const CommandResult RESULT = runCommand({}, 1000ms);
  EXPECT_EQ(RESULT.status, CommandStatus::INVALID_ARGUMENT);
}

/** @test A missing executable reports NOT_FOUND. */
TEST(ProcessTest, MissingCommand) {
  const CommandResult RESULT = runCommand({"cpufetch-no-such-command-xyz"}, 2000ms);
  EXPECT_EQ(RESULT.status, CommandStatus::NOT_FOUND);
  EXPECT_EQ(RESULT.describe("cpufetch-no-such-command-xyz"),
            "cpufetch-no-such-command-xyz: command not found");
}

/** @test Non-zero exit status is reported with its code. */
TEST(ProcessTest, NonZeroExit) {
  const CommandResult RESULT = runCommand({"sh", "-c", "exit 3"}, 2000ms);
  EXPECT_EQ(RESULT.status, CommandStatus::NON_ZERO_EXIT);
  EXPECT_EQ(RESULT.exitCode, 3);
  EXPECT_EQ(RESULT.describe("sh"), "sh: exited with status 3");
}

/** @test A command outliving its timeout is killed promptly. */
TEST(ProcessTest, TimeoutKillsChild) {
  const auto START = std::chrono::steady_clock::now();
  const CommandResult RESULT = runCommand({"sleep", "5"}, 200ms);
  const auto ELAPSED = std::chrono::steady_clock::now() - START;

  EXPECT_EQ(RESULT.status, CommandStatus::TIMED_OUT);
  EXPECT_LT(ELAPSED, 3s);
  EXPECT_EQ(RESULT.describe("sleep"), "sleep: timed out after 200 ms");
}

#endif // !_WIN32
