#ifndef CPUFETCH_HELPERS_PROCESS_HPP
#define CPUFETCH_HELPERS_PROCESS_HPP
/**
 * @file Process.hpp
 * @brief Bounded-wait execution of external inventory commands.
 *
 * Runs a command with stdout captured and stderr discarded. The caller gives a
 * timeout; when it expires the child is killed and TIMED_OUT is reported, so a
 * hung lscpu/sysctl/powershell never blocks the tool indefinitely.
 *
 * @note POSIX: fork/execvp with a poll() loop. Windows: CreateProcess with a
 *       PeekNamedPipe loop.
 */

#include <chrono>  // std::chrono::milliseconds
#include <cstddef> // std::size_t
#include <cstdint> // std::uint8_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace cpufetch {
namespace helpers {
namespace process {

/* ----------------------------- Constants ----------------------------- */

/// Default timeout for external commands.
inline constexpr std::chrono::milliseconds DEFAULT_COMMAND_TIMEOUT{5000};

/// Captured output cap; larger outputs are truncated.
inline constexpr std::size_t MAX_COMMAND_OUTPUT = 1024 * 1024;

/// Exit code a POSIX child uses when execvp fails.
inline constexpr int EXEC_FAILED_EXIT_CODE = 127;

/* ----------------------------- CommandStatus ----------------------------- */

/**
 * @brief Outcome of a command execution.
 */
enum class CommandStatus : std::uint8_t {
  OK = 0,           ///< Exited with status 0
  INVALID_ARGUMENT, ///< Empty argv
  NOT_FOUND,        ///< Executable not found
  SPAWN_FAILED,     ///< pipe/fork/CreateProcess failed
  NON_ZERO_EXIT,    ///< Exited with a non-zero status
  KILLED,           ///< Terminated by a signal
  TIMED_OUT,        ///< Killed after the timeout expired
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(CommandStatus status) noexcept;

/* ----------------------------- CommandResult ----------------------------- */

/**
 * @brief Captured result of runCommand().
 */
struct CommandResult {
  CommandStatus status{CommandStatus::SPAWN_FAILED};
  int exitCode{-1};   ///< Exit status when the child exited normally
  std::string output; ///< Captured stdout (possibly partial on failure)
  std::chrono::milliseconds timeout{0}; ///< Timeout that was applied

  /// @brief True if the command exited with status 0.
  [[nodiscard]] bool ok() const noexcept { return status == CommandStatus::OK; }

  /// @brief One-line description, e.g. "lscpu: timed out after 5000 ms".
  [[nodiscard]] std::string describe(const std::string& command) const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run an external command and capture its stdout.
 * @param argv Program and arguments; argv[0] is searched in PATH.
 * @param timeout Upper bound on the total run time.
 * @return Result with status, exit code and captured output.
 * @note The child runs with LC_ALL=C so reports use stable labels and decimals.
 */
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) noexcept;

} // namespace process
} // namespace helpers
} // namespace cpufetch

#endif // CPUFETCH_HELPERS_PROCESS_HPP
