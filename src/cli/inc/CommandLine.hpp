#ifndef CPUFETCH_CLI_COMMAND_LINE_HPP
#define CPUFETCH_CLI_COMMAND_LINE_HPP
/**
 * @file CommandLine.hpp
 * @brief cpufetch option table, validation and informational texts.
 *
 * Parsing is side-effect free: the caller prints the texts and chooses the exit
 * status, so every path is unit-testable.
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Process.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <cstdint>     // std::uint8_t
#include <optional>    // std::optional
#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view

namespace cpufetch {

namespace cli {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::string_view PROGRAM_NAME = "cpufetch";
inline constexpr std::string_view PROGRAM_VERSION = "0.1.0";
inline constexpr std::string_view PROGRAM_DESCRIPTION =
    "Display CPU model, vendor, topology, frequency and caches beside a vendor logo.";

/* ----------------------------- Types ----------------------------- */

/// Argument keys; their order is the order of the --help table.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_VERSION = 1,
  ARG_LICENSE = 2,
  ARG_COMPLETIONS = 3,
  ARG_NO_LOGO = 4,
  ARG_LOGO = 5,
  ARG_SOURCE = 6,
  ARG_TIMEOUT = 7,
  ARG_VERBOSE = 8,
};

/// What the invocation asks for, in short-circuit priority order.
enum class Action : std::uint8_t {
  REPORT = 0,  ///< Query the CPU and print the report
  HELP,        ///< Print help text
  VERSION,     ///< Print version text
  LICENSE,     ///< Print license text
  COMPLETIONS, ///< Print a shell completion script
};

/// Shells with a completion script.
enum class Shell : std::uint8_t {
  FISH = 0,
  BASH,
  ZSH,
};

/// Validated command-line options.
struct Options {
  Action action{Action::REPORT};
  Shell shell{Shell::BASH};                ///< Valid when action == COMPLETIONS
  bool noLogo{false};                      ///< -n: plain layout
  std::optional<std::string> logoOverride; ///< -l: logo name, lowercase
  std::optional<cpu::CpuInfoSource> source;
  std::chrono::milliseconds timeout{helpers::process::DEFAULT_COMMAND_TIMEOUT};
  bool verbose{false};
};

/* ----------------------------- API ----------------------------- */

/// @brief Flag definitions for cpufetch.
[[nodiscard]] helpers::args::ArgMap buildArgMap();

/**
 * @brief Parse and validate arguments (program name excluded).
 * @param args Argument tokens.
 * @param out Receives validated options on success.
 * @param error Receives the message (without the "Error: " prefix) on failure.
 * @return true on success.
 */
[[nodiscard]] bool parseCommandLine(std::span<const std::string_view> args, Options& out,
                                    std::string& error) noexcept;

/// @brief Lowercase shell name.
[[nodiscard]] const char* toString(Shell shell) noexcept;

/// @brief Case-insensitive shell lookup.
[[nodiscard]] std::optional<Shell> parseShell(std::string_view name) noexcept;

/// @brief Full --help text.
[[nodiscard]] std::string helpText();

/// @brief "cpufetch <version>".
[[nodiscard]] std::string versionText();

/// @brief Copyright and GPLv3 notice.
[[nodiscard]] std::string licenseText();

/// @brief Completion script for the given shell.
[[nodiscard]] std::string completionScript(Shell shell);

} // namespace cli

} // namespace cpufetch

#endif // CPUFETCH_CLI_COMMAND_LINE_HPP
