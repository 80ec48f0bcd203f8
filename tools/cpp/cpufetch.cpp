/**
 * @file cpufetch.cpp
 * @brief Print a CPU summary beside the vendor's ASCII-art logo.
 *
 * Exit status: 0 on a report or informational text, 1 on a usage error or when
 * CPU information could not be obtained.
 */

#include "src/cli/inc/CommandLine.hpp"
#include "src/cpu/inc/CpuQuery.hpp"
#include "src/display/inc/InfoLayout.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace cli = cpufetch::cli;
namespace cpu = cpufetch::cpu;
namespace display = cpufetch::display;

namespace {

/// Print the text an informational action asks for.
void printInfo(const cli::Options& opts) {
  switch (opts.action) {
  case cli::Action::HELP:
    fmt::print("{}", cli::helpText());
    break;
  case cli::Action::VERSION:
    fmt::print("{}", cli::versionText());
    break;
  case cli::Action::LICENSE:
    fmt::print("{}", cli::licenseText());
    break;
  case cli::Action::COMPLETIONS:
    fmt::print("{}", cli::completionScript(opts.shell));
    break;
  case cli::Action::REPORT:
    break;
  }
}

void printNotes(const std::vector<std::string>& notes) {
  for (const std::string& NOTE : notes) {
    fmt::print(stderr, "note: {}\n", NOTE);
  }
}

} // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string_view> args;
  args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  cli::Options opts;
  std::string error;
  if (!cli::parseCommandLine(args, opts, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    fmt::print(stderr, "Type `{} --help` for usage.\n", cli::PROGRAM_NAME);
    return 1;
  }

  if (opts.action != cli::Action::REPORT) {
    printInfo(opts);
    return 0;
  }

  cpu::QueryOptions query;
  query.timeout = opts.timeout;

  const cpu::CpuInfoResult RESULT =
      opts.source ? cpu::getCpuInfo(*opts.source, query) : cpu::getCpuInfo(query);

  if (opts.verbose) {
    printNotes(RESULT.notes);
  }

  if (!RESULT.ok()) {
    fmt::print(stderr, "Error: {}\n", RESULT.detail);
    return 1;
  }

  if (opts.noLogo) {
    fmt::print("{}", display::renderPlain(RESULT.value));
  } else {
    std::optional<std::string_view> logo;
    if (opts.logoOverride) {
      logo = *opts.logoOverride;
    }
    fmt::print("{}", display::renderWithLogo(RESULT.value, logo));
  }
  return 0;
}
