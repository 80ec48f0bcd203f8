/**
 * @file CommandLine.cpp
 * @brief Option validation, help, version, license and completion texts.
 */

#include "src/cli/inc/CommandLine.hpp"
#include "src/cpu/inc/CpuQuery.hpp"
#include "src/cpu/inc/FieldParsers.hpp"
#include "src/display/inc/Logos.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array> // std::array

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace cpufetch {

namespace cli {

using cpufetch::helpers::args::ArgMap;
using cpufetch::helpers::args::ParsedArgs;
using cpufetch::helpers::strings::equalsIgnoreCase;
using cpufetch::helpers::strings::toLower;

namespace {

constexpr std::array<Shell, 3> ALL_SHELLS{Shell::FISH, Shell::BASH, Shell::ZSH};

constexpr std::array<std::string_view, 5> SOURCE_NAMES{"proc", "sysfs", "lscpu", "sysctl", "wmi"};

constexpr std::string_view FISH_COMPLETIONS = R"(# Fish completions for cpufetch
complete -c cpufetch -s h -l help -d 'Print help information'
complete -c cpufetch -s V -l version -d 'Print version information'
complete -c cpufetch -l license -d 'Display license information'
complete -c cpufetch -s n -l no-logo -d 'Disable logo display'
complete -c cpufetch -s l -l logo -x -a 'nvidia powerpc arm amd intel apple' -d 'Override logo display with specific vendor'
complete -c cpufetch -s s -l source -x -a 'proc sysfs lscpu sysctl wmi' -d 'Data source'
complete -c cpufetch -s t -l timeout -x -d 'External command timeout in milliseconds'
complete -c cpufetch -s v -l verbose -d 'Print source diagnostics'
complete -c cpufetch -l completions -x -a 'fish bash zsh' -d 'Generate shell completions'
)";

constexpr std::string_view BASH_COMPLETIONS = R"(# Bash completions for cpufetch
_cpufetch() {
    local cur prev opts
    COMPREPLY=()
    cur="${COMP_WORDS[COMP_CWORD]}"
    prev="${COMP_WORDS[COMP_CWORD-1]}"
    opts="-h --help -V --version --license -n --no-logo -l --logo -s --source -t --timeout -v --verbose --completions"

    case "${prev}" in
        --logo|-l)
            COMPREPLY=($(compgen -W "nvidia powerpc arm amd intel apple" -- "${cur}"))
            return 0
            ;;
        --source|-s)
            COMPREPLY=($(compgen -W "proc sysfs lscpu sysctl wmi" -- "${cur}"))
            return 0
            ;;
        --timeout|-t)
            return 0
            ;;
        --completions)
            COMPREPLY=($(compgen -W "fish bash zsh" -- "${cur}"))
            return 0
            ;;
    esac

    COMPREPLY=($(compgen -W "${opts}" -- "${cur}"))
}
complete -F _cpufetch cpufetch
)";

constexpr std::string_view ZSH_COMPLETIONS = R"(#compdef cpufetch
# Zsh completions for cpufetch

_cpufetch() {
    _arguments \
        '(-h --help)'{-h,--help}'[Print help information]' \
        '(-V --version)'{-V,--version}'[Print version information]' \
        '--license[Display license information]' \
        '(-n --no-logo)'{-n,--no-logo}'[Disable logo display]' \
        '(-l --logo)'{-l,--logo}'[Override logo display with specific vendor]:vendor:(nvidia powerpc arm amd intel apple)' \
        '(-s --source)'{-s,--source}'[Data source]:source:(proc sysfs lscpu sysctl wmi)' \
        '(-t --timeout)'{-t,--timeout}'[External command timeout in milliseconds]:milliseconds:' \
        '(-v --verbose)'{-v,--verbose}'[Print source diagnostics]' \
        '--completions[Generate shell completions]:shell:(fish bash zsh)'
}

_cpufetch "$@"
)";

/// Single value of a one-argument flag, if it was given.
std::optional<std::string_view> valueOf(const ParsedArgs& pargs, ArgKey key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

bool has(const ParsedArgs& pargs, ArgKey key) { return pargs.count(key) != 0; }

} // namespace

/* ----------------------------- Shell ----------------------------- */

const char* toString(Shell shell) noexcept {
  switch (shell) {
  case Shell::FISH:
    return "fish";
  case Shell::BASH:
    return "bash";
  case Shell::ZSH:
    return "zsh";
  }
  return "unknown";
}

std::optional<Shell> parseShell(std::string_view name) noexcept {
  for (const Shell SHELL : ALL_SHELLS) {
    if (equalsIgnoreCase(name, toString(SHELL))) {
      return SHELL;
    }
  }
  return std::nullopt;
}

/* ----------------------------- Parsing ----------------------------- */

ArgMap buildArgMap() {
  ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, "Print help information"};
  map[ARG_VERSION] = {"--version", "-V", 0, false, "Print version information"};
  map[ARG_LICENSE] = {"--license", "", 0, false, "Display license information"};
  map[ARG_COMPLETIONS] = {"--completions", "", 1, false,
                          "Generate shell completions (fish, bash, zsh)", "SHELL"};
  map[ARG_NO_LOGO] = {"--no-logo", "-n", 0, false, "Disable logo display"};
  map[ARG_LOGO] = {"--logo", "-l", 1, false, "Override logo display with specific vendor",
                   "VENDOR"};
  map[ARG_SOURCE] = {"--source", "-s", 1, false, "Data source (proc, sysfs, lscpu, sysctl, wmi)",
                     "SOURCE"};
  map[ARG_TIMEOUT] = {"--timeout", "-t", 1, false, "External command timeout in milliseconds",
                      "MS"};
  map[ARG_VERBOSE] = {"--verbose", "-v", 0, false, "Print source diagnostics to stderr"};
  return map;
}

bool parseCommandLine(std::span<const std::string_view> args, Options& out,
                      std::string& error) noexcept {
  const ArgMap MAP = buildArgMap();
  ParsedArgs pargs;
  if (!helpers::args::parseArgs(args, MAP, pargs, error)) {
    return false;
  }

  Options opts;

  if (const auto SHELL = valueOf(pargs, ARG_COMPLETIONS)) {
    const auto PARSED = parseShell(*SHELL);
    if (!PARSED) {
      error = fmt::format("Unsupported shell '{}'. Supported shells: fish, bash, zsh", *SHELL);
      return false;
    }
    opts.shell = *PARSED;
  }

  if (const auto LOGO = valueOf(pargs, ARG_LOGO)) {
    if (!display::isLogoName(*LOGO)) {
      error = fmt::format("Invalid logo '{}'. Valid vendors: {}", *LOGO,
                          fmt::join(display::LOGO_NAMES, ", "));
      return false;
    }
    opts.logoOverride = toLower(*LOGO);
  }

  if (const auto SOURCE = valueOf(pargs, ARG_SOURCE)) {
    opts.source = cpu::parseCpuInfoSource(*SOURCE);
    if (!opts.source) {
      error = fmt::format("Invalid source '{}'. Valid sources: {}", *SOURCE,
                          fmt::join(SOURCE_NAMES, ", "));
      return false;
    }
  }

  if (const auto TIMEOUT = valueOf(pargs, ARG_TIMEOUT)) {
    const auto MS = cpu::parseUnsigned(*TIMEOUT);
    if (!MS || *MS == 0) {
      error = fmt::format("Invalid timeout '{}'. Expected a positive number of milliseconds",
                          *TIMEOUT);
      return false;
    }
    opts.timeout = std::chrono::milliseconds{*MS};
  }

  opts.noLogo = has(pargs, ARG_NO_LOGO);
  opts.verbose = has(pargs, ARG_VERBOSE);

  if (has(pargs, ARG_HELP)) {
    opts.action = Action::HELP;
  } else if (has(pargs, ARG_VERSION)) {
    opts.action = Action::VERSION;
  } else if (has(pargs, ARG_LICENSE)) {
    opts.action = Action::LICENSE;
  } else if (has(pargs, ARG_COMPLETIONS)) {
    opts.action = Action::COMPLETIONS;
  }

  out = std::move(opts);
  return true;
}

/* ----------------------------- Texts ----------------------------- */

std::string helpText() {
  std::string out = fmt::format("{} {}\n{}\n\n", PROGRAM_NAME, PROGRAM_VERSION, PROGRAM_DESCRIPTION);
  out += fmt::format("Usage: {} [OPTIONS]\n\n", PROGRAM_NAME);
  out += "Options:\n";
  out += helpers::args::formatOptions(buildArgMap());
  out += fmt::format("\nValid vendors: {}\n", fmt::join(display::LOGO_NAMES, ", "));
  out += "\nExamples:\n";
  out += fmt::format("  {}                    Display CPU info with auto-detected logo\n",
                     PROGRAM_NAME);
  out += fmt::format("  {} --no-logo          Display CPU info without logo\n", PROGRAM_NAME);
  out += fmt::format("  {} --logo intel       Display CPU info with Intel logo\n", PROGRAM_NAME);
  out += fmt::format("  {} --source lscpu -v  Read lscpu output and print diagnostics\n",
                     PROGRAM_NAME);
  return out;
}

std::string versionText() { return fmt::format("{} {}\n", PROGRAM_NAME, PROGRAM_VERSION); }

std::string licenseText() {
  return fmt::format(
      "Copyright (C) 2025 - Present: Kenneth A. Jenkins, Alan D. Aguilar, & contributors.\n"
      "Licensed under the GNU GPLv3: GNU General Public License version 3.\n"
      "{0} comes with ABSOLUTELY NO WARRANTY.\n"
      "\n"
      "A copy of the GNU General Public License Version 3 should\n"
      "have been provided with {0}. If not, you can\n"
      "find it at: <https://www.gnu.org/licenses/gpl-3.0.html>.\n"
      "\n"
      "This is free software, and you are welcome to redistribute it\n"
      "under certain conditions, as described above. Type `{0} --help` for assistance.\n",
      PROGRAM_NAME);
}

std::string completionScript(Shell shell) {
  switch (shell) {
  case Shell::FISH:
    return std::string(FISH_COMPLETIONS);
  case Shell::BASH:
    return std::string(BASH_COMPLETIONS);
  case Shell::ZSH:
    return std::string(ZSH_COMPLETIONS);
  }
  return {};
}

} // namespace cli

} // namespace cpufetch
