#ifndef CPUFETCH_HELPERS_ARGS_HPP
#define CPUFETCH_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing with short aliases and "--flag=value" syntax.
 * Tokens that match no flag are rejected. Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace cpufetch {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;        ///< Long flag string, e.g. "--logo"
  std::string_view alias;       ///< Short alias, e.g. "-l" (empty if none)
  std::uint8_t nargs;           ///< Number of values required after the flag (0 or 1 inline)
  bool required;                ///< True if flag must be provided
  std::string_view desc{};      ///< Description for help output (optional)
  std::string_view valueName{}; ///< Value placeholder for help output, e.g. "VENDOR"
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  std::string_view flag;
};

inline void setError(std::optional<std::reference_wrapper<std::string>>& error,
                     std::string message) {
  if (error) {
    error->get() = std::move(message);
  }
}

/// "-l, --logo <VENDOR>" column of the usage table.
inline std::string usageFlagColumn(const ArgDef& def) {
  std::string col = def.alias.empty() ? "    " : fmt::format("{}, ", def.alias);
  col.append(def.flag);
  if (def.nargs > 0) {
    const std::string_view NAME = def.valueName.empty() ? "value" : def.valueName;
    col.append(fmt::format(" <{}>", NAME));
    if (def.nargs > 1) {
      col.append(" ...");
    }
  }
  return col;
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * Fixed-arity parser: when a flag (or its alias) is matched, it consumes the next
 * nargs tokens literally as its values. A long flag written "--flag=value" takes
 * its single value inline. Any token that is not a known flag is an error.
 *
 * @param args   Argument list without the program name (non-owning views; must
 *               outlive the call and the parsed result).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  // Build reverse LUT once: flag and alias -> compact view
  std::unordered_map<std::string_view, detail::ArgDefView> lut;
  lut.reserve(map.size() * 2);
  for (const auto& KV : map) {
    const detail::ArgDefView VIEW{KV.first, KV.second.nargs, KV.second.flag};
    lut.emplace(KV.second.flag, VIEW);
    if (!KV.second.alias.empty()) {
      lut.emplace(KV.second.alias, VIEW);
    }
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    std::string_view tok = args[i];
    std::optional<std::string_view> inlineValue;

    if (tok.size() > 2 && tok.substr(0, 2) == "--") {
      const std::size_t EQ = tok.find('=');
      if (EQ != std::string_view::npos) {
        inlineValue = tok.substr(EQ + 1);
        tok = tok.substr(0, EQ);
      }
    }

    auto it = lut.find(tok);
    if (it == lut.end()) {
      detail::setError(error, fmt::format("Unknown argument '{}'", args[i]));
      return false;
    }

    const detail::ArgDefView& D = it->second;
    auto& out = pargs[D.key];
    out.clear();

    if (inlineValue) {
      if (D.need != 1) {
        detail::setError(error, fmt::format("Flag '{}' does not take an inline value", D.flag));
        return false;
      }
      if (inlineValue->empty()) {
        detail::setError(error, fmt::format("Flag '{}' requires a value", D.flag));
        return false;
      }
      out.push_back(*inlineValue);
      seen.set(D.key);
      continue;
    }

    // Need tokens in [i+1, i+D.need]
    if (i + static_cast<std::size_t>(D.need) >= N) {
      detail::setError(error, D.need == 1
                                  ? fmt::format("Flag '{}' requires a value", D.flag)
                                  : fmt::format("Flag '{}' requires {} values", D.flag, D.need));
      return false;
    }

    out.reserve(D.need);
    for (std::uint8_t k = 0; k < D.need; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(D.key);
    i += D.need;
  }

  // Validate required flags
  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      detail::setError(error, fmt::format("Missing required argument '{}'", KV.second.flag));
      return false;
    }
  }

  return true;
}

/**
 * @brief Build the options table of a usage message.
 *
 * Entries appear in key order, one per line: "  -l, --logo <VENDOR>  desc".
 *
 * @param map Argument definitions to document.
 * @return Formatted table, each line '\n'-terminated.
 */
[[nodiscard]] inline std::string formatOptions(const ArgMap& map) {
  std::vector<std::pair<std::uint8_t, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.emplace_back(KV.first, &KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  // Compute column width for alignment
  std::size_t maxFlagWidth = 16;
  for (const auto& ENTRY : entries) {
    maxFlagWidth = std::max(maxFlagWidth, detail::usageFlagColumn(*ENTRY.second).size());
  }
  maxFlagWidth = std::min<std::size_t>(maxFlagWidth, 30);

  std::string out;
  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;
    std::string line = fmt::format("  {:<{}}  {}", detail::usageFlagColumn(DEF), maxFlagWidth,
                                   DEF.desc);
    if (DEF.required) {
      line.append(DEF.desc.empty() ? "(required)" : " (required)");
    }
    while (!line.empty() && line.back() == ' ') {
      line.pop_back();
    }
    out.append(line);
    out.push_back('\n');
  }
  return out;
}

} // namespace args
} // namespace helpers
} // namespace cpufetch

#endif // CPUFETCH_HELPERS_ARGS_HPP
