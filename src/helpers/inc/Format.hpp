#ifndef CPUFETCH_HELPERS_FORMAT_HPP
#define CPUFETCH_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting of cache sizes and clock speeds.
 *
 * Uses fmt library for string formatting.
 */

#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace cpufetch {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a kilobyte count verbatim (e.g., "512KB").
 */
[[nodiscard]] inline std::string kilobytes(std::uint32_t kb) { return fmt::format("{}KB", kb); }

/**
 * @brief Format a kilobyte count, switching to megabytes from 1000 KB up.
 * @return e.g. "192KB", "16.0MB".
 */
[[nodiscard]] inline std::string kilobytesCompact(std::uint32_t kb) {
  if (kb >= 1000U) {
    return fmt::format("{:.1f}MB", static_cast<double>(kb) / 1024.0);
  }
  return kilobytes(kb);
}

/**
 * @brief Format a clock speed in GHz with three decimals (e.g., "3.500 GHz").
 */
[[nodiscard]] inline std::string gigahertz(double ghz) { return fmt::format("{:.3f} GHz", ghz); }

} // namespace format
} // namespace helpers
} // namespace cpufetch

#endif // CPUFETCH_HELPERS_FORMAT_HPP
