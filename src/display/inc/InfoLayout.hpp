#ifndef CPUFETCH_DISPLAY_INFO_LAYOUT_HPP
#define CPUFETCH_DISPLAY_INFO_LAYOUT_HPP
/**
 * @file InfoLayout.hpp
 * @brief Text rendering of a CpuInfoRecord, with or without a logo.
 *
 * Renderers return the complete text so callers decide where it goes.
 */

#include "src/cpu/inc/CpuInfo.hpp"

#include <cstddef>     // std::size_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace cpufetch {

namespace display {

/* ----------------------------- Constants ----------------------------- */

/// Total terminal width budget for the side-by-side layout.
inline constexpr std::size_t LOGO_LAYOUT_WIDTH = 100;

/// Flag wrap width for the plain layout.
inline constexpr std::size_t PLAIN_LAYOUT_WIDTH = 80;

/// Space between logo column and info column.
inline constexpr std::string_view LOGO_GUTTER = "   ";

/// Label of the flag block; continuation lines are indented to its width.
inline constexpr std::string_view FLAGS_LABEL = "Flags: ";

/* ----------------------------- Helpers ----------------------------- */

/**
 * @brief Printed width of text, skipping ANSI CSI sequences and UTF-8
 *        continuation bytes.
 */
[[nodiscard]] std::size_t visibleWidth(std::string_view text) noexcept;

/**
 * @brief "<per>KB (<total>KB Total)", or "Unknown" when the size is absent.
 */
[[nodiscard]] std::string formatCacheSize(const std::optional<cpu::CacheSize>& size);

/* ----------------------------- Layout ----------------------------- */

/**
 * @brief One line per fact: name, vendor, architecture, byte order,
 *        frequency, cores, L1i/L1d/L2/L3, then core clusters.
 */
[[nodiscard]] std::vector<std::string> buildInfoLines(const cpu::CpuInfoRecord& rec);

/**
 * @brief Wrap flags into a "Flags: a, b, c" block no wider than width.
 *
 * A single flag wider than the budget still gets its own line. Empty flags
 * produce no lines.
 */
[[nodiscard]] std::vector<std::string> wrapFlags(const std::vector<std::string>& flags,
                                                 std::size_t width);

/**
 * @brief Logo and info side by side.
 * @param rec Record to render.
 * @param logoOverride Logo key to use instead of the record's vendor.
 * @return Rendered text, one '\n'-terminated line per row. Falls back to the
 *         info column alone when no logo matches.
 */
[[nodiscard]] std::string renderWithLogo(const cpu::CpuInfoRecord& rec,
                                         std::optional<std::string_view> logoOverride);

/**
 * @brief One fact per line, flags wrapped at PLAIN_LAYOUT_WIDTH.
 */
[[nodiscard]] std::string renderPlain(const cpu::CpuInfoRecord& rec);

} // namespace display

} // namespace cpufetch

#endif // CPUFETCH_DISPLAY_INFO_LAYOUT_HPP
