#ifndef CPUFETCH_DISPLAY_LOGOS_HPP
#define CPUFETCH_DISPLAY_LOGOS_HPP
/**
 * @file Logos.hpp
 * @brief Vendor ASCII-art logo catalog.
 *
 * Logos are stored with "$C1".."$C9" color placeholders and "$CR" for reset.
 * lookupLogo() substitutes ANSI escape sequences from the logo's palette.
 */

#include <array>       // std::array
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace cpufetch {

namespace display {

/* ----------------------------- Colors ----------------------------- */

inline constexpr std::string_view COLOR_RED = "\x1b[31;1m";
inline constexpr std::string_view COLOR_GREEN = "\x1b[32;1m";
inline constexpr std::string_view COLOR_YELLOW = "\x1b[33;1m";
inline constexpr std::string_view COLOR_BLUE = "\x1b[34;1m";
inline constexpr std::string_view COLOR_MAGENTA = "\x1b[35;1m";
inline constexpr std::string_view COLOR_CYAN = "\x1b[36;1m";
inline constexpr std::string_view COLOR_WHITE = "\x1b[37;1m";
inline constexpr std::string_view COLOR_RESET = "\x1b[m";

/* ----------------------------- Catalog ----------------------------- */

/// Logo names accepted by --logo, in help-text order.
inline constexpr std::array<std::string_view, 6> LOGO_NAMES{"nvidia", "powerpc", "arm",
                                                            "amd",    "intel",   "apple"};

/**
 * @brief Look up a vendor logo.
 * @param vendorKey Canonical vendor key ("Intel"), logo name ("intel") or raw
 *        vendor id ("GenuineIntel", "AuthenticAMD"); case-insensitive.
 * @return Colorized logo lines, or nullopt if no logo exists for the key.
 */
[[nodiscard]] std::optional<std::vector<std::string>> lookupLogo(std::string_view vendorKey);

/**
 * @brief True if name is one of LOGO_NAMES (case-insensitive).
 */
[[nodiscard]] bool isLogoName(std::string_view name) noexcept;

/**
 * @brief Replace "$C<n>" with palette[n-1] and "$CR" with COLOR_RESET.
 *
 * Placeholders beyond the palette are removed.
 */
[[nodiscard]] std::string substituteColors(std::string_view raw,
                                           const std::vector<std::string_view>& palette);

} // namespace display

} // namespace cpufetch

#endif // CPUFETCH_DISPLAY_LOGOS_HPP
