#ifndef CPUFETCH_CPU_FIELD_PARSERS_HPP
#define CPUFETCH_CPU_FIELD_PARSERS_HPP
/**
 * @file FieldParsers.hpp
 * @brief Tolerant scalar parsers shared by the per-platform field extractors.
 *
 * Every parser returns std::nullopt for malformed input. A parse failure never
 * becomes a zero or an empty string, so "unknown" stays distinguishable from a
 * real value downstream.
 */

#include "src/cpu/inc/CpuInfo.hpp"

#include <cstdint>     // std::uint32_t
#include <optional>    // std::optional
#include <string_view> // std::string_view

namespace cpufetch {

namespace cpu {

/* ----------------------------- Numbers ----------------------------- */

/**
 * @brief Parse a non-negative decimal integer.
 * @param text Digits, optionally surrounded by whitespace.
 * @return Value, or nullopt for empty, signed, fractional or out-of-range input.
 */
[[nodiscard]] std::optional<std::uint32_t> parseUnsigned(std::string_view text) noexcept;

/**
 * @brief Parse a signed decimal integer (sysfs ids may be -1).
 */
[[nodiscard]] std::optional<int> parseSigned(std::string_view text) noexcept;

/**
 * @brief Parse a decimal floating-point number ("2800.000", "3.5").
 * @return Value, or nullopt if the whole trimmed text is not a number.
 */
[[nodiscard]] std::optional<double> parseDecimal(std::string_view text) noexcept;

/* ----------------------------- Cache Sizes ----------------------------- */

/**
 * @brief Parse a cache size string to kilobytes.
 * @param text Size such as "512K", "2M", "32 KiB", "1.5 MiB" or "1024".
 * @return Size in KB, or nullopt if the string is not a size.
 *
 * Rules:
 *  - K, KB, KiB: kilobytes
 *  - M, MB, MiB: x1024
 *  - G, GB, GiB: x1024*1024
 *  - no suffix: already kilobytes
 *  - decimals are rounded to the nearest KB
 *
 * Suffixes are case-insensitive and may be separated from the number by spaces.
 */
[[nodiscard]] std::optional<std::uint32_t> parseCacheSizeKb(std::string_view text) noexcept;

/**
 * @brief Parse a byte count (sysctl "hw.l1dcachesize") into kilobytes.
 * @return Bytes / 1024, or nullopt for zero or malformed input.
 */
[[nodiscard]] std::optional<std::uint32_t> bytesToKb(std::string_view bytes) noexcept;

/* ----------------------------- Cache Identity ----------------------------- */

/**
 * @brief Map a numeric cache level (1..3) to CacheLevel.
 */
[[nodiscard]] std::optional<CacheLevel> toCacheLevel(int level) noexcept;

/**
 * @brief Parse a cache type name ("Data", "Instruction", "Unified"), case-insensitive.
 */
[[nodiscard]] std::optional<CacheType> parseCacheType(std::string_view text) noexcept;

/* ----------------------------- CPU Lists ----------------------------- */

/**
 * @brief Count CPUs in a kernel CPU list ("0-3,8-11", "0").
 * @return Number of CPUs listed, or nullopt if the list is malformed or empty.
 */
[[nodiscard]] std::optional<std::uint32_t> countCpuList(std::string_view text) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_FIELD_PARSERS_HPP
