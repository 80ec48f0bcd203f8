#ifndef CPUFETCH_CPU_VENDOR_HPP
#define CPUFETCH_CPU_VENDOR_HPP
/**
 * @file Vendor.hpp
 * @brief Canonical CPU vendor and raw-vendor-string normalization.
 *
 * Sources report vendors in different shapes: a compact CPUID identifier
 * ("GenuineIntel"), an ARM implementer code ("0x41"), or only a brand string
 * ("Apple M2 Pro"). All of them are reduced to one Vendor value, whose key string
 * is used both for display and for logo lookup.
 */

#include <cstdint>     // std::uint8_t
#include <string_view> // std::string_view

namespace cpufetch {

namespace cpu {

/* ----------------------------- Vendor ----------------------------- */

/**
 * @brief Canonical CPU vendor.
 */
enum class Vendor : std::uint8_t { UNKNOWN = 0, INTEL, AMD, APPLE, NVIDIA, ARM, POWERPC };

/**
 * @brief Canonical vendor key ("Intel", "AMD", "Apple", "NVIDIA", "ARM", "PowerPC",
 *        "Unknown").
 */
[[nodiscard]] const char* toString(Vendor vendor) noexcept;

/* ----------------------------- Normalization ----------------------------- */

/**
 * @brief Map a raw vendor or brand string onto a canonical vendor.
 * @param raw Vendor id, brand string, or any free text.
 * @return First vendor whose name fragment occurs in raw; UNKNOWN otherwise.
 *
 * Matching is case-insensitive substring search in this fixed priority order:
 *  1. Intel   ("genuineintel", "intel")
 *  2. AMD     ("authenticamd", "amd")
 *  3. Apple   ("apple")
 *  4. NVIDIA  ("nvidia")
 *  5. ARM     ("arm", "aarch64")
 *  6. PowerPC ("powerpc", "ppc", "power")
 *
 * A string naming both Intel and AMD therefore resolves to Intel.
 */
[[nodiscard]] Vendor normalizeVendor(std::string_view raw) noexcept;

/**
 * @brief Vendor implied by a machine architecture string.
 * @return ARM for aarch64/arm*, POWERPC for ppc*, UNKNOWN otherwise.
 */
[[nodiscard]] Vendor vendorFromArchitecture(std::string_view arch) noexcept;

/**
 * @brief Name of an ARM "CPU implementer" code from /proc/cpuinfo.
 * @param code Hex code as printed by the kernel (e.g. "0x41").
 * @return Implementer name ("ARM", "NVIDIA", "Apple", ...), or empty view if unknown.
 */
[[nodiscard]] std::string_view armImplementerName(std::string_view code) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_VENDOR_HPP
