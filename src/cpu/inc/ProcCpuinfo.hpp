#ifndef CPUFETCH_CPU_PROC_CPUINFO_HPP
#define CPUFETCH_CPU_PROC_CPUINFO_HPP
/**
 * @file ProcCpuinfo.hpp
 * @brief /proc/cpuinfo reader and field extractor.
 * @note The reader is Linux-only; the extractor is pure text parsing.
 *
 * Format: one block per logical processor separated by blank lines, each line
 * "key<TAB>: value". Key sets differ by architecture:
 *  - x86: vendor_id, model name, physical id, core id, cpu cores, cpu MHz,
 *         cache size, flags
 *  - ARM: CPU implementer, model name or Processor, Features
 *  - PowerPC: cpu, clock
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/Observations.hpp"

#include <string>      // std::string
#include <string_view> // std::string_view

namespace cpufetch {

namespace cpu {

/// Default /proc/cpuinfo location.
inline constexpr const char* PROC_CPUINFO_PATH = "/proc/cpuinfo";

/**
 * @brief Read /proc/cpuinfo verbatim.
 * @param path File to read (overridable for fixtures).
 * @return Raw text, or SOURCE_UNAVAILABLE if the file is unreadable or empty.
 */
[[nodiscard]] Outcome<std::string> readProcCpuinfo(const char* path = PROC_CPUINFO_PATH) noexcept;

/**
 * @brief Parse /proc/cpuinfo text into observations.
 *
 * One LogicalUnit per block containing a "processor" key. "cpu MHz" readings
 * are PEAK_OBSERVED (current clocks). "cache size" is recorded as a unified L2
 * observation when no explicit "L2 cache" line is present. Flags are taken from
 * the first block that lists them.
 */
[[nodiscard]] CpuObservations extractProcCpuinfo(std::string_view text) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_PROC_CPUINFO_HPP
