#ifndef CPUFETCH_CPU_MAC_SYSCTL_HPP
#define CPUFETCH_CPU_MAC_SYSCTL_HPP
/**
 * @file MacSysctl.hpp
 * @brief macOS sysctl property store reader and field extractor.
 * @note The reader is only functional on Apple platforms; elsewhere it reports
 *       SOURCE_UNAVAILABLE. The extractor is portable.
 *
 * Properties are queried by explicit name through sysctlbyname(). ARM feature
 * flags have no single key, so the text of "sysctl hw.optional.arm." is captured
 * as well.
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/Observations.hpp"
#include "src/helpers/inc/Process.hpp"

#include <chrono> // std::chrono::milliseconds
#include <string> // std::string

namespace cpufetch {

namespace cpu {

/* ----------------------------- MacSysctlSnapshot ----------------------------- */

/**
 * @brief Raw values of the sysctl keys cpufetch understands.
 *
 * Integer properties are stored as decimal strings. Keys that the running
 * kernel does not provide are absent.
 */
struct MacSysctlSnapshot {
  PropertyMap properties{};      ///< sysctl name -> value
  std::string armFeatureReport{}; ///< "hw.optional.arm.FEAT_X: 0|1" lines
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Query the sysctl property store.
 * @param timeout Bound for the "sysctl hw.optional.arm." command.
 * @return Snapshot, or SOURCE_UNAVAILABLE if neither a brand string nor a CPU
 *         count could be read. A failed feature query only adds a note.
 */
[[nodiscard]] Outcome<MacSysctlSnapshot>
readMacSysctl(std::chrono::milliseconds timeout = helpers::process::DEFAULT_COMMAND_TIMEOUT) noexcept;

/**
 * @brief Parse a sysctl snapshot into observations.
 *
 * Keys used:
 *  - machdep.cpu.brand_string, machdep.cpu.vendor, hw.machine
 *  - hw.byteorder (1234 little, 4321 big)
 *  - hw.physicalcpu / hw.logicalcpu, else machdep.cpu.core_count / thread_count
 *  - hw.cpufrequency_max (MAX, Hz), hw.cpufrequency (BASE, Hz)
 *  - hw.l1icachesize, hw.l1dcachesize, hw.l2cachesize, hw.l3cachesize (bytes)
 *  - hw.nperflevels and hw.perflevelN.{name,physicalcpu,l1icachesize,
 *    l1dcachesize,l2cachesize} for core clusters
 *  - machdep.cpu.features + machdep.cpu.leaf7_features (x86 flags)
 */
[[nodiscard]] CpuObservations extractMacSysctl(const MacSysctlSnapshot& snapshot) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_MAC_SYSCTL_HPP
