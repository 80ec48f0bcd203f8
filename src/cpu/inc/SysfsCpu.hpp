#ifndef CPUFETCH_CPU_SYSFS_CPU_HPP
#define CPUFETCH_CPU_SYSFS_CPU_HPP
/**
 * @file SysfsCpu.hpp
 * @brief /sys/devices/system/cpu snapshot and field extractor.
 * @note Linux-only reader. The extractor works on a PropertyMap so it can be
 *       exercised without a sysfs mount.
 *
 * Snapshot keys are paths relative to the root:
 *  - online
 *  - cpuN/topology/{physical_package_id,core_id}
 *  - cpuN/cache/indexK/{level,type,size}
 *  - cpuN/cpufreq/{cpuinfo_max_freq,base_frequency,scaling_cur_freq}  (kHz)
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/Observations.hpp"

namespace cpufetch {

namespace cpu {

/// Default sysfs CPU root.
inline constexpr const char* SYSFS_CPU_ROOT = "/sys/devices/system/cpu";

/**
 * @brief Snapshot the attribute files that exist under root.
 * @param root Directory to scan (overridable for fixtures).
 * @return Relative path -> trimmed content, or SOURCE_UNAVAILABLE if root is
 *         missing or has no readable cpuN entry.
 */
[[nodiscard]] Outcome<PropertyMap> readSysfsCpuTree(const char* root = SYSFS_CPU_ROOT) noexcept;

/**
 * @brief Parse a sysfs snapshot into observations.
 *
 * One LogicalUnit per cpuN with any recorded attribute, one CacheObservation per
 * cpuN/cache/indexK. Frequencies: cpuinfo_max_freq is MAX, base_frequency is
 * BASE, scaling_cur_freq is PEAK_OBSERVED. "online" becomes the reported
 * logical count.
 */
[[nodiscard]] CpuObservations extractSysfsCpuTree(const PropertyMap& tree) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_SYSFS_CPU_HPP
