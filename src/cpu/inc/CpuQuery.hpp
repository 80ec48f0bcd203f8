#ifndef CPUFETCH_CPU_QUERY_HPP
#define CPUFETCH_CPU_QUERY_HPP
/**
 * @file CpuQuery.hpp
 * @brief Source selection and the read -> extract -> normalize pipeline.
 *
 * Each CpuInfoSource variant pairs one reader with one extractor. The active
 * variant is chosen once, from the compile-time platform or from the command
 * line, and dispatched with a switch.
 *
 * Platform defaults:
 *  - Linux:   LINUX_SYSFS (sysfs primary, /proc/cpuinfo fallback), then
 *             LINUX_LSCPU if the sysfs tree is unavailable
 *  - macOS:   MAC_SYSCTL
 *  - Windows: WINDOWS_WMI
 *
 * Any other operating system yields UNSUPPORTED_PLATFORM before any read.
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/ProcCpuinfo.hpp"
#include "src/cpu/inc/SysfsCpu.hpp"
#include "src/helpers/inc/Process.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace cpufetch {

namespace cpu {

/* ----------------------------- QueryOptions ----------------------------- */

/**
 * @brief Tunables for a CPU query.
 */
struct QueryOptions {
  std::chrono::milliseconds timeout{helpers::process::DEFAULT_COMMAND_TIMEOUT}; ///< Per command
  std::string procCpuinfoPath{PROC_CPUINFO_PATH};
  std::string sysfsRoot{SYSFS_CPU_ROOT};
};

/* ----------------------------- Platform ----------------------------- */

/**
 * @brief Lowercase name of the host operating system ("linux", "macos", ...).
 */
[[nodiscard]] std::string hostOsName();

/**
 * @brief Default source for the host platform; nullopt if unsupported.
 */
[[nodiscard]] std::optional<CpuInfoSource> defaultCpuInfoSource() noexcept;

/**
 * @brief True if the source variant can run on this build's platform.
 */
[[nodiscard]] bool isSourceSupported(CpuInfoSource source) noexcept;

/**
 * @brief Parse a source name as printed by toString(CpuInfoSource), case-insensitive.
 */
[[nodiscard]] std::optional<CpuInfoSource> parseCpuInfoSource(std::string_view name) noexcept;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run one source variant end to end.
 * @return Record, or the first hard failure. Fallbacks taken are listed in notes.
 */
[[nodiscard]] CpuInfoResult getCpuInfo(CpuInfoSource source,
                                       const QueryOptions& options = QueryOptions{}) noexcept;

/**
 * @brief Run the platform's default source.
 * @return UNSUPPORTED_PLATFORM ("Unsupported operating system: <name>") on
 *         platforms without a backend.
 */
[[nodiscard]] CpuInfoResult getCpuInfo(const QueryOptions& options = QueryOptions{}) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_QUERY_HPP
