#ifndef CPUFETCH_CPU_WINDOWS_WMI_HPP
#define CPUFETCH_CPU_WINDOWS_WMI_HPP
/**
 * @file WindowsWmi.hpp
 * @brief Win32_Processor report reader and field extractor.
 *
 * The reader runs PowerShell's Get-CimInstance and formats the result as a
 * list: one "Label : value" block per processor package, blocks separated by
 * blank lines. Win32_Processor reports L2CacheSize and L3CacheSize in KB per
 * package and clock speeds in MHz.
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/Observations.hpp"
#include "src/helpers/inc/Process.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <string>      // std::string
#include <string_view> // std::string_view

namespace cpufetch {

namespace cpu {

/**
 * @brief Run the Win32_Processor query and capture its list output.
 * @param timeout Upper bound on the PowerShell run time.
 * @return Report text, or SOURCE_UNAVAILABLE.
 */
[[nodiscard]] Outcome<std::string>
readWindowsWmi(std::chrono::milliseconds timeout = helpers::process::DEFAULT_COMMAND_TIMEOUT) noexcept;

/**
 * @brief Parse a Win32_Processor list report.
 *
 * Core and thread counts are summed across packages. L2 per-unit is the package
 * L2 divided by its core count; L3 is the package value. MaxClockSpeed is a MAX
 * reading, CurrentClockSpeed a PEAK_OBSERVED one.
 */
[[nodiscard]] CpuObservations extractWindowsWmi(std::string_view text) noexcept;

/**
 * @brief Architecture name for a Win32_Processor.Architecture code.
 * @return "x86", "ARM", "ia64", "x86_64", "aarch64", or empty if unknown.
 */
[[nodiscard]] std::string_view wmiArchitectureName(std::uint32_t code) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_WINDOWS_WMI_HPP
