#ifndef CPUFETCH_CPU_LSCPU_HPP
#define CPUFETCH_CPU_LSCPU_HPP
/**
 * @file Lscpu.hpp
 * @brief lscpu report reader and field extractor.
 *
 * lscpu is run with LC_ALL=C so labels and decimal separators are stable.
 * The report is a flat "Label: value" list; newer util-linux versions indent
 * nested labels and print caches as "<total> (<n> instances)".
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
 * @brief Run lscpu and capture its report.
 * @param timeout Upper bound on the command's run time.
 * @return Report text, or SOURCE_UNAVAILABLE (missing, failed or timed out).
 */
[[nodiscard]] Outcome<std::string>
readLscpu(std::chrono::milliseconds timeout = helpers::process::DEFAULT_COMMAND_TIMEOUT) noexcept;

/**
 * @brief Parse an lscpu report.
 *
 * CPU(s) is the reported logical count; Core(s) per socket (or per cluster)
 * times Socket(s) (or Cluster(s)) the reported physical count. "CPU max MHz" is
 * a MAX reading, "CPU MHz" a PEAK_OBSERVED one.
 */
[[nodiscard]] CpuObservations extractLscpu(std::string_view text) noexcept;

/**
 * @brief Parse one lscpu cache value to a per-instance size in KB.
 * @param value "32K", "128 KiB (4 instances)", "8 MiB (1 instance)".
 * @return Per-instance KB (the total divided by the instance count when given).
 */
[[nodiscard]] std::optional<std::uint32_t> parseLscpuCacheKb(std::string_view value) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_LSCPU_HPP
