#ifndef CPUFETCH_CPU_NORMALIZER_HPP
#define CPUFETCH_CPU_NORMALIZER_HPP
/**
 * @file Normalizer.hpp
 * @brief Reduction of CpuObservations to one CpuInfoRecord.
 *
 * Rules:
 *  - Model and vendor: first non-empty observation, no voting.
 *  - Vendor key: vendor string, then model string, then architecture.
 *  - Physical cores: distinct (package, core) pairs; else the reported core
 *    count; else distinct package ids (assumes one core per package, an
 *    approximation); else 1.
 *  - Logical cores: reported thread count, else unit count; never below the
 *    physical count.
 *  - Frequency: kind precedence MAX > BASE > PEAK_OBSERVED, maximum value
 *    within the chosen kind, converted to GHz.
 *  - Caches: per-unit is the largest size seen for the (level, type). Per-core
 *    levels (L1, L2) total per-unit x physical cores; the shared L3 total is the
 *    per-unit value unchanged.
 */

#include "src/cpu/inc/CpuInfo.hpp"
#include "src/cpu/inc/Observations.hpp"

#include <optional> // std::optional

namespace cpufetch {

namespace cpu {

/**
 * @brief Build a record from the observations of one (possibly merged) source.
 * @return Record, or INSUFFICIENT_DATA when no model, vendor or processor count
 *         was observed.
 */
[[nodiscard]] CpuInfoResult normalize(const CpuObservations& obs) noexcept;

/**
 * @brief Convert a reading to GHz.
 */
[[nodiscard]] double toGhz(const FrequencyReading& reading) noexcept;

/**
 * @brief Pick the representative frequency of a reading set.
 * @return Reading in the highest-precedence kind with the largest value, or
 *         nullopt if there is no positive reading.
 */
[[nodiscard]] std::optional<FrequencyReading>
selectFrequency(const std::vector<FrequencyReading>& readings) noexcept;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_NORMALIZER_HPP
