#ifndef CPUFETCH_CPU_OBSERVATIONS_HPP
#define CPUFETCH_CPU_OBSERVATIONS_HPP
/**
 * @file Observations.hpp
 * @brief Raw candidate values produced by the field extractors.
 *
 * An extractor turns one platform format into a CpuObservations value. Nothing
 * is reduced here: a clock reading per logical CPU stays a separate reading, and
 * each logical CPU keeps its own (package id, core id) pair. The normalizer does
 * all reduction.
 *
 * A field that failed to parse is simply not recorded.
 */

#include "src/cpu/inc/CpuInfo.hpp"

#include <cstdint>  // std::uint32_t
#include <map>      // std::map
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace cpufetch {

namespace cpu {

/// Relative key -> raw value snapshot (sysfs tree, sysctl store).
using PropertyMap = std::map<std::string, std::string>;

/* ----------------------------- Observation Types ----------------------------- */

/// Native unit of a frequency reading.
enum class FrequencyUnit : std::uint8_t { HZ = 0, KHZ, MHZ };

/**
 * @brief One logical processor as seen by the source.
 */
struct LogicalUnit {
  std::optional<int> packageId{}; ///< Physical package ("physical id")
  std::optional<int> coreId{};    ///< Core within the package ("core id")
};

/**
 * @brief One cache description (a sysfs index directory, a report line, ...).
 */
struct CacheObservation {
  std::optional<int> level{};            ///< 1..3 are used; others are ignored
  std::optional<CacheType> type{};
  std::optional<std::uint32_t> sizeKb{}; ///< Size of one instance
};

/**
 * @brief One clock reading in the source's native unit.
 */
struct FrequencyReading {
  double value{0.0};
  FrequencyUnit unit{FrequencyUnit::MHZ};
  FrequencyKind kind{FrequencyKind::PEAK_OBSERVED};
};

/* ----------------------------- CpuObservations ----------------------------- */

/**
 * @brief Everything one source reported, before reduction.
 */
struct CpuObservations {
  CpuInfoSource source{CpuInfoSource::LINUX_PROC};

  std::vector<std::string> modelNames{};  ///< In source order
  std::vector<std::string> vendorNames{}; ///< Raw vendor ids or implementer names
  std::vector<LogicalUnit> units{};
  std::vector<CacheObservation> caches{};
  std::vector<FrequencyReading> frequencies{};
  std::vector<std::string> flags{};
  std::vector<CoreCluster> clusters{};

  std::optional<std::string> architecture{};
  ByteOrder byteOrder{ByteOrder::UNKNOWN};

  std::optional<std::uint32_t> reportedLogicalCores{};  ///< Explicit thread count
  std::optional<std::uint32_t> reportedPhysicalCores{}; ///< Explicit core count

  /// @brief True if nothing at all was recorded.
  [[nodiscard]] bool empty() const noexcept;
};

/* ----------------------------- Precedence ----------------------------- */

/**
 * @brief Combine two sources, keeping every field the primary supplied.
 * @param primary Higher-precedence observations (e.g. sysfs).
 * @param fallback Lower-precedence observations (e.g. /proc/cpuinfo).
 * @return primary with the fields it lacked taken from fallback.
 *
 * Each list is taken as a whole from the fallback only when the primary's list
 * is empty. Caches are merged per (level, type): a fallback cache observation is
 * added only if the primary has none for that key. The result keeps the
 * primary's source tag.
 */
[[nodiscard]] CpuObservations mergeObservations(const CpuObservations& primary,
                                                const CpuObservations& fallback);

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_OBSERVATIONS_HPP
