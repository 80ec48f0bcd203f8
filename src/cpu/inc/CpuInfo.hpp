#ifndef CPUFETCH_CPU_INFO_HPP
#define CPUFETCH_CPU_INFO_HPP
/**
 * @file CpuInfo.hpp
 * @brief Normalized CPU identification record and the result type of every query.
 *
 * A CpuInfoRecord is built fresh on every invocation by the normalizer and is only
 * handed out by value or const reference. It carries no reference to the source
 * data it was built from.
 */

#include "src/cpu/inc/Vendor.hpp"

#include <cstdint>  // std::uint32_t
#include <map>      // std::map
#include <optional> // std::optional
#include <string>   // std::string
#include <utility>  // std::pair
#include <vector>   // std::vector

namespace cpufetch {

namespace cpu {

/* ----------------------------- ExtractionError ----------------------------- */

/**
 * @brief Hard failures of a CPU query.
 *
 * Per-field parse failures never appear here; they only make the field absent.
 */
enum class ExtractionError : std::uint8_t {
  NONE = 0,             ///< Success
  SOURCE_UNAVAILABLE,   ///< Primary source unreadable or command failed
  INSUFFICIENT_DATA,    ///< Source readable but no identifying field found
  UNSUPPORTED_PLATFORM, ///< Operating system has no extraction backend
};

/**
 * @brief Human-readable error string.
 */
[[nodiscard]] const char* toString(ExtractionError error) noexcept;

/* ----------------------------- Outcome ----------------------------- */

/**
 * @brief Value-or-error return used by readers, the normalizer and getCpuInfo().
 * @tparam T Value type; default-constructed when error != NONE.
 */
template <typename T> struct Outcome {
  ExtractionError error{ExtractionError::NONE};
  std::string detail{};            ///< One-line diagnostic when error != NONE
  T value{};                       ///< Valid only when ok()
  std::vector<std::string> notes{}; ///< Non-fatal diagnostics (fallbacks taken)

  [[nodiscard]] bool ok() const noexcept { return error == ExtractionError::NONE; }

  /// @brief Build a failed outcome.
  [[nodiscard]] static Outcome failure(ExtractionError err, std::string why) {
    Outcome out{};
    out.error = err;
    out.detail = std::move(why);
    return out;
  }

  /// @brief Build a successful outcome.
  [[nodiscard]] static Outcome success(T val) {
    Outcome out{};
    out.value = std::move(val);
    return out;
  }
};

/* ----------------------------- Enums ----------------------------- */

/// Byte order of the host CPU.
enum class ByteOrder : std::uint8_t { UNKNOWN = 0, LITTLE, BIG };

/// Cache tier.
enum class CacheLevel : std::uint8_t { L1 = 1, L2 = 2, L3 = 3 };

/// Cache content type.
enum class CacheType : std::uint8_t { INSTRUCTION = 0, DATA, UNIFIED };

/// How a cache level is shared between cores.
enum class CacheSharing : std::uint8_t { PER_CORE = 0, SHARED };

/**
 * @brief What a reported frequency represents.
 *
 * PEAK_OBSERVED is the maximum of per-logical-CPU current clocks. It is only an
 * approximation of the rated speed.
 */
enum class FrequencyKind : std::uint8_t { MAX = 0, BASE, PEAK_OBSERVED };

/**
 * @brief Data source variants, one per platform extraction backend.
 */
enum class CpuInfoSource : std::uint8_t {
  LINUX_PROC = 0, ///< /proc/cpuinfo blocks
  LINUX_SYSFS,    ///< /sys/devices/system/cpu tree, /proc/cpuinfo fallback
  LINUX_LSCPU,    ///< lscpu report
  MAC_SYSCTL,     ///< sysctl property store
  WINDOWS_WMI,    ///< Win32_Processor via PowerShell CIM
};

[[nodiscard]] const char* toString(ByteOrder order) noexcept;
[[nodiscard]] const char* toString(CacheLevel level) noexcept;
[[nodiscard]] const char* toString(CacheType type) noexcept;
[[nodiscard]] const char* toString(FrequencyKind kind) noexcept;
[[nodiscard]] const char* toString(CpuInfoSource source) noexcept;

/**
 * @brief Sharing semantics per level: L1/L2 per core, L3 shared.
 */
[[nodiscard]] CacheSharing cacheSharing(CacheLevel level) noexcept;

/* ----------------------------- CacheSize ----------------------------- */

/**
 * @brief Size of one cache (level, type) in kilobytes.
 */
struct CacheSize {
  std::uint32_t perUnitKb{0}; ///< One instance (core or package)
  std::uint32_t totalKb{0};   ///< Summed across cores, or the shared value

  bool operator==(const CacheSize& other) const noexcept {
    return perUnitKb == other.perUnitKb && totalKb == other.totalKb;
  }
};

/// Cache map key.
using CacheKey = std::pair<CacheLevel, CacheType>;

/* ----------------------------- CoreCluster ----------------------------- */

/**
 * @brief A group of identical cores on a heterogeneous CPU (P-cores, E-cores).
 */
struct CoreCluster {
  std::string name;                      ///< e.g. "Performance", "Efficiency"
  std::uint32_t physicalCores{0};        ///< Cores in this cluster
  std::optional<std::uint32_t> l1iKb{};  ///< L1 instruction per core
  std::optional<std::uint32_t> l1dKb{};  ///< L1 data per core
  std::optional<std::uint32_t> l2Kb{};   ///< L2 per cluster
};

/* ----------------------------- CpuInfoRecord ----------------------------- */

/**
 * @brief Normalized CPU information.
 *
 * Invariants once built by normalize():
 *  - physicalCores >= 1 and logicalCores >= physicalCores
 *  - a missing cache key means "unknown", never zero
 */
struct CpuInfoRecord {
  std::string modelName{};                  ///< Brand string; may be empty
  Vendor vendor{Vendor::UNKNOWN};           ///< Canonical vendor
  std::string vendorId{};                   ///< Raw vendor string from the source
  std::optional<std::string> architecture{}; ///< Machine type (x86_64, aarch64, ...)
  ByteOrder byteOrder{ByteOrder::UNKNOWN};
  std::uint32_t physicalCores{0};
  std::uint32_t logicalCores{0};
  std::optional<double> frequencyGhz{};     ///< See frequencyKind
  FrequencyKind frequencyKind{FrequencyKind::MAX};
  std::map<CacheKey, CacheSize> caches{};
  std::vector<std::string> flags{};         ///< ISA feature tokens, source order
  std::vector<CoreCluster> clusters{};
  CpuInfoSource source{CpuInfoSource::LINUX_PROC};

  /// @brief Canonical vendor key, also the default logo key.
  [[nodiscard]] const char* vendorKey() const noexcept { return cpufetch::cpu::toString(vendor); }

  /// @brief Look up a cache entry.
  [[nodiscard]] std::optional<CacheSize> cache(CacheLevel level, CacheType type) const;

  /// @brief Human-readable single-line summary.
  [[nodiscard]] std::string toString() const;
};

/// Result of a CPU query.
using CpuInfoResult = Outcome<CpuInfoRecord>;

} // namespace cpu

} // namespace cpufetch

#endif // CPUFETCH_CPU_INFO_HPP
