/**
 * @file MacSysctl.cpp
 * @brief sysctl queries and property-store extraction.
 */

#include "src/cpu/inc/MacSysctl.hpp"
#include "src/cpu/inc/FieldParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

#if defined(__APPLE__)
#include <sys/sysctl.h>
#include <sys/types.h>

#include <cstring> // std::memcpy, strnlen
#endif

#include <algorithm> // std::min
#include <array>     // std::array
#include <cstdint>   // std::uint64_t

#include <fmt/core.h>

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::strings::splitKeyValue;
using cpufetch::helpers::strings::splitLines;
using cpufetch::helpers::strings::splitTokens;
using cpufetch::helpers::strings::startsWith;
using cpufetch::helpers::strings::trim;

namespace {

constexpr std::string_view ARM_FEATURE_PREFIX = "hw.optional.arm.";

/// Upper bound on hw.nperflevels worth querying.
constexpr std::uint32_t MAX_PERF_LEVELS = 4;

#if defined(__APPLE__)

constexpr std::array<const char*, 5> STRING_KEYS{
    "machdep.cpu.brand_string", "machdep.cpu.vendor", "machdep.cpu.features",
    "machdep.cpu.leaf7_features", "hw.machine"};

constexpr std::array<const char*, 12> INTEGER_KEYS{
    "hw.byteorder",           "hw.physicalcpu",           "hw.logicalcpu",
    "machdep.cpu.core_count", "machdep.cpu.thread_count", "hw.cpufrequency",
    "hw.cpufrequency_max",    "hw.l1icachesize",          "hw.l1dcachesize",
    "hw.l2cachesize",         "hw.l3cachesize",           "hw.nperflevels"};

constexpr std::array<const char*, 5> PERF_LEVEL_INTEGER_KEYS{
    "physicalcpu", "logicalcpu", "l1icachesize", "l1dcachesize", "l2cachesize"};

/// String-valued sysctl; false if the key does not exist.
bool sysctlString(const char* name, std::string& out) {
  std::size_t size = 0;
  if (::sysctlbyname(name, nullptr, &size, nullptr, 0) != 0 || size == 0) {
    return false;
  }
  std::string buf(size, '\0');
  if (::sysctlbyname(name, buf.data(), &size, nullptr, 0) != 0) {
    return false;
  }
  buf.resize(::strnlen(buf.c_str(), size));
  out = std::string(trim(buf));
  return !out.empty();
}

/// Integer-valued sysctl (32 or 64 bit); false if the key does not exist.
bool sysctlInteger(const char* name, std::uint64_t& out) noexcept {
  std::uint64_t value = 0;
  std::size_t size = sizeof(value);
  if (::sysctlbyname(name, &value, &size, nullptr, 0) != 0) {
    return false;
  }
  if (size == sizeof(std::uint32_t)) {
    std::uint32_t narrow = 0;
    std::memcpy(&narrow, &value, sizeof(narrow));
    value = narrow;
  }
  out = value;
  return true;
}

void snapshotString(const char* name, PropertyMap& out) {
  std::string value;
  if (sysctlString(name, value)) {
    out.emplace(name, std::move(value));
  }
}

void snapshotInteger(const char* name, PropertyMap& out) {
  std::uint64_t value = 0;
  if (sysctlInteger(name, value)) {
    out.emplace(name, std::to_string(value));
  }
}

#endif // __APPLE__

/// Property value or empty view.
std::string_view property(const PropertyMap& props, const std::string& key) {
  const auto IT = props.find(key);
  return IT == props.end() ? std::string_view{} : std::string_view{IT->second};
}

/// Byte-valued cache property converted to KB.
std::optional<std::uint32_t> cacheKb(const PropertyMap& props, const std::string& key) {
  return bytesToKb(property(props, key));
}

void addCache(CpuObservations& obs, int level, CacheType type, std::optional<std::uint32_t> kb) {
  if (!kb) {
    return;
  }
  CacheObservation cache{};
  cache.level = level;
  cache.type = type;
  cache.sizeKb = kb;
  obs.caches.push_back(cache);
}

/// Default cluster name when hw.perflevelN.name is missing.
std::string defaultClusterName(std::uint32_t level) {
  if (level == 0) {
    return "Performance";
  }
  if (level == 1) {
    return "Efficiency";
  }
  return fmt::format("Level {}", level);
}

} // namespace

/* ----------------------------- Reader ----------------------------- */

Outcome<MacSysctlSnapshot> readMacSysctl(std::chrono::milliseconds timeout) noexcept {
#if defined(__APPLE__)
  MacSysctlSnapshot snap{};
  for (const char* KEY : STRING_KEYS) {
    snapshotString(KEY, snap.properties);
  }
  for (const char* KEY : INTEGER_KEYS) {
    snapshotInteger(KEY, snap.properties);
  }

  const auto LEVELS = parseUnsigned(property(snap.properties, "hw.nperflevels"));
  const std::uint32_t LEVEL_COUNT = LEVELS ? std::min(*LEVELS, MAX_PERF_LEVELS) : 0;
  for (std::uint32_t lvl = 0; lvl < LEVEL_COUNT; ++lvl) {
    snapshotString(fmt::format("hw.perflevel{}.name", lvl).c_str(), snap.properties);
    for (const char* KEY : PERF_LEVEL_INTEGER_KEYS) {
      snapshotInteger(fmt::format("hw.perflevel{}.{}", lvl, KEY).c_str(), snap.properties);
    }
  }

  if (snap.properties.count("machdep.cpu.brand_string") == 0 &&
      snap.properties.count("hw.logicalcpu") == 0) {
    return Outcome<MacSysctlSnapshot>::failure(
        ExtractionError::SOURCE_UNAVAILABLE,
        "sysctl: neither machdep.cpu.brand_string nor hw.logicalcpu is readable");
  }

  Outcome<MacSysctlSnapshot> out{};
  const auto FEATURES = helpers::process::runCommand({"sysctl", "hw.optional.arm."}, timeout);
  if (FEATURES.ok()) {
    snap.armFeatureReport = FEATURES.output;
  } else {
    out.notes.push_back(FEATURES.describe("sysctl hw.optional.arm."));
  }
  out.value = std::move(snap);
  return out;
#else
  (void)timeout;
  return Outcome<MacSysctlSnapshot>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                             "sysctl: not available on this platform");
#endif
}

/* ----------------------------- Extractor ----------------------------- */

CpuObservations extractMacSysctl(const MacSysctlSnapshot& snapshot) noexcept {
  const PropertyMap& PROPS = snapshot.properties;

  CpuObservations obs{};
  obs.source = CpuInfoSource::MAC_SYSCTL;

  const std::string_view BRAND = property(PROPS, "machdep.cpu.brand_string");
  if (!BRAND.empty()) {
    obs.modelNames.emplace_back(BRAND);
  }
  const std::string_view VENDOR = property(PROPS, "machdep.cpu.vendor");
  if (!VENDOR.empty()) {
    obs.vendorNames.emplace_back(VENDOR);
  }
  const std::string_view MACHINE = property(PROPS, "hw.machine");
  if (!MACHINE.empty()) {
    obs.architecture = std::string(MACHINE);
  }

  const auto ORDER = parseUnsigned(property(PROPS, "hw.byteorder"));
  if (ORDER && *ORDER == 1234) {
    obs.byteOrder = ByteOrder::LITTLE;
  } else if (ORDER && *ORDER == 4321) {
    obs.byteOrder = ByteOrder::BIG;
  }

  obs.reportedPhysicalCores = parseUnsigned(property(PROPS, "hw.physicalcpu"));
  if (!obs.reportedPhysicalCores) {
    obs.reportedPhysicalCores = parseUnsigned(property(PROPS, "machdep.cpu.core_count"));
  }
  obs.reportedLogicalCores = parseUnsigned(property(PROPS, "hw.logicalcpu"));
  if (!obs.reportedLogicalCores) {
    obs.reportedLogicalCores = parseUnsigned(property(PROPS, "machdep.cpu.thread_count"));
  }

  if (const auto HZ = parseDecimal(property(PROPS, "hw.cpufrequency_max"))) {
    obs.frequencies.push_back(FrequencyReading{*HZ, FrequencyUnit::HZ, FrequencyKind::MAX});
  }
  if (const auto HZ = parseDecimal(property(PROPS, "hw.cpufrequency"))) {
    obs.frequencies.push_back(FrequencyReading{*HZ, FrequencyUnit::HZ, FrequencyKind::BASE});
  }

  addCache(obs, 1, CacheType::INSTRUCTION, cacheKb(PROPS, "hw.l1icachesize"));
  addCache(obs, 1, CacheType::DATA, cacheKb(PROPS, "hw.l1dcachesize"));
  addCache(obs, 2, CacheType::UNIFIED, cacheKb(PROPS, "hw.l2cachesize"));
  addCache(obs, 3, CacheType::UNIFIED, cacheKb(PROPS, "hw.l3cachesize"));

  const auto LEVELS = parseUnsigned(property(PROPS, "hw.nperflevels"));
  // A single perf level means a homogeneous CPU: no cluster lines
  const std::uint32_t LEVEL_COUNT = LEVELS && *LEVELS > 1 ? std::min(*LEVELS, MAX_PERF_LEVELS) : 0;
  for (std::uint32_t lvl = 0; lvl < LEVEL_COUNT; ++lvl) {
    const std::string PREFIX = fmt::format("hw.perflevel{}.", lvl);
    const auto CORES = parseUnsigned(property(PROPS, PREFIX + "physicalcpu"));
    if (!CORES || *CORES == 0) {
      continue;
    }
    CoreCluster cluster{};
    const std::string_view NAME = property(PROPS, PREFIX + "name");
    cluster.name = NAME.empty() ? defaultClusterName(lvl) : std::string(NAME);
    cluster.physicalCores = *CORES;
    cluster.l1iKb = cacheKb(PROPS, PREFIX + "l1icachesize");
    cluster.l1dKb = cacheKb(PROPS, PREFIX + "l1dcachesize");
    cluster.l2Kb = cacheKb(PROPS, PREFIX + "l2cachesize");
    obs.clusters.push_back(std::move(cluster));
  }

  // x86: feature words; ARM: hw.optional.arm.* keys set to 1
  obs.flags = splitTokens(property(PROPS, "machdep.cpu.features"));
  const std::vector<std::string> LEAF7 = splitTokens(property(PROPS, "machdep.cpu.leaf7_features"));
  obs.flags.insert(obs.flags.end(), LEAF7.begin(), LEAF7.end());

  for (const std::string_view LINE : splitLines(snapshot.armFeatureReport)) {
    std::string_view key;
    std::string_view value;
    if (!splitKeyValue(LINE, ':', key, value) || !startsWith(key, ARM_FEATURE_PREFIX)) {
      continue;
    }
    if (value == "1") {
      obs.flags.emplace_back(key.substr(ARM_FEATURE_PREFIX.size()));
    }
  }

  return obs;
}

} // namespace cpu

} // namespace cpufetch
