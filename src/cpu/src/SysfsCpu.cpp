/**
 * @file SysfsCpu.cpp
 * @brief sysfs CPU tree snapshot and topology/cache/cpufreq extraction.
 */

#include "src/cpu/inc/SysfsCpu.hpp"
#include "src/cpu/inc/FieldParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

#if !defined(_WIN32)
#include "src/helpers/inc/Files.hpp"
#endif

#include <array>      // std::array
#include <filesystem> // std::filesystem
#include <map>        // std::map
#include <utility>    // std::pair

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::strings::startsWith;

namespace {

constexpr std::array<const char*, 2> TOPOLOGY_FILES{"physical_package_id", "core_id"};
constexpr std::array<const char*, 3> CACHE_FILES{"level", "type", "size"};
constexpr std::array<const char*, 3> CPUFREQ_FILES{"cpuinfo_max_freq", "base_frequency",
                                                   "scaling_cur_freq"};

/// Parse numeric suffix of "cpu12" or "index3"; -1 if name is not prefix + digits.
int parseIndexedName(std::string_view name, std::string_view prefix) noexcept {
  if (!startsWith(name, prefix) || name.size() == prefix.size()) {
    return -1;
  }
  const auto ID = parseUnsigned(name.substr(prefix.size()));
  return ID ? static_cast<int>(*ID) : -1;
}

#if !defined(_WIN32)

/// Record root/rel in the map if it is readable and non-empty.
void snapshotFile(const fs::path& root, const std::string& rel, PropertyMap& out) {
  std::string value;
  if (helpers::files::readAttribute((root / rel).c_str(), value)) {
    out.emplace(rel, std::move(value));
  }
}

#endif

} // namespace

/* ----------------------------- Reader ----------------------------- */

Outcome<PropertyMap> readSysfsCpuTree(const char* root) noexcept {
#if defined(_WIN32)
  return Outcome<PropertyMap>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                       fmt::format("{}: not available on this platform", root));
#else
  const fs::path ROOT{root};
  if (!helpers::files::isDirectory(root)) {
    return Outcome<PropertyMap>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         fmt::format("{}: no such directory", root));
  }

  PropertyMap tree;
  snapshotFile(ROOT, "online", tree);

  std::error_code ec;
  for (const auto& ENTRY : fs::directory_iterator(ROOT, ec)) {
    const std::string NAME = ENTRY.path().filename().string();
    if (parseIndexedName(NAME, "cpu") < 0 || !ENTRY.is_directory(ec)) {
      continue;
    }

    for (const char* FILE : TOPOLOGY_FILES) {
      snapshotFile(ROOT, fmt::format("{}/topology/{}", NAME, FILE), tree);
    }
    for (const char* FILE : CPUFREQ_FILES) {
      snapshotFile(ROOT, fmt::format("{}/cpufreq/{}", NAME, FILE), tree);
    }

    const fs::path CACHE_DIR = ENTRY.path() / "cache";
    if (!helpers::files::isDirectory(CACHE_DIR.c_str())) {
      continue;
    }
    std::error_code cacheEc;
    for (const auto& CIDX : fs::directory_iterator(CACHE_DIR, cacheEc)) {
      const std::string INDEX = CIDX.path().filename().string();
      if (parseIndexedName(INDEX, "index") < 0) {
        continue;
      }
      for (const char* FILE : CACHE_FILES) {
        snapshotFile(ROOT, fmt::format("{}/cache/{}/{}", NAME, INDEX, FILE), tree);
      }
    }
  }

  if (ec) {
    return Outcome<PropertyMap>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         fmt::format("{}: {}", root, ec.message()));
  }

  bool anyCpu = false;
  for (const auto& KV : tree) {
    if (KV.first != "online") {
      anyCpu = true;
      break;
    }
  }
  if (!anyCpu) {
    return Outcome<PropertyMap>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         fmt::format("{}: no readable cpu entries", root));
  }
  return Outcome<PropertyMap>::success(std::move(tree));
#endif
}

/* ----------------------------- Extractor ----------------------------- */

CpuObservations extractSysfsCpuTree(const PropertyMap& tree) noexcept {
  CpuObservations obs{};
  obs.source = CpuInfoSource::LINUX_SYSFS;

  std::map<int, LogicalUnit> units;
  std::map<std::pair<int, int>, CacheObservation> caches;

  for (const auto& [KEY, VALUE] : tree) {
    if (KEY == "online") {
      obs.reportedLogicalCores = countCpuList(VALUE);
      continue;
    }

    const std::string_view PATH = KEY;
    const std::size_t SLASH = PATH.find('/');
    if (SLASH == std::string_view::npos) {
      continue;
    }
    const int CPU_ID = parseIndexedName(PATH.substr(0, SLASH), "cpu");
    if (CPU_ID < 0) {
      continue;
    }
    const std::string_view REST = PATH.substr(SLASH + 1);
    LogicalUnit& unit = units[CPU_ID];

    if (REST == "topology/physical_package_id") {
      // -1 means the kernel has no package map: one package
      const auto ID = parseSigned(VALUE);
      if (ID) {
        unit.packageId = *ID >= 0 ? *ID : 0;
      }
    } else if (REST == "topology/core_id") {
      const auto ID = parseSigned(VALUE);
      if (ID && *ID >= 0) {
        unit.coreId = *ID;
      }
    } else if (startsWith(REST, "cpufreq/")) {
      const std::string_view FILE = REST.substr(8);
      const auto KHZ = parseDecimal(VALUE);
      if (!KHZ) {
        continue;
      }
      FrequencyKind kind = FrequencyKind::PEAK_OBSERVED;
      if (FILE == "cpuinfo_max_freq") {
        kind = FrequencyKind::MAX;
      } else if (FILE == "base_frequency") {
        kind = FrequencyKind::BASE;
      } else if (FILE != "scaling_cur_freq") {
        continue;
      }
      obs.frequencies.push_back(FrequencyReading{*KHZ, FrequencyUnit::KHZ, kind});
    } else if (startsWith(REST, "cache/")) {
      // cache/indexK/<attr>
      const std::string_view CACHE_PATH = REST.substr(6);
      const std::size_t SEP = CACHE_PATH.find('/');
      if (SEP == std::string_view::npos) {
        continue;
      }
      const int INDEX = parseIndexedName(CACHE_PATH.substr(0, SEP), "index");
      if (INDEX < 0) {
        continue;
      }
      const std::string_view ATTR = CACHE_PATH.substr(SEP + 1);
      CacheObservation& cache = caches[{CPU_ID, INDEX}];
      if (ATTR == "level") {
        cache.level = parseSigned(VALUE);
      } else if (ATTR == "type") {
        cache.type = parseCacheType(VALUE);
      } else if (ATTR == "size") {
        cache.sizeKb = parseCacheSizeKb(VALUE);
      }
    }
  }

  obs.units.reserve(units.size());
  for (const auto& KV : units) {
    obs.units.push_back(KV.second);
  }
  obs.caches.reserve(caches.size());
  for (const auto& KV : caches) {
    obs.caches.push_back(KV.second);
  }
  return obs;
}

} // namespace cpu

} // namespace cpufetch
