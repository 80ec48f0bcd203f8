/**
 * @file Normalizer.cpp
 * @brief Observation reduction: core counting, frequency and cache totals.
 */

#include "src/cpu/inc/Normalizer.hpp"
#include "src/cpu/inc/FieldParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm> // std::max
#include <array>     // std::array
#include <set>       // std::set
#include <utility>   // std::pair

#include <fmt/core.h>

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::strings::trim;

namespace {

/// Kinds in precedence order.
constexpr std::array<FrequencyKind, 3> KIND_PRECEDENCE{FrequencyKind::MAX, FrequencyKind::BASE,
                                                       FrequencyKind::PEAK_OBSERVED};

/// First non-blank entry, trimmed.
std::string firstNonEmpty(const std::vector<std::string>& values) {
  for (const std::string& VALUE : values) {
    const std::string_view TRIMMED = trim(VALUE);
    if (!TRIMMED.empty()) {
      return std::string(TRIMMED);
    }
  }
  return {};
}

std::uint32_t countPhysicalCores(const CpuObservations& obs) {
  std::set<std::pair<int, int>> pairs;
  std::set<int> packages;
  for (const LogicalUnit& UNIT : obs.units) {
    if (UNIT.packageId && UNIT.coreId) {
      pairs.emplace(*UNIT.packageId, *UNIT.coreId);
    }
    if (UNIT.packageId) {
      packages.insert(*UNIT.packageId);
    }
  }

  if (!pairs.empty()) {
    return static_cast<std::uint32_t>(pairs.size());
  }
  if (obs.reportedPhysicalCores && *obs.reportedPhysicalCores > 0) {
    return *obs.reportedPhysicalCores;
  }
  if (!packages.empty()) {
    return static_cast<std::uint32_t>(packages.size());
  }
  return 1;
}

std::uint32_t countLogicalCores(const CpuObservations& obs, std::uint32_t physical) {
  std::uint32_t logical = static_cast<std::uint32_t>(obs.units.size());
  if (obs.reportedLogicalCores && *obs.reportedLogicalCores > 0) {
    logical = *obs.reportedLogicalCores;
  }
  return std::max(logical, physical);
}

void buildCaches(const CpuObservations& obs, std::uint32_t physical, CpuInfoRecord& rec) {
  std::map<CacheKey, std::uint32_t> perUnit;
  for (const CacheObservation& OBS : obs.caches) {
    if (!OBS.level || !OBS.type || !OBS.sizeKb || *OBS.sizeKb == 0) {
      continue;
    }
    const auto LEVEL = toCacheLevel(*OBS.level);
    if (!LEVEL) {
      continue;
    }
    std::uint32_t& slot = perUnit[CacheKey{*LEVEL, *OBS.type}];
    slot = std::max(slot, *OBS.sizeKb);
  }

  for (const auto& [KEY, PER] : perUnit) {
    CacheSize size{};
    size.perUnitKb = PER;
    size.totalKb = cacheSharing(KEY.first) == CacheSharing::PER_CORE ? PER * physical : PER;
    rec.caches.emplace(KEY, size);
  }
}

} // namespace

/* ----------------------------- Frequency ----------------------------- */

double toGhz(const FrequencyReading& reading) noexcept {
  switch (reading.unit) {
  case FrequencyUnit::HZ:
    return reading.value / 1e9;
  case FrequencyUnit::KHZ:
    return reading.value / 1e6;
  case FrequencyUnit::MHZ:
    return reading.value / 1e3;
  }
  return reading.value / 1e3;
}

std::optional<FrequencyReading>
selectFrequency(const std::vector<FrequencyReading>& readings) noexcept {
  for (const FrequencyKind KIND : KIND_PRECEDENCE) {
    std::optional<FrequencyReading> best{};
    for (const FrequencyReading& READING : readings) {
      if (READING.kind != KIND || !(READING.value > 0.0)) {
        continue;
      }
      if (!best || toGhz(READING) > toGhz(*best)) {
        best = READING;
      }
    }
    if (best) {
      return best;
    }
  }
  return std::nullopt;
}

/* ----------------------------- API ----------------------------- */

CpuInfoResult normalize(const CpuObservations& obs) noexcept {
  CpuInfoRecord rec{};
  rec.source = obs.source;
  rec.modelName = firstNonEmpty(obs.modelNames);
  rec.vendorId = firstNonEmpty(obs.vendorNames);

  const bool HAVE_COUNT = !obs.units.empty() || obs.reportedLogicalCores.has_value() ||
                          obs.reportedPhysicalCores.has_value();
  if (rec.modelName.empty() && rec.vendorId.empty() && !HAVE_COUNT) {
    return CpuInfoResult::failure(
        ExtractionError::INSUFFICIENT_DATA,
        fmt::format("no model, vendor or processor count found in {} data",
                    cpufetch::cpu::toString(obs.source)));
  }

  rec.architecture = obs.architecture;
  rec.byteOrder = obs.byteOrder;

  rec.vendor = normalizeVendor(rec.vendorId);
  if (rec.vendor == Vendor::UNKNOWN) {
    rec.vendor = normalizeVendor(rec.modelName);
  }
  if (rec.vendor == Vendor::UNKNOWN && rec.architecture) {
    rec.vendor = vendorFromArchitecture(*rec.architecture);
  }

  rec.physicalCores = countPhysicalCores(obs);
  rec.logicalCores = countLogicalCores(obs, rec.physicalCores);

  if (const auto FREQ = selectFrequency(obs.frequencies)) {
    rec.frequencyGhz = toGhz(*FREQ);
    rec.frequencyKind = FREQ->kind;
  }

  buildCaches(obs, rec.physicalCores, rec);

  rec.flags = obs.flags;
  rec.clusters = obs.clusters;

  return CpuInfoResult::success(std::move(rec));
}

} // namespace cpu

} // namespace cpufetch
