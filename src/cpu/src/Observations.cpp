/**
 * @file Observations.cpp
 * @brief Source precedence merge.
 */

#include "src/cpu/inc/Observations.hpp"

#include <set>     // std::set
#include <utility> // std::pair

namespace cpufetch {

namespace cpu {

namespace {

/// Take fallback's list only if primary's is empty.
template <typename T> void fillIfEmpty(std::vector<T>& out, const std::vector<T>& fallback) {
  if (out.empty()) {
    out = fallback;
  }
}

/// Take fallback's value only if primary has none.
template <typename T> void fillIfAbsent(std::optional<T>& out, const std::optional<T>& fallback) {
  if (!out && fallback) {
    out = fallback;
  }
}

} // namespace

bool CpuObservations::empty() const noexcept {
  return modelNames.empty() && vendorNames.empty() && units.empty() && caches.empty() &&
         frequencies.empty() && flags.empty() && clusters.empty() && !architecture &&
         !reportedLogicalCores && !reportedPhysicalCores;
}

CpuObservations mergeObservations(const CpuObservations& primary,
                                  const CpuObservations& fallback) {
  CpuObservations out = primary;

  fillIfEmpty(out.modelNames, fallback.modelNames);
  fillIfEmpty(out.vendorNames, fallback.vendorNames);
  fillIfEmpty(out.units, fallback.units);
  fillIfEmpty(out.frequencies, fallback.frequencies);
  fillIfEmpty(out.flags, fallback.flags);
  fillIfEmpty(out.clusters, fallback.clusters);

  fillIfAbsent(out.architecture, fallback.architecture);
  fillIfAbsent(out.reportedLogicalCores, fallback.reportedLogicalCores);
  fillIfAbsent(out.reportedPhysicalCores, fallback.reportedPhysicalCores);

  if (out.byteOrder == ByteOrder::UNKNOWN) {
    out.byteOrder = fallback.byteOrder;
  }

  // Per-key cache merge: keys the primary described are never touched
  std::set<std::pair<int, CacheType>> primaryKeys;
  for (const CacheObservation& OBS : primary.caches) {
    if (OBS.level && OBS.type && OBS.sizeKb) {
      primaryKeys.emplace(*OBS.level, *OBS.type);
    }
  }
  for (const CacheObservation& OBS : fallback.caches) {
    if (!OBS.level || !OBS.type || !OBS.sizeKb) {
      continue;
    }
    if (primaryKeys.count({*OBS.level, *OBS.type}) == 0) {
      out.caches.push_back(OBS);
    }
  }

  return out;
}

} // namespace cpu

} // namespace cpufetch
