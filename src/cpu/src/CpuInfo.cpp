/**
 * @file CpuInfo.cpp
 * @brief CpuInfoRecord helpers and enum string conversions.
 */

#include "src/cpu/inc/CpuInfo.hpp"

#include <fmt/core.h>

namespace cpufetch {

namespace cpu {

/* ----------------------------- Enum Strings ----------------------------- */

const char* toString(ExtractionError error) noexcept {
  switch (error) {
  case ExtractionError::NONE:
    return "none";
  case ExtractionError::SOURCE_UNAVAILABLE:
    return "source unavailable";
  case ExtractionError::INSUFFICIENT_DATA:
    return "insufficient data";
  case ExtractionError::UNSUPPORTED_PLATFORM:
    return "unsupported platform";
  }
  return "unknown error";
}

const char* toString(ByteOrder order) noexcept {
  switch (order) {
  case ByteOrder::LITTLE:
    return "Little Endian";
  case ByteOrder::BIG:
    return "Big Endian";
  case ByteOrder::UNKNOWN:
  default:
    return "Unknown";
  }
}

const char* toString(CacheLevel level) noexcept {
  switch (level) {
  case CacheLevel::L1:
    return "L1";
  case CacheLevel::L2:
    return "L2";
  case CacheLevel::L3:
    return "L3";
  }
  return "L?";
}

const char* toString(CacheType type) noexcept {
  switch (type) {
  case CacheType::INSTRUCTION:
    return "Instruction";
  case CacheType::DATA:
    return "Data";
  case CacheType::UNIFIED:
    return "Unified";
  }
  return "Unknown";
}

const char* toString(FrequencyKind kind) noexcept {
  switch (kind) {
  case FrequencyKind::MAX:
    return "Max";
  case FrequencyKind::BASE:
    return "Base";
  case FrequencyKind::PEAK_OBSERVED:
    return "Peak";
  }
  return "Unknown";
}

const char* toString(CpuInfoSource source) noexcept {
  switch (source) {
  case CpuInfoSource::LINUX_PROC:
    return "proc";
  case CpuInfoSource::LINUX_SYSFS:
    return "sysfs";
  case CpuInfoSource::LINUX_LSCPU:
    return "lscpu";
  case CpuInfoSource::MAC_SYSCTL:
    return "sysctl";
  case CpuInfoSource::WINDOWS_WMI:
    return "wmi";
  }
  return "unknown";
}

CacheSharing cacheSharing(CacheLevel level) noexcept {
  return level == CacheLevel::L3 ? CacheSharing::SHARED : CacheSharing::PER_CORE;
}

/* ----------------------------- CpuInfoRecord ----------------------------- */

std::optional<CacheSize> CpuInfoRecord::cache(CacheLevel level, CacheType type) const {
  const auto IT = caches.find(CacheKey{level, type});
  if (IT == caches.end()) {
    return std::nullopt;
  }
  return IT->second;
}

std::string CpuInfoRecord::toString() const {
  const std::string FREQ =
      frequencyGhz ? fmt::format("{:.3f} GHz ({})", *frequencyGhz,
                                 cpufetch::cpu::toString(frequencyKind))
                   : std::string("unknown");
  return fmt::format("{} [{}] cores={} threads={} freq={} caches={} flags={} source={}",
                     modelName.empty() ? "?" : modelName, vendorKey(), physicalCores,
                     logicalCores, FREQ, caches.size(), flags.size(),
                     cpufetch::cpu::toString(source));
}

} // namespace cpu

} // namespace cpufetch
