/**
 * @file ProcCpuinfo.cpp
 * @brief /proc/cpuinfo block parsing.
 */

#include "src/cpu/inc/ProcCpuinfo.hpp"
#include "src/cpu/inc/FieldParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

#if !defined(_WIN32)
#include "src/helpers/inc/Files.hpp"
#endif

#include <set> // std::set

#include <fmt/core.h>

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::strings::splitKeyValue;
using cpufetch::helpers::strings::splitLines;
using cpufetch::helpers::strings::splitTokens;
using cpufetch::helpers::strings::trim;

namespace {

/// Per-block scratch state; flushed on every blank line.
struct BlockState {
  bool isProcessor{false};
  LogicalUnit unit{};

  void reset() noexcept {
    isProcessor = false;
    unit = LogicalUnit{};
  }
};

/// Scan-wide accumulator.
struct ProcScan {
  CpuObservations obs{};
  std::vector<std::string> secondaryModels{}; ///< "Processor" / PowerPC "cpu"
  std::vector<std::string> hardwareModels{};  ///< ARM "Hardware"
  std::optional<std::uint32_t> coresPerPackage{};
  std::vector<CacheObservation> cacheSizeLines{}; ///< x86 "cache size"
  bool sawExplicitL2{false};
};

/// Map "L1d cache" style labels to a cache identity.
bool cacheLabel(std::string_view key, int& level, CacheType& type) noexcept {
  if (key == "L1d cache") {
    level = 1;
    type = CacheType::DATA;
  } else if (key == "L1i cache") {
    level = 1;
    type = CacheType::INSTRUCTION;
  } else if (key == "L2 cache") {
    level = 2;
    type = CacheType::UNIFIED;
  } else if (key == "L3 cache") {
    level = 3;
    type = CacheType::UNIFIED;
  } else {
    return false;
  }
  return true;
}

void flushBlock(BlockState& block, ProcScan& scan) {
  if (block.isProcessor) {
    scan.obs.units.push_back(block.unit);
  }
  block.reset();
}

void applyField(std::string_view key, std::string_view value, BlockState& block,
                ProcScan& scan) {
  CpuObservations& obs = scan.obs;

  if (key == "processor") {
    block.isProcessor = true;
  } else if (key == "vendor_id") {
    if (!value.empty()) {
      obs.vendorNames.emplace_back(value);
    }
  } else if (key == "CPU implementer") {
    const std::string_view NAME = armImplementerName(value);
    if (!NAME.empty()) {
      obs.vendorNames.emplace_back(NAME);
    }
  } else if (key == "model name") {
    if (!value.empty()) {
      obs.modelNames.emplace_back(value);
    }
  } else if (key == "Processor" || key == "cpu") {
    if (!value.empty()) {
      scan.secondaryModels.emplace_back(value);
    }
  } else if (key == "Hardware") {
    if (!value.empty()) {
      scan.hardwareModels.emplace_back(value);
    }
  } else if (key == "physical id") {
    const auto ID = parseSigned(value);
    if (ID) {
      block.unit.packageId = *ID >= 0 ? *ID : 0;
    }
  } else if (key == "core id") {
    const auto ID = parseSigned(value);
    if (ID && *ID >= 0) {
      block.unit.coreId = *ID;
    }
  } else if (key == "cpu cores") {
    if (!scan.coresPerPackage) {
      scan.coresPerPackage = parseUnsigned(value);
    }
  } else if (key == "cpu MHz" || key == "clock") {
    // PowerPC prints "clock : 2300.000000MHz"
    std::string_view number = value;
    if (number.size() >= 3 && number.substr(number.size() - 3) == "MHz") {
      number.remove_suffix(3);
    }
    if (const auto MHZ = parseDecimal(number)) {
      obs.frequencies.push_back(
          FrequencyReading{*MHZ, FrequencyUnit::MHZ, FrequencyKind::PEAK_OBSERVED});
    }
  } else if (key == "cache size") {
    CacheObservation cache{};
    cache.level = 2;
    cache.type = CacheType::UNIFIED;
    cache.sizeKb = parseCacheSizeKb(value);
    scan.cacheSizeLines.push_back(cache);
  } else if (key == "flags" || key == "Features") {
    if (obs.flags.empty()) {
      obs.flags = splitTokens(value);
    }
  } else {
    int level = 0;
    CacheType type = CacheType::UNIFIED;
    if (cacheLabel(key, level, type)) {
      CacheObservation cache{};
      cache.level = level;
      cache.type = type;
      cache.sizeKb = parseCacheSizeKb(value);
      obs.caches.push_back(cache);
      if (level == 2) {
        scan.sawExplicitL2 = true;
      }
    }
  }
}

} // namespace

/* ----------------------------- Reader ----------------------------- */

Outcome<std::string> readProcCpuinfo(const char* path) noexcept {
#if defined(_WIN32)
  return Outcome<std::string>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                       fmt::format("{}: not available on this platform", path));
#else
  std::string text;
  std::string error;
  if (!helpers::files::readFileToString(path, text, error)) {
    return Outcome<std::string>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         fmt::format("failed to read {}", error));
  }
  if (trim(text).empty()) {
    return Outcome<std::string>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         fmt::format("{}: file is empty", path));
  }
  return Outcome<std::string>::success(std::move(text));
#endif
}

/* ----------------------------- Extractor ----------------------------- */

CpuObservations extractProcCpuinfo(std::string_view text) noexcept {
  ProcScan scan{};
  scan.obs.source = CpuInfoSource::LINUX_PROC;

  BlockState block{};
  for (const std::string_view LINE : splitLines(text)) {
    if (trim(LINE).empty()) {
      flushBlock(block, scan);
      continue;
    }

    std::string_view key;
    std::string_view value;
    if (!splitKeyValue(LINE, ':', key, value)) {
      continue;
    }
    applyField(key, value, block, scan);
  }
  flushBlock(block, scan);

  CpuObservations& obs = scan.obs;
  obs.modelNames.insert(obs.modelNames.end(), scan.secondaryModels.begin(),
                        scan.secondaryModels.end());
  obs.modelNames.insert(obs.modelNames.end(), scan.hardwareModels.begin(),
                        scan.hardwareModels.end());

  if (!scan.sawExplicitL2) {
    obs.caches.insert(obs.caches.end(), scan.cacheSizeLines.begin(), scan.cacheSizeLines.end());
  }

  // "cpu cores" counts cores in one package
  if (scan.coresPerPackage && *scan.coresPerPackage > 0) {
    std::set<int> packages;
    for (const LogicalUnit& UNIT : obs.units) {
      if (UNIT.packageId) {
        packages.insert(*UNIT.packageId);
      }
    }
    const std::uint32_t PACKAGES = packages.empty() ? 1U : static_cast<std::uint32_t>(packages.size());
    obs.reportedPhysicalCores = *scan.coresPerPackage * PACKAGES;
  }

  return obs;
}

} // namespace cpu

} // namespace cpufetch
