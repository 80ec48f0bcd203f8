/**
 * @file WindowsWmi.cpp
 * @brief Win32_Processor list parsing.
 */

#include "src/cpu/inc/WindowsWmi.hpp"
#include "src/cpu/inc/FieldParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::process::CommandResult;
using cpufetch::helpers::process::runCommand;
using cpufetch::helpers::strings::splitKeyValue;
using cpufetch::helpers::strings::splitLines;
using cpufetch::helpers::strings::trim;

namespace {

constexpr const char* WMI_QUERY =
    "Get-CimInstance -ClassName Win32_Processor | Format-List "
    "Name,Manufacturer,Architecture,NumberOfCores,NumberOfLogicalProcessors,"
    "MaxClockSpeed,CurrentClockSpeed,L2CacheSize,L3CacheSize";

/// One processor package block.
struct PackageBlock {
  bool any{false};
  std::optional<std::uint32_t> cores{};
  std::optional<std::uint32_t> threads{};
  std::optional<std::uint32_t> l2Kb{};
  std::optional<std::uint32_t> l3Kb{};
};

void addCount(std::optional<std::uint32_t>& total, std::optional<std::uint32_t> count) {
  if (count) {
    total = total.value_or(0) + *count;
  }
}

void flushPackage(PackageBlock& block, CpuObservations& obs) {
  if (!block.any) {
    return;
  }
  addCount(obs.reportedPhysicalCores, block.cores);
  addCount(obs.reportedLogicalCores, block.threads);

  if (block.l2Kb && *block.l2Kb > 0) {
    CacheObservation cache{};
    cache.level = 2;
    cache.type = CacheType::UNIFIED;
    cache.sizeKb = (block.cores && *block.cores > 0) ? *block.l2Kb / *block.cores : *block.l2Kb;
    obs.caches.push_back(cache);
  }
  if (block.l3Kb && *block.l3Kb > 0) {
    CacheObservation cache{};
    cache.level = 3;
    cache.type = CacheType::UNIFIED;
    cache.sizeKb = block.l3Kb;
    obs.caches.push_back(cache);
  }
  block = PackageBlock{};
}

} // namespace

/* ----------------------------- Reader ----------------------------- */

Outcome<std::string> readWindowsWmi(std::chrono::milliseconds timeout) noexcept {
  const CommandResult RESULT =
      runCommand({"powershell", "-NoProfile", "-NonInteractive", "-Command", WMI_QUERY}, timeout);
  if (!RESULT.ok()) {
    return Outcome<std::string>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         RESULT.describe("powershell Get-CimInstance"));
  }
  if (trim(RESULT.output).empty()) {
    return Outcome<std::string>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         "powershell Get-CimInstance: empty output");
  }
  return Outcome<std::string>::success(RESULT.output);
}

/* ----------------------------- Extractor ----------------------------- */

std::string_view wmiArchitectureName(std::uint32_t code) noexcept {
  switch (code) {
  case 0:
    return "x86";
  case 5:
    return "ARM";
  case 6:
    return "ia64";
  case 9:
    return "x86_64";
  case 12:
    return "aarch64";
  default:
    return {};
  }
}

CpuObservations extractWindowsWmi(std::string_view text) noexcept {
  CpuObservations obs{};
  obs.source = CpuInfoSource::WINDOWS_WMI;
  obs.byteOrder = ByteOrder::LITTLE;

  PackageBlock block{};
  for (const std::string_view LINE : splitLines(text)) {
    if (trim(LINE).empty()) {
      flushPackage(block, obs);
      continue;
    }

    std::string_view key;
    std::string_view value;
    if (!splitKeyValue(LINE, ':', key, value)) {
      continue;
    }
    block.any = true;

    if (key == "Name") {
      if (!value.empty()) {
        obs.modelNames.emplace_back(value);
      }
    } else if (key == "Manufacturer") {
      if (!value.empty()) {
        obs.vendorNames.emplace_back(value);
      }
    } else if (key == "Architecture") {
      const auto CODE = parseUnsigned(value);
      const std::string_view NAME = CODE ? wmiArchitectureName(*CODE) : std::string_view{};
      if (!NAME.empty() && !obs.architecture) {
        obs.architecture = std::string(NAME);
      }
    } else if (key == "NumberOfCores") {
      block.cores = parseUnsigned(value);
    } else if (key == "NumberOfLogicalProcessors") {
      block.threads = parseUnsigned(value);
    } else if (key == "MaxClockSpeed") {
      if (const auto MHZ = parseDecimal(value)) {
        obs.frequencies.push_back(FrequencyReading{*MHZ, FrequencyUnit::MHZ, FrequencyKind::MAX});
      }
    } else if (key == "CurrentClockSpeed") {
      if (const auto MHZ = parseDecimal(value)) {
        obs.frequencies.push_back(
            FrequencyReading{*MHZ, FrequencyUnit::MHZ, FrequencyKind::PEAK_OBSERVED});
      }
    } else if (key == "L2CacheSize") {
      block.l2Kb = parseUnsigned(value);
    } else if (key == "L3CacheSize") {
      block.l3Kb = parseUnsigned(value);
    }
  }
  flushPackage(block, obs);

  return obs;
}

} // namespace cpu

} // namespace cpufetch
