/**
 * @file Lscpu.cpp
 * @brief lscpu report parsing.
 */

#include "src/cpu/inc/Lscpu.hpp"
#include "src/cpu/inc/FieldParsers.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::process::CommandResult;
using cpufetch::helpers::process::runCommand;
using cpufetch::helpers::strings::containsIgnoreCase;
using cpufetch::helpers::strings::splitKeyValue;
using cpufetch::helpers::strings::splitLines;
using cpufetch::helpers::strings::splitTokens;
using cpufetch::helpers::strings::trim;

namespace {

/// Cache label -> identity. Both "L1d" and "L1d cache" spellings exist.
bool lscpuCacheLabel(std::string_view key, int& level, CacheType& type) noexcept {
  if (key.size() > 6 && key.substr(key.size() - 6) == " cache") {
    key.remove_suffix(6);
  }
  if (key == "L1d") {
    level = 1;
    type = CacheType::DATA;
  } else if (key == "L1i") {
    level = 1;
    type = CacheType::INSTRUCTION;
  } else if (key == "L2") {
    level = 2;
    type = CacheType::UNIFIED;
  } else if (key == "L3") {
    level = 3;
    type = CacheType::UNIFIED;
  } else {
    return false;
  }
  return true;
}

/// Multiply two optional counts.
std::optional<std::uint32_t> product(std::optional<std::uint32_t> a,
                                     std::optional<std::uint32_t> b) noexcept {
  if (!a || *a == 0) {
    return std::nullopt;
  }
  return *a * (b && *b > 0 ? *b : 1U);
}

} // namespace

/* ----------------------------- Reader ----------------------------- */

Outcome<std::string> readLscpu(std::chrono::milliseconds timeout) noexcept {
  const CommandResult RESULT = runCommand({"lscpu"}, timeout);
  if (!RESULT.ok()) {
    return Outcome<std::string>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         RESULT.describe("lscpu"));
  }
  if (trim(RESULT.output).empty()) {
    return Outcome<std::string>::failure(ExtractionError::SOURCE_UNAVAILABLE,
                                         "lscpu: empty output");
  }
  return Outcome<std::string>::success(RESULT.output);
}

/* ----------------------------- Extractor ----------------------------- */

std::optional<std::uint32_t> parseLscpuCacheKb(std::string_view value) noexcept {
  const std::size_t PAREN = value.find('(');
  const auto SIZE = parseCacheSizeKb(value.substr(0, PAREN));
  if (!SIZE || PAREN == std::string_view::npos) {
    return SIZE;
  }

  // "(4 instances)": the size is the sum over all instances
  const std::vector<std::string> TOKENS = splitTokens(value.substr(PAREN + 1), " \t)");
  if (TOKENS.empty() || !containsIgnoreCase(value.substr(PAREN), "instance")) {
    return SIZE;
  }
  const auto INSTANCES = parseUnsigned(TOKENS.front());
  if (!INSTANCES || *INSTANCES == 0) {
    return SIZE;
  }
  return *SIZE / *INSTANCES;
}

CpuObservations extractLscpu(std::string_view text) noexcept {
  CpuObservations obs{};
  obs.source = CpuInfoSource::LINUX_LSCPU;

  std::optional<std::uint32_t> coresPerSocket{};
  std::optional<std::uint32_t> sockets{};
  std::optional<std::uint32_t> coresPerCluster{};
  std::optional<std::uint32_t> clusterCount{};

  for (const std::string_view LINE : splitLines(text)) {
    std::string_view key;
    std::string_view value;
    if (!splitKeyValue(LINE, ':', key, value) || value.empty()) {
      continue;
    }

    if (key == "Architecture") {
      obs.architecture = std::string(value);
    } else if (key == "Byte Order") {
      if (containsIgnoreCase(value, "little")) {
        obs.byteOrder = ByteOrder::LITTLE;
      } else if (containsIgnoreCase(value, "big")) {
        obs.byteOrder = ByteOrder::BIG;
      }
    } else if (key == "CPU(s)") {
      obs.reportedLogicalCores = parseUnsigned(value);
    } else if (key == "Vendor ID") {
      obs.vendorNames.emplace_back(value);
    } else if (key == "Model name") {
      obs.modelNames.emplace_back(value);
    } else if (key == "Core(s) per socket") {
      coresPerSocket = parseUnsigned(value);
    } else if (key == "Socket(s)") {
      sockets = parseUnsigned(value);
    } else if (key == "Core(s) per cluster") {
      coresPerCluster = parseUnsigned(value);
    } else if (key == "Cluster(s)") {
      clusterCount = parseUnsigned(value);
    } else if (key == "CPU max MHz") {
      if (const auto MHZ = parseDecimal(value)) {
        obs.frequencies.push_back(FrequencyReading{*MHZ, FrequencyUnit::MHZ, FrequencyKind::MAX});
      }
    } else if (key == "CPU MHz") {
      if (const auto MHZ = parseDecimal(value)) {
        obs.frequencies.push_back(
            FrequencyReading{*MHZ, FrequencyUnit::MHZ, FrequencyKind::PEAK_OBSERVED});
      }
    } else if (key == "Flags") {
      obs.flags = splitTokens(value);
    } else {
      int level = 0;
      CacheType type = CacheType::UNIFIED;
      if (lscpuCacheLabel(key, level, type)) {
        CacheObservation cache{};
        cache.level = level;
        cache.type = type;
        cache.sizeKb = parseLscpuCacheKb(value);
        obs.caches.push_back(cache);
      }
    }
  }

  obs.reportedPhysicalCores = product(coresPerSocket, sockets);
  if (!obs.reportedPhysicalCores) {
    obs.reportedPhysicalCores = product(coresPerCluster, clusterCount);
  }
  return obs;
}

} // namespace cpu

} // namespace cpufetch
