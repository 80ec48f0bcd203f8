/**
 * @file CpuQuery.cpp
 * @brief Source variant dispatch and Linux sysfs -> /proc -> lscpu fallback chain.
 */

#include "src/cpu/inc/CpuQuery.hpp"
#include "src/cpu/inc/Lscpu.hpp"
#include "src/cpu/inc/MacSysctl.hpp"
#include "src/cpu/inc/Normalizer.hpp"
#include "src/cpu/inc/WindowsWmi.hpp"
#include "src/helpers/inc/Strings.hpp"

#if !defined(_WIN32)
#include <sys/utsname.h> // uname
#endif

#include <array> // std::array
#include <bit>   // std::endian

#include <fmt/core.h>

namespace cpufetch {

namespace cpu {

using cpufetch::helpers::strings::equalsIgnoreCase;
using cpufetch::helpers::strings::toLower;

namespace {

constexpr std::array<CpuInfoSource, 5> ALL_SOURCES{
    CpuInfoSource::LINUX_PROC, CpuInfoSource::LINUX_SYSFS, CpuInfoSource::LINUX_LSCPU,
    CpuInfoSource::MAC_SYSCTL, CpuInfoSource::WINDOWS_WMI};

/// Fill facts no text source reports: machine type and byte order of this build.
void fillHostFacts(CpuObservations& obs) {
#if !defined(_WIN32)
  if (!obs.architecture) {
    struct utsname uts{};
    if (::uname(&uts) == 0 && uts.machine[0] != '\0') {
      obs.architecture = std::string(uts.machine);
    }
  }
#endif
  if (obs.byteOrder == ByteOrder::UNKNOWN) {
    if constexpr (std::endian::native == std::endian::little) {
      obs.byteOrder = ByteOrder::LITTLE;
    } else if constexpr (std::endian::native == std::endian::big) {
      obs.byteOrder = ByteOrder::BIG;
    }
  }
}

/// Normalize and carry notes collected along the way.
CpuInfoResult finish(CpuObservations obs, std::vector<std::string> notes) {
  fillHostFacts(obs);
  CpuInfoResult result = normalize(obs);
  notes.insert(notes.end(), result.notes.begin(), result.notes.end());
  result.notes = std::move(notes);
  return result;
}

/// Propagate a reader failure as a query result.
template <typename T> CpuInfoResult failed(const Outcome<T>& read) {
  CpuInfoResult result = CpuInfoResult::failure(read.error, read.detail);
  result.notes = read.notes;
  return result;
}

CpuInfoResult queryProc(const QueryOptions& options) {
  const auto READ = readProcCpuinfo(options.procCpuinfoPath.c_str());
  if (!READ.ok()) {
    return failed(READ);
  }
  return finish(extractProcCpuinfo(READ.value), {});
}

CpuInfoResult queryLscpu(const QueryOptions& options) {
  const auto READ = readLscpu(options.timeout);
  if (!READ.ok()) {
    return failed(READ);
  }
  return finish(extractLscpu(READ.value), {});
}

CpuInfoResult querySysfs(const QueryOptions& options) {
  std::vector<std::string> notes;

  const auto TREE = readSysfsCpuTree(options.sysfsRoot.c_str());
  if (!TREE.ok()) {
    notes.push_back(fmt::format("{}; trying lscpu", TREE.detail));
    CpuInfoResult viaLscpu = queryLscpu(options);
    if (!viaLscpu.ok()) {
      viaLscpu.detail = fmt::format("{}; {}", TREE.detail, viaLscpu.detail);
    }
    notes.insert(notes.end(), viaLscpu.notes.begin(), viaLscpu.notes.end());
    viaLscpu.notes = std::move(notes);
    return viaLscpu;
  }

  CpuObservations obs = extractSysfsCpuTree(TREE.value);

  const auto PROC = readProcCpuinfo(options.procCpuinfoPath.c_str());
  if (PROC.ok()) {
    obs = mergeObservations(obs, extractProcCpuinfo(PROC.value));
  } else {
    notes.push_back(fmt::format("{}; model, vendor and flags unavailable", PROC.detail));
  }
  return finish(std::move(obs), std::move(notes));
}

CpuInfoResult queryMac(const QueryOptions& options) {
  const auto READ = readMacSysctl(options.timeout);
  if (!READ.ok()) {
    return failed(READ);
  }
  return finish(extractMacSysctl(READ.value), READ.notes);
}

CpuInfoResult queryWindows(const QueryOptions& options) {
  const auto READ = readWindowsWmi(options.timeout);
  if (!READ.ok()) {
    return failed(READ);
  }
  return finish(extractWindowsWmi(READ.value), {});
}

} // namespace

/* ----------------------------- Platform ----------------------------- */

std::string hostOsName() {
#if defined(__linux__)
  return "linux";
#elif defined(__APPLE__)
  return "macos";
#elif defined(_WIN32)
  return "windows";
#else
  struct utsname uts{};
  if (::uname(&uts) == 0 && uts.sysname[0] != '\0') {
    return toLower(uts.sysname);
  }
  return "unknown";
#endif
}

std::optional<CpuInfoSource> defaultCpuInfoSource() noexcept {
#if defined(__linux__)
  return CpuInfoSource::LINUX_SYSFS;
#elif defined(__APPLE__)
  return CpuInfoSource::MAC_SYSCTL;
#elif defined(_WIN32)
  return CpuInfoSource::WINDOWS_WMI;
#else
  return std::nullopt;
#endif
}

bool isSourceSupported(CpuInfoSource source) noexcept {
  switch (source) {
  case CpuInfoSource::LINUX_PROC:
  case CpuInfoSource::LINUX_SYSFS:
  case CpuInfoSource::LINUX_LSCPU:
#if defined(__linux__)
    return true;
#else
    return false;
#endif
  case CpuInfoSource::MAC_SYSCTL:
#if defined(__APPLE__)
    return true;
#else
    return false;
#endif
  case CpuInfoSource::WINDOWS_WMI:
#if defined(_WIN32)
    return true;
#else
    return false;
#endif
  }
  return false;
}

std::optional<CpuInfoSource> parseCpuInfoSource(std::string_view name) noexcept {
  for (const CpuInfoSource SOURCE : ALL_SOURCES) {
    if (equalsIgnoreCase(name, cpufetch::cpu::toString(SOURCE))) {
      return SOURCE;
    }
  }
  return std::nullopt;
}

/* ----------------------------- API ----------------------------- */

CpuInfoResult getCpuInfo(CpuInfoSource source, const QueryOptions& options) noexcept {
  if (!isSourceSupported(source)) {
    return CpuInfoResult::failure(ExtractionError::UNSUPPORTED_PLATFORM,
                                  fmt::format("Source '{}' is not supported on {}",
                                              cpufetch::cpu::toString(source), hostOsName()));
  }

  switch (source) {
  case CpuInfoSource::LINUX_PROC:
    return queryProc(options);
  case CpuInfoSource::LINUX_SYSFS:
    return querySysfs(options);
  case CpuInfoSource::LINUX_LSCPU:
    return queryLscpu(options);
  case CpuInfoSource::MAC_SYSCTL:
    return queryMac(options);
  case CpuInfoSource::WINDOWS_WMI:
    return queryWindows(options);
  }
  return CpuInfoResult::failure(ExtractionError::UNSUPPORTED_PLATFORM, "unknown source");
}

CpuInfoResult getCpuInfo(const QueryOptions& options) noexcept {
  const auto SOURCE = defaultCpuInfoSource();
  if (!SOURCE) {
    return CpuInfoResult::failure(ExtractionError::UNSUPPORTED_PLATFORM,
                                  fmt::format("Unsupported operating system: {}", hostOsName()));
  }
  return getCpuInfo(*SOURCE, options);
}

} // namespace cpu

} // namespace cpufetch
