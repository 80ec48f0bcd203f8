/**
 * @file InfoLayout.cpp
 * @brief Info line building, flag wrapping and column layout.
 */

#include "src/display/inc/InfoLayout.hpp"
#include "src/display/inc/Logos.hpp"
#include "src/helpers/inc/Format.hpp"

#include <algorithm> // std::max

#include <fmt/core.h>

namespace cpufetch {

namespace display {

using cpufetch::cpu::CacheLevel;
using cpufetch::cpu::CacheType;
using cpufetch::cpu::CpuInfoRecord;
using cpufetch::helpers::format::gigahertz;
using cpufetch::helpers::format::kilobytes;
using cpufetch::helpers::format::kilobytesCompact;

namespace {

constexpr char ESC = '\x1b';

/// Narrowest flag column still worth wrapping into.
constexpr std::size_t MIN_FLAG_WIDTH = 20;

std::string clusterL1Line(const cpu::CoreCluster& cluster) {
  return fmt::format("{} L1 Cache: {} I + {} D", cluster.name, kilobytesCompact(*cluster.l1iKb),
                     kilobytesCompact(*cluster.l1dKb));
}

} // namespace

/* ----------------------------- Helpers ----------------------------- */

std::size_t visibleWidth(std::string_view text) noexcept {
  std::size_t width = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    const unsigned char C = static_cast<unsigned char>(text[i]);
    if (C == static_cast<unsigned char>(ESC) && i + 1 < text.size() && text[i + 1] == '[') {
      // CSI: ESC [ params... final byte in 0x40..0x7E
      i += 2;
      while (i < text.size() && !(text[i] >= 0x40 && text[i] <= 0x7E)) {
        ++i;
      }
      ++i;
      continue;
    }
    if ((C & 0xC0U) != 0x80U) {
      ++width;
    }
    ++i;
  }
  return width;
}

std::string formatCacheSize(const std::optional<cpu::CacheSize>& size) {
  if (!size) {
    return "Unknown";
  }
  return fmt::format("{} ({} Total)", kilobytes(size->perUnitKb), kilobytes(size->totalKb));
}

/* ----------------------------- Layout ----------------------------- */

std::vector<std::string> buildInfoLines(const CpuInfoRecord& rec) {
  std::vector<std::string> lines;
  lines.reserve(12 + rec.clusters.size() * 3);

  lines.push_back(fmt::format("Name: {}", rec.modelName.empty() ? "Unknown" : rec.modelName));

  const std::string_view KEY = rec.vendorKey();
  if (!rec.vendorId.empty() && rec.vendorId != KEY) {
    lines.push_back(fmt::format("Vendor: {} ({})", KEY, rec.vendorId));
  } else {
    lines.push_back(fmt::format("Vendor: {}", KEY));
  }

  lines.push_back(fmt::format("Architecture: {}", rec.architecture.value_or("Unknown")));
  lines.push_back(fmt::format("Byte Order: {}", cpu::toString(rec.byteOrder)));

  if (rec.frequencyGhz) {
    lines.push_back(fmt::format("{} Frequency: {}", cpu::toString(rec.frequencyKind),
                                gigahertz(*rec.frequencyGhz)));
  } else {
    lines.push_back("Max Frequency: Unknown");
  }

  lines.push_back(
      fmt::format("Cores: {} cores ({} threads)", rec.physicalCores, rec.logicalCores));

  lines.push_back(
      fmt::format("L1i Size: {}", formatCacheSize(rec.cache(CacheLevel::L1, CacheType::INSTRUCTION))));
  lines.push_back(
      fmt::format("L1d Size: {}", formatCacheSize(rec.cache(CacheLevel::L1, CacheType::DATA))));
  lines.push_back(
      fmt::format("L2 Size: {}", formatCacheSize(rec.cache(CacheLevel::L2, CacheType::UNIFIED))));
  lines.push_back(
      fmt::format("L3 Size: {}", formatCacheSize(rec.cache(CacheLevel::L3, CacheType::UNIFIED))));

  for (const cpu::CoreCluster& CLUSTER : rec.clusters) {
    lines.push_back(fmt::format("{} Cores: {}", CLUSTER.name, CLUSTER.physicalCores));
    if (CLUSTER.l1iKb && CLUSTER.l1dKb) {
      lines.push_back(clusterL1Line(CLUSTER));
    }
    if (CLUSTER.l2Kb) {
      lines.push_back(fmt::format("{} L2 Cache: {}", CLUSTER.name, kilobytesCompact(*CLUSTER.l2Kb)));
    }
  }

  return lines;
}

std::vector<std::string> wrapFlags(const std::vector<std::string>& flags, std::size_t width) {
  std::vector<std::string> lines;
  if (flags.empty()) {
    return lines;
  }

  const std::string INDENT(FLAGS_LABEL.size(), ' ');
  std::string current(FLAGS_LABEL);
  bool first = true;

  for (const std::string& FLAG : flags) {
    if (first) {
      current += FLAG;
      first = false;
      continue;
    }
    if (visibleWidth(current) + 2 + visibleWidth(FLAG) > width) {
      lines.push_back(std::move(current));
      current = INDENT + FLAG;
    } else {
      current += ", ";
      current += FLAG;
    }
  }
  lines.push_back(std::move(current));
  return lines;
}

std::string renderWithLogo(const CpuInfoRecord& rec, std::optional<std::string_view> logoOverride) {
  const std::string_view KEY = logoOverride ? *logoOverride : std::string_view{rec.vendorKey()};
  const std::vector<std::string> LOGO = lookupLogo(KEY).value_or(std::vector<std::string>{});

  std::size_t logoWidth = 0;
  for (const std::string& LINE : LOGO) {
    logoWidth = std::max(logoWidth, visibleWidth(LINE));
  }

  const std::size_t USED = LOGO.empty() ? 0 : logoWidth + LOGO_GUTTER.size();
  const std::size_t FLAG_WIDTH =
      LOGO_LAYOUT_WIDTH > USED + MIN_FLAG_WIDTH ? LOGO_LAYOUT_WIDTH - USED : MIN_FLAG_WIDTH;

  std::vector<std::string> info = buildInfoLines(rec);
  std::vector<std::string> flagLines = wrapFlags(rec.flags, FLAG_WIDTH);
  info.insert(info.end(), flagLines.begin(), flagLines.end());

  std::string out;
  const std::size_t ROWS = std::max(LOGO.size(), info.size());
  for (std::size_t row = 0; row < ROWS; ++row) {
    const std::string_view INFO = row < info.size() ? std::string_view{info[row]} : "";
    if (LOGO.empty()) {
      out += INFO;
      out += '\n';
      continue;
    }

    const std::string_view CELL = row < LOGO.size() ? std::string_view{LOGO[row]} : "";
    out += CELL;
    if (INFO.empty()) {
      out += COLOR_RESET;
      out += '\n';
      continue;
    }
    out.append(logoWidth - visibleWidth(CELL), ' ');
    out += COLOR_RESET;
    out += LOGO_GUTTER;
    out += INFO;
    out += '\n';
  }
  return out;
}

std::string renderPlain(const CpuInfoRecord& rec) {
  std::string out;
  for (const std::string& LINE : buildInfoLines(rec)) {
    out += LINE;
    out += '\n';
  }
  for (const std::string& LINE : wrapFlags(rec.flags, PLAIN_LAYOUT_WIDTH)) {
    out += LINE;
    out += '\n';
  }
  return out;
}

} // namespace display

} // namespace cpufetch
