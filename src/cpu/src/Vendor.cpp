/**
 * @file Vendor.cpp
 * @brief Vendor normalization tables.
 */

#include "src/cpu/inc/Vendor.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>   // std::array
#include <utility> // std::pair

namespace cpufetch {

namespace cpu {

namespace {

using cpufetch::helpers::strings::containsIgnoreCase;
using cpufetch::helpers::strings::equalsIgnoreCase;
using cpufetch::helpers::strings::startsWith;
using cpufetch::helpers::strings::toLower;
using cpufetch::helpers::strings::trim;

/// One vendor and the fragments that identify it.
struct VendorFragments {
  Vendor vendor;
  std::array<std::string_view, 3> fragments; ///< Unused slots are empty
};

/// Priority order matters: the first matching row wins.
constexpr std::array<VendorFragments, 6> VENDOR_TABLE{{
    {Vendor::INTEL, {"genuineintel", "intel", ""}},
    {Vendor::AMD, {"authenticamd", "amd", ""}},
    {Vendor::APPLE, {"apple", "", ""}},
    {Vendor::NVIDIA, {"nvidia", "", ""}},
    {Vendor::ARM, {"arm", "aarch64", ""}},
    {Vendor::POWERPC, {"powerpc", "ppc", "power"}},
}};

/// ARM MIDR implementer codes (arch/arm64/include/asm/cputype.h).
constexpr std::array<std::pair<std::string_view, std::string_view>, 18> ARM_IMPLEMENTERS{{
    {"0x41", "ARM"},
    {"0x42", "Broadcom"},
    {"0x43", "Cavium"},
    {"0x44", "DEC"},
    {"0x46", "Fujitsu"},
    {"0x48", "HiSilicon"},
    {"0x49", "Infineon"},
    {"0x4d", "Freescale"},
    {"0x4e", "NVIDIA"},
    {"0x50", "APM"},
    {"0x51", "Qualcomm"},
    {"0x56", "Marvell"},
    {"0x61", "Apple"},
    {"0x66", "Faraday"},
    {"0x69", "Intel"},
    {"0x6d", "Microsoft"},
    {"0x70", "Phytium"},
    {"0xc0", "Ampere"},
}};

} // namespace

/* ----------------------------- Strings ----------------------------- */

const char* toString(Vendor vendor) noexcept {
  switch (vendor) {
  case Vendor::INTEL:
    return "Intel";
  case Vendor::AMD:
    return "AMD";
  case Vendor::APPLE:
    return "Apple";
  case Vendor::NVIDIA:
    return "NVIDIA";
  case Vendor::ARM:
    return "ARM";
  case Vendor::POWERPC:
    return "PowerPC";
  case Vendor::UNKNOWN:
  default:
    return "Unknown";
  }
}

/* ----------------------------- Normalization ----------------------------- */

Vendor normalizeVendor(std::string_view raw) noexcept {
  const std::string_view TEXT = trim(raw);
  if (TEXT.empty()) {
    return Vendor::UNKNOWN;
  }

  for (const VendorFragments& ROW : VENDOR_TABLE) {
    for (const std::string_view FRAG : ROW.fragments) {
      if (!FRAG.empty() && containsIgnoreCase(TEXT, FRAG)) {
        return ROW.vendor;
      }
    }
  }
  return Vendor::UNKNOWN;
}

Vendor vendorFromArchitecture(std::string_view arch) noexcept {
  const std::string_view TEXT = trim(arch);
  if (TEXT.empty()) {
    return Vendor::UNKNOWN;
  }
  const std::string LOWER = toLower(TEXT);
  if (startsWith(LOWER, "aarch64") || startsWith(LOWER, "arm")) {
    return Vendor::ARM;
  }
  if (startsWith(LOWER, "ppc") || startsWith(LOWER, "powerpc")) {
    return Vendor::POWERPC;
  }
  return Vendor::UNKNOWN;
}

std::string_view armImplementerName(std::string_view code) noexcept {
  const std::string_view TEXT = trim(code);
  for (const auto& ENTRY : ARM_IMPLEMENTERS) {
    if (equalsIgnoreCase(TEXT, ENTRY.first)) {
      return ENTRY.second;
    }
  }
  return {};
}

} // namespace cpu

} // namespace cpufetch
