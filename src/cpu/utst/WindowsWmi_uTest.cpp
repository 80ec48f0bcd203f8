/**
 * @file WindowsWmi_uTest.cpp
 * @brief Unit tests for cpufetch::cpu Win32_Processor extraction.
 *
 * Notes:
 *  - Input mirrors "Format-List" output, so these run on every platform.
 */

#include "src/cpu/inc/Normalizer.hpp"
#include "src/cpu/inc/WindowsWmi.hpp"

#include <gtest/gtest.h>

using cpufetch::cpu::ByteOrder;
using cpufetch::cpu::CacheLevel;
using cpufetch::cpu::CacheSize;
using cpufetch::cpu::CacheType;
using cpufetch::cpu::CpuInfoResult;
using cpufetch::cpu::CpuObservations;
using cpufetch::cpu::extractWindowsWmi;
using cpufetch::cpu::FrequencyKind;
using cpufetch::cpu::normalize;
using cpufetch::cpu::Vendor;
using cpufetch::cpu::wmiArchitectureName;

namespace {

constexpr const char* SINGLE_PACKAGE = "\r\n"
                                       "Name                      : AMD Ryzen 7 5800X 8-Core Processor\r\n"
                                       "Manufacturer              : AuthenticAMD\r\n"
                                       "Architecture              : 9\r\n"
                                       "NumberOfCores             : 8\r\n"
                                       "NumberOfLogicalProcessors : 16\r\n"
                                       "MaxClockSpeed             : 3801\r\n"
                                       "CurrentClockSpeed         : 3801\r\n"
                                       "L2CacheSize               : 4096\r\n"
                                       "L3CacheSize               : 32768\r\n"
                                       "\r\n";

constexpr const char* TWO_PACKAGES = "Name                      : Intel(R) Xeon(R) Gold 6230\n"
                                     "Manufacturer              : GenuineIntel\n"
                                     "NumberOfCores             : 20\n"
                                     "NumberOfLogicalProcessors : 40\n"
                                     "L2CacheSize               : 20480\n"
                                     "\n"
                                     "Name                      : Intel(R) Xeon(R) Gold 6230\n"
                                     "Manufacturer              : GenuineIntel\n"
                                     "NumberOfCores             : 20\n"
                                     "NumberOfLogicalProcessors : 40\n"
                                     "L2CacheSize               : 20480\n";

} // namespace

/** @test A single package maps to counts, max clock and per-core L2. */
TEST(WindowsWmiTest, SinglePackage) {
  const CpuObservations OBS = extractWindowsWmi(SINGLE_PACKAGE);
  EXPECT_EQ(OBS.byteOrder, ByteOrder::LITTLE);
  EXPECT_EQ(OBS.architecture, "x86_64");

  const CpuInfoResult RESULT = normalize(OBS);
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.vendor, Vendor::AMD);
  EXPECT_EQ(RESULT.value.physicalCores, 8U);
  EXPECT_EQ(RESULT.value.logicalCores, 16U);
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L2, CacheType::UNIFIED), (CacheSize{512, 4096}));
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L3, CacheType::UNIFIED), (CacheSize{32768, 32768}));
  ASSERT_TRUE(RESULT.value.frequencyGhz.has_value());
  EXPECT_DOUBLE_EQ(*RESULT.value.frequencyGhz, 3.801);
  EXPECT_EQ(RESULT.value.frequencyKind, FrequencyKind::MAX);
}

/** @test Counts are summed over packages. */
TEST(WindowsWmiTest, TwoPackagesSummed) {
  const CpuInfoResult RESULT = normalize(extractWindowsWmi(TWO_PACKAGES));
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.physicalCores, 40U);
  EXPECT_EQ(RESULT.value.logicalCores, 80U);
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L2, CacheType::UNIFIED)->perUnitKb, 1024U);
}

/** @test Known architecture codes map to machine names. */
TEST(WindowsWmiTest, ArchitectureCodes) {
  EXPECT_EQ(wmiArchitectureName(9), "x86_64");
  EXPECT_EQ(wmiArchitectureName(12), "aarch64");
  EXPECT_TRUE(wmiArchitectureName(42).empty());
}
