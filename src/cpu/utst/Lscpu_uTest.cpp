/**
 * @file Lscpu_uTest.cpp
 * @brief Unit tests for cpufetch::cpu lscpu extraction.
 */

#include "src/cpu/inc/Lscpu.hpp"
#include "src/cpu/inc/Normalizer.hpp"

#include <gtest/gtest.h>

#include <string>

using cpufetch::cpu::ByteOrder;
using cpufetch::cpu::CacheLevel;
using cpufetch::cpu::CacheSize;
using cpufetch::cpu::CacheType;
using cpufetch::cpu::CpuInfoResult;
using cpufetch::cpu::CpuInfoSource;
using cpufetch::cpu::CpuObservations;
using cpufetch::cpu::ExtractionError;
using cpufetch::cpu::extractLscpu;
using cpufetch::cpu::FrequencyKind;
using cpufetch::cpu::normalize;
using cpufetch::cpu::parseLscpuCacheKb;
using cpufetch::cpu::readLscpu;
using cpufetch::cpu::Vendor;

namespace {

/// util-linux 2.38 layout for a 6-core, 12-thread desktop part.
constexpr const char* X86_LSCPU = R"(Architecture:            x86_64
  CPU op-mode(s):        32-bit, 64-bit
  Address sizes:         39 bits physical, 48 bits virtual
  Byte Order:            Little Endian
CPU(s):                  12
  On-line CPU(s) list:   0-11
Vendor ID:               GenuineIntel
  Model name:            Example CPU X9
    CPU family:          6
    Model:               151
    Thread(s) per core:  2
    Core(s) per socket:  6
    Socket(s):           1
    CPU max MHz:         4400.0000
    CPU min MHz:         800.0000
    BogoMIPS:            4992.00
    Flags:               fpu vme de pse tsc msr
Caches (sum of all):
  L1d:                   288 KiB (6 instances)
  L1i:                   192 KiB (6 instances)
  L2:                    7.5 MiB (6 instances)
  L3:                    18 MiB (1 instance)
)";

/// Older layout with per-instance sizes and an ARM cluster topology.
constexpr const char* ARM_LSCPU = R"(Architecture:        aarch64
Byte Order:          Little Endian
CPU(s):              4
Vendor ID:           ARM
Model name:          Cortex-A72
Core(s) per cluster: 4
Cluster(s):          1
CPU MHz:             1500.000
L1d cache:           32K
L1i cache:           48K
L2 cache:            1024K
)";

} // namespace

/* ----------------------------- Cache Values ----------------------------- */

/** @test "(N instances)" divides the summed size. */
TEST(LscpuTest, CacheInstances) {
  EXPECT_EQ(parseLscpuCacheKb("288 KiB (6 instances)"), 48U);
  EXPECT_EQ(parseLscpuCacheKb("18 MiB (1 instance)"), 18432U);
}

/** @test Plain sizes pass through; garbage is absent. */
TEST(LscpuTest, CachePlain) {
  EXPECT_EQ(parseLscpuCacheKb("1024K"), 1024U);
  EXPECT_FALSE(parseLscpuCacheKb("unknown").has_value());
}

/* ----------------------------- Extraction ----------------------------- */

class LscpuX86Test : public ::testing::Test {
protected:
  CpuObservations obs_{};

  void SetUp() override { obs_ = extractLscpu(X86_LSCPU); }
};

/** @test Indented keys are recognized. */
TEST_F(LscpuX86Test, Fields) {
  EXPECT_EQ(obs_.source, CpuInfoSource::LINUX_LSCPU);
  EXPECT_EQ(obs_.architecture, "x86_64");
  EXPECT_EQ(obs_.byteOrder, ByteOrder::LITTLE);
  EXPECT_EQ(obs_.reportedLogicalCores, 12U);
  EXPECT_EQ(obs_.reportedPhysicalCores, 6U);
  ASSERT_EQ(obs_.flags.size(), 6U);
  EXPECT_EQ(obs_.flags.back(), "msr");
}

/** @test The pipeline yields per-core and shared cache totals. */
TEST_F(LscpuX86Test, Normalized) {
  const CpuInfoResult RESULT = normalize(obs_);
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.vendor, Vendor::INTEL);
  EXPECT_EQ(RESULT.value.modelName, "Example CPU X9");
  EXPECT_EQ(RESULT.value.physicalCores, 6U);
  EXPECT_EQ(RESULT.value.logicalCores, 12U);
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L1, CacheType::DATA), (CacheSize{48, 288}));
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L2, CacheType::UNIFIED), (CacheSize{1280, 7680}));
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L3, CacheType::UNIFIED), (CacheSize{18432, 18432}));
  ASSERT_TRUE(RESULT.value.frequencyGhz.has_value());
  EXPECT_DOUBLE_EQ(*RESULT.value.frequencyGhz, 4.4);
  EXPECT_EQ(RESULT.value.frequencyKind, FrequencyKind::MAX);
}

/** @test Clusters stand in for sockets; "L1d cache" labels are accepted. */
TEST(LscpuTest, ArmClusters) {
  const CpuObservations OBS = extractLscpu(ARM_LSCPU);
  EXPECT_EQ(OBS.reportedPhysicalCores, 4U);
  EXPECT_EQ(OBS.caches.size(), 3U);

  const CpuInfoResult RESULT = normalize(OBS);
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.vendor, Vendor::ARM);
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L1, CacheType::INSTRUCTION), (CacheSize{48, 192}));
  EXPECT_EQ(RESULT.value.frequencyKind, FrequencyKind::PEAK_OBSERVED);
}

/** @test Output with no usable fields normalizes to INSUFFICIENT_DATA. */
TEST(LscpuTest, Unrecognized) {
  EXPECT_EQ(normalize(extractLscpu("nothing useful\n")).error, ExtractionError::INSUFFICIENT_DATA);
}

/** @test The live command, when present, reports at least one CPU. */
TEST(LscpuTest, LiveCommand) {
  const auto READ = readLscpu();
  if (!READ.ok()) {
    GTEST_SKIP() << READ.detail;
  }
  const CpuInfoResult RESULT = normalize(extractLscpu(READ.value));
  ASSERT_TRUE(RESULT.ok()) << RESULT.detail;
  EXPECT_GE(RESULT.value.logicalCores, 1U);
}
