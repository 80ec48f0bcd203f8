/**
 * @file Normalizer_uTest.cpp
 * @brief Unit tests for cpufetch::cpu::normalize.
 *
 * Notes:
 *  - Observations are built by hand so each rule is exercised in isolation.
 */

#include "src/cpu/inc/Normalizer.hpp"

#include <gtest/gtest.h>

#include <vector>

using cpufetch::cpu::CacheLevel;
using cpufetch::cpu::CacheObservation;
using cpufetch::cpu::CacheSize;
using cpufetch::cpu::CacheType;
using cpufetch::cpu::CpuInfoResult;
using cpufetch::cpu::CpuObservations;
using cpufetch::cpu::ExtractionError;
using cpufetch::cpu::FrequencyKind;
using cpufetch::cpu::FrequencyReading;
using cpufetch::cpu::FrequencyUnit;
using cpufetch::cpu::LogicalUnit;
using cpufetch::cpu::normalize;
using cpufetch::cpu::selectFrequency;
using cpufetch::cpu::toGhz;
using cpufetch::cpu::Vendor;

class NormalizerTest : public ::testing::Test {
protected:
  CpuObservations obs_{};

  void SetUp() override { obs_.modelNames = {"Example CPU X9"}; }

  CpuInfoResult run() const { return normalize(obs_); }
};

/* ----------------------------- Failure ----------------------------- */

/** @test No model, vendor or count is INSUFFICIENT_DATA. */
TEST_F(NormalizerTest, NothingIdentifying) {
  const CpuInfoResult RESULT = normalize(CpuObservations{});
  EXPECT_EQ(RESULT.error, ExtractionError::INSUFFICIENT_DATA);
  EXPECT_EQ(RESULT.detail, "no model, vendor or processor count found in proc data");
}

/** @test A processor count alone is enough to produce a record. */
TEST_F(NormalizerTest, CountAloneSuffices) {
  CpuObservations obs{};
  obs.units.resize(2);
  const CpuInfoResult RESULT = normalize(obs);
  ASSERT_TRUE(RESULT.ok());
  EXPECT_TRUE(RESULT.value.modelName.empty());
  EXPECT_EQ(RESULT.value.logicalCores, 2U);
}

/* ----------------------------- Core Counting ----------------------------- */

/** @test N distinct (package, core) pairs give N physical cores. */
TEST_F(NormalizerTest, DistinctPairsCounted) {
  obs_.units = {LogicalUnit{0, 0}, LogicalUnit{0, 1}, LogicalUnit{1, 0}, LogicalUnit{1, 1},
                LogicalUnit{1, 1}};
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.physicalCores, 4U);
  EXPECT_EQ(RESULT.value.logicalCores, 5U);
}

/** @test Two units sharing ids are one physical core. */
TEST_F(NormalizerTest, SharedIdsDeduplicated) {
  obs_.units = {LogicalUnit{0, 0}, LogicalUnit{0, 0}};
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.physicalCores, 1U);
  EXPECT_EQ(RESULT.value.logicalCores, 2U);
}

/** @test Units without ids: physical falls back to 1, logical is the unit count. */
TEST_F(NormalizerTest, NoIdsFallback) {
  obs_.units.resize(6);
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.physicalCores, 1U);
  EXPECT_EQ(RESULT.value.logicalCores, 6U);
}

/** @test A reported physical count is used when no pairs exist. */
TEST_F(NormalizerTest, ReportedPhysicalCount) {
  obs_.units.resize(8);
  obs_.reportedPhysicalCores = 4;
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.physicalCores, 4U);
}

/** @test Logical cores never drop below physical cores. */
TEST_F(NormalizerTest, LogicalAtLeastPhysical) {
  obs_.reportedPhysicalCores = 8;
  obs_.reportedLogicalCores = 4;
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.logicalCores, 8U);
}

/* ----------------------------- Vendor ----------------------------- */

/** @test The vendor id outranks the model string. */
TEST_F(NormalizerTest, VendorIdFirst) {
  obs_.modelNames = {"Intel-compatible processor"};
  obs_.vendorNames = {"AuthenticAMD"};
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.vendor, Vendor::AMD);
  EXPECT_EQ(RESULT.value.vendorId, "AuthenticAMD");
}

/** @test The model string is searched when the vendor id is missing. */
TEST_F(NormalizerTest, VendorFromModel) {
  obs_.modelNames = {"12th Gen Intel(R) Core(TM) i5-12400"};
  EXPECT_EQ(run().value.vendor, Vendor::INTEL);
}

/** @test The architecture decides when nothing else names a vendor. */
TEST_F(NormalizerTest, VendorFromArchitecture) {
  obs_.modelNames = {"Cortex-A72"};
  obs_.architecture = "aarch64";
  EXPECT_EQ(run().value.vendor, Vendor::ARM);
}

/* ----------------------------- Frequency ----------------------------- */

/** @test Units convert to GHz. */
TEST_F(NormalizerTest, ToGhz) {
  EXPECT_DOUBLE_EQ(toGhz(FrequencyReading{3.5e9, FrequencyUnit::HZ, FrequencyKind::MAX}), 3.5);
  EXPECT_DOUBLE_EQ(toGhz(FrequencyReading{4200000, FrequencyUnit::KHZ, FrequencyKind::MAX}), 4.2);
  EXPECT_DOUBLE_EQ(toGhz(FrequencyReading{2400, FrequencyUnit::MHZ, FrequencyKind::MAX}), 2.4);
}

/** @test Max outranks base, which outranks observed speeds. */
TEST_F(NormalizerTest, FrequencyPrecedence) {
  const std::vector<FrequencyReading> READINGS{
      {4800, FrequencyUnit::MHZ, FrequencyKind::PEAK_OBSERVED},
      {3000000, FrequencyUnit::KHZ, FrequencyKind::BASE},
      {4200000, FrequencyUnit::KHZ, FrequencyKind::MAX},
      {4100000, FrequencyUnit::KHZ, FrequencyKind::MAX}};
  const auto BEST = selectFrequency(READINGS);
  ASSERT_TRUE(BEST.has_value());
  EXPECT_EQ(BEST->kind, FrequencyKind::MAX);
  EXPECT_DOUBLE_EQ(toGhz(*BEST), 4.2);
}

/** @test Among observed speeds the highest wins; zeros are ignored. */
TEST_F(NormalizerTest, ObservedPeak) {
  obs_.frequencies = {{0, FrequencyUnit::MHZ, FrequencyKind::MAX},
                      {1800, FrequencyUnit::MHZ, FrequencyKind::PEAK_OBSERVED},
                      {3600, FrequencyUnit::MHZ, FrequencyKind::PEAK_OBSERVED}};
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  ASSERT_TRUE(RESULT.value.frequencyGhz.has_value());
  EXPECT_DOUBLE_EQ(*RESULT.value.frequencyGhz, 3.6);
  EXPECT_EQ(RESULT.value.frequencyKind, FrequencyKind::PEAK_OBSERVED);
}

/** @test No frequency readings leave the field absent without failing. */
TEST_F(NormalizerTest, MissingFrequency) {
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_FALSE(RESULT.value.frequencyGhz.has_value());
}

/* ----------------------------- Caches ----------------------------- */

/** @test Per-core caches multiply by physical cores; L3 stays unchanged. */
TEST_F(NormalizerTest, CacheTotals) {
  obs_.reportedPhysicalCores = 6;
  obs_.caches = {CacheObservation{1, CacheType::DATA, 48},
                 CacheObservation{2, CacheType::UNIFIED, 1280},
                 CacheObservation{3, CacheType::UNIFIED, 18432}};
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L1, CacheType::DATA), (CacheSize{48, 288}));
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L2, CacheType::UNIFIED), (CacheSize{1280, 7680}));
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L3, CacheType::UNIFIED), (CacheSize{18432, 18432}));
  EXPECT_FALSE(RESULT.value.cache(CacheLevel::L1, CacheType::INSTRUCTION).has_value());
}

/** @test Zero sizes, unknown levels and incomplete observations are dropped. */
TEST_F(NormalizerTest, CacheNoiseIgnored) {
  obs_.caches = {CacheObservation{1, CacheType::DATA, 0}, CacheObservation{4, CacheType::UNIFIED, 64},
                 CacheObservation{2, std::nullopt, 512}, CacheObservation{2, CacheType::UNIFIED, {}}};
  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_TRUE(RESULT.value.caches.empty());
}

/* ----------------------------- End To End ----------------------------- */

/** @test One package, 4 cores, 2 threads each, L1d 32K per core, 16 MB shared L3. */
TEST_F(NormalizerTest, ExampleCpuX9) {
  for (int thread = 0; thread < 2; ++thread) {
    for (int core = 0; core < 4; ++core) {
      obs_.units.push_back(LogicalUnit{0, core});
    }
  }
  obs_.caches = {CacheObservation{1, CacheType::DATA, 32},
                 CacheObservation{3, CacheType::UNIFIED, 16384}};

  const CpuInfoResult RESULT = run();
  ASSERT_TRUE(RESULT.ok());
  EXPECT_EQ(RESULT.value.modelName, "Example CPU X9");
  EXPECT_EQ(RESULT.value.physicalCores, 4U);
  EXPECT_EQ(RESULT.value.logicalCores, 8U);
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L1, CacheType::DATA)->totalKb, 128U);
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L3, CacheType::UNIFIED)->totalKb, 16384U);
}
