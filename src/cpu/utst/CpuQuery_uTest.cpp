/**
 * @file CpuQuery_uTest.cpp
 * @brief Unit tests for cpufetch::cpu source selection and dispatch.
 *
 * Notes:
 *  - Linux tests point the sysfs and /proc paths at temporary fixtures.
 *  - Live-host tests verify structural invariants, not specific hardware values.
 */

#include "src/cpu/inc/CpuQuery.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using cpufetch::cpu::ByteOrder;
using cpufetch::cpu::CacheLevel;
using cpufetch::cpu::CacheType;
using cpufetch::cpu::CpuInfoResult;
using cpufetch::cpu::CpuInfoSource;
using cpufetch::cpu::defaultCpuInfoSource;
using cpufetch::cpu::ExtractionError;
using cpufetch::cpu::getCpuInfo;
using cpufetch::cpu::hostOsName;
using cpufetch::cpu::isSourceSupported;
using cpufetch::cpu::parseCpuInfoSource;
using cpufetch::cpu::QueryOptions;
using cpufetch::cpu::Vendor;

/* ----------------------------- Source Names ----------------------------- */

/** @test Source names round-trip case-insensitively. */
TEST(CpuQueryTest, ParseSourceNames) {
  EXPECT_EQ(parseCpuInfoSource("proc"), CpuInfoSource::LINUX_PROC);
  EXPECT_EQ(parseCpuInfoSource("SYSFS"), CpuInfoSource::LINUX_SYSFS);
  EXPECT_EQ(parseCpuInfoSource("lscpu"), CpuInfoSource::LINUX_LSCPU);
  EXPECT_EQ(parseCpuInfoSource("sysctl"), CpuInfoSource::MAC_SYSCTL);
  EXPECT_EQ(parseCpuInfoSource("Wmi"), CpuInfoSource::WINDOWS_WMI);
  EXPECT_FALSE(parseCpuInfoSource("cpuid").has_value());
}

/** @test The platform default is always a supported source. */
TEST(CpuQueryTest, DefaultIsSupported) {
  const auto SOURCE = defaultCpuInfoSource();
  if (!SOURCE) {
    GTEST_SKIP() << "no default source on " << hostOsName();
  }
  EXPECT_TRUE(isSourceSupported(*SOURCE));
}

/** @test A source from another platform fails before any read. */
TEST(CpuQueryTest, ForeignSourceUnsupported) {
#if defined(__APPLE__)
  const CpuInfoSource FOREIGN = CpuInfoSource::WINDOWS_WMI;
#else
  const CpuInfoSource FOREIGN = CpuInfoSource::MAC_SYSCTL;
#endif
  const CpuInfoResult RESULT = getCpuInfo(FOREIGN);
  EXPECT_EQ(RESULT.error, ExtractionError::UNSUPPORTED_PLATFORM);
  EXPECT_NE(RESULT.detail.find("is not supported on " + hostOsName()), std::string::npos);
}

/* ----------------------------- Live Host ----------------------------- */

/** @test The default query on this host yields a consistent record. */
TEST(CpuQueryTest, LiveHostInvariants) {
  const CpuInfoResult RESULT = getCpuInfo();
  if (!RESULT.ok()) {
    GTEST_SKIP() << RESULT.detail;
  }
  EXPECT_GE(RESULT.value.physicalCores, 1U);
  EXPECT_GE(RESULT.value.logicalCores, RESULT.value.physicalCores);
  EXPECT_NE(RESULT.value.byteOrder, ByteOrder::UNKNOWN);
  if (RESULT.value.frequencyGhz) {
    EXPECT_GT(*RESULT.value.frequencyGhz, 0.0);
  }
  for (const auto& [KEY, SIZE] : RESULT.value.caches) {
    EXPECT_GE(SIZE.totalKb, SIZE.perUnitKb);
  }
}

/* ----------------------------- Linux Fixtures ----------------------------- */

#if defined(__linux__)

class CpuQueryLinuxTest : public ::testing::Test {
protected:
  fs::path root_{};
  QueryOptions options_{};

  void SetUp() override {
    const std::string TEST_NAME = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    root_ = fs::temp_directory_path() / ("cpufetch_query_" + TEST_NAME);
    fs::remove_all(root_);
    fs::create_directories(root_ / "cpu");
    options_.sysfsRoot = (root_ / "cpu").string();
    options_.procCpuinfoPath = (root_ / "cpuinfo").string();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void write(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
  }

  void writeProc() {
    write(options_.procCpuinfoPath, "processor\t: 0\n"
                                    "vendor_id\t: AuthenticAMD\n"
                                    "model name\t: Example CPU X9\n"
                                    "flags\t\t: fpu sse sse2\n"
                                    "\n"
                                    "processor\t: 1\n"
                                    "vendor_id\t: AuthenticAMD\n"
                                    "model name\t: Example CPU X9\n");
  }

  void writeSysfs() {
    const fs::path CPU = root_ / "cpu";
    write(CPU / "online", "0-1\n");
    for (int cpu = 0; cpu < 2; ++cpu) {
      const fs::path DIR = CPU / ("cpu" + std::to_string(cpu));
      write(DIR / "topology/physical_package_id", "0\n");
      write(DIR / "topology/core_id", std::to_string(cpu) + "\n");
      write(DIR / "cache/index0/level", "1\n");
      write(DIR / "cache/index0/type", "Data\n");
      write(DIR / "cache/index0/size", "32K\n");
    }
  }
};

/** @test sysfs topology combines with the /proc model, vendor and flags. */
TEST_F(CpuQueryLinuxTest, SysfsMergedWithProc) {
  writeSysfs();
  writeProc();
  const CpuInfoResult RESULT = getCpuInfo(CpuInfoSource::LINUX_SYSFS, options_);
  ASSERT_TRUE(RESULT.ok()) << RESULT.detail;
  EXPECT_EQ(RESULT.value.source, CpuInfoSource::LINUX_SYSFS);
  EXPECT_EQ(RESULT.value.modelName, "Example CPU X9");
  EXPECT_EQ(RESULT.value.vendor, Vendor::AMD);
  EXPECT_EQ(RESULT.value.physicalCores, 2U);
  EXPECT_EQ(RESULT.value.logicalCores, 2U);
  EXPECT_EQ(RESULT.value.flags.size(), 3U);
  EXPECT_EQ(RESULT.value.cache(CacheLevel::L1, CacheType::DATA)->totalKb, 64U);
  EXPECT_TRUE(RESULT.value.architecture.has_value());
  EXPECT_TRUE(RESULT.notes.empty());
}

/** @test Without /proc, sysfs alone still succeeds and leaves a note. */
TEST_F(CpuQueryLinuxTest, SysfsWithoutProc) {
  writeSysfs();
  const CpuInfoResult RESULT = getCpuInfo(CpuInfoSource::LINUX_SYSFS, options_);
  ASSERT_TRUE(RESULT.ok()) << RESULT.detail;
  EXPECT_TRUE(RESULT.value.modelName.empty());
  EXPECT_EQ(RESULT.value.logicalCores, 2U);
  ASSERT_EQ(RESULT.notes.size(), 1U);
  EXPECT_NE(RESULT.notes[0].find("model, vendor and flags unavailable"), std::string::npos);
}

/** @test An unreadable sysfs tree notes the lscpu fallback. */
TEST_F(CpuQueryLinuxTest, SysfsMissingTriesLscpu) {
  options_.sysfsRoot = (root_ / "absent").string();
  const CpuInfoResult RESULT = getCpuInfo(CpuInfoSource::LINUX_SYSFS, options_);
  ASSERT_FALSE(RESULT.notes.empty());
  EXPECT_NE(RESULT.notes[0].find("trying lscpu"), std::string::npos);
  if (!RESULT.ok()) {
    EXPECT_EQ(RESULT.error, ExtractionError::SOURCE_UNAVAILABLE);
    EXPECT_NE(RESULT.detail.find("no such directory"), std::string::npos);
  }
}

/** @test The proc source reads the configured path. */
TEST_F(CpuQueryLinuxTest, ProcSource) {
  writeProc();
  const CpuInfoResult RESULT = getCpuInfo(CpuInfoSource::LINUX_PROC, options_);
  ASSERT_TRUE(RESULT.ok()) << RESULT.detail;
  EXPECT_EQ(RESULT.value.source, CpuInfoSource::LINUX_PROC);
  EXPECT_EQ(RESULT.value.logicalCores, 2U);
  EXPECT_EQ(RESULT.value.physicalCores, 1U);
}

/** @test A missing /proc file is SOURCE_UNAVAILABLE. */
TEST_F(CpuQueryLinuxTest, ProcMissing) {
  const CpuInfoResult RESULT = getCpuInfo(CpuInfoSource::LINUX_PROC, options_);
  EXPECT_EQ(RESULT.error, ExtractionError::SOURCE_UNAVAILABLE);
}

#endif // __linux__
