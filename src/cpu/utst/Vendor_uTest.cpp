/**
 * @file Vendor_uTest.cpp
 * @brief Unit tests for cpufetch::cpu vendor normalization.
 */

#include "src/cpu/inc/Vendor.hpp"

#include <gtest/gtest.h>

#include <string>

using cpufetch::cpu::armImplementerName;
using cpufetch::cpu::normalizeVendor;
using cpufetch::cpu::toString;
using cpufetch::cpu::Vendor;
using cpufetch::cpu::vendorFromArchitecture;

/* ----------------------------- Substring Matching ----------------------------- */

/** @test Raw x86 vendor ids resolve. */
TEST(VendorTest, X86VendorIds) {
  EXPECT_EQ(normalizeVendor("GenuineIntel"), Vendor::INTEL);
  EXPECT_EQ(normalizeVendor("AuthenticAMD"), Vendor::AMD);
}

/** @test Matching is case-insensitive and position-independent. */
TEST(VendorTest, ModelStringSubstring) {
  EXPECT_EQ(normalizeVendor("11th Gen INTEL(R) Core(TM) i7-1185G7"), Vendor::INTEL);
  EXPECT_EQ(normalizeVendor("amd ryzen 9 7950x"), Vendor::AMD);
  EXPECT_EQ(normalizeVendor("Apple M2 Pro"), Vendor::APPLE);
  EXPECT_EQ(normalizeVendor("NVIDIA Tegra"), Vendor::NVIDIA);
  EXPECT_EQ(normalizeVendor("POWER9 (raw), altivec supported"), Vendor::POWERPC);
}

/** @test A string naming both AMD and Intel resolves to Intel. */
TEST(VendorTest, IntelOutranksAmd) {
  EXPECT_EQ(normalizeVendor("AMD and Intel"), Vendor::INTEL);
  EXPECT_EQ(normalizeVendor("Intel and AMD"), Vendor::INTEL);
}

/** @test Unrecognized or blank text is Unknown. */
TEST(VendorTest, Unknown) {
  EXPECT_EQ(normalizeVendor("HygonGenuine"), Vendor::UNKNOWN);
  EXPECT_EQ(normalizeVendor("   "), Vendor::UNKNOWN);
}

/* ----------------------------- Architecture ----------------------------- */

/** @test Machine names imply ARM or PowerPC. */
TEST(VendorTest, FromArchitecture) {
  EXPECT_EQ(vendorFromArchitecture("aarch64"), Vendor::ARM);
  EXPECT_EQ(vendorFromArchitecture("armv7l"), Vendor::ARM);
  EXPECT_EQ(vendorFromArchitecture("ppc64le"), Vendor::POWERPC);
  EXPECT_EQ(vendorFromArchitecture("x86_64"), Vendor::UNKNOWN);
}

/* ----------------------------- Names ----------------------------- */

/** @test Canonical keys used for display and logo lookup. */
TEST(VendorTest, CanonicalKeys) {
  EXPECT_STREQ(toString(Vendor::INTEL), "Intel");
  EXPECT_STREQ(toString(Vendor::AMD), "AMD");
  EXPECT_STREQ(toString(Vendor::POWERPC), "PowerPC");
  EXPECT_STREQ(toString(Vendor::UNKNOWN), "Unknown");
}

/** @test ARM implementer codes map to company names. */
TEST(VendorTest, ArmImplementers) {
  EXPECT_EQ(armImplementerName("0x41"), "ARM");
  EXPECT_EQ(armImplementerName("0x61"), "Apple");
  EXPECT_EQ(armImplementerName("0x4E"), "NVIDIA");
  EXPECT_TRUE(armImplementerName("0xff").empty());
}
