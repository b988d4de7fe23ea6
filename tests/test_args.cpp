#include "inv/util/Args.hpp"
#include <cstdint>
#include <gtest/gtest.h>

using namespace inv::args;

TEST(Args, CountAcceptsPlainIntegers) {
  std::uint64_t n = 0;
  EXPECT_TRUE(parseCount("0", n));
  EXPECT_EQ(n, 0u);
  EXPECT_TRUE(parseCount("3600", n));
  EXPECT_EQ(n, 3600u);
  EXPECT_TRUE(parseCount("18446744073709551615", n));
  EXPECT_EQ(n, UINT64_MAX);
}

TEST(Args, CountRejectsEverythingElse) {
  std::uint64_t n = 7;
  for (const char *bad : {"", "nan", "inf", "-1", "1e30", "1.5", "12abc",
                          " 12", "+3", "18446744073709551616"}) {
    EXPECT_FALSE(parseCount(bad, n)) << bad;
  }
  EXPECT_EQ(n, 7u);
}

TEST(Args, SeedMustFitIn32Bits) {
  std::uint32_t s = 0;
  EXPECT_TRUE(parseSeed("4294967295", s));
  EXPECT_EQ(s, 4294967295u);
  EXPECT_FALSE(parseSeed("4294967296", s));
  EXPECT_FALSE(parseSeed("-1", s));
  EXPECT_FALSE(parseSeed("nan", s));
}

TEST(Args, ExtentAcceptsFinitePositiveLengths) {
  float v = 0.f;
  EXPECT_TRUE(parseExtent("598", v));
  EXPECT_FLOAT_EQ(v, 598.f);
  EXPECT_TRUE(parseExtent("676.5", v));
  EXPECT_FLOAT_EQ(v, 676.5f);
}

TEST(Args, ExtentRejectsNonFiniteAndOutOfRange) {
  float v = 42.f;
  for (const char *bad : {"", "nan", "NaN", "inf", "-inf", "infinity", "0",
                          "-5", "1e39", "1e400", "600px"}) {
    EXPECT_FALSE(parseExtent(bad, v)) << bad;
  }
  EXPECT_FLOAT_EQ(v, 42.f);
}
