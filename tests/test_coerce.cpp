#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "invoicer/coerce.hpp"

using nlohmann::json;
using invoicer::Decimal;

// ==================== Integer text ====================

TEST(CoerceTest, Int32TextIsStrict) {
  std::int32_t v = 0;
  EXPECT_TRUE(invoicer::parse_int32_text("250", v));
  EXPECT_EQ(v, 250);
  EXPECT_TRUE(invoicer::parse_int32_text(" +5 ", v));
  EXPECT_EQ(v, 5);
  EXPECT_TRUE(invoicer::parse_int32_text("-7", v));
  EXPECT_EQ(v, -7);

  EXPECT_FALSE(invoicer::parse_int32_text("", v));
  EXPECT_FALSE(invoicer::parse_int32_text("  ", v));
  EXPECT_FALSE(invoicer::parse_int32_text("12.0", v));
  EXPECT_FALSE(invoicer::parse_int32_text("0x10", v));
  EXPECT_FALSE(invoicer::parse_int32_text("2147483648", v));
  EXPECT_FALSE(invoicer::parse_int32_text("99999999999999999999999", v));
}

// ==================== Integer target ====================

TEST(CoerceTest, Int32FromJsonNumbers) {
  std::int32_t v = 0;
  EXPECT_TRUE(invoicer::coerce_int32(json(250), v));
  EXPECT_EQ(v, 250);

  EXPECT_TRUE(invoicer::coerce_int32(json(std::uint64_t{5}), v));
  EXPECT_EQ(v, 5);

  EXPECT_TRUE(invoicer::coerce_int32(json(-2147483648LL), v));
  EXPECT_EQ(v, -2147483648LL);

  EXPECT_TRUE(invoicer::coerce_int32(json::parse("12.0"), v));
  EXPECT_EQ(v, 12);

  EXPECT_TRUE(invoicer::coerce_int32(json::parse("1e3"), v));
  EXPECT_EQ(v, 1000);
}

TEST(CoerceTest, Int32RejectsFractionsAndOverflow) {
  std::int32_t v = 42;
  EXPECT_FALSE(invoicer::coerce_int32(json(12.5), v));
  EXPECT_FALSE(invoicer::coerce_int32(json(2147483648LL), v));
  EXPECT_FALSE(invoicer::coerce_int32(json(std::uint64_t{4294967296ULL}), v));
  EXPECT_FALSE(invoicer::coerce_int32(json(1e10), v));
  EXPECT_EQ(v, 42);
}

TEST(CoerceTest, Int32FromFloatTokenNeedsAnIntegralValue) {
  std::int32_t v = 42;
  const std::string near_max = "2147483647.0000000001";
  // the double for this token is exactly 2147483647
  EXPECT_FALSE(invoicer::coerce_int32(json::parse(near_max), v, &near_max));
  EXPECT_EQ(v, 42);

  const std::string whole = "2147483647.000";
  EXPECT_TRUE(invoicer::coerce_int32(json::parse(whole), v, &whole));
  EXPECT_EQ(v, 2147483647);

  const std::string exp = "2.5e1";
  EXPECT_FALSE(invoicer::coerce_int32(json::parse(exp), v, &exp));
}

TEST(CoerceTest, Int32FromText) {
  std::int32_t v = 0;
  EXPECT_TRUE(invoicer::coerce_int32(json("250"), v));
  EXPECT_EQ(v, 250);

  EXPECT_TRUE(invoicer::coerce_int32(json("12.0"), v));
  EXPECT_EQ(v, 12);

  EXPECT_TRUE(invoicer::coerce_int32(json(" 42 "), v));
  EXPECT_EQ(v, 42);

  EXPECT_TRUE(invoicer::coerce_int32(json("1,000"), v));
  EXPECT_EQ(v, 1000);

  EXPECT_FALSE(invoicer::coerce_int32(json("abc"), v));
  EXPECT_FALSE(invoicer::coerce_int32(json("12.5"), v));
  EXPECT_FALSE(invoicer::coerce_int32(json("2147483648"), v));
  EXPECT_FALSE(invoicer::coerce_int32(json("3000000000.0"), v));
  EXPECT_FALSE(invoicer::coerce_int32(json(""), v));
}

TEST(CoerceTest, Int32RejectsOtherKinds) {
  std::int32_t v = 0;
  EXPECT_FALSE(invoicer::coerce_int32(json(true), v));
  EXPECT_FALSE(invoicer::coerce_int32(json(nullptr), v));
  EXPECT_FALSE(invoicer::coerce_int32(json::array({1}), v));
  EXPECT_FALSE(invoicer::coerce_int32(json::object(), v));
}

// ==================== Decimal target ====================

TEST(CoerceTest, DecimalFromJsonNumbers) {
  Decimal d;
  EXPECT_TRUE(invoicer::coerce_decimal(json(10), d));
  EXPECT_EQ(d.to_string(), "10");

  EXPECT_TRUE(invoicer::coerce_decimal(json::parse("0.1"), d));
  EXPECT_EQ(d, Decimal::from_units(1, 1));

  EXPECT_TRUE(invoicer::coerce_decimal(json(-2.5), d));
  EXPECT_EQ(d, Decimal::from_units(-25, 1));
}

TEST(CoerceTest, DecimalFromFloatTokenIsExact) {
  Decimal d;
  const std::string written = "10.50";
  EXPECT_TRUE(invoicer::coerce_decimal(json::parse(written), d, &written));
  EXPECT_EQ(d.to_string(), "10.50");

  const std::string long_fraction = "123456789.123456789";
  EXPECT_TRUE(invoicer::coerce_decimal(json::parse(long_fraction), d, &long_fraction));
  EXPECT_EQ(d.to_string(), "123456789.123456789");

  const std::string tiny = "5e-324";
  EXPECT_TRUE(invoicer::coerce_decimal(json::parse(tiny), d, &tiny));
  EXPECT_EQ(d, Decimal::from_int(0));

  // without the token the double's shortest form is used
  EXPECT_TRUE(invoicer::coerce_decimal(json(10.5), d));
  EXPECT_EQ(d.to_string(), "10.5");
}

TEST(CoerceTest, DecimalFromText) {
  Decimal d;
  EXPECT_TRUE(invoicer::coerce_decimal(json("10.50"), d));
  EXPECT_EQ(d.to_string(), "10.50");

  EXPECT_FALSE(invoicer::coerce_decimal(json("abc"), d));
  EXPECT_FALSE(invoicer::coerce_decimal(json("1e3"), d));
  EXPECT_FALSE(invoicer::coerce_decimal(json(""), d));
}

TEST(CoerceTest, DecimalRejectsOtherKinds) {
  Decimal d;
  EXPECT_FALSE(invoicer::coerce_decimal(json(false), d));
  EXPECT_FALSE(invoicer::coerce_decimal(json(nullptr), d));
  EXPECT_FALSE(invoicer::coerce_decimal(json::array(), d));
  EXPECT_FALSE(invoicer::coerce_decimal(json::object(), d));
}

// ==================== Text ====================

TEST(CoerceTest, TextFromAnyNonNullValue) {
  std::string s;
  EXPECT_TRUE(invoicer::coerce_text(json("C1"), s));
  EXPECT_EQ(s, "C1");

  EXPECT_TRUE(invoicer::coerce_text(json(42), s));
  EXPECT_EQ(s, "42");

  EXPECT_TRUE(invoicer::coerce_text(json(true), s));
  EXPECT_EQ(s, "true");

  const std::string token = "7.50";
  EXPECT_TRUE(invoicer::coerce_text(json::parse(token), s, &token));
  EXPECT_EQ(s, "7.50");

  s = "unchanged";
  EXPECT_FALSE(invoicer::coerce_text(json(nullptr), s));
  EXPECT_EQ(s, "unchanged");
}
