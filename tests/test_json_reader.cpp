#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "invoicer/json_reader.hpp"

using nlohmann::json;
using invoicer::UsageDocument;

TEST(JsonReaderTest, BuildsTheSameTreeAsParse) {
  const std::string text =
      R"([{"CustomerId":"A","API_Calls":5,"Storage_GB":10.50,"Tags":["x",null,true]},
          7, "s", [1.5, {"k":-2}], {}])";

  UsageDocument doc;
  std::string err;
  ASSERT_TRUE(invoicer::read_usage_document(text, doc, &err)) << err;
  EXPECT_EQ(doc.root, json::parse(text));
}

TEST(JsonReaderTest, KeepsFloatTokensOfEntryMembers) {
  UsageDocument doc;
  ASSERT_TRUE(invoicer::read_usage_document(
      R"([{"CustomerId":"A","Storage_GB":10.50,"API_Calls":5},
          {"Storage_GB":1e-3,"Compute_Minutes":12.0}])",
      doc));

  ASSERT_NE(doc.raw_number(0, "Storage_GB"), nullptr);
  EXPECT_EQ(*doc.raw_number(0, "Storage_GB"), "10.50");
  EXPECT_EQ(*doc.raw_number(1, "Storage_GB"), "1e-3");
  EXPECT_EQ(*doc.raw_number(1, "Compute_Minutes"), "12.0");

  // integers and strings are exact in the tree already
  EXPECT_EQ(doc.raw_number(0, "API_Calls"), nullptr);
  EXPECT_EQ(doc.raw_number(0, "CustomerId"), nullptr);
  EXPECT_EQ(doc.raw_number(2, "Storage_GB"), nullptr);
}

TEST(JsonReaderTest, IgnoresFloatsOutsideEntryMembers) {
  UsageDocument doc;
  ASSERT_TRUE(invoicer::read_usage_document(
      R"([1.25, {"Nested":{"Storage_GB":2.50},"List":[3.75]}, [4.5]])", doc));

  EXPECT_TRUE(doc.raw_numbers.empty());
  EXPECT_EQ(doc.raw_number(1, "Storage_GB"), nullptr);

  ASSERT_TRUE(invoicer::read_usage_document("2.50", doc));
  EXPECT_TRUE(doc.raw_numbers.empty());
}

TEST(JsonReaderTest, NestedMembersDoNotShiftTheEntryIndex) {
  UsageDocument doc;
  ASSERT_TRUE(invoicer::read_usage_document(
      R"([{"Meta":{"a":[1,2,{"b":3}]},"Storage_GB":0.10}, {"Storage_GB":0.20}])", doc));

  EXPECT_EQ(*doc.raw_number(0, "Storage_GB"), "0.10");
  EXPECT_EQ(*doc.raw_number(1, "Storage_GB"), "0.20");
}

TEST(JsonReaderTest, RepeatedKeyKeepsTheLastValue) {
  UsageDocument doc;
  ASSERT_TRUE(invoicer::read_usage_document(
      R"([{"Storage_GB":1.50,"Storage_GB":2.750}, {"Storage_GB":1.50,"Storage_GB":"3"}])", doc));

  EXPECT_EQ(*doc.raw_number(0, "Storage_GB"), "2.750");
  EXPECT_EQ(doc.root[1]["Storage_GB"], "3");
  EXPECT_EQ(doc.raw_number(1, "Storage_GB"), nullptr);
}

TEST(JsonReaderTest, InvalidJsonLeavesAnEmptyDocument) {
  UsageDocument doc;
  std::string err;
  EXPECT_FALSE(invoicer::read_usage_document(R"([{"Storage_GB":1.50},)", doc, &err));
  EXPECT_EQ(err.rfind("Invalid JSON: ", 0), 0u);
  EXPECT_TRUE(doc.root.is_null());
  EXPECT_TRUE(doc.raw_numbers.empty());

  err.clear();
  EXPECT_FALSE(invoicer::read_usage_document("", doc, &err));
  EXPECT_FALSE(err.empty());

  EXPECT_FALSE(invoicer::read_usage_document("[1] 2", doc));
}
