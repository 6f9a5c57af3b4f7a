#include <gtest/gtest.h>

#include "orders/OrderParser.hpp"

namespace smartcart::test {

TEST(OrderParserTest, ExtractsNamesFromNestedJson) {
    const std::string raw =
        R"({"orders":[{"item_details":[{"item_name":"Wings","qty":2},)"
        R"({"item_name":"Ranch"}]},{"item_details":[{"item_name":"Fries"}]}]})";

    auto names = extract_item_names(raw);
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "Wings");
    EXPECT_EQ(names[1], "Ranch");
    EXPECT_EQ(names[2], "Fries");
}

TEST(OrderParserTest, AcceptsPlainStringArray) {
    auto names = extract_item_names(R"(["Wings", "Soda"])");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "Wings");
    EXPECT_EQ(names[1], "Soda");
}

TEST(OrderParserTest, UnwrapsDoubleEncodedJson) {
    auto names = extract_item_names(R"("[{\"name\":\"Wings\"},{\"name\":\"Fries\"}]")");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[1], "Fries");
}

TEST(OrderParserTest, ScansGarbledJsonForItemNames) {
    // single quotes and a missing closing brace
    const std::string raw = "[{'item_name': 'Wings', 'qty': 1}, {'item_name': 'Ranch'";
    auto names = extract_item_names(raw);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "Wings");
    EXPECT_EQ(names[1], "Ranch");
}

TEST(OrderParserTest, SplitsDelimitedText) {
    auto names = extract_item_names("Wings | Fries; Ranch,Soda");
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(clean_item_name(names[0]), "Wings");
    EXPECT_EQ(clean_item_name(names[3]), "Soda");
}

TEST(OrderParserTest, PlaceholdersAndBlankYieldNothing) {
    EXPECT_TRUE(extract_item_names("").empty());
    EXPECT_TRUE(extract_item_names("   ").empty());
    EXPECT_TRUE(extract_item_names("NaN").empty());
    EXPECT_TRUE(extract_item_names("[]").empty());
    EXPECT_TRUE(parse_order_record("{}").empty());
}

TEST(OrderParserTest, CleanItemNameStripsQuantityMarkers) {
    EXPECT_EQ(clean_item_name("2x Wings"), "Wings");
    EXPECT_EQ(clean_item_name("Wings x2"), "Wings");
    EXPECT_EQ(clean_item_name("Wings (x2)"), "Wings");
    EXPECT_EQ(clean_item_name("Wings (2)"), "Wings");
    EXPECT_EQ(clean_item_name("3 x Ranch"), "Ranch");
    EXPECT_EQ(clean_item_name("Ranch x 3"), "Ranch");
}

TEST(OrderParserTest, CleanItemNameKeepsMeaningfulNumbers) {
    EXPECT_EQ(clean_item_name("10 pc Wings"), "10 pc Wings");
    EXPECT_EQ(clean_item_name("7up"), "7up");
}

TEST(OrderParserTest, CleanItemNameTrimsPunctuationAndWhitespace) {
    EXPECT_EQ(clean_item_name("  \"Cajun   Fried Corn\", "), "Cajun Fried Corn");
    EXPECT_EQ(clean_item_name("*Ranch*"), "Ranch");
    EXPECT_EQ(clean_item_name("null"), "");
    EXPECT_EQ(clean_item_name(" n/a "), "");
}

TEST(OrderParserTest, ParseOrderRecordDropsEmptyEntries) {
    auto order = parse_order_record(R"(["Wings", "", "null", "2x Fries"])");
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "Wings");
    EXPECT_EQ(order[1], "Fries");
}

TEST(OrderParserTest, DeeplyNestedInputDoesNotThrow) {
    std::string raw;
    for (int i = 0; i < 200; ++i) raw += "[";
    raw += "\"Wings\"";
    for (int i = 0; i < 200; ++i) raw += "]";

    EXPECT_NO_THROW(parse_order_record(raw));
}

}  // namespace smartcart::test
