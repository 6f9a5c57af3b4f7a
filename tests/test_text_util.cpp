#include <gtest/gtest.h>

#include "orders/TextUtil.hpp"

namespace smartcart::test {

TEST(TextUtilTest, TrimStripsOuterWhitespace) {
    EXPECT_EQ(textutil::trim("  Wings \t\n"), "Wings");
    EXPECT_EQ(textutil::trim("   "), "");
    EXPECT_EQ(textutil::trim(""), "");
}

TEST(TextUtilTest, CollapseSpacesFoldsRunsAndControlChars) {
    EXPECT_EQ(textutil::collapse_spaces("  Cajun \t  Fried\nCorn "), "Cajun Fried Corn");
    EXPECT_EQ(textutil::collapse_spaces("a\x01\x02" "b"), "a b");
    EXPECT_EQ(textutil::collapse_spaces("\t\n"), "");
}

TEST(TextUtilTest, NormalizeKeepsBundleMarkers) {
    EXPECT_EQ(textutil::normalize("Wings + Fries!"), "wings + fries");
    EXPECT_EQ(textutil::normalize("Fish & Chips"), "fish & chips");
    EXPECT_EQ(textutil::normalize("10-pc. Boneless"), "10 pc boneless");
}

TEST(TextUtilTest, LookupKeyIsCaseAndSpaceInsensitive) {
    EXPECT_EQ(textutil::lookup_key("  Veggie   STICKS "), "veggie sticks");
    EXPECT_EQ(textutil::lookup_key("Ranch"), textutil::lookup_key("ranch"));
}

TEST(TextUtilTest, ValidUtf8PassesThroughUnchanged) {
    EXPECT_EQ(textutil::to_valid_utf8("Wings"), "Wings");
    EXPECT_EQ(textutil::to_valid_utf8("Caf\xc3\xa9 Latte"), "Caf\xc3\xa9 Latte");
    EXPECT_EQ(textutil::to_valid_utf8("\xe2\x82\xac 5 Meal"), "\xe2\x82\xac 5 Meal");
    EXPECT_EQ(textutil::to_valid_utf8(""), "");
}

TEST(TextUtilTest, LegacyBytesAreReencodedAndStayDistinct) {
    EXPECT_EQ(textutil::to_valid_utf8("Caf\xe9"), "Caf\xc3\xa9");
    EXPECT_EQ(textutil::to_valid_utf8("Caf\xe8"), "Caf\xc3\xa8");
    EXPECT_EQ(textutil::to_valid_utf8("\x80" "5"), "\xe2\x82\xac" "5");

    // truncated sequence, overlong form, lone continuation byte
    EXPECT_EQ(textutil::to_valid_utf8("a\xc3"), "a\xc3\x83");
    EXPECT_EQ(textutil::to_valid_utf8("\xc0\xaf"), "\xc3\x80\xc2\xaf");
    EXPECT_EQ(textutil::to_valid_utf8("\xbf"), "\xc2\xbf");

    const std::string once = textutil::to_valid_utf8("Jalape\xf1o Poppers");
    EXPECT_EQ(textutil::to_valid_utf8(once), once);
}

TEST(TextUtilTest, LookupKeyMatchesLegacyAndUtf8Spellings) {
    EXPECT_EQ(textutil::lookup_key("CAF\xe9 latte"), textutil::lookup_key("CAF\xc3\xa9 Latte"));
    EXPECT_NE(textutil::lookup_key("Caf\xe9"), textutil::lookup_key("Caf\xe8"));
}

TEST(TextUtilTest, ContainsPhraseMatchesWholeWordsOnly) {
    EXPECT_TRUE(textutil::contains_phrase("large sweet tea", "sweet tea"));
    EXPECT_TRUE(textutil::contains_phrase("tea", "tea"));
    EXPECT_FALSE(textutil::contains_phrase("steak bites", "tea"));
    EXPECT_FALSE(textutil::contains_phrase("dipping sauce", "dip"));
}

TEST(TextUtilTest, SplitAnyKeepsEmptyPieces) {
    auto parts = textutil::split_any("a|b;;c", "|;");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "c");
}

TEST(TextUtilTest, TokenizeSkipsEmptyTokens) {
    auto toks = textutil::tokenize("hot  honey wings");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0], "hot");
    EXPECT_EQ(toks[2], "wings");
    EXPECT_TRUE(textutil::tokenize("").empty());
}

}  // namespace smartcart::test
