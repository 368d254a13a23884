/// @file test_util.cpp
/// Unit tests for util.hpp: listen-address parsing and keyword helpers.

#include "util.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace bulk_planner;

// ============================================================================
// parseListenAddress
// ============================================================================

TEST(ParseListenAddress, HostAndPort) {
    auto addr = parseListenAddress("127.0.0.1:8787");
    EXPECT_EQ(addr.host, "127.0.0.1");
    EXPECT_EQ(addr.port, 8787);
}

TEST(ParseListenAddress, EmptyHostMeansAllInterfaces) {
    auto addr = parseListenAddress(":9000");
    EXPECT_EQ(addr.host, "0.0.0.0");
    EXPECT_EQ(addr.port, 9000);
}

TEST(ParseListenAddress, BracketedIpv6) {
    auto addr = parseListenAddress("[::1]:8080");
    EXPECT_EQ(addr.host, "::1");
    EXPECT_EQ(addr.port, 8080);
}

TEST(ParseListenAddress, PortZeroIsAllowed) {
    EXPECT_EQ(parseListenAddress("127.0.0.1:0").port, 0);
}

TEST(ParseListenAddress, MissingPortThrows) {
    EXPECT_THROW(parseListenAddress("localhost"), std::invalid_argument);
    EXPECT_THROW(parseListenAddress("localhost:"), std::invalid_argument);
}

TEST(ParseListenAddress, NonNumericPortThrows) {
    EXPECT_THROW(parseListenAddress("localhost:http"), std::invalid_argument);
    EXPECT_THROW(parseListenAddress("localhost:-1"), std::invalid_argument);
}

TEST(ParseListenAddress, PortOutOfRangeThrows) {
    EXPECT_THROW(parseListenAddress("localhost:70000"), std::invalid_argument);
}

TEST(ParseListenAddress, UnterminatedBracketThrows) {
    EXPECT_THROW(parseListenAddress("[::1:8080"), std::invalid_argument);
}

// ============================================================================
// String helpers
// ============================================================================

TEST(StringHelpers, ToLowerLeavesUtf8Untouched) {
    EXPECT_EQ(toLower("Increase €5 PRICE"), "increase €5 price");
}

TEST(StringHelpers, TrimBothEnds) {
    EXPECT_EQ(trim("  hoodie \t\n"), "hoodie");
    EXPECT_EQ(trim("   "), "");
}

TEST(StringHelpers, CollapseWhitespace) {
    EXPECT_EQ(collapseWhitespace("  red   summer \t hoodie  "), "red summer hoodie");
    EXPECT_EQ(collapseWhitespace(" \t "), "");
}

// ============================================================================
// containsWordPrefix / containsAnyKeyword
// ============================================================================

TEST(ContainsWordPrefix, MatchesAtWordStart) {
    EXPECT_TRUE(containsWordPrefix("Archived products", "archive"));
    EXPECT_TRUE(containsWordPrefix("increase PRICES", "price"));
    EXPECT_TRUE(containsWordPrefix("compare-at price", "price"));
}

TEST(ContainsWordPrefix, IgnoresMatchesInsideWords) {
    EXPECT_FALSE(containsWordPrefix("unpublish hoodies", "publish"));
    EXPECT_FALSE(containsWordPrefix("flower pots", "lower"));
    EXPECT_FALSE(containsWordPrefix("vintage denim", "tag"));
}

TEST(ContainsWordPrefix, EmptyKeywordNeverMatches) {
    EXPECT_FALSE(containsWordPrefix("anything", ""));
}

TEST(ContainsAnyKeyword, AnyOfList) {
    EXPECT_TRUE(containsAnyKeyword("restock the stock", {"inventory", "stock"}));
    EXPECT_FALSE(containsAnyKeyword("do something vague", {"price", "tag"}));
}

TEST(ContainsAnySubstring, MatchesInsideWords) {
    EXPECT_TRUE(containsAnySubstring("RESTOCK hoodies", {"inventory", "stock"}));
    EXPECT_TRUE(containsAnySubstring("reprice mugs", {"price"}));
    EXPECT_FALSE(containsAnySubstring("do something vague", {"price", "tag"}));
    EXPECT_FALSE(containsAnySubstring("anything", {""}));
}

// ============================================================================
// removeWholeWord
// ============================================================================

TEST(RemoveWholeWord, RemovesCaseInsensitively) {
    EXPECT_EQ(collapseWhitespace(removeWholeWord("PRICE up price", "price")), "up");
}

TEST(RemoveWholeWord, KeepsLongerWords) {
    EXPECT_EQ(collapseWhitespace(removeWholeWord("prices and price", "price")),
              "prices and");
}

TEST(RemoveWholeWord, RemovesMultiWordPhrase) {
    EXPECT_EQ(collapseWhitespace(removeWholeWord("hoodies at Main Warehouse now",
                                                 "main warehouse")),
              "hoodies at now");
}
