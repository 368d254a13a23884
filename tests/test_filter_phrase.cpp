/// @file test_filter_phrase.cpp
/// Unit tests for filter_phrase.hpp: residual "title contains" extraction.

#include "filter_phrase.hpp"
#include "vocabulary.hpp"

#include <gtest/gtest.h>

using namespace bulk_planner;

// ============================================================================
// residualPhrase
// ============================================================================

TEST(ResidualPhrase, StripsNumbersStopWordsAndConsumed) {
    EXPECT_EQ(residualPhrase("increase hoodie prices by 10%", vocabulary::kPriceConsumed),
              "hoodie");
}

TEST(ResidualPhrase, StripsQuotedLiterals) {
    EXPECT_EQ(residualPhrase(R"(add "Summer Sale" to all denim jackets)",
                             vocabulary::kTagsConsumed),
              "denim jackets");
}

TEST(ResidualPhrase, StripsCurrencySymbolsAndPunctuation) {
    EXPECT_EQ(residualPhrase("set price of red scarves to €15.50, please!",
                             vocabulary::kPriceConsumed),
              "red scarves");
}

TEST(ResidualPhrase, ConsumedFragmentsAreCaseInsensitive) {
    EXPECT_EQ(residualPhrase("RAISE Beanie PRICES BY 5", vocabulary::kPriceConsumed),
              "Beanie");
}

TEST(ResidualPhrase, ConsumedFragmentsMatchWholeWordsOnly) {
    EXPECT_EQ(residualPhrase("lower flower prices by 2", vocabulary::kPriceConsumed),
              "flower");
}

TEST(ResidualPhrase, MultiWordFragment) {
    EXPECT_EQ(residualPhrase("set stock of mugs to 4 at Main Warehouse",
                             {"set", "stock", "at", "Main Warehouse"}),
              "mugs");
}

TEST(ResidualPhrase, EmptyFragmentsAreIgnored) {
    EXPECT_EQ(residualPhrase("archive old mugs", {"", "archive"}), "old mugs");
}

// ============================================================================
// buildFilterSpec
// ============================================================================

TEST(BuildFilterSpec, ResidueBecomesTitleContains) {
    auto filter = buildFilterSpec("increase hoodie prices by 10%", vocabulary::kPriceConsumed);
    ASSERT_TRUE(filter.titleContains.has_value());
    EXPECT_EQ(*filter.titleContains, "hoodie");
    EXPECT_FALSE(filter.empty());
}

TEST(BuildFilterSpec, ShortResidueLeavesFilterEmpty) {
    auto filter = buildFilterSpec("raise xl prices by 3%", vocabulary::kPriceConsumed);
    EXPECT_FALSE(filter.titleContains.has_value());
    EXPECT_TRUE(filter.empty());
}

TEST(BuildFilterSpec, OnlyStructuralWordsLeavesFilterEmpty) {
    auto filter = buildFilterSpec("archive all products", vocabulary::kStatusConsumed);
    EXPECT_TRUE(filter.empty());
}

TEST(BuildFilterSpec, NeverFillsStructuredCategories) {
    auto filter = buildFilterSpec("increase nike hoodie prices by 10%",
                                  vocabulary::kPriceConsumed);
    EXPECT_TRUE(filter.must.vendors.empty());
    EXPECT_TRUE(filter.must.types.empty());
    EXPECT_TRUE(filter.must.collections.empty());
    EXPECT_TRUE(filter.must.tags.empty());
    EXPECT_TRUE(filter.mustNot.tags.empty());
    EXPECT_FALSE(filter.numeric.priceGte.has_value());
    EXPECT_FALSE(filter.numeric.priceLte.has_value());
    EXPECT_FALSE(filter.numeric.inventoryEq.has_value());
}
