#include <gtest/gtest.h>

#include "ranker/Taxonomy.hpp"

namespace ranker::test {

TEST(TaxonomyTest, NormalizeKey) {
    EXPECT_EQ(normalize_key("  Live  Music "), "live_music");
    EXPECT_EQ(normalize_key("too-far"), "too_far");
    EXPECT_EQ(normalize_key("Great__Value"), "great_value");
    EXPECT_EQ(normalize_key(""), "");
}

TEST(TaxonomyTest, AliasesFoldToCanonicalCategory) {
    EXPECT_EQ(normalize_category("Cafe"), "coffee");
    EXPECT_EQ(normalize_category("bar"), "bars");
    EXPECT_EQ(normalize_category("Museum"), "culture");
    EXPECT_EQ(normalize_category("restaurant"), "dining");
    EXPECT_EQ(normalize_category("hiking"), "hiking");
}

TEST(TaxonomyTest, ContainsCategoryNormalizesList) {
    EXPECT_TRUE(contains_category({"Cafe", "Park"}, "coffee"));
    EXPECT_TRUE(contains_category({"Cafe", "Park"}, "outdoor"));
    EXPECT_FALSE(contains_category({"Cafe"}, "bars"));
}

TEST(TaxonomyTest, HourWindowIsHalfOpenAndWraps) {
    const HourWindow morning{7, 10};
    EXPECT_TRUE(morning.contains(7));
    EXPECT_TRUE(morning.contains(9));
    EXPECT_FALSE(morning.contains(10));

    const HourWindow late{20, 2};
    EXPECT_TRUE(late.contains(20));
    EXPECT_TRUE(late.contains(0));
    EXPECT_TRUE(late.contains(1));
    EXPECT_FALSE(late.contains(2));
    EXPECT_FALSE(late.contains(12));

    EXPECT_FALSE((HourWindow{5, 5}).contains(5));
}

TEST(TaxonomyTest, Dayparts) {
    EXPECT_EQ(daypart_for_hour(5), Daypart::Morning);
    EXPECT_EQ(daypart_for_hour(12), Daypart::Afternoon);
    EXPECT_EQ(daypart_for_hour(17), Daypart::Evening);
    EXPECT_EQ(daypart_for_hour(21), Daypart::Night);
    EXPECT_EQ(daypart_for_hour(3), Daypart::Night);
}

TEST(TaxonomyTest, DefaultTablesCoverCoreCategories) {
    const auto windows = default_time_windows();
    ASSERT_TRUE(windows.count("coffee"));
    EXPECT_EQ(windows.at("coffee").ideal.front().start_hour, 7);

    const auto related = default_related_categories();
    ASSERT_TRUE(related.count("coffee"));
    EXPECT_EQ(related.at("coffee").front(), "dining");
}

}  // namespace ranker::test
