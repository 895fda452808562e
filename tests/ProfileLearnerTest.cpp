#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ranker/ProfileLearner.hpp"

namespace ranker::test {

class ProfileLearnerTest : public ::testing::Test {
protected:
    AIProfile profile;

    static FeedbackEvent event(const std::string& category, FeedbackRating rating,
                               std::vector<std::string> tags = {}) {
        FeedbackEvent e;
        e.category = category;
        e.rating = rating;
        e.tags = std::move(tags);
        return e;
    }
};

// ============================================================================
// Categories
// ============================================================================

TEST_F(ProfileLearnerTest, PositiveFeedbackAddsFavorite) {
    profile.disliked_categories = {"coffee"};
    const AIProfile next = apply_feedback(profile, event("Cafe", FeedbackRating::Positive));

    EXPECT_EQ(next.favorite_categories, (std::vector<std::string>{"coffee"}));
    EXPECT_TRUE(next.disliked_categories.empty());
}

TEST_F(ProfileLearnerTest, NegativeFeedbackMovesCategoryToDisliked) {
    profile.favorite_categories = {"hiking", "coffee"};
    const AIProfile next = apply_feedback(profile, event("hiking", FeedbackRating::Negative));

    EXPECT_EQ(next.favorite_categories, (std::vector<std::string>{"coffee"}));
    EXPECT_EQ(next.disliked_categories, (std::vector<std::string>{"hiking"}));
}

TEST_F(ProfileLearnerTest, RepeatedCategoryMovesToMostRecent) {
    profile.favorite_categories = {"coffee", "arts", "fitness"};
    const AIProfile next = apply_feedback(profile, event("coffee", FeedbackRating::Positive));
    EXPECT_EQ(next.favorite_categories, (std::vector<std::string>{"arts", "fitness", "coffee"}));
}

TEST_F(ProfileLearnerTest, CategoryMemoryEvictsOldest) {
    for (int i = 0; i < 10; ++i) profile.favorite_categories.push_back("cat" + std::to_string(i));

    const AIProfile next = apply_feedback(profile, event("newest", FeedbackRating::Positive));
    ASSERT_EQ(next.favorite_categories.size(), 10u);
    EXPECT_EQ(next.favorite_categories.front(), "cat1");
    EXPECT_EQ(next.favorite_categories.back(), "newest");
}

TEST_F(ProfileLearnerTest, ConflictingInputIsRepairedInFavorOfDislike) {
    profile.favorite_categories = {"coffee", "arts"};
    profile.disliked_categories = {"coffee"};

    const AIProfile next = apply_feedback(profile, event("fitness", FeedbackRating::Positive));
    EXPECT_EQ(next.favorite_categories, (std::vector<std::string>{"arts", "fitness"}));
    EXPECT_EQ(next.disliked_categories, (std::vector<std::string>{"coffee"}));
}

TEST_F(ProfileLearnerTest, InputProfileIsNotModified) {
    profile.favorite_categories = {"coffee"};
    const AIProfile before = profile;

    (void)apply_feedback(profile, event("coffee", FeedbackRating::Negative, {"too far"}));
    EXPECT_EQ(profile.favorite_categories, before.favorite_categories);
    EXPECT_DOUBLE_EQ(profile.preferred_distance, before.preferred_distance);
}

// ============================================================================
// Tags
// ============================================================================

TEST_F(ProfileLearnerTest, TooFarShortensDistanceAndTolerance) {
    const LearningOutcome out = learn_from_feedback(profile, event("hiking", FeedbackRating::Negative, {"too far"}));

    EXPECT_DOUBLE_EQ(out.profile.preferred_distance, 4.5);
    EXPECT_EQ(out.profile.distance_tolerance, DistanceTolerance::Low);
    EXPECT_EQ(out.applied_tags, (std::vector<std::string>{"too_far"}));
}

TEST_F(ProfileLearnerTest, PreferredDistanceHasAFloor) {
    profile.preferred_distance = 0.7;
    EXPECT_DOUBLE_EQ(apply_feedback(profile, event("x", FeedbackRating::Negative, {"too_far"})).preferred_distance, 0.5);

    profile.preferred_distance = 0.3;
    EXPECT_DOUBLE_EQ(apply_feedback(profile, event("x", FeedbackRating::Negative, {"too_far"})).preferred_distance, 0.3);
}

TEST_F(ProfileLearnerTest, ConvenientShortensDistance) {
    const AIProfile next = apply_feedback(profile, event("coffee", FeedbackRating::Positive, {"Convenient"}));
    EXPECT_DOUBLE_EQ(next.preferred_distance, 4.5);
}

TEST_F(ProfileLearnerTest, GreatValueLowersPriceSensitivity) {
    profile.price_sensitivity = PriceSensitivity::High;
    AIProfile next = apply_feedback(profile, event("coffee", FeedbackRating::Positive, {"great value"}));
    EXPECT_EQ(next.price_sensitivity, PriceSensitivity::Medium);

    next = apply_feedback(next, event("coffee", FeedbackRating::Positive, {"good_value"}));
    EXPECT_EQ(next.price_sensitivity, PriceSensitivity::Low);

    next = apply_feedback(next, event("coffee", FeedbackRating::Positive, {"good_value"}));
    EXPECT_EQ(next.price_sensitivity, PriceSensitivity::Low);
}

TEST_F(ProfileLearnerTest, TooExpensiveRaisesSensitivityAndLowersBudget) {
    AIProfile next = apply_feedback(profile, event("dining", FeedbackRating::Negative, {"too expensive"}));
    EXPECT_EQ(next.price_sensitivity, PriceSensitivity::High);
    ASSERT_TRUE(next.budget_level.has_value());
    EXPECT_DOUBLE_EQ(*next.budget_level, 1.5);

    next = apply_feedback(next, event("dining", FeedbackRating::Negative, {"too expensive"}));
    EXPECT_DOUBLE_EQ(*next.budget_level, 1.0);

    next = apply_feedback(next, event("dining", FeedbackRating::Negative, {"too expensive"}));
    EXPECT_DOUBLE_EQ(*next.budget_level, 1.0);
}

TEST_F(ProfileLearnerTest, TooCrowdedIsDeferred) {
    const LearningOutcome out = learn_from_feedback(profile, event("bars", FeedbackRating::Negative, {"too crowded"}));
    EXPECT_EQ(out.deferred_tags, (std::vector<std::string>{"too_crowded"}));
    EXPECT_TRUE(out.applied_tags.empty());
    EXPECT_DOUBLE_EQ(out.profile.preferred_distance, profile.preferred_distance);
    EXPECT_EQ(out.profile.price_sensitivity, profile.price_sensitivity);
}

TEST_F(ProfileLearnerTest, UnknownAndMismatchedTagsAreIgnored) {
    const LearningOutcome out =
        learn_from_feedback(profile, event("bars", FeedbackRating::Positive, {"loud music", "too far"}));
    EXPECT_EQ(out.ignored_tags, (std::vector<std::string>{"loud_music", "too_far"}));
    EXPECT_DOUBLE_EQ(out.profile.preferred_distance, 5.0);
}

// ============================================================================
// Budget
// ============================================================================

TEST_F(ProfileLearnerTest, LikedPriceTierBlendsIntoBudget) {
    FeedbackEvent e = event("dining", FeedbackRating::Positive);
    e.price_tier = 0;
    const AIProfile next = apply_feedback(profile, e);
    ASSERT_TRUE(next.budget_level.has_value());
    EXPECT_DOUBLE_EQ(*next.budget_level, 1.0);  // round(0.7 * 2 + 0.3 * 0)
}

TEST_F(ProfileLearnerTest, DislikedPriceTierDoesNotMoveBudget) {
    FeedbackEvent e = event("dining", FeedbackRating::Negative);
    e.price_tier = 3;
    EXPECT_FALSE(apply_feedback(profile, e).budget_level.has_value());
}

TEST_F(ProfileLearnerTest, EmptyCategoryStillAppliesTags) {
    const AIProfile next = apply_feedback(profile, event("", FeedbackRating::Negative, {"too far"}));
    EXPECT_TRUE(next.disliked_categories.empty());
    EXPECT_DOUBLE_EQ(next.preferred_distance, 4.5);
}

// ============================================================================
// Statistics
// ============================================================================

TEST_F(ProfileLearnerTest, StatsCountRatingsAndSatisfaction) {
    const std::vector<FeedbackEvent> events = {
        event("coffee", FeedbackRating::Positive),
        event("Cafe", FeedbackRating::Positive),
        event("hiking", FeedbackRating::Positive),
        event("bars", FeedbackRating::Negative),
        event("live music", FeedbackRating::Positive),
        event("hiking", FeedbackRating::Positive),
        event("coffee", FeedbackRating::Positive),
        event("bars", FeedbackRating::Negative),
    };

    const FeedbackStats stats = summarize_feedback(events);
    EXPECT_EQ(stats.total, 8u);
    EXPECT_EQ(stats.positive, 6u);
    EXPECT_EQ(stats.negative, 2u);
    EXPECT_DOUBLE_EQ(stats.satisfaction_rate, 75.0);
    EXPECT_EQ(stats.top_categories, (std::vector<std::string>{"coffee", "hiking", "live_music"}));
}

TEST_F(ProfileLearnerTest, StatsKeepAtMostTopN) {
    std::vector<FeedbackEvent> events;
    for (const char* c : {"a", "b", "c", "d", "e", "f", "g"}) events.push_back(event(c, FeedbackRating::Positive));
    events.push_back(event("g", FeedbackRating::Positive));

    const FeedbackStats stats = summarize_feedback(events);
    ASSERT_EQ(stats.top_categories.size(), 5u);
    EXPECT_EQ(stats.top_categories.front(), "g");
    EXPECT_EQ(stats.top_categories.back(), "d");

    EXPECT_EQ(summarize_feedback(events, 2).top_categories, (std::vector<std::string>{"g", "a"}));
}

TEST_F(ProfileLearnerTest, StatsOfNoFeedbackAreZero) {
    const FeedbackStats stats = summarize_feedback({});
    EXPECT_EQ(stats.total, 0u);
    EXPECT_DOUBLE_EQ(stats.satisfaction_rate, 0.0);
    EXPECT_TRUE(stats.top_categories.empty());
}

}  // namespace ranker::test
