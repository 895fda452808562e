#include <gtest/gtest.h>

#include <string>

#include "ranker/Explainer.hpp"

namespace ranker::test {

static Recommendation make_rec(double base, double location, double time) {
    Recommendation r;
    r.candidate.id = "c";
    r.candidate.category = "coffee";
    r.score.base = base;
    r.score.location = location;
    r.score.time = time;
    r.score.feedback = 5.0;
    r.score.collaborative = 5.0;
    r.score.base_total = base + location + time + 10.0;
    r.score.final_score = r.score.base_total;
    r.evidence.category = "coffee";
    return r;
}

TEST(ExplainerTest, InterestLeadsWithDistanceSecond) {
    Recommendation r = make_rec(40, 20, 15);
    r.candidate.rating = 4.8;
    r.evidence.interest_match = InterestMatch::TopInterest;
    r.evidence.matched_interest = "coffee";
    r.evidence.location_reference = LocationReference::Home;
    r.evidence.distance = 0.3;
    r.evidence.time_fit = TimeFit::Ideal;
    r.evidence.daypart = Daypart::Morning;

    EXPECT_EQ(explain(r), "Matches your interest in coffee, 0.3 mi away.");
}

TEST(ExplainerTest, LocationLeadsWhenItIsTheLargestSubScore) {
    Recommendation r = make_rec(10, 20, 5);
    r.evidence.location_reference = LocationReference::Home;
    r.evidence.distance = 0.3;

    EXPECT_EQ(dominant_factor(r.score), ExplanationFactor::Location);
    EXPECT_EQ(explain(r), "Just 0.3 mi away.");
}

TEST(ExplainerTest, HighRatingFillsInForAWeakSecondFactor) {
    Recommendation r = make_rec(10, 20, 5);
    r.evidence.location_reference = LocationReference::Home;
    r.evidence.distance = 0.3;
    r.candidate.rating = 4.7;

    EXPECT_EQ(explain(r), "Just 0.3 mi away, highly rated.");
}

TEST(ExplainerTest, CommuteLead) {
    Recommendation r = make_rec(10, 20, 5);
    r.evidence.location_reference = LocationReference::Commute;
    r.evidence.distance = 0.2;

    EXPECT_EQ(explain(r), "Right on your commute.");
}

TEST(ExplainerTest, UnknownLocationIsVague) {
    Recommendation r = make_rec(40, 20, 5);
    r.evidence.interest_match = InterestMatch::TopInterest;
    r.evidence.matched_interest = "coffee";
    r.evidence.location_reference = LocationReference::Unknown;

    EXPECT_EQ(explain(r), "Matches your interest in coffee, in your area.");
}

TEST(ExplainerTest, TimeLeads) {
    Recommendation r = make_rec(10, 5, 15);
    r.evidence.time_fit = TimeFit::Ideal;
    r.evidence.daypart = Daypart::Evening;

    EXPECT_EQ(dominant_factor(r.score), ExplanationFactor::Time);
    EXPECT_EQ(explain(r), "Perfect for this evening.");
}

TEST(ExplainerTest, GoodWindowWording) {
    Recommendation r = make_rec(40, 5, 10);
    r.evidence.interest_match = InterestMatch::TopInterest;
    r.evidence.matched_interest = "coffee";
    r.evidence.time_fit = TimeFit::Good;
    r.evidence.daypart = Daypart::Morning;

    ExplainConfig ecfg;
    ecfg.secondary_share = 0.6;
    EXPECT_EQ(explain(r, ScoreConfig{}, ecfg), "Matches your interest in coffee, a good fit for this morning.");
}

TEST(ExplainerTest, InterestLeadsWithIdealTimeSecond) {
    Recommendation r = make_rec(40, 5, 15);
    r.evidence.interest_match = InterestMatch::TopInterest;
    r.evidence.matched_interest = "arts";
    r.evidence.time_fit = TimeFit::Ideal;
    r.evidence.daypart = Daypart::Afternoon;

    EXPECT_EQ(explain(r), "Matches your interest in arts, perfect for this afternoon.");
}

TEST(ExplainerTest, RelatedInterestUsesReadableName) {
    Recommendation r = make_rec(20, 5, 5);
    r.evidence.interest_match = InterestMatch::Related;
    r.evidence.matched_interest = "live_music";

    EXPECT_EQ(explain(r), "Similar to your interest in live music.");
}

TEST(ExplainerTest, StatedInterestOutranksFullLocationAndTime) {
    Recommendation r = make_rec(30, 20, 15);
    r.evidence.interest_match = InterestMatch::Interest;
    r.evidence.matched_interest = "coffee";
    r.evidence.location_reference = LocationReference::Home;
    r.evidence.distance = 0.3;
    r.evidence.time_fit = TimeFit::Ideal;
    r.evidence.daypart = Daypart::Morning;

    EXPECT_EQ(dominant_factor(r.score), ExplanationFactor::Interest);
    EXPECT_EQ(explain(r), "Matches your interest in coffee, 0.3 mi away.");
}

TEST(ExplainerTest, TiedSubScoresFavorInterestThenLocation) {
    EXPECT_EQ(dominant_factor(make_rec(15, 15, 15).score), ExplanationFactor::Interest);
    EXPECT_EQ(dominant_factor(make_rec(10, 15, 15).score), ExplanationFactor::Location);
}

TEST(ExplainerTest, SecondClausePicksTheFullerBudget) {
    Recommendation r = make_rec(20, 5, 15);
    r.evidence.interest_match = InterestMatch::Related;
    r.evidence.matched_interest = "live_music";
    r.evidence.time_fit = TimeFit::Ideal;
    r.evidence.daypart = Daypart::Evening;

    EXPECT_EQ(dominant_factor(r.score), ExplanationFactor::Interest);
    EXPECT_EQ(explain(r), "Similar to your interest in live music, perfect for this evening.");
}

TEST(ExplainerTest, AllZeroSubScoresFavorInterest) {
    ScoreBreakdown s;
    EXPECT_EQ(dominant_factor(s), ExplanationFactor::Interest);
}

TEST(ExplainerTest, NeverMentionsScores) {
    Recommendation r = make_rec(40, 20, 15);
    r.evidence.interest_match = InterestMatch::TopInterest;
    r.evidence.matched_interest = "coffee";
    r.evidence.location_reference = LocationReference::Home;
    r.evidence.distance = 0.3;

    const std::string text = explain(r);
    EXPECT_EQ(text.find("85"), std::string::npos);
    EXPECT_EQ(text.find("score"), std::string::npos);
    EXPECT_EQ(text.find("point"), std::string::npos);
}

TEST(ExplainerTest, SecondaryThresholdIsConfigurable) {
    Recommendation r = make_rec(40, 10, 5);
    r.evidence.interest_match = InterestMatch::TopInterest;
    r.evidence.matched_interest = "coffee";
    r.evidence.location_reference = LocationReference::Home;
    r.evidence.distance = 2.5;

    EXPECT_EQ(explain(r), "Matches your interest in coffee.");

    ExplainConfig ecfg;
    ecfg.secondary_share = 0.5;
    EXPECT_EQ(explain(r, ScoreConfig{}, ecfg), "Matches your interest in coffee, 2.5 mi away.");
}

}  // namespace ranker::test
