#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "TestFixtures.hpp"
#include "ranker/Selector.hpp"

namespace ranker::test {

static std::vector<std::string> selected_ids(const SelectorResult& res) {
    std::vector<std::string> ids;
    for (const auto& r : res.selected) ids.push_back(r.candidate.id);
    return ids;
}

static std::set<std::string> selected_categories(const SelectorResult& res) {
    std::set<std::string> cats;
    for (const auto& r : res.selected) cats.insert(r.evidence.category);
    return cats;
}

static const SelectionDecision* last_decision(const SelectorResult& res, const std::string& id) {
    const SelectionDecision* found = nullptr;
    for (const auto& d : res.decisions) {
        if (d.candidate_id == id) found = &d;
    }
    return found;
}

TEST(SelectorTest, EffectiveKIsClampedToMinimum) {
    SelectorConfig cfg;
    cfg.k = 3;
    EXPECT_EQ(effective_k(cfg), 5);
    cfg.k = 12;
    EXPECT_EQ(effective_k(cfg), 12);
}

TEST(SelectorTest, SponsorCapIsFortyPercentFloored) {
    SelectorConfig cfg;
    EXPECT_EQ(max_sponsored(5, cfg), 2);
    EXPECT_EQ(max_sponsored(10, cfg), 4);
    EXPECT_EQ(max_sponsored(7, cfg), 2);
}

TEST(SelectorTest, EmptyInputIsAValidEmptyResult) {
    const SelectorResult res = select_candidates({}, SelectorConfig{});
    EXPECT_TRUE(res.selected.empty());
    EXPECT_TRUE(res.decisions.empty());
    EXPECT_EQ(res.available_categories, 0);
}

TEST(SelectorTest, FewerCandidatesThanKAreAllReturned) {
    const std::vector<ScoredCandidate> scored = {
        make_scored("a", "coffee", 80),
        make_scored("b", "arts", 70),
        make_scored("c", "fitness", 60),
    };
    const SelectorResult res = select_candidates(scored, 10);
    EXPECT_EQ(selected_ids(res), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(SelectorTest, TiesBreakByIdAscending) {
    const std::vector<ScoredCandidate> scored = {
        make_scored("m", "coffee", 50),
        make_scored("c", "arts", 50),
        make_scored("x", "fitness", 50),
        make_scored("a", "dining", 50),
    };
    const SelectorResult res = select_candidates(scored, 5);
    EXPECT_EQ(selected_ids(res), (std::vector<std::string>{"a", "c", "m", "x"}));
}

TEST(SelectorTest, KeepsOnlyBestListingPerBusiness) {
    const std::vector<ScoredCandidate> scored = {
        make_scored("yelp-1", "coffee", 70, SponsorTier::Organic, std::string("biz-1")),
        make_scored("google-1", "coffee", 75, SponsorTier::Organic, std::string("biz-1")),
        make_scored("other", "arts", 60),
    };
    const SelectorResult res = select_candidates(scored, 5);

    EXPECT_EQ(selected_ids(res), (std::vector<std::string>{"google-1", "other"}));
    const SelectionDecision* d = last_decision(res, "yelp-1");
    ASSERT_NE(d, nullptr);
    EXPECT_FALSE(d->accepted);
    EXPECT_EQ(d->reason, "duplicate_business");
}

TEST(SelectorTest, MissingBusinessIdNeverCollides) {
    const std::vector<ScoredCandidate> scored = {
        make_scored("a", "coffee", 70),
        make_scored("b", "coffee", 69),
    };
    EXPECT_EQ(select_candidates(scored, 5).selected.size(), 2u);
}

TEST(SelectorTest, SponsoredEntriesAreCapped) {
    std::vector<ScoredCandidate> scored;
    for (int i = 0; i < 6; ++i) {
        scored.push_back(make_scored("s" + std::to_string(i), i % 2 ? "coffee" : "arts", 120 - i, SponsorTier::Premium));
    }
    for (int i = 0; i < 6; ++i) {
        scored.push_back(make_scored("o" + std::to_string(i), i % 2 ? "fitness" : "dining", 60 - i));
    }

    const SelectorResult res = select_candidates(scored, 5);
    ASSERT_EQ(res.selected.size(), 5u);
    EXPECT_EQ(res.sponsor_cap, 2);

    const auto sponsored = std::count_if(res.selected.begin(), res.selected.end(),
                                         [](const Recommendation& r) { return r.is_sponsored; });
    EXPECT_EQ(sponsored, 2);

    const SelectionDecision* d = last_decision(res, "s2");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->reason, "sponsor_cap");
}

TEST(SelectorTest, DiversityFloorSwapsInAbsentCategory) {
    std::vector<ScoredCandidate> scored;
    for (int i = 0; i < 8; ++i) scored.push_back(make_scored("bar" + std::to_string(i), "bars", 90 - i));
    scored.push_back(make_scored("museum0", "culture", 40));
    scored.push_back(make_scored("museum1", "culture", 39));

    const SelectorResult res = select_candidates(scored, 5);
    ASSERT_EQ(res.selected.size(), 5u);
    EXPECT_EQ(res.available_categories, 2);
    EXPECT_EQ(selected_categories(res).size(), 2u);

    // The weakest bar made room; the best museum came in and sorts last.
    EXPECT_EQ(selected_ids(res), (std::vector<std::string>{"bar0", "bar1", "bar2", "bar3", "museum0"}));

    const SelectionDecision* out = last_decision(res, "bar4");
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->reason, "diversity_swap_out");
    const SelectionDecision* in = last_decision(res, "museum0");
    ASSERT_NE(in, nullptr);
    EXPECT_TRUE(in->accepted);
    EXPECT_EQ(in->reason, "diversity_swap_in");
}

TEST(SelectorTest, DiversityFloorReachesThreeCategories) {
    std::vector<ScoredCandidate> scored;
    for (int i = 0; i < 6; ++i) scored.push_back(make_scored("coffee" + std::to_string(i), "coffee", 95 - i));
    for (int i = 0; i < 6; ++i) scored.push_back(make_scored("arts" + std::to_string(i), "arts", 85 - i));
    scored.push_back(make_scored("gym", "fitness", 30));
    scored.push_back(make_scored("park", "outdoor", 29));

    const SelectorResult res = select_candidates(scored, 10);
    ASSERT_EQ(res.selected.size(), 10u);
    EXPECT_GE(selected_categories(res).size(), 3u);
    EXPECT_TRUE(selected_categories(res).count("fitness"));
}

TEST(SelectorTest, SwapNeverEmptiesACategory) {
    std::vector<ScoredCandidate> scored = {
        make_scored("a0", "coffee", 90),
        make_scored("a1", "coffee", 89),
        make_scored("a2", "coffee", 88),
        make_scored("a3", "coffee", 87),
        make_scored("b0", "arts", 86),
        make_scored("c0", "fitness", 10),
    };

    const SelectorResult res = select_candidates(scored, 5);
    const auto cats = selected_categories(res);
    EXPECT_EQ(cats.size(), 3u);
    EXPECT_TRUE(cats.count("arts"));
    const auto ids = selected_ids(res);
    EXPECT_EQ(std::count(ids.begin(), ids.end(), "a3"), 0);
}

TEST(SelectorTest, SponsoredNewcomerUnderFullCapOnlyReplacesSponsored) {
    std::vector<ScoredCandidate> scored = {
        make_scored("s0", "coffee", 100, SponsorTier::Boosted),
        make_scored("s1", "coffee", 99, SponsorTier::Boosted),
        make_scored("o0", "coffee", 98),
        make_scored("o1", "coffee", 97),
        make_scored("o2", "arts", 96),
        make_scored("s-gym", "fitness", 20, SponsorTier::Premium),
    };

    const SelectorResult res = select_candidates(scored, 5);
    const auto sponsored = std::count_if(res.selected.begin(), res.selected.end(),
                                         [](const Recommendation& r) { return r.is_sponsored; });
    EXPECT_LE(sponsored, res.sponsor_cap);
    EXPECT_TRUE(selected_categories(res).count("fitness"));

    const SelectionDecision* out = last_decision(res, "s1");
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->reason, "diversity_swap_out");
}

TEST(SelectorTest, InputOrderDoesNotMatter) {
    std::vector<ScoredCandidate> scored;
    for (int i = 0; i < 12; ++i) {
        const char* cats[] = {"coffee", "arts", "bars", "fitness"};
        scored.push_back(make_scored("id" + std::to_string(i), cats[i % 4], 50 + (i * 7) % 13,
                                     i % 3 == 0 ? SponsorTier::Boosted : SponsorTier::Organic));
    }

    std::vector<ScoredCandidate> reversed(scored.rbegin(), scored.rend());
    EXPECT_EQ(selected_ids(select_candidates(scored, 6)), selected_ids(select_candidates(reversed, 6)));
}

}  // namespace ranker::test
