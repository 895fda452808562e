#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ranker/Models.hpp"

namespace ranker {

struct LearnerConfig {
    double distance_step = 0.5;           // miles per "too far" / "convenient"
    double min_preferred_distance = 0.5;  // floor
    size_t max_category_memory = 10;      // most recent entries kept per list

    double initial_budget_level = 2.0;    // when the profile has no budget yet
    double budget_blend = 0.3;            // weight of a liked price tier
    double expensive_budget_step = 0.5;
    double min_budget_level = 1.0;
};

// Tags are grouped by what the transition did with them.
struct LearningOutcome {
    AIProfile profile;
    std::vector<std::string> applied_tags;   // changed the profile
    std::vector<std::string> deferred_tags;  // recognized, no numeric effect yet ("too_crowded")
    std::vector<std::string> ignored_tags;   // unknown, or not meaningful for this rating
};

// Pure transition. Not idempotent: each FeedbackEvent must be applied exactly
// once, in order, by a single writer per user.
LearningOutcome learn_from_feedback(const AIProfile& current, const FeedbackEvent& event, const LearnerConfig& cfg = {});

AIProfile apply_feedback(const AIProfile& current, const FeedbackEvent& event, const LearnerConfig& cfg = {});

struct FeedbackStats {
    size_t total = 0;
    size_t positive = 0;
    size_t negative = 0;
    double satisfaction_rate = 0.0;          // percent positive, 0 with no events
    std::vector<std::string> top_categories;  // most liked first, normalized
};

// Learning progress over a feedback history. Categories are ranked by
// positive count, ties in order of first appearance.
FeedbackStats summarize_feedback(const std::vector<FeedbackEvent>& events, size_t top_n = 5);

}  // namespace ranker
