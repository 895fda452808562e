#pragma once

#include <vector>

#include "ranker/EngineConfig.hpp"
#include "ranker/Models.hpp"
#include "ranker/Scorer.hpp"
#include "ranker/Selector.hpp"

namespace ranker {

struct RecommendationRun {
    int effective_k = 0;
    int sponsor_cap = 0;
    int available_categories = 0;

    std::vector<ScoredCandidate> scored;              // every candidate, ranking order
    std::vector<Recommendation> recommendations;      // selected, explained
    std::vector<SelectionDecision> decisions;

    // An empty result is a valid outcome ("no recommendations available").
    bool empty() const { return recommendations.empty(); }
};

// score -> sponsor boost -> business rules -> explanations
RecommendationRun recommend(
    const std::vector<Candidate>& candidates,
    const UserProfile& user,
    const AIProfile& ai,
    const ScoringContext& ctx,
    const EngineConfig& cfg = {}
);

}  // namespace ranker
