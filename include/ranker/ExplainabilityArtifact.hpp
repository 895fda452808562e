#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "ranker/Engine.hpp"
#include "ranker/EngineConfig.hpp"
#include "ranker/Scorer.hpp"
#include "ranker/Selector.hpp"

namespace ranker {

// What was recommended and why, including every selection decision.
// `loop-ranker validate` re-checks the business rules against this file.
struct ExplainabilityArtifact {
    std::string candidates_path;
    std::string user_path;
    std::string ai_profile_path;

    ScoringContext context;
    EngineConfig cfg;

    int effective_k = 0;
    int sponsor_cap = 0;
    int available_categories = 0;

    std::vector<Recommendation> selected;
    std::vector<SelectionDecision> decisions;

    static ExplainabilityArtifact from_run(const RecommendationRun& run, const ScoringContext& ctx, const EngineConfig& cfg);

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

nlohmann::json context_to_json(const ScoringContext& ctx);

}  // namespace ranker
