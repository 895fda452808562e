#include "ranker/Engine.hpp"

#include <spdlog/spdlog.h>

#include "ranker/Explainer.hpp"

namespace ranker {

RecommendationRun recommend(
    const std::vector<Candidate>& candidates,
    const UserProfile& user,
    const AIProfile& ai,
    const ScoringContext& ctx,
    const EngineConfig& cfg
) {
    RecommendationRun run;

    run.scored = score_candidates(candidates, user, ai, ctx, cfg.score);

    SelectorResult sel = select_candidates(run.scored, cfg.selector);
    run.effective_k = sel.effective_k;
    run.sponsor_cap = sel.sponsor_cap;
    run.available_categories = sel.available_categories;
    run.decisions = std::move(sel.decisions);
    run.recommendations = std::move(sel.selected);

    for (auto& rec : run.recommendations) {
        rec.explanation = explain(rec, cfg.score, cfg.explain);
    }

    if (run.empty()) {
        spdlog::info("no recommendations available ({} candidates)", candidates.size());
    } else {
        spdlog::debug("selected {} of {} candidates (k={})", run.recommendations.size(), candidates.size(), run.effective_k);
    }

    return run;
}

}  // namespace ranker
