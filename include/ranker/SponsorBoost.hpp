#pragma once

#include "ranker/Models.hpp"
#include "ranker/Scorer.hpp"

namespace ranker {

// Below this organic total a candidate is a poor match, and its paid boost is
// capped at kLowRelevanceBoostCap points. Hard invariant, not configuration.
constexpr double kSponsorRelevanceThreshold = 40.0;
constexpr double kLowRelevanceBoostCap = 10.0;

double sponsor_multiplier(SponsorTier tier, const ScoreConfig& cfg = {});

// Sets sponsor_multiplier, sponsor_boost and final_score from base_total.
ScoreBreakdown apply_sponsor_boost(ScoreBreakdown score, SponsorTier tier, const ScoreConfig& cfg = {});

}  // namespace ranker
