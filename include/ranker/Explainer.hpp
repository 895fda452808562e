#pragma once

#include <string>

#include "ranker/Scorer.hpp"
#include "ranker/Selector.hpp"

namespace ranker {

enum class ExplanationFactor {
    Interest,
    Location,
    Time
};

struct ExplainConfig {
    double secondary_share = 0.75;   // the runner-up is mentioned at this share of its budget
    double highly_rated = 4.5;
};

// Factor with the largest sub-score. Ties favor interest, then location.
ExplanationFactor dominant_factor(const ScoreBreakdown& score, const ScoreConfig& cfg = {});

// One short sentence, e.g. "Matches your interest in coffee, 0.3 mi away."
// Never mentions scores.
std::string explain(const Recommendation& rec, const ScoreConfig& cfg = {}, const ExplainConfig& ecfg = {});

}  // namespace ranker
