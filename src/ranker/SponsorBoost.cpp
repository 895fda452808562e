#include "ranker/SponsorBoost.hpp"

#include <algorithm>

namespace ranker {

double sponsor_multiplier(SponsorTier tier, const ScoreConfig& cfg) {
    switch (tier) {
        case SponsorTier::Boosted: return std::max(1.0, cfg.boosted_multiplier);
        case SponsorTier::Premium: return std::max(1.0, cfg.premium_multiplier);
        case SponsorTier::Organic: return 1.0;
    }
    return 1.0;
}

ScoreBreakdown apply_sponsor_boost(ScoreBreakdown score, SponsorTier tier, const ScoreConfig& cfg) {
    const double m = sponsor_multiplier(tier, cfg);
    score.sponsor_multiplier = m;

    if (score.base_total < kSponsorRelevanceThreshold) {
        score.sponsor_boost = std::min(score.base_total * (m - 1.0), kLowRelevanceBoostCap);
        score.final_score = score.base_total + score.sponsor_boost;
    } else {
        score.final_score = score.base_total * m;
        score.sponsor_boost = score.final_score - score.base_total;
    }
    return score;
}

}  // namespace ranker
