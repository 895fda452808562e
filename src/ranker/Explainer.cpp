#include "ranker/Explainer.hpp"

#include <algorithm>
#include <vector>

#include "geo/GeoUtil.hpp"

namespace ranker {

struct RankedFactor {
    ExplanationFactor factor;
    double points;
    double share;  // of the factor's point budget
};

static double share_of(double value, double budget) {
    if (budget <= 0.0) return 0.0;
    return value / budget;
}

// Largest sub-score first; stable, so ties keep interest, location, time order.
static std::vector<RankedFactor> ranked_factors(const ScoreBreakdown& score, const ScoreConfig& cfg) {
    std::vector<RankedFactor> out = {
        {ExplanationFactor::Interest, score.base, share_of(score.base, cfg.base_top_interest)},
        {ExplanationFactor::Location, score.location, share_of(score.location, cfg.location_commute)},
        {ExplanationFactor::Time, score.time, share_of(score.time, cfg.time_ideal)},
    };
    std::stable_sort(out.begin(), out.end(),
                     [](const RankedFactor& a, const RankedFactor& b) { return a.points > b.points; });
    return out;
}

ExplanationFactor dominant_factor(const ScoreBreakdown& score, const ScoreConfig& cfg) {
    return ranked_factors(score, cfg).front().factor;
}

static std::string display_name(const std::string& key) {
    std::string out = key;
    std::replace(out.begin(), out.end(), '_', ' ');
    return out;
}

static std::string capitalize(std::string s) {
    if (!s.empty() && s[0] >= 'a' && s[0] <= 'z') s[0] = static_cast<char>(s[0] - 'a' + 'A');
    return s;
}

static const char* daypart_phrase(Daypart d) {
    switch (d) {
        case Daypart::Morning: return "this morning";
        case Daypart::Afternoon: return "this afternoon";
        case Daypart::Evening: return "this evening";
        case Daypart::Night: return "tonight";
    }
    return "today";
}

static std::string interest_clause(const ScoreEvidence& ev) {
    switch (ev.interest_match) {
        case InterestMatch::TopInterest:
        case InterestMatch::Interest:
            return "matches your interest in " + display_name(ev.matched_interest);
        case InterestMatch::Related:
            return "similar to your interest in " + display_name(ev.matched_interest);
        case InterestMatch::None:
            break;
    }
    return "something new to try in " + display_name(ev.category);
}

static std::string location_clause(const ScoreEvidence& ev, bool lead) {
    if (ev.location_reference == LocationReference::Commute) {
        return lead ? "right on your commute" : "on your commute";
    }
    if (ev.location_reference == LocationReference::Unknown || !ev.distance) {
        return "in your area";
    }
    const std::string d = geoutil::format_distance(*ev.distance);
    return lead ? "just " + d + " away" : d + " away";
}

static std::string time_clause(const ScoreEvidence& ev) {
    const std::string when = daypart_phrase(ev.daypart);
    switch (ev.time_fit) {
        case TimeFit::Ideal: return "perfect for " + when;
        case TimeFit::Good: return "a good fit for " + when;
        case TimeFit::Preferred: return "fits your usual " + std::string(daypart_str(ev.daypart)) + " plans";
        case TimeFit::Closed: return "worth planning ahead";
        case TimeFit::Fallback:
            break;
    }
    return "worth a visit " + when;
}

static std::string factor_clause(ExplanationFactor f, const ScoreEvidence& ev, bool lead) {
    switch (f) {
        case ExplanationFactor::Interest: return interest_clause(ev);
        case ExplanationFactor::Location: return location_clause(ev, lead);
        case ExplanationFactor::Time: return time_clause(ev);
    }
    return "recommended for you";
}

std::string explain(const Recommendation& rec, const ScoreConfig& cfg, const ExplainConfig& ecfg) {
    const auto factors = ranked_factors(rec.score, cfg);

    std::string out = capitalize(factor_clause(factors[0].factor, rec.evidence, true));

    // Runner-up by share of budget; on a tie the larger sub-score wins.
    const RankedFactor& second = factors[2].share > factors[1].share ? factors[2] : factors[1];
    if (second.share >= ecfg.secondary_share) {
        out += ", " + factor_clause(second.factor, rec.evidence, false);
    } else if (rec.candidate.rating && *rec.candidate.rating >= ecfg.highly_rated) {
        out += ", highly rated";
    }

    out += ".";
    return out;
}

}  // namespace ranker
