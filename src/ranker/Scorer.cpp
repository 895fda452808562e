#include "ranker/Scorer.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "geo/GeoUtil.hpp"
#include "ranker/BusinessHours.hpp"
#include "ranker/SponsorBoost.hpp"

namespace ranker {

const char* interest_match_str(InterestMatch m) {
    switch (m) {
        case InterestMatch::TopInterest: return "top_interest";
        case InterestMatch::Interest: return "interest";
        case InterestMatch::Related: return "related";
        case InterestMatch::None: return "none";
    }
    return "unknown";
}

const char* location_reference_str(LocationReference r) {
    switch (r) {
        case LocationReference::Commute: return "commute";
        case LocationReference::Home: return "home";
        case LocationReference::Work: return "work";
        case LocationReference::Current: return "current";
        case LocationReference::Unknown: return "unknown";
    }
    return "unknown";
}

const char* time_fit_str(TimeFit t) {
    switch (t) {
        case TimeFit::Ideal: return "ideal";
        case TimeFit::Good: return "good";
        case TimeFit::Preferred: return "preferred";
        case TimeFit::Fallback: return "fallback";
        case TimeFit::Closed: return "closed";
    }
    return "unknown";
}

static double clamp_range(double x, double lo, double hi) {
    if (x < lo) return lo;
    if (x > hi) return hi;
    return x;
}

static double score_base(
    const UserProfile& user,
    const ScoreConfig& cfg,
    ScoreEvidence& ev
) {
    std::vector<std::string> interests;
    interests.reserve(user.interests.size());
    for (const auto& i : user.interests) interests.push_back(normalize_category(i));

    const int top_n = std::max(0, cfg.top_interest_count);

    for (size_t i = 0; i < interests.size(); ++i) {
        if (interests[i] != ev.category) continue;

        ev.matched_interest = interests[i];
        if (static_cast<int>(i) < top_n) {
            ev.interest_match = InterestMatch::TopInterest;
            return cfg.base_top_interest;
        }
        ev.interest_match = InterestMatch::Interest;
        return cfg.base_interest;
    }

    // Related categories: credit the highest-ranked stated interest that is related.
    auto rit = cfg.related_categories.find(ev.category);
    if (rit != cfg.related_categories.end()) {
        for (const auto& interest : interests) {
            for (const auto& related : rit->second) {
                if (normalize_category(related) != interest) continue;

                ev.interest_match = InterestMatch::Related;
                ev.matched_interest = interest;
                return cfg.base_related;
            }
        }
    }

    ev.interest_match = InterestMatch::None;
    return cfg.base_baseline;
}

// The stated radius. The learned preferred_distance is a search radius for
// retrieval and does not rescale the score.
static double effective_max_distance(const UserProfile& user, const ScoreConfig& cfg) {
    if (user.max_distance > 0.0) return user.max_distance;
    return cfg.default_max_distance;
}

static double score_location(
    const Candidate& c,
    const UserProfile& user,
    const ScoringContext& ctx,
    const ScoreConfig& cfg,
    ScoreEvidence& ev
) {
    ev.max_distance = effective_max_distance(user, cfg);

    // Nearest anchor point (home, work, current position).
    std::optional<double> anchor;
    LocationReference anchor_ref = LocationReference::Unknown;

    auto consider = [&](const std::optional<GeoPoint>& p, LocationReference ref) {
        if (!p) return;
        const double d = geoutil::haversine_miles(*p, c.location);
        if (!anchor || d < *anchor) {
            anchor = d;
            anchor_ref = ref;
        }
    };

    consider(user.home_location, LocationReference::Home);
    consider(user.work_location, LocationReference::Work);
    consider(ctx.current_location, LocationReference::Current);

    std::optional<double> commute;
    if (user.home_location && user.work_location) {
        commute = geoutil::distance_to_segment_miles(c.location, *user.home_location, *user.work_location);
    }

    if (!anchor && !commute) {
        ev.location_reference = LocationReference::Unknown;
        return cfg.location_unknown;
    }

    // The commute line only wins when it is strictly closer than every anchor,
    // i.e. the venue sits between home and work rather than next to either.
    double nearest = anchor ? *anchor : *commute;
    ev.location_reference = anchor_ref;
    if (commute && (!anchor || *commute < *anchor - 1e-9)) {
        nearest = *commute;
        ev.location_reference = LocationReference::Commute;
    }
    ev.distance = nearest;

    if (nearest <= cfg.commute_radius) return cfg.location_commute;
    if (anchor && *anchor <= cfg.near_radius) return cfg.location_near;

    if (nearest <= ev.max_distance) {
        const double ratio = 1.0 - (nearest / ev.max_distance);
        return std::floor(cfg.location_scaled_min + cfg.location_scaled_span * ratio);
    }

    // Distance alone never disqualifies.
    return cfg.location_far;
}

static bool in_any(const std::vector<HourWindow>& windows, int hour) {
    for (const auto& w : windows) {
        if (w.contains(hour)) return true;
    }
    return false;
}

static double score_time(
    const Candidate& c,
    const UserProfile& user,
    const ScoringContext& ctx,
    const ScoreConfig& cfg,
    ScoreEvidence& ev
) {
    const int hour = ((ctx.hour % 24) + 24) % 24;
    ev.daypart = daypart_for_hour(hour);

    if (c.hours) {
        const int minute = std::clamp(ctx.minute, 0, 59);
        if (!is_open_at(*c.hours, ctx.weekday, hour * 60 + minute)) {
            ev.time_fit = TimeFit::Closed;
            return cfg.time_closed;
        }
    }

    auto wit = cfg.time_windows.find(ev.category);
    if (wit != cfg.time_windows.end()) {
        if (in_any(wit->second.ideal, hour)) {
            ev.time_fit = TimeFit::Ideal;
            return cfg.time_ideal;
        }
        if (in_any(wit->second.good, hour)) {
            ev.time_fit = TimeFit::Good;
            return cfg.time_good;
        }
    }

    if (std::find(user.preferred_times.begin(), user.preferred_times.end(), ev.daypart) != user.preferred_times.end()) {
        ev.time_fit = TimeFit::Preferred;
        return cfg.time_preferred;
    }

    ev.time_fit = TimeFit::Fallback;
    return cfg.time_fallback;
}

static bool price_matches(const Candidate& c, const UserProfile& user, const AIProfile& ai) {
    if (!c.price_tier) return false;

    const double level = ai.budget_level ? *ai.budget_level : static_cast<double>(user.budget_level);
    const int preferred = std::clamp(static_cast<int>(std::lround(level)), 0, 3);
    const int tier = *c.price_tier;

    switch (ai.price_sensitivity) {
        case PriceSensitivity::High: return tier <= preferred;
        case PriceSensitivity::Medium: return tier == preferred;
        case PriceSensitivity::Low: return tier <= preferred + 1;
    }
    return false;
}

static double score_feedback(
    const Candidate& c,
    const UserProfile& user,
    const AIProfile& ai,
    const ScoreConfig& cfg,
    ScoreEvidence& ev
) {
    ev.favorite = contains_category(ai.favorite_categories, ev.category);
    ev.disliked = contains_category(ai.disliked_categories, ev.category);
    ev.price_match = price_matches(c, user, ai);

    // A category in both sets is a caller error; the dislike wins until the
    // next learning transition repairs the profile.
    double v = cfg.feedback_neutral;
    if (ev.disliked) {
        v = std::max(0.0, cfg.feedback_neutral - cfg.feedback_dislike_penalty);
    } else if (ev.favorite) {
        v = cfg.feedback_favorite;
    }

    if (ev.price_match) v += cfg.feedback_price_match;

    return clamp_range(v, 0.0, cfg.feedback_max);
}

static double score_collaborative(const ScoringContext& ctx, const ScoreConfig& cfg, ScoreEvidence& ev) {
    if (ctx.collaborative_score_override && std::isfinite(*ctx.collaborative_score_override)) {
        ev.collaborative_override = true;
        return clamp_range(*ctx.collaborative_score_override, 0.0, cfg.collaborative_max);
    }
    return cfg.collaborative_default;
}

ScoredCandidate score_candidate(
    const Candidate& candidate,
    const UserProfile& user,
    const AIProfile& ai,
    const ScoringContext& ctx,
    const ScoreConfig& cfg
) {
    ScoredCandidate sc;
    sc.candidate = candidate;
    sc.evidence.category = normalize_category(candidate.category);

    ScoreBreakdown& s = sc.score;
    s.base = score_base(user, cfg, sc.evidence);
    s.location = score_location(candidate, user, ctx, cfg, sc.evidence);
    s.time = score_time(candidate, user, ctx, cfg, sc.evidence);
    s.feedback = score_feedback(candidate, user, ai, cfg, sc.evidence);
    s.collaborative = score_collaborative(ctx, cfg, sc.evidence);

    s.base_total = s.base + s.location + s.time + s.feedback + s.collaborative;
    s.sponsor_multiplier = 1.0;
    s.sponsor_boost = 0.0;
    s.final_score = s.base_total;

    return sc;
}

bool ranks_before(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.score.final_score != b.score.final_score) return a.score.final_score > b.score.final_score;
    return a.candidate.id < b.candidate.id;
}

std::vector<ScoredCandidate> score_candidates(
    const std::vector<Candidate>& candidates,
    const UserProfile& user,
    const AIProfile& ai,
    const ScoringContext& ctx,
    const ScoreConfig& cfg
) {
    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());

    for (const auto& c : candidates) {
        ScoredCandidate sc = score_candidate(c, user, ai, ctx, cfg);
        sc.score = apply_sponsor_boost(sc.score, c.sponsor_tier, cfg);

        spdlog::debug("scored {} [{}]: base={} location={} time={} feedback={} collaborative={} total={} final={}",
                      c.id, sc.evidence.category, sc.score.base, sc.score.location, sc.score.time,
                      sc.score.feedback, sc.score.collaborative, sc.score.base_total, sc.score.final_score);

        scored.push_back(std::move(sc));
    }

    std::stable_sort(scored.begin(), scored.end(), ranks_before);
    return scored;
}

}  // namespace ranker
