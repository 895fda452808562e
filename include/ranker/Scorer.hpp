#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ranker/Models.hpp"
#include "ranker/Taxonomy.hpp"

namespace ranker {

// Point budgets total 100 before the sponsor multiplier.
struct ScoreConfig {
    // base (0-40)
    double base_top_interest = 40.0;
    double base_interest = 30.0;
    double base_related = 20.0;
    double base_baseline = 10.0;
    int top_interest_count = 3;

    // location (0-20)
    double location_commute = 20.0;
    double location_near = 15.0;
    double location_scaled_min = 10.0;   // at max distance
    double location_scaled_span = 5.0;   // added at zero distance
    double location_far = 5.0;
    double location_unknown = 10.0;
    double commute_radius = 0.5;         // miles
    double near_radius = 1.0;            // miles
    double default_max_distance = 5.0;   // miles

    // time (0-15)
    double time_ideal = 15.0;
    double time_good = 10.0;
    double time_preferred = 8.0;   // outside any window, but in a preferred daypart
    double time_fallback = 5.0;
    double time_closed = 5.0;

    // feedback (0-15)
    double feedback_favorite = 15.0;
    double feedback_neutral = 5.0;
    double feedback_dislike_penalty = 5.0;
    double feedback_price_match = 3.0;
    double feedback_max = 15.0;

    // collaborative (0-10)
    double collaborative_default = 5.0;
    double collaborative_max = 10.0;

    // sponsor multipliers; the low-relevance cap in SponsorBoost.hpp is not tunable
    double boosted_multiplier = 1.15;
    double premium_multiplier = 1.30;

    RelatedCategoryMap related_categories = default_related_categories();
    TimeWindowMap time_windows = default_time_windows();
};

// Target of the request. The library never reads the wall clock.
struct ScoringContext {
    int hour = 12;     // 0-23
    int minute = 0;
    int weekday = 1;   // 0 = Sunday
    std::optional<GeoPoint> current_location;
    std::optional<double> collaborative_score_override;
};

enum class InterestMatch {
    TopInterest,
    Interest,
    Related,
    None
};

enum class LocationReference {
    Commute,
    Home,
    Work,
    Current,
    Unknown
};

enum class TimeFit {
    Ideal,
    Good,
    Preferred,
    Fallback,
    Closed
};

// What the scorer saw, kept for explanations and artifacts.
struct ScoreEvidence {
    std::string category;          // normalized
    InterestMatch interest_match = InterestMatch::None;
    std::string matched_interest;  // normalized stated interest that earned the base credit

    LocationReference location_reference = LocationReference::Unknown;
    std::optional<double> distance;  // miles to the nearest reference point
    double max_distance = 0.0;       // effective max distance used for scaling

    Daypart daypart = Daypart::Afternoon;
    TimeFit time_fit = TimeFit::Fallback;

    bool favorite = false;
    bool disliked = false;
    bool price_match = false;
    bool collaborative_override = false;
};

struct ScoreBreakdown {
    double base = 0.0;
    double location = 0.0;
    double time = 0.0;
    double feedback = 0.0;
    double collaborative = 0.0;

    double base_total = 0.0;         // sum of the five sub-scores (<= 100)
    double sponsor_multiplier = 1.0;
    double sponsor_boost = 0.0;      // final_score - base_total
    double final_score = 0.0;
};

struct ScoredCandidate {
    Candidate candidate;
    ScoreBreakdown score;
    ScoreEvidence evidence;
};

const char* interest_match_str(InterestMatch m);
const char* location_reference_str(LocationReference r);
const char* time_fit_str(TimeFit t);

// Organic score only: sponsor_multiplier = 1, final_score = base_total.
ScoredCandidate score_candidate(
    const Candidate& candidate,
    const UserProfile& user,
    const AIProfile& ai,
    const ScoringContext& ctx,
    const ScoreConfig& cfg = {}
);

// Scores, applies the sponsor boost and returns candidates in ranking order.
std::vector<ScoredCandidate> score_candidates(
    const std::vector<Candidate>& candidates,
    const UserProfile& user,
    const AIProfile& ai,
    const ScoringContext& ctx,
    const ScoreConfig& cfg = {}
);

// final_score desc, then candidate id asc
bool ranks_before(const ScoredCandidate& a, const ScoredCandidate& b);

}  // namespace ranker
