#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace ranker {

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

enum class SponsorTier {
    Organic,
    Boosted,
    Premium
};

// Ordered: Low < Medium < High
enum class PriceSensitivity {
    Low,
    Medium,
    High
};

enum class DistanceTolerance {
    Low,
    Medium,
    High
};

enum class Daypart {
    Morning,    // 05-12
    Afternoon,  // 12-17
    Evening,    // 17-21
    Night       // 21-05
};

enum class FeedbackRating {
    Positive,
    Negative
};

struct DayHours {
    bool closed = false;
    int open_minute = 0;   // minutes since midnight
    int close_minute = 0;  // may be < open_minute when closing after midnight
};

// Index 0 = Sunday. A day with no entry is treated as closed.
using WeeklyHours = std::array<std::optional<DayHours>, 7>;

struct Candidate {
    std::string id;                          // unique per provider
    std::string name;
    std::optional<std::string> business_id;  // groups listings of one real-world business
    std::string category;
    GeoPoint location;

    std::optional<double> rating;            // 0.0 - 5.0
    std::optional<int> review_count;
    std::optional<int> price_tier;           // 0 = free .. 3 = expensive
    std::optional<WeeklyHours> hours;

    SponsorTier sponsor_tier = SponsorTier::Organic;
};

struct UserProfile {
    std::vector<std::string> interests;  // most important first
    std::optional<GeoPoint> home_location;
    std::optional<GeoPoint> work_location;
    double max_distance = 5.0;           // miles
    int budget_level = 2;
    std::vector<Daypart> preferred_times;
};

struct AIProfile {
    std::vector<std::string> favorite_categories;  // insertion order, oldest first
    std::vector<std::string> disliked_categories;
    PriceSensitivity price_sensitivity = PriceSensitivity::Medium;
    double preferred_distance = 5.0;               // miles
    DistanceTolerance distance_tolerance = DistanceTolerance::Medium;
    std::optional<double> budget_level;            // 0-3, learned from rated price tiers
};

struct FeedbackEvent {
    std::string category;           // copied from the candidate at feedback time
    std::optional<int> price_tier;
    FeedbackRating rating = FeedbackRating::Positive;
    std::vector<std::string> tags;  // "too far", "great value", ...
};

const char* sponsor_tier_str(SponsorTier t);
const char* price_sensitivity_str(PriceSensitivity p);
const char* distance_tolerance_str(DistanceTolerance d);
const char* daypart_str(Daypart d);
const char* feedback_rating_str(FeedbackRating r);

std::optional<SponsorTier> parse_sponsor_tier(const std::string& s);
std::optional<PriceSensitivity> parse_price_sensitivity(const std::string& s);
std::optional<DistanceTolerance> parse_distance_tolerance(const std::string& s);
std::optional<Daypart> parse_daypart(const std::string& s);
std::optional<FeedbackRating> parse_feedback_rating(const std::string& s);

}  // namespace ranker
