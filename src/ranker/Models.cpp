#include "ranker/Models.hpp"

#include "ranker/Taxonomy.hpp"

namespace ranker {

const char* sponsor_tier_str(SponsorTier t) {
    switch (t) {
        case SponsorTier::Organic: return "organic";
        case SponsorTier::Boosted: return "boosted";
        case SponsorTier::Premium: return "premium";
    }
    return "unknown";
}

const char* price_sensitivity_str(PriceSensitivity p) {
    switch (p) {
        case PriceSensitivity::Low: return "low";
        case PriceSensitivity::Medium: return "medium";
        case PriceSensitivity::High: return "high";
    }
    return "unknown";
}

const char* distance_tolerance_str(DistanceTolerance d) {
    switch (d) {
        case DistanceTolerance::Low: return "low";
        case DistanceTolerance::Medium: return "medium";
        case DistanceTolerance::High: return "high";
    }
    return "unknown";
}

const char* daypart_str(Daypart d) {
    switch (d) {
        case Daypart::Morning: return "morning";
        case Daypart::Afternoon: return "afternoon";
        case Daypart::Evening: return "evening";
        case Daypart::Night: return "night";
    }
    return "unknown";
}

const char* feedback_rating_str(FeedbackRating r) {
    switch (r) {
        case FeedbackRating::Positive: return "positive";
        case FeedbackRating::Negative: return "negative";
    }
    return "unknown";
}

std::optional<SponsorTier> parse_sponsor_tier(const std::string& s) {
    const std::string k = normalize_key(s);
    if (k == "organic") return SponsorTier::Organic;
    if (k == "boosted") return SponsorTier::Boosted;
    if (k == "premium") return SponsorTier::Premium;
    return std::nullopt;
}

std::optional<PriceSensitivity> parse_price_sensitivity(const std::string& s) {
    const std::string k = normalize_key(s);
    if (k == "low") return PriceSensitivity::Low;
    if (k == "medium") return PriceSensitivity::Medium;
    if (k == "high") return PriceSensitivity::High;
    return std::nullopt;
}

std::optional<DistanceTolerance> parse_distance_tolerance(const std::string& s) {
    const std::string k = normalize_key(s);
    if (k == "low") return DistanceTolerance::Low;
    if (k == "medium") return DistanceTolerance::Medium;
    if (k == "high") return DistanceTolerance::High;
    return std::nullopt;
}

std::optional<Daypart> parse_daypart(const std::string& s) {
    const std::string k = normalize_key(s);
    if (k == "morning") return Daypart::Morning;
    if (k == "afternoon") return Daypart::Afternoon;
    if (k == "evening") return Daypart::Evening;
    if (k == "night") return Daypart::Night;
    return std::nullopt;
}

// Accepts the thumbs_up / thumbs_down spelling used by feedback capture.
std::optional<FeedbackRating> parse_feedback_rating(const std::string& s) {
    const std::string k = normalize_key(s);
    if (k == "positive" || k == "thumbs_up") return FeedbackRating::Positive;
    if (k == "negative" || k == "thumbs_down") return FeedbackRating::Negative;
    return std::nullopt;
}

}  // namespace ranker
