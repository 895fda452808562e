#include "ranker/ProfileLearner.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

#include "ranker/Taxonomy.hpp"

namespace ranker {

static PriceSensitivity toward_low(PriceSensitivity p) {
    return p == PriceSensitivity::High ? PriceSensitivity::Medium : PriceSensitivity::Low;
}

static PriceSensitivity toward_high(PriceSensitivity p) {
    return p == PriceSensitivity::Low ? PriceSensitivity::Medium : PriceSensitivity::High;
}

static DistanceTolerance toward_low(DistanceTolerance d) {
    return d == DistanceTolerance::High ? DistanceTolerance::Medium : DistanceTolerance::Low;
}

static void forget_category(std::vector<std::string>& list, const std::string& category) {
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const std::string& c) { return normalize_category(c) == category; }),
               list.end());
}

// Re-inserting moves the category to the most recent position.
static void remember_category(std::vector<std::string>& list, const std::string& category, size_t cap) {
    forget_category(list, category);
    list.push_back(category);
    if (cap > 0 && list.size() > cap) {
        list.erase(list.begin(), list.begin() + static_cast<std::ptrdiff_t>(list.size() - cap));
    }
}

// Never moves a distance that is already under the floor upward.
static void shorten_preferred_distance(AIProfile& p, const LearnerConfig& cfg) {
    const double next = p.preferred_distance - cfg.distance_step;
    if (next >= cfg.min_preferred_distance) {
        p.preferred_distance = next;
    } else {
        p.preferred_distance = std::min(p.preferred_distance, cfg.min_preferred_distance);
    }
}

// Any category present in both lists is kept only as a dislike.
static size_t repair_exclusivity(AIProfile& p) {
    const size_t before = p.favorite_categories.size();
    p.favorite_categories.erase(
        std::remove_if(p.favorite_categories.begin(), p.favorite_categories.end(),
                       [&](const std::string& c) {
                           return contains_category(p.disliked_categories, normalize_category(c));
                       }),
        p.favorite_categories.end());
    return before - p.favorite_categories.size();
}

LearningOutcome learn_from_feedback(const AIProfile& current, const FeedbackEvent& event, const LearnerConfig& cfg) {
    LearningOutcome out;
    out.profile = current;
    AIProfile& p = out.profile;

    const std::string category = normalize_category(event.category);
    const bool positive = event.rating == FeedbackRating::Positive;

    if (category.empty()) {
        spdlog::warn("feedback event without a category; only tags are applied");
    } else if (positive) {
        remember_category(p.favorite_categories, category, cfg.max_category_memory);
        forget_category(p.disliked_categories, category);
    } else {
        remember_category(p.disliked_categories, category, cfg.max_category_memory);
        forget_category(p.favorite_categories, category);
    }

    if (positive && event.price_tier) {
        const double b = p.budget_level.value_or(cfg.initial_budget_level);
        const double tier = std::clamp(*event.price_tier, 0, 3);
        const double blended = std::round(b * (1.0 - cfg.budget_blend) + tier * cfg.budget_blend);
        p.budget_level = std::clamp(blended, 0.0, 3.0);
    }

    for (const auto& raw : event.tags) {
        const std::string tag = normalize_key(raw);
        if (tag.empty()) continue;

        if (positive) {
            if (tag == "good_value" || tag == "great_value") {
                p.price_sensitivity = toward_low(p.price_sensitivity);
                out.applied_tags.push_back(tag);
            } else if (tag == "convenient") {
                shorten_preferred_distance(p, cfg);
                out.applied_tags.push_back(tag);
            } else {
                out.ignored_tags.push_back(tag);
            }
            continue;
        }

        if (tag == "too_expensive") {
            p.price_sensitivity = toward_high(p.price_sensitivity);
            const double b = p.budget_level.value_or(cfg.initial_budget_level);
            p.budget_level = std::max(cfg.min_budget_level, b - cfg.expensive_budget_step);
            out.applied_tags.push_back(tag);
        } else if (tag == "too_far") {
            shorten_preferred_distance(p, cfg);
            p.distance_tolerance = toward_low(p.distance_tolerance);
            out.applied_tags.push_back(tag);
        } else if (tag == "too_crowded") {
            // Reserved for a quiet-venue preference; recorded only.
            out.deferred_tags.push_back(tag);
        } else {
            out.ignored_tags.push_back(tag);
        }
    }

    const size_t repaired = repair_exclusivity(p);
    if (repaired > 0) {
        spdlog::warn("removed {} categories present in both favorite and disliked lists", repaired);
    }

    spdlog::debug("learned from {} feedback on '{}': favorites={} disliked={} preferred_distance={} price_sensitivity={}",
                  feedback_rating_str(event.rating), category, p.favorite_categories.size(),
                  p.disliked_categories.size(), p.preferred_distance, price_sensitivity_str(p.price_sensitivity));

    return out;
}

AIProfile apply_feedback(const AIProfile& current, const FeedbackEvent& event, const LearnerConfig& cfg) {
    return learn_from_feedback(current, event, cfg).profile;
}

FeedbackStats summarize_feedback(const std::vector<FeedbackEvent>& events, size_t top_n) {
    FeedbackStats stats;
    std::vector<std::pair<std::string, size_t>> liked;

    for (const auto& e : events) {
        ++stats.total;
        if (e.rating != FeedbackRating::Positive) {
            ++stats.negative;
            continue;
        }
        ++stats.positive;

        const std::string category = normalize_category(e.category);
        if (category.empty()) continue;

        auto it = std::find_if(liked.begin(), liked.end(),
                               [&](const std::pair<std::string, size_t>& l) { return l.first == category; });
        if (it == liked.end()) {
            liked.emplace_back(category, 1);
        } else {
            ++it->second;
        }
    }

    if (stats.total > 0) {
        stats.satisfaction_rate = 100.0 * static_cast<double>(stats.positive) / static_cast<double>(stats.total);
    }

    std::stable_sort(liked.begin(), liked.end(),
                     [](const std::pair<std::string, size_t>& a, const std::pair<std::string, size_t>& b) {
                         return a.second > b.second;
                     });
    for (size_t i = 0; i < liked.size() && i < top_n; ++i) {
        stats.top_categories.push_back(liked[i].first);
    }
    return stats;
}

}  // namespace ranker
