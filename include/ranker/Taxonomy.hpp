#pragma once

#include <map>
#include <string>
#include <vector>

#include "ranker/Models.hpp"

namespace ranker {

// lowercase, trim, turn runs of spaces / hyphens / underscores into a single '_'
std::string normalize_key(const std::string& s);

// normalize_key + alias folding ("cafe" -> "coffee", "bar" -> "bars", ...).
// Unknown categories pass through normalized.
std::string normalize_category(const std::string& s);

// `list` entries are normalized on the fly; `category` must already be normalized.
bool contains_category(const std::vector<std::string>& list, const std::string& category);

// Half-open [start_hour, end_hour). Wraps midnight when start_hour > end_hour.
struct HourWindow {
    int start_hour = 0;
    int end_hour = 0;

    bool contains(int hour) const;
};

struct CategoryTimeWindows {
    std::vector<HourWindow> ideal;
    std::vector<HourWindow> good;
};

using RelatedCategoryMap = std::map<std::string, std::vector<std::string>>;
using TimeWindowMap = std::map<std::string, CategoryTimeWindows>;

RelatedCategoryMap default_related_categories();
TimeWindowMap default_time_windows();

Daypart daypart_for_hour(int hour);

}  // namespace ranker
