#include "ranker/Taxonomy.hpp"

#include <cctype>
#include <unordered_map>

namespace ranker {

std::string normalize_key(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_sep = false;

    for (unsigned char ch : s) {
        if (std::isspace(ch) || ch == '-' || ch == '_') {
            pending_sep = !out.empty();
            continue;
        }
        if (pending_sep) {
            out.push_back('_');
            pending_sep = false;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

static const std::string& fold_alias(const std::string& key) {
    static const std::unordered_map<std::string, std::string> alias = {
        {"cafe", "coffee"},
        {"coffee_shop", "coffee"},
        {"bakery", "breakfast"},
        {"brunch", "breakfast"},
        {"restaurant", "dining"},
        {"restaurants", "dining"},
        {"food", "dining"},
        {"bar", "bars"},
        {"pub", "bars"},
        {"club", "nightlife"},
        {"night_club", "nightlife"},
        {"music", "live_music"},
        {"concert", "live_music"},
        {"concerts", "live_music"},
        {"gym", "fitness"},
        {"park", "outdoor"},
        {"parks", "outdoor"},
        {"outdoors", "outdoor"},
        {"museum", "culture"},
        {"museums", "culture"},
        {"art", "arts"},
        {"art_gallery", "arts"},
        {"movie_theater", "entertainment"},
        {"movies", "entertainment"},
        {"spa", "wellness"},
        {"store", "shopping"},
        {"shopping_mall", "shopping"},
    };

    auto it = alias.find(key);
    if (it != alias.end()) return it->second;
    return key;
}

std::string normalize_category(const std::string& s) {
    const std::string key = normalize_key(s);
    return fold_alias(key);
}

bool contains_category(const std::vector<std::string>& list, const std::string& category) {
    for (const auto& c : list) {
        if (normalize_category(c) == category) return true;
    }
    return false;
}

bool HourWindow::contains(int hour) const {
    if (start_hour == end_hour) return false;
    if (start_hour < end_hour) return hour >= start_hour && hour < end_hour;
    return hour >= start_hour || hour < end_hour;
}

RelatedCategoryMap default_related_categories() {
    return {
        {"coffee", {"dining", "breakfast"}},
        {"breakfast", {"coffee", "dining"}},
        {"bars", {"nightlife", "entertainment", "live_music"}},
        {"nightlife", {"bars", "live_music", "entertainment"}},
        {"dining", {"coffee", "bars"}},
        {"fitness", {"outdoor", "wellness", "sports"}},
        {"outdoor", {"fitness", "sports"}},
        {"arts", {"culture", "entertainment"}},
        {"culture", {"arts", "education"}},
        {"live_music", {"bars", "nightlife", "entertainment"}},
        {"shopping", {"arts", "culture"}},
    };
}

TimeWindowMap default_time_windows() {
    return {
        {"coffee",        {{{7, 10}},            {{10, 15}}}},
        {"breakfast",     {{{7, 10}},            {{10, 12}}}},
        {"dining",        {{{11, 14}, {18, 20}}, {{17, 18}, {20, 22}}}},
        {"bars",          {{{20, 2}},            {{17, 20}}}},
        {"nightlife",     {{{21, 3}},            {{19, 21}}}},
        {"live_music",    {{{19, 23}},           {{17, 19}}}},
        {"entertainment", {{{18, 23}},           {{12, 18}}}},
        {"fitness",       {{{6, 9}},             {{17, 20}}}},
        {"outdoor",       {{{8, 11}},            {{14, 18}}}},
        {"wellness",      {{{9, 12}},            {{14, 18}}}},
        {"sports",        {{{18, 22}},           {{12, 18}}}},
        {"arts",          {{{13, 17}},           {{10, 13}}}},
        {"culture",       {{{13, 17}},           {{10, 13}}}},
        {"shopping",      {{{14, 17}},           {{10, 14}, {17, 20}}}},
        {"events",        {{{18, 22}},           {{12, 18}}}},
        {"family",        {{{10, 16}},           {{16, 18}}}},
        {"education",     {{{9, 12}},            {{13, 17}}}},
    };
}

Daypart daypart_for_hour(int hour) {
    if (hour >= 5 && hour < 12) return Daypart::Morning;
    if (hour >= 12 && hour < 17) return Daypart::Afternoon;
    if (hour >= 17 && hour < 21) return Daypart::Evening;
    return Daypart::Night;
}

}  // namespace ranker
