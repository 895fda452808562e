#include "ranker/BusinessHours.hpp"

#include <cctype>

#include "ranker/Taxonomy.hpp"

namespace ranker {

static const char* const kWeekdays[7] = {
    "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"
};

std::optional<int> parse_clock(const std::string& hhmm) {
    const auto colon = hhmm.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2) return std::nullopt;
    if (hhmm.size() != colon + 3) return std::nullopt;

    int h = 0;
    for (size_t i = 0; i < colon; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(hhmm[i]))) return std::nullopt;
        h = h * 10 + (hhmm[i] - '0');
    }

    int m = 0;
    for (size_t i = colon + 1; i < hhmm.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(hhmm[i]))) return std::nullopt;
        m = m * 10 + (hhmm[i] - '0');
    }

    if (m > 59) return std::nullopt;
    if (h == 24 && m == 0) return 24 * 60;
    if (h > 23) return std::nullopt;
    return h * 60 + m;
}

std::optional<int> parse_weekday(const std::string& name) {
    const std::string k = normalize_key(name);
    for (int i = 0; i < 7; ++i) {
        if (k == kWeekdays[i]) return i;
    }
    return std::nullopt;
}

const char* weekday_str(int weekday) {
    if (weekday < 0 || weekday > 6) return "unknown";
    return kWeekdays[weekday];
}

bool is_open_at(const WeeklyHours& hours, int weekday, int minute_of_day) {
    if (weekday < 0 || weekday > 6) return false;

    const auto& day = hours[static_cast<size_t>(weekday)];
    if (!day || day->closed) return false;

    if (day->close_minute < day->open_minute) {
        return minute_of_day >= day->open_minute || minute_of_day <= day->close_minute;
    }
    return minute_of_day >= day->open_minute && minute_of_day <= day->close_minute;
}

}  // namespace ranker
