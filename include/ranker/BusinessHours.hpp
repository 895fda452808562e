#pragma once

#include <optional>
#include <string>

#include "ranker/Models.hpp"

namespace ranker {

// "HH:MM" (24-hour) -> minutes since midnight. "24:00" is accepted as 1440.
std::optional<int> parse_clock(const std::string& hhmm);

// "monday".."sunday" (case-insensitive) -> 0 = Sunday .. 6 = Saturday
std::optional<int> parse_weekday(const std::string& name);

const char* weekday_str(int weekday);

// Inclusive on both ends. A closing time before the opening time means the
// venue closes after midnight; the early-morning tail counts for the same day.
bool is_open_at(const WeeklyHours& hours, int weekday, int minute_of_day);

}  // namespace ranker
