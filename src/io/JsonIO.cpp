#include "io/JsonIO.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "ranker/BusinessHours.hpp"
#include "ranker/Taxonomy.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace io {

using namespace ranker;

static std::string at_index(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static bool has_value(const json& j, const char* key) {
    return j.contains(key) && !j.at(key).is_null();
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!has_value(j, key)) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static double require_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static std::optional<double> optional_number(const json& j, const char* key, const std::string& where) {
    if (!has_value(j, key)) return std::nullopt;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static std::optional<int> optional_int(const json& j, const char* key, const std::string& where) {
    if (!has_value(j, key)) return std::nullopt;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<int>();
}

static std::vector<std::string> optional_string_array(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!has_value(j, key)) return out;

    const json& arr = j.at(key);
    require_array(arr, where + "." + key);
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            throw std::runtime_error(at_index(where, key, i) + " must be a string");
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static void warn_unknown_keys(const json& j, const std::vector<std::string>& known, const std::string& where) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(known.begin(), known.end(), it.key()) == known.end()) {
            spdlog::warn("{}: ignoring unknown key '{}'", where, it.key());
        }
    }
}

template <typename Enum>
static Enum require_enum(const std::string& value, std::optional<Enum> (*parse)(const std::string&), const std::string& where) {
    const auto parsed = parse(value);
    if (!parsed) {
        throw std::runtime_error(where + " has unrecognized value: " + value);
    }
    return *parsed;
}

static GeoPoint parse_geo_point(const json& j, const std::string& where) {
    require_object(j, where);

    GeoPoint p;
    p.latitude = require_number(j, "latitude", where);
    p.longitude = require_number(j, "longitude", where);
    if (p.latitude < -90.0 || p.latitude > 90.0 || p.longitude < -180.0 || p.longitude > 180.0) {
        throw std::runtime_error(where + " is outside valid coordinate ranges");
    }
    return p;
}

static std::optional<GeoPoint> optional_geo_point(const json& j, const char* key, const std::string& where) {
    if (!has_value(j, key)) return std::nullopt;
    return parse_geo_point(j.at(key), where + "." + key);
}

static int require_clock(const json& j, const char* key, const std::string& where) {
    const std::string s = require_string(j, key, where);
    const auto minute = parse_clock(s);
    if (!minute) {
        throw std::runtime_error(where + "." + std::string(key) + " must be HH:MM, got: " + s);
    }
    return *minute;
}

static WeeklyHours parse_hours(const json& j, const std::string& where) {
    require_object(j, where);

    WeeklyHours hours;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto day = parse_weekday(it.key());
        if (!day) {
            throw std::runtime_error(where + " has unknown day: " + it.key());
        }

        const std::string dwhere = where + "." + it.key();
        const json& dj = it.value();
        require_object(dj, dwhere);

        DayHours dh;
        if (dj.contains("closed") && dj.at("closed").is_boolean() && dj.at("closed").get<bool>()) {
            dh.closed = true;
        } else {
            dh.open_minute = require_clock(dj, "open", dwhere);
            dh.close_minute = require_clock(dj, "close", dwhere);
        }
        hours[static_cast<size_t>(*day)] = dh;
    }
    return hours;
}

static Candidate parse_candidate(const json& j, const std::string& where) {
    require_object(j, where);

    Candidate c;
    c.id = require_string(j, "id", where);
    c.name = optional_string(j, "name", where).value_or("");
    c.business_id = optional_string(j, "business_id", where);
    if (c.business_id && c.business_id->empty()) c.business_id.reset();
    c.category = require_string(j, "category", where);

    if (!j.contains("location")) {
        throw std::runtime_error(where + " missing required field: location");
    }
    c.location = parse_geo_point(j.at("location"), where + ".location");

    c.rating = optional_number(j, "rating", where);
    if (c.rating && (*c.rating < 0.0 || *c.rating > 5.0)) {
        throw std::runtime_error(where + ".rating must be within 0-5");
    }
    c.review_count = optional_int(j, "review_count", where);

    c.price_tier = optional_int(j, "price_tier", where);
    if (c.price_tier && (*c.price_tier < 0 || *c.price_tier > 3)) {
        throw std::runtime_error(where + ".price_tier must be within 0-3");
    }

    if (has_value(j, "hours")) c.hours = parse_hours(j.at("hours"), where + ".hours");

    if (const auto tier = optional_string(j, "sponsor_tier", where)) {
        c.sponsor_tier = require_enum<SponsorTier>(*tier, parse_sponsor_tier, where + ".sponsor_tier");
    }

    return c;
}

std::vector<Candidate> parse_candidates(const json& j) {
    const json* arr = &j;
    std::string where = "root";
    if (j.is_object()) {
        if (!j.contains("candidates")) {
            throw std::runtime_error("root missing required field: candidates");
        }
        arr = &j.at("candidates");
        where = "root.candidates";
    }
    require_array(*arr, where);

    std::vector<Candidate> out;
    out.reserve(arr->size());
    std::vector<std::string> ids;
    ids.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        Candidate c = parse_candidate(arr->at(i), oss.str());

        if (std::find(ids.begin(), ids.end(), c.id) != ids.end()) {
            throw std::runtime_error(oss.str() + ".id is duplicated: " + c.id);
        }
        ids.push_back(c.id);
        out.push_back(std::move(c));
    }
    return out;
}

UserProfile parse_user_profile(const json& j) {
    require_object(j, "root");

    UserProfile u;
    u.interests = optional_string_array(j, "interests", "root");
    u.home_location = optional_geo_point(j, "home_location", "root");
    u.work_location = optional_geo_point(j, "work_location", "root");

    if (const auto d = optional_number(j, "max_distance", "root")) u.max_distance = *d;
    else if (const auto d2 = optional_number(j, "max_distance_miles", "root")) u.max_distance = *d2;

    if (const auto b = optional_int(j, "budget_level", "root")) u.budget_level = *b;

    const auto times = optional_string_array(j, "preferred_times", "root");
    for (size_t i = 0; i < times.size(); ++i) {
        u.preferred_times.push_back(
            require_enum<Daypart>(times[i], parse_daypart, at_index("root", "preferred_times", i)));
    }

    return u;
}

AIProfile parse_ai_profile(const json& j) {
    AIProfile p;
    if (j.is_null()) return p;
    require_object(j, "root");

    static const std::vector<std::string> known = {
        "favorite_categories", "disliked_categories", "price_sensitivity", "preferred_distance",
        "preferred_distance_miles", "distance_tolerance", "budget_level",
    };
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(known.begin(), known.end(), it.key()) == known.end()) {
            spdlog::debug("ai profile: ignoring key '{}'", it.key());
        }
    }

    for (const auto& c : optional_string_array(j, "favorite_categories", "root")) {
        p.favorite_categories.push_back(normalize_category(c));
    }
    for (const auto& c : optional_string_array(j, "disliked_categories", "root")) {
        p.disliked_categories.push_back(normalize_category(c));
    }

    if (const auto s = optional_string(j, "price_sensitivity", "root")) {
        p.price_sensitivity = require_enum<PriceSensitivity>(*s, parse_price_sensitivity, "root.price_sensitivity");
    }
    if (const auto s = optional_string(j, "distance_tolerance", "root")) {
        p.distance_tolerance = require_enum<DistanceTolerance>(*s, parse_distance_tolerance, "root.distance_tolerance");
    }

    if (const auto d = optional_number(j, "preferred_distance", "root")) p.preferred_distance = *d;
    else if (const auto d2 = optional_number(j, "preferred_distance_miles", "root")) p.preferred_distance = *d2;

    p.budget_level = optional_number(j, "budget_level", "root");

    return p;
}

static FeedbackEvent parse_feedback_event(const json& j, const std::string& where) {
    require_object(j, where);

    FeedbackEvent e;
    e.category = require_string(j, "category", where);
    e.price_tier = optional_int(j, "price_tier", where);
    e.rating = require_enum<FeedbackRating>(require_string(j, "rating", where), parse_feedback_rating, where + ".rating");
    e.tags = optional_string_array(j, "tags", where);
    return e;
}

std::vector<FeedbackEvent> parse_feedback_events(const json& j) {
    std::vector<FeedbackEvent> out;

    if (j.is_object() && !j.contains("events")) {
        out.push_back(parse_feedback_event(j, "root"));
        return out;
    }

    const json& arr = j.is_object() ? j.at("events") : j;
    const std::string where = j.is_object() ? "root.events" : "root";
    require_array(arr, where);

    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        out.push_back(parse_feedback_event(arr.at(i), oss.str()));
    }
    return out;
}

ScoringContext parse_context(const json& j) {
    ScoringContext ctx;
    if (j.is_null()) return ctx;
    require_object(j, "root");

    if (const auto h = optional_int(j, "hour", "root")) {
        if (*h < 0 || *h > 23) throw std::runtime_error("root.hour must be within 0-23");
        ctx.hour = *h;
    }
    if (const auto m = optional_int(j, "minute", "root")) {
        if (*m < 0 || *m > 59) throw std::runtime_error("root.minute must be within 0-59");
        ctx.minute = *m;
    }

    if (has_value(j, "weekday")) {
        const json& w = j.at("weekday");
        if (w.is_number_integer()) {
            const int d = w.get<int>();
            if (d < 0 || d > 6) throw std::runtime_error("root.weekday must be within 0-6 (0 = Sunday)");
            ctx.weekday = d;
        } else if (w.is_string()) {
            const auto d = parse_weekday(w.get<std::string>());
            if (!d) throw std::runtime_error("root.weekday has unrecognized value: " + w.get<std::string>());
            ctx.weekday = *d;
        } else {
            throw std::runtime_error("root.weekday must be an integer or a day name");
        }
    }

    ctx.current_location = optional_geo_point(j, "current_location", "root");
    ctx.collaborative_score_override = optional_number(j, "collaborative_score_override", "root");
    return ctx;
}

template <typename T>
static void override_number(const json& j, const char* key, T& field, const std::string& where) {
    if (!has_value(j, key)) return;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    field = j.at(key).get<T>();
}

static std::vector<HourWindow> parse_windows(const json& j, const std::string& where) {
    require_array(j, where);

    std::vector<HourWindow> out;
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        const json& w = j.at(i);
        if (!w.is_array() || w.size() != 2 || !w.at(0).is_number_integer() || !w.at(1).is_number_integer()) {
            throw std::runtime_error(oss.str() + " must be [start_hour, end_hour]");
        }
        HourWindow hw{w.at(0).get<int>(), w.at(1).get<int>()};
        if (hw.start_hour < 0 || hw.start_hour > 23 || hw.end_hour < 0 || hw.end_hour > 24) {
            throw std::runtime_error(oss.str() + " hours must be within 0-24");
        }
        out.push_back(hw);
    }
    return out;
}

static void parse_score_config(const json& j, ScoreConfig& cfg) {
    const std::string where = "root.score";
    require_object(j, where);

    struct Field {
        const char* key;
        double* value;
    };
    const std::vector<Field> fields = {
        {"base_top_interest", &cfg.base_top_interest},
        {"base_interest", &cfg.base_interest},
        {"base_related", &cfg.base_related},
        {"base_baseline", &cfg.base_baseline},
        {"location_commute", &cfg.location_commute},
        {"location_near", &cfg.location_near},
        {"location_scaled_min", &cfg.location_scaled_min},
        {"location_scaled_span", &cfg.location_scaled_span},
        {"location_far", &cfg.location_far},
        {"location_unknown", &cfg.location_unknown},
        {"commute_radius", &cfg.commute_radius},
        {"near_radius", &cfg.near_radius},
        {"default_max_distance", &cfg.default_max_distance},
        {"time_ideal", &cfg.time_ideal},
        {"time_good", &cfg.time_good},
        {"time_preferred", &cfg.time_preferred},
        {"time_fallback", &cfg.time_fallback},
        {"time_closed", &cfg.time_closed},
        {"feedback_favorite", &cfg.feedback_favorite},
        {"feedback_neutral", &cfg.feedback_neutral},
        {"feedback_dislike_penalty", &cfg.feedback_dislike_penalty},
        {"feedback_price_match", &cfg.feedback_price_match},
        {"feedback_max", &cfg.feedback_max},
        {"collaborative_default", &cfg.collaborative_default},
        {"collaborative_max", &cfg.collaborative_max},
        {"boosted_multiplier", &cfg.boosted_multiplier},
        {"premium_multiplier", &cfg.premium_multiplier},
    };

    std::vector<std::string> known = {"top_interest_count", "related_categories", "time_windows"};
    for (const auto& f : fields) {
        override_number(j, f.key, *f.value, where);
        known.push_back(f.key);
    }
    override_number(j, "top_interest_count", cfg.top_interest_count, where);
    warn_unknown_keys(j, known, where);

    if (has_value(j, "related_categories")) {
        const json& rj = j.at("related_categories");
        require_object(rj, where + ".related_categories");
        for (auto it = rj.begin(); it != rj.end(); ++it) {
            std::vector<std::string> related;
            for (const auto& r : optional_string_array(rj, it.key().c_str(), where + ".related_categories")) {
                related.push_back(normalize_category(r));
            }
            cfg.related_categories[normalize_category(it.key())] = std::move(related);
        }
    }

    if (has_value(j, "time_windows")) {
        const json& tj = j.at("time_windows");
        require_object(tj, where + ".time_windows");
        for (auto it = tj.begin(); it != tj.end(); ++it) {
            const std::string cwhere = where + ".time_windows." + it.key();
            require_object(it.value(), cwhere);

            CategoryTimeWindows w;
            if (has_value(it.value(), "ideal")) w.ideal = parse_windows(it.value().at("ideal"), cwhere + ".ideal");
            if (has_value(it.value(), "good")) w.good = parse_windows(it.value().at("good"), cwhere + ".good");
            cfg.time_windows[normalize_category(it.key())] = std::move(w);
        }
    }
}

EngineConfig parse_engine_config(const json& j, const EngineConfig& base) {
    EngineConfig cfg = base;
    require_object(j, "root");
    warn_unknown_keys(j, {"score", "selector", "explain", "learner"}, "root");

    if (has_value(j, "score")) parse_score_config(j.at("score"), cfg.score);

    if (has_value(j, "selector")) {
        const json& sj = j.at("selector");
        require_object(sj, "root.selector");
        override_number(sj, "k", cfg.selector.k, "root.selector");
        override_number(sj, "min_k", cfg.selector.min_k, "root.selector");
        override_number(sj, "max_sponsored_ratio", cfg.selector.max_sponsored_ratio, "root.selector");
        override_number(sj, "min_categories", cfg.selector.min_categories, "root.selector");
        warn_unknown_keys(sj, {"k", "min_k", "max_sponsored_ratio", "min_categories"}, "root.selector");
    }

    if (has_value(j, "explain")) {
        const json& ej = j.at("explain");
        require_object(ej, "root.explain");
        override_number(ej, "secondary_share", cfg.explain.secondary_share, "root.explain");
        override_number(ej, "highly_rated", cfg.explain.highly_rated, "root.explain");
        warn_unknown_keys(ej, {"secondary_share", "highly_rated"}, "root.explain");
    }

    if (has_value(j, "learner")) {
        const json& lj = j.at("learner");
        require_object(lj, "root.learner");
        override_number(lj, "distance_step", cfg.learner.distance_step, "root.learner");
        override_number(lj, "min_preferred_distance", cfg.learner.min_preferred_distance, "root.learner");
        override_number(lj, "max_category_memory", cfg.learner.max_category_memory, "root.learner");
        override_number(lj, "initial_budget_level", cfg.learner.initial_budget_level, "root.learner");
        override_number(lj, "budget_blend", cfg.learner.budget_blend, "root.learner");
        override_number(lj, "expensive_budget_step", cfg.learner.expensive_budget_step, "root.learner");
        override_number(lj, "min_budget_level", cfg.learner.min_budget_level, "root.learner");
        warn_unknown_keys(lj, {"distance_step", "min_preferred_distance", "max_category_memory",
                               "initial_budget_level", "budget_blend", "expensive_budget_step",
                               "min_budget_level"}, "root.learner");
    }

    return cfg;
}

json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path.string() + ": " + e.what());
    }
    return j;
}

void write_json_file(const fs::path& path, const json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());

    out << j.dump(2) << "\n";
}

std::vector<Candidate> load_candidates(const fs::path& path) {
    return parse_candidates(read_json_file(path));
}

UserProfile load_user_profile(const fs::path& path) {
    return parse_user_profile(read_json_file(path));
}

AIProfile load_ai_profile(const fs::path& path) {
    return parse_ai_profile(read_json_file(path));
}

std::vector<FeedbackEvent> load_feedback_events(const fs::path& path) {
    return parse_feedback_events(read_json_file(path));
}

ScoringContext load_context(const fs::path& path) {
    return parse_context(read_json_file(path));
}

EngineConfig load_engine_config(const fs::path& path, const EngineConfig& base) {
    return parse_engine_config(read_json_file(path), base);
}

static json geo_to_json(const GeoPoint& p) {
    return {{"latitude", p.latitude}, {"longitude", p.longitude}};
}

static std::string clock_str(int minute_of_day) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minute_of_day / 60, minute_of_day % 60);
    return buf;
}

json candidate_to_json(const Candidate& c) {
    json j;
    j["id"] = c.id;
    j["name"] = c.name;
    j["business_id"] = c.business_id ? json(*c.business_id) : json(nullptr);
    j["category"] = c.category;
    j["location"] = geo_to_json(c.location);
    j["rating"] = c.rating ? json(*c.rating) : json(nullptr);
    j["review_count"] = c.review_count ? json(*c.review_count) : json(nullptr);
    j["price_tier"] = c.price_tier ? json(*c.price_tier) : json(nullptr);
    j["sponsor_tier"] = sponsor_tier_str(c.sponsor_tier);

    if (c.hours) {
        json hj = json::object();
        for (int d = 0; d < 7; ++d) {
            const auto& day = (*c.hours)[static_cast<size_t>(d)];
            if (!day) continue;
            if (day->closed) {
                hj[weekday_str(d)] = {{"closed", true}};
            } else {
                hj[weekday_str(d)] = {{"open", clock_str(day->open_minute)}, {"close", clock_str(day->close_minute)}};
            }
        }
        j["hours"] = hj;
    } else {
        j["hours"] = nullptr;
    }
    return j;
}

json ai_profile_to_json(const AIProfile& p) {
    json j;
    j["favorite_categories"] = p.favorite_categories;
    j["disliked_categories"] = p.disliked_categories;
    j["price_sensitivity"] = price_sensitivity_str(p.price_sensitivity);
    j["preferred_distance"] = p.preferred_distance;
    j["distance_tolerance"] = distance_tolerance_str(p.distance_tolerance);
    j["budget_level"] = p.budget_level ? json(*p.budget_level) : json(nullptr);
    return j;
}

json score_to_json(const ScoreBreakdown& s) {
    return {
        {"base", s.base},
        {"location", s.location},
        {"time", s.time},
        {"feedback", s.feedback},
        {"collaborative", s.collaborative},
        {"base_total", s.base_total},
        {"sponsor_multiplier", s.sponsor_multiplier},
        {"sponsor_boost", s.sponsor_boost},
        {"final", s.final_score},
    };
}

json evidence_to_json(const ScoreEvidence& ev) {
    json j;
    j["category"] = ev.category;
    j["interest_match"] = interest_match_str(ev.interest_match);
    j["matched_interest"] = ev.matched_interest;
    j["location_reference"] = location_reference_str(ev.location_reference);
    j["distance"] = ev.distance ? json(*ev.distance) : json(nullptr);
    j["max_distance"] = ev.max_distance;
    j["daypart"] = daypart_str(ev.daypart);
    j["time_fit"] = time_fit_str(ev.time_fit);
    j["favorite"] = ev.favorite;
    j["disliked"] = ev.disliked;
    j["price_match"] = ev.price_match;
    j["collaborative_override"] = ev.collaborative_override;
    return j;
}

json recommendation_to_json(const Recommendation& r) {
    json j;
    j["candidate"] = candidate_to_json(r.candidate);
    j["score"] = score_to_json(r.score);
    j["evidence"] = evidence_to_json(r.evidence);
    j["explanation"] = r.explanation;
    j["is_sponsored"] = r.is_sponsored;
    return j;
}

json engine_config_to_json(const EngineConfig& cfg) {
    json j;

    const ScoreConfig& s = cfg.score;
    j["score"] = {
        {"base_top_interest", s.base_top_interest},
        {"base_interest", s.base_interest},
        {"base_related", s.base_related},
        {"base_baseline", s.base_baseline},
        {"top_interest_count", s.top_interest_count},
        {"location_commute", s.location_commute},
        {"location_near", s.location_near},
        {"location_scaled_min", s.location_scaled_min},
        {"location_scaled_span", s.location_scaled_span},
        {"location_far", s.location_far},
        {"location_unknown", s.location_unknown},
        {"commute_radius", s.commute_radius},
        {"near_radius", s.near_radius},
        {"default_max_distance", s.default_max_distance},
        {"time_ideal", s.time_ideal},
        {"time_good", s.time_good},
        {"time_preferred", s.time_preferred},
        {"time_fallback", s.time_fallback},
        {"time_closed", s.time_closed},
        {"feedback_favorite", s.feedback_favorite},
        {"feedback_neutral", s.feedback_neutral},
        {"feedback_dislike_penalty", s.feedback_dislike_penalty},
        {"feedback_price_match", s.feedback_price_match},
        {"feedback_max", s.feedback_max},
        {"collaborative_default", s.collaborative_default},
        {"collaborative_max", s.collaborative_max},
        {"boosted_multiplier", s.boosted_multiplier},
        {"premium_multiplier", s.premium_multiplier},
    };

    j["selector"] = {
        {"k", cfg.selector.k},
        {"min_k", cfg.selector.min_k},
        {"max_sponsored_ratio", cfg.selector.max_sponsored_ratio},
        {"min_categories", cfg.selector.min_categories},
    };

    j["explain"] = {
        {"secondary_share", cfg.explain.secondary_share},
        {"highly_rated", cfg.explain.highly_rated},
    };

    j["learner"] = {
        {"distance_step", cfg.learner.distance_step},
        {"min_preferred_distance", cfg.learner.min_preferred_distance},
        {"max_category_memory", cfg.learner.max_category_memory},
        {"initial_budget_level", cfg.learner.initial_budget_level},
        {"budget_blend", cfg.learner.budget_blend},
        {"expensive_budget_step", cfg.learner.expensive_budget_step},
        {"min_budget_level", cfg.learner.min_budget_level},
    };

    return j;
}

}  // namespace io
