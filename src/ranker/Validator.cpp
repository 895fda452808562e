#include "ranker/Validator.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "io/JsonIO.hpp"
#include "ranker/SponsorBoost.hpp"

namespace fs = std::filesystem;

namespace ranker {

static constexpr double kEps = 1e-6;

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& candidate_id = "") {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.candidate_id = candidate_id;
    rep.errors.push_back(std::move(e));
}

static int get_int_or(const nlohmann::json& j, const char* key, int def) {
    if (!j.contains(key)) return def;
    if (!j[key].is_number_integer()) return def;
    return j[key].get<int>();
}

static double get_double_or(const nlohmann::json& j, const char* key, double def) {
    if (!j.contains(key)) return def;
    if (!j[key].is_number()) return def;
    return j[key].get<double>();
}

static void check_score(ValidationReport& rep, const nlohmann::json& score, const std::string& id, double premium_multiplier) {
    const double base = get_double_or(score, "base", 0.0);
    const double location = get_double_or(score, "location", 0.0);
    const double time = get_double_or(score, "time", 0.0);
    const double feedback = get_double_or(score, "feedback", 0.0);
    const double collaborative = get_double_or(score, "collaborative", 0.0);
    const double base_total = get_double_or(score, "base_total", 0.0);
    const double final_score = get_double_or(score, "final", 0.0);

    for (double part : {base, location, time, feedback, collaborative}) {
        if (part < -kEps) {
            add_error(rep, "score_out_of_range", "negative sub-score", id);
            break;
        }
    }

    if (std::fabs(base + location + time + feedback + collaborative - base_total) > kEps) {
        add_error(rep, "score_out_of_range", "base_total is not the sum of its sub-scores", id);
    }
    if (base_total < -kEps || base_total > 100.0 + kEps) {
        add_error(rep, "score_out_of_range", "base_total outside 0-100", id);
    }
    if (final_score < -kEps || final_score > 100.0 * premium_multiplier + kEps) {
        add_error(rep, "score_out_of_range", "final score outside 0 to 100 x premium multiplier", id);
    }
    if (final_score + kEps < base_total) {
        add_error(rep, "score_out_of_range", "final score below base_total", id);
    }
    if (base_total < kSponsorRelevanceThreshold && final_score - base_total > kLowRelevanceBoostCap + kEps) {
        add_error(rep, "boost_cap_exceeded", "low-relevance sponsor boost exceeds 10 points", id);
    }
}

ValidationReport validate_explainability(const nlohmann::json& explain_j) {
    ValidationReport rep;

    if (!explain_j.is_object()) {
        add_error(rep, "bad_explainability", "explainability document must be an object");
        return rep;
    }
    if (!explain_j.contains("recommendations") || !explain_j["recommendations"].is_array()) {
        add_error(rep, "bad_explainability", "missing or invalid recommendations array");
        return rep;
    }
    if (!explain_j.contains("config") || !explain_j["config"].is_object()) {
        add_error(rep, "bad_explainability", "missing or invalid config object");
        return rep;
    }

    const nlohmann::json& cfg = explain_j["config"];
    const nlohmann::json selector_cfg = cfg.value("selector", nlohmann::json::object());
    const nlohmann::json score_cfg = cfg.value("score", nlohmann::json::object());

    const int k = get_int_or(explain_j, "effective_k", get_int_or(selector_cfg, "k", 10));
    const int sponsor_cap = get_int_or(explain_j, "sponsor_cap", 0);
    const int min_categories = get_int_or(selector_cfg, "min_categories", 3);
    const double premium_multiplier = get_double_or(score_cfg, "premium_multiplier", 1.30);

    const auto& recs = explain_j["recommendations"];

    if ((int)recs.size() > k) {
        add_error(rep, "constraint_violation", "recommendations exceed k=" + std::to_string(k));
    }

    std::unordered_set<std::string> seen_ids;
    std::unordered_set<std::string> seen_business;
    std::unordered_set<std::string> categories;
    int sponsored = 0;

    bool have_prev = false;
    double prev_final = 0.0;
    std::string prev_id;

    for (const auto& r : recs) {
        if (!r.is_object() || !r.contains("candidate") || !r["candidate"].is_object()) {
            add_error(rep, "bad_explainability", "recommendation without a candidate object");
            continue;
        }

        const nlohmann::json& c = r["candidate"];
        const std::string id = c.value("id", "");
        if (id.empty()) {
            add_error(rep, "bad_explainability", "recommendation with empty candidate id");
            continue;
        }

        if (!seen_ids.insert(id).second) {
            add_error(rep, "duplicate_candidate", "candidate recommended twice", id);
        }

        if (c.contains("business_id") && c["business_id"].is_string()) {
            const std::string bid = c["business_id"].get<std::string>();
            if (!bid.empty() && !seen_business.insert(bid).second) {
                add_error(rep, "duplicate_business", "second listing of business_id=" + bid, id);
            }
        }

        if (r.value("is_sponsored", false)) ++sponsored;

        const nlohmann::json evidence = r.value("evidence", nlohmann::json::object());
        categories.insert(evidence.value("category", c.value("category", "")));

        if (r.value("explanation", std::string()).empty()) {
            add_error(rep, "missing_explanation", "recommendation has no explanation", id);
        }

        if (!r.contains("score") || !r["score"].is_object()) {
            add_error(rep, "bad_explainability", "recommendation without a score object", id);
            continue;
        }
        check_score(rep, r["score"], id, premium_multiplier);

        const double final_score = get_double_or(r["score"], "final", 0.0);
        if (have_prev) {
            const bool out_of_order = final_score > prev_final || (final_score == prev_final && id < prev_id);
            if (out_of_order) {
                add_error(rep, "ordering_violation", "not in final score desc, id asc order", id);
            }
        }
        have_prev = true;
        prev_final = final_score;
        prev_id = id;
    }

    if (sponsored > sponsor_cap) {
        add_error(rep, "constraint_violation",
                  std::to_string(sponsored) + " sponsored recommendations exceed cap of " + std::to_string(sponsor_cap));
    }

    const int available = get_int_or(explain_j, "available_categories", (int)categories.size());
    int target = std::min(min_categories, available);
    target = std::min(target, k);
    if ((int)categories.size() < target) {
        add_error(rep, "diversity_violation",
                  std::to_string(categories.size()) + " categories, expected at least " + std::to_string(target));
    }

    return rep;
}

ValidationReport validate_run(const ValidationInputs& in) {
    ValidationReport rep;

    if (!fs::exists(in.explainability_path)) {
        add_error(rep, "missing_file", "explainability file does not exist: " + in.explainability_path);
        return rep;
    }

    nlohmann::json explain_j;
    try {
        explain_j = io::read_json_file(fs::path(in.explainability_path));
    } catch (const std::exception& e) {
        add_error(rep, "json_parse_error", e.what());
        return rep;
    }

    return validate_explainability(explain_j);
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    nlohmann::json j;
    j["pass"] = rep.pass;
    j["errors"] = nlohmann::json::array();

    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.candidate_id.empty()) ej["candidate_id"] = e.candidate_id;
        j["errors"].push_back(ej);
    }

    io::write_json_file(path, j);
}

}  // namespace ranker
