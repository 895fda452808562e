#include "ranker/ExplainabilityArtifact.hpp"

#include <fstream>
#include <stdexcept>

#include "io/JsonIO.hpp"
#include "ranker/BusinessHours.hpp"

namespace ranker {

nlohmann::json context_to_json(const ScoringContext& ctx) {
    nlohmann::json j;
    j["hour"] = ctx.hour;
    j["minute"] = ctx.minute;
    j["weekday"] = weekday_str(ctx.weekday);
    if (ctx.current_location) {
        j["current_location"] = {
            {"latitude", ctx.current_location->latitude},
            {"longitude", ctx.current_location->longitude}
        };
    } else {
        j["current_location"] = nullptr;
    }
    j["collaborative_score_override"] =
        ctx.collaborative_score_override ? nlohmann::json(*ctx.collaborative_score_override) : nlohmann::json(nullptr);
    return j;
}

ExplainabilityArtifact ExplainabilityArtifact::from_run(const RecommendationRun& run, const ScoringContext& ctx, const EngineConfig& cfg) {
    ExplainabilityArtifact a;
    a.context = ctx;
    a.cfg = cfg;
    a.effective_k = run.effective_k;
    a.sponsor_cap = run.sponsor_cap;
    a.available_categories = run.available_categories;
    a.selected = run.recommendations;
    a.decisions = run.decisions;
    return a;
}

nlohmann::json ExplainabilityArtifact::to_json() const {
    nlohmann::json j;

    j["candidates_path"] = candidates_path;
    j["user_path"] = user_path;
    j["ai_profile_path"] = ai_profile_path;
    j["context"] = context_to_json(context);
    j["config"] = io::engine_config_to_json(cfg);

    j["effective_k"] = effective_k;
    j["sponsor_cap"] = sponsor_cap;
    j["available_categories"] = available_categories;

    nlohmann::json sel = nlohmann::json::array();
    for (size_t i = 0; i < selected.size(); ++i) {
        nlohmann::json rj = io::recommendation_to_json(selected[i]);
        rj["rank"] = static_cast<int>(i) + 1;
        sel.push_back(rj);
    }
    j["recommendations"] = sel;

    nlohmann::json dec = nlohmann::json::array();
    for (const auto& d : decisions) {
        dec.push_back({
            {"candidate_id", d.candidate_id},
            {"accepted", d.accepted},
            {"reason", d.reason}
        });
    }
    j["selection_decisions"] = dec;

    return j;
}

void ExplainabilityArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace ranker
