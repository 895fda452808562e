#include "commands/rank.hpp"

#include "commands/CliArgs.hpp"
#include "io/JsonIO.hpp"
#include "ranker/BusinessHours.hpp"
#include "ranker/Engine.hpp"
#include "ranker/EngineConfig.hpp"
#include "ranker/ExplainabilityArtifact.hpp"
#include "ranker/ScoresArtifact.hpp"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static int rank_usage() {
    std::cerr
        << "usage:\n"
        << "  loop-ranker rank --candidates <path> --user <path> [--ai <path>] [options]\n"
        << "  (see: loop-ranker rank --help)\n";
    return 1;
}

// Local wall clock. Only the CLI reads it; the engine takes the time as input.
static ranker::ScoringContext now_context() {
    const std::time_t t = std::time(nullptr);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    ranker::ScoringContext ctx;
    ctx.hour = local.tm_hour;
    ctx.minute = local.tm_min;
    ctx.weekday = local.tm_wday;
    return ctx;
}

static int parse_weekday_arg(const std::string& s) {
    if (!s.empty() && std::isdigit(static_cast<unsigned char>(s[0]))) {
        const int d = std::stoi(s);
        if (d < 0 || d > 6) throw std::runtime_error("--weekday must be within 0-6 (0 = Sunday)");
        return d;
    }
    const auto d = ranker::parse_weekday(s);
    if (!d) throw std::runtime_error("--weekday has unrecognized value: " + s);
    return *d;
}

static nlohmann::json recommendations_json(const ranker::RecommendationRun& run) {
    nlohmann::json arr = nlohmann::json::array();
    for (size_t i = 0; i < run.recommendations.size(); ++i) {
        const auto& r = run.recommendations[i];
        arr.push_back({
            {"rank", static_cast<int>(i) + 1},
            {"id", r.candidate.id},
            {"name", r.candidate.name},
            {"category", r.evidence.category},
            {"final_score", r.score.final_score},
            {"is_sponsored", r.is_sponsored},
            {"explanation", r.explanation}
        });
    }

    nlohmann::json j;
    j["count"] = run.recommendations.size();
    j["recommendations"] = arr;
    if (run.empty()) j["message"] = "no recommendations available";
    return j;
}

int cmd_rank(int argc, char** argv) {
    try {
        init_logging(has_flag(argc, argv, "--verbose"));

        const std::string candidates_path = get_arg(argc, argv, "--candidates", "");
        const std::string user_path = get_arg(argc, argv, "--user", "");
        const std::string ai_path = get_arg(argc, argv, "--ai", "");
        const std::string context_path = get_arg(argc, argv, "--context", "");
        const std::string config_path = get_arg(argc, argv, "--config", "");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");

        if (candidates_path.empty() || user_path.empty()) {
            std::cerr << "error: missing --candidates and/or --user\n";
            return rank_usage();
        }

        ranker::EngineConfig cfg;
        if (!config_path.empty()) cfg = io::load_engine_config(config_path, cfg);
        cfg.selector.k = get_arg_int(argc, argv, "--k", cfg.selector.k);

        const std::vector<ranker::Candidate> candidates = io::load_candidates(candidates_path);
        const ranker::UserProfile user = io::load_user_profile(user_path);

        ranker::AIProfile ai;
        if (!ai_path.empty()) {
            ai = io::load_ai_profile(ai_path);
        } else {
            spdlog::info("no --ai profile given; ranking without learned preferences");
        }

        ranker::ScoringContext ctx = !context_path.empty() ? io::load_context(context_path) : now_context();

        ctx.hour = get_arg_int(argc, argv, "--hour", ctx.hour);
        if (ctx.hour < 0 || ctx.hour > 23) throw std::runtime_error("--hour must be within 0-23");
        ctx.minute = get_arg_int(argc, argv, "--minute", ctx.minute);
        if (ctx.minute < 0 || ctx.minute > 59) throw std::runtime_error("--minute must be within 0-59");

        const std::string weekday_arg = get_arg(argc, argv, "--weekday", "");
        if (!weekday_arg.empty()) ctx.weekday = parse_weekday_arg(weekday_arg);

        if (has_flag(argc, argv, "--collaborative")) {
            ctx.collaborative_score_override = get_arg_double(argc, argv, "--collaborative", 0.0);
        }

        const ranker::RecommendationRun run = ranker::recommend(candidates, user, ai, ctx, cfg);

        ranker::ScoresArtifact scores;
        scores.num_candidates = static_cast<int>(candidates.size());
        scores.candidates_path = candidates_path;
        scores.context = ctx;
        scores.scored = run.scored;

        ranker::ExplainabilityArtifact explain = ranker::ExplainabilityArtifact::from_run(run, ctx, cfg);
        explain.candidates_path = candidates_path;
        explain.user_path = user_path;
        explain.ai_profile_path = ai_path;

        const fs::path scores_path = outdir / "scores.json";
        const fs::path recs_path = outdir / "recommendations.json";
        const fs::path explain_path = outdir / "explainability.json";

        scores.write_to(scores_path);
        io::write_json_file(recs_path, recommendations_json(run));
        explain.write_to(explain_path);

        std::cout << "CANDIDATES: " << candidates.size() << "\n";
        std::cout << "TIME: " << ranker::weekday_str(ctx.weekday) << " "
                  << std::setw(2) << std::setfill('0') << ctx.hour << ":"
                  << std::setw(2) << std::setfill('0') << ctx.minute << std::setfill(' ') << "\n";
        std::cout << "K: " << run.effective_k << "\n";
        std::cout << "SPONSOR_CAP: " << run.sponsor_cap << "\n";
        std::cout << "SELECTED: " << run.recommendations.size() << "\n";

        if (run.empty()) {
            std::cout << "no recommendations available\n";
        }
        for (size_t i = 0; i < run.recommendations.size(); ++i) {
            const auto& r = run.recommendations[i];
            std::cout << "  " << (i + 1) << ". " << (r.candidate.name.empty() ? r.candidate.id : r.candidate.name)
                      << " [" << r.evidence.category << "] "
                      << std::fixed << std::setprecision(1) << r.score.final_score
                      << (r.is_sponsored ? " (sponsored)" : "")
                      << ": " << r.explanation << "\n";
        }

        std::cout << "OUT_SCORES: " << scores_path.string() << "\n";
        std::cout << "OUT_RECOMMENDATIONS: " << recs_path.string() << "\n";
        std::cout << "OUT_EXPLAIN: " << explain_path.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "rank failed: " << e.what() << "\n";
        return 1;
    }
}
