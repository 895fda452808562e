#include "commands/learn.hpp"

#include "commands/CliArgs.hpp"
#include "io/JsonIO.hpp"
#include "ranker/EngineConfig.hpp"
#include "ranker/ProfileLearner.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static int learn_usage() {
    std::cerr
        << "usage:\n"
        << "  loop-ranker learn --feedback <path> [--ai <path>] [--out <path>] [--config <path>]\n";
    return 1;
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += v[i];
    }
    return out;
}

int cmd_learn(int argc, char** argv) {
    try {
        init_logging(has_flag(argc, argv, "--verbose"));

        const std::string ai_path = get_arg(argc, argv, "--ai", "");
        const std::string feedback_path = get_arg(argc, argv, "--feedback", "");
        const std::string config_path = get_arg(argc, argv, "--config", "");

        if (feedback_path.empty()) {
            std::cerr << "error: missing --feedback\n";
            return learn_usage();
        }

        const fs::path out_path = get_arg(argc, argv, "--out", ai_path.empty() ? "out/ai_profile.json" : ai_path);

        ranker::EngineConfig cfg;
        if (!config_path.empty()) cfg = io::load_engine_config(config_path, cfg);

        ranker::AIProfile profile;
        if (!ai_path.empty() && fs::exists(ai_path)) {
            profile = io::load_ai_profile(ai_path);
        } else if (!ai_path.empty()) {
            spdlog::info("{} does not exist; starting from an empty profile", ai_path);
        }

        const std::vector<ranker::FeedbackEvent> events = io::load_feedback_events(feedback_path);

        for (size_t i = 0; i < events.size(); ++i) {
            const ranker::LearningOutcome out = ranker::learn_from_feedback(profile, events[i], cfg.learner);
            profile = out.profile;

            std::cout << "EVENT " << (i + 1) << ": " << ranker::feedback_rating_str(events[i].rating)
                      << " " << events[i].category;
            if (!out.applied_tags.empty()) std::cout << " applied=" << join(out.applied_tags);
            if (!out.deferred_tags.empty()) std::cout << " deferred=" << join(out.deferred_tags);
            if (!out.ignored_tags.empty()) std::cout << " ignored=" << join(out.ignored_tags);
            std::cout << "\n";
        }

        io::write_json_file(out_path, io::ai_profile_to_json(profile));

        const ranker::FeedbackStats stats = ranker::summarize_feedback(events);

        std::cout << "EVENTS: " << stats.total << "\n";
        std::cout << "POSITIVE: " << stats.positive << "\n";
        std::cout << "NEGATIVE: " << stats.negative << "\n";
        std::cout << "SATISFACTION_RATE: " << std::fixed << std::setprecision(1) << stats.satisfaction_rate
                  << std::defaultfloat << std::setprecision(6) << "%\n";
        std::cout << "TOP_CATEGORIES: " << join(stats.top_categories) << "\n";
        std::cout << "FAVORITES: " << join(profile.favorite_categories) << "\n";
        std::cout << "DISLIKED: " << join(profile.disliked_categories) << "\n";
        std::cout << "PRICE_SENSITIVITY: " << ranker::price_sensitivity_str(profile.price_sensitivity) << "\n";
        std::cout << "PREFERRED_DISTANCE: " << profile.preferred_distance << "\n";
        std::cout << "OUT_PROFILE: " << out_path.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "learn failed: " << e.what() << "\n";
        return 1;
    }
}
