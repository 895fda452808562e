#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "ranker/Engine.hpp"
#include "ranker/EngineConfig.hpp"
#include "ranker/Models.hpp"
#include "ranker/Scorer.hpp"
#include "ranker/Selector.hpp"

namespace io {

// All parse_* functions throw std::runtime_error with a path-qualified message
// ("root.candidates[2].location must be an object") on malformed input.

nlohmann::json read_json_file(const std::filesystem::path& path);
void write_json_file(const std::filesystem::path& path, const nlohmann::json& j);

// Root may be an array or an object with a "candidates" array.
std::vector<ranker::Candidate> parse_candidates(const nlohmann::json& j);
ranker::UserProfile parse_user_profile(const nlohmann::json& j);

// Unknown keys are ignored; a null or missing document yields the defaults.
ranker::AIProfile parse_ai_profile(const nlohmann::json& j);

// Root may be a single event, an array of events, or an object with "events".
std::vector<ranker::FeedbackEvent> parse_feedback_events(const nlohmann::json& j);

ranker::ScoringContext parse_context(const nlohmann::json& j);

// Overrides `base` with whatever the document sets.
ranker::EngineConfig parse_engine_config(const nlohmann::json& j, const ranker::EngineConfig& base = {});

std::vector<ranker::Candidate> load_candidates(const std::filesystem::path& path);
ranker::UserProfile load_user_profile(const std::filesystem::path& path);
ranker::AIProfile load_ai_profile(const std::filesystem::path& path);
std::vector<ranker::FeedbackEvent> load_feedback_events(const std::filesystem::path& path);
ranker::ScoringContext load_context(const std::filesystem::path& path);
ranker::EngineConfig load_engine_config(const std::filesystem::path& path, const ranker::EngineConfig& base = {});

nlohmann::json candidate_to_json(const ranker::Candidate& c);
nlohmann::json ai_profile_to_json(const ranker::AIProfile& p);
nlohmann::json score_to_json(const ranker::ScoreBreakdown& s);
nlohmann::json evidence_to_json(const ranker::ScoreEvidence& ev);
nlohmann::json recommendation_to_json(const ranker::Recommendation& r);
nlohmann::json engine_config_to_json(const ranker::EngineConfig& cfg);

}  // namespace io
