#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "ranker/Scorer.hpp"

namespace ranker {

// Every candidate with its full breakdown, in ranking order.
struct ScoresArtifact {
    int num_candidates = 0;
    std::string candidates_path;
    ScoringContext context;

    std::vector<ScoredCandidate> scored;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace ranker
