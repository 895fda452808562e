#include "ranker/ScoresArtifact.hpp"

#include <fstream>
#include <stdexcept>

#include "io/JsonIO.hpp"
#include "ranker/ExplainabilityArtifact.hpp"

namespace ranker {

nlohmann::json ScoresArtifact::to_json() const {
    nlohmann::json j;
    j["num_candidates"] = num_candidates;
    j["candidates_path"] = candidates_path;
    j["context"] = context_to_json(context);

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : scored) {
        arr.push_back({
            {"id", s.candidate.id},
            {"name", s.candidate.name},
            {"category", s.evidence.category},
            {"sponsor_tier", sponsor_tier_str(s.candidate.sponsor_tier)},
            {"score", io::score_to_json(s.score)},
            {"evidence", io::evidence_to_json(s.evidence)}
        });
    }
    j["candidates"] = arr;
    return j;
}

void ScoresArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace ranker
