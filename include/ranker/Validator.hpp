#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "nlohmann/json.hpp"

namespace ranker {

struct ValidationError {
    std::string code;
    std::string message;
    std::string candidate_id;
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

struct ValidationInputs {
    std::string explainability_path;
};

// Re-checks an explainability document against the ranking rules: list size,
// one listing per business, sponsorship cap, category diversity, score bounds
// and ordering.
ValidationReport validate_explainability(const nlohmann::json& explain_j);

ValidationReport validate_run(const ValidationInputs& in);
void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace ranker
