#include "commands/validate.hpp"

#include "commands/CliArgs.hpp"
#include "ranker/Validator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int cmd_validate(int argc, char** argv) {
    try {
        init_logging(has_flag(argc, argv, "--verbose"));

        const std::string outdir = get_arg(argc, argv, "--outdir", "out");
        const fs::path outdir_p(outdir);

        const std::string explain_path = get_arg(argc, argv, "--explain", (outdir_p / "explainability.json").string());
        const std::string out_path = get_arg(argc, argv, "--out", (outdir_p / "validation_report.json").string());

        ranker::ValidationInputs vin;
        vin.explainability_path = explain_path;

        const ranker::ValidationReport rep = ranker::validate_run(vin);
        ranker::write_validation_report(fs::path(out_path), rep);

        if (!rep.pass) {
            std::cerr << "validation failed: wrote " << out_path << "\n";
            for (const auto& e : rep.errors) {
                std::cerr << "- " << e.code << ": " << e.message;
                if (!e.candidate_id.empty()) std::cerr << " (candidate_id=" << e.candidate_id << ")";
                std::cerr << "\n";
            }
            return 1;
        }

        std::cout << "VALIDATION: pass\n";
        std::cout << "OUT_VALIDATE: " << out_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "validate failed: " << e.what() << "\n";
        return 1;
    }
}
