#include "commands/learn.hpp"
#include "commands/rank.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  loop-ranker rank [args]\n"
        << "  loop-ranker learn [args]\n"
        << "  loop-ranker validate [args]\n"
        << "  loop-ranker help\n";
    return 1;
}

static int print_rank_help() {
    std::cerr
        << "usage:\n"
        << "  loop-ranker rank --candidates <path> --user <path> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --candidates <path>          (required) array of candidate places\n"
        << "  --user <path>                (required) stated user profile\n"
        << "  --ai <path>                  learned profile; default: none\n"
        << "  --context <path>             hour/weekday/current_location; default: local time\n"
        << "  --outdir <dir>               default: out\n"
        << "\n"
        << "overrides:\n"
        << "  --config <path>              engine config JSON (any subset of fields)\n"
        << "  --k <n>                      default: 10, minimum 5\n"
        << "  --hour <n>                   0-23\n"
        << "  --minute <n>                 0-59\n"
        << "  --weekday <name|n>           sunday..saturday or 0-6\n"
        << "  --collaborative <x>          collaborative score, clamped to 0-10\n"
        << "  --verbose                    debug logging\n";
    return 0;
}

static int print_learn_help() {
    std::cerr
        << "usage:\n"
        << "  loop-ranker learn --feedback <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --feedback <path>            (required) one event, an array, or {\"events\": [...]}\n"
        << "  --ai <path>                  profile to update; default: empty profile\n"
        << "  --out <path>                 default: --ai path, else out/ai_profile.json\n"
        << "  --config <path>              engine config JSON (learner section)\n"
        << "  --verbose                    debug logging\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  loop-ranker validate [options]\n"
        << "\n"
        << "options:\n"
        << "  --outdir <dir>               default: out\n"
        << "  --explain <path>             default: <outdir>/explainability.json\n"
        << "  --out <path>                 default: <outdir>/validation_report.json\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    // subcommand help
    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "rank" && wants_help) return print_rank_help();
    if (cmd == "learn" && wants_help) return print_learn_help();
    if (cmd == "validate" && wants_help) return print_validate_help();

    if (cmd == "rank") return cmd_rank(argc - 1, argv + 1);
    if (cmd == "learn") return cmd_learn(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
