#include "commands/CliArgs.hpp"

#include <memory>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects an integer, got: " + s);
    }
    if (pos != s.size()) throw std::runtime_error(key + " expects an integer, got: " + s);
    return v;
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects a number, got: " + s);
    }
    if (pos != s.size()) throw std::runtime_error(key + " expects a number, got: " + s);
    return v;
}

void init_logging(bool verbose) {
    auto logger = spdlog::get("loop-ranker");
    if (!logger) {
        logger = spdlog::stderr_color_mt("loop-ranker");
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}
