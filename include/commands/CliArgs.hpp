#pragma once

#include <string>

// Flat "--key value" argument helpers shared by the subcommands.

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Throw std::runtime_error when the value is present but not a number.
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);

// stderr logger; --verbose switches it to debug.
void init_logging(bool verbose);
