#pragma once

#include <string>
#include <vector>

#include <spdlog/common.h>

class ParseError;

struct CliConfig {
    std::vector<std::string> costs;   // empty: read costs from stdin
    bool sort = false;
    bool show_value = false;
    bool show_colors = false;
    bool help = false;
    spdlog::level::level_enum log_level = spdlog::level::warn;

    // Throws std::invalid_argument on unknown options or missing values.
    static CliConfig fromArgs(const std::vector<std::string>& args);
    static CliConfig fromArgs(int argc, char** argv);
};

std::string usage(const std::string& program);

// One output line for `cost` according to `config`.
std::string describe(const std::string& cost, const CliConfig& config);

// User-facing report for a cost that failed to parse: the error message, the
// cost, and a caret line under the offending token.
std::string diagnostic(const std::string& cost, const ParseError& error);
