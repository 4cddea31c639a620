// src/main.cpp
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cli/cli_config.h"
#include "parsing/parser.h"

namespace {

void setupLogging(spdlog::level::level_enum level) {
    auto console = spdlog::stderr_color_mt("console");
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    // SPDLOG_LEVEL in the environment wins over the command line
    spdlog::cfg::load_env_levels();
}

bool processCost(const std::string& cost, const CliConfig& config) {
    try {
        std::cout << describe(cost, config) << std::endl;
        return true;
    } catch (const ParseError& e) {
        spdlog::debug("Cannot parse '{}'", cost);
        std::cerr << diagnostic(cost, e);
    } catch (const InvalidSymbol& e) {
        spdlog::debug("Invalid symbol in '{}'", cost);
        std::cerr << "error: " << e.what() << std::endl;
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    CliConfig config;
    try {
        config = CliConfig::fromArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl << usage(argv[0]);
        return 2;
    }

    if (config.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    setupLogging(config.log_level);

    bool ok = true;
    if (!config.costs.empty()) {
        for (const std::string& cost : config.costs) {
            ok = processCost(cost, config) && ok;
        }
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            ok = processCost(line, config) && ok;
        }
    }

    spdlog::shutdown();
    return ok ? 0 : 1;
}
