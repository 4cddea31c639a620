// cli_config.cpp
#include "cli/cli_config.h"

#include "parsing/parser.h"
#include "symbols/mana_cost.h"

#include <algorithm>
#include <format>
#include <stdexcept>

CliConfig CliConfig::fromArgs(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return fromArgs(args);
}

CliConfig CliConfig::fromArgs(const std::vector<std::string>& args) {
    CliConfig config;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        // Costs never start with '-', but "--" is still honored
        if (options_done || arg.empty() || arg[0] != '-') {
            config.costs.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "-s" || arg == "--sort") {
            config.sort = true;
        } else if (arg == "-v" || arg == "--value") {
            config.show_value = true;
        } else if (arg == "--colors") {
            config.show_colors = true;
        } else if (arg == "-h" || arg == "--help") {
            config.help = true;
        } else if (arg == "--log-level") {
            if (i + 1 == args.size()) {
                throw std::invalid_argument("--log-level requires a value");
            }
            const std::string& name = args[++i];
            config.log_level = spdlog::level::from_str(name);
            // from_str falls back to off for names it does not know
            if (config.log_level == spdlog::level::off && name != "off") {
                throw std::invalid_argument(std::format("Unknown log level: {}", name));
            }
        } else {
            throw std::invalid_argument(std::format("Unknown option: {}", arg));
        }
    }
    return config;
}

std::string usage(const std::string& program) {
    return std::format(
        "Usage: {} [options] [COST...]\n"
        "Reads one cost per line from stdin when no COST is given.\n"
        "\n"
        "Options:\n"
        "  -s, --sort           print costs in canonical order\n"
        "  -v, --value          append the mana value\n"
        "      --colors         append the colors of the cost\n"
        "      --log-level LVL  trace, debug, info, warn, error, critical or off\n"
        "  -h, --help           show this message\n",
        program);
}

std::string describe(const std::string& cost, const CliConfig& config) {
    ManaCost parsed = ManaCost::parse(cost);
    if (config.sort) {
        parsed = parsed.sorted();
    }

    std::string line = parsed.toString();
    if (config.show_value) {
        line += std::format("\t{}", parsed.manaValue());
    }
    if (config.show_colors) {
        line += "\t" + toString(parsed.colors());
    }
    return line;
}

std::string diagnostic(const std::string& cost, const ParseError& error) {
    size_t width = std::max<size_t>(error.token().size(), 1);
    return std::format("error: {}\n  {}\n  {}{}\n", error.what(), cost,
                       std::string(error.offset(), ' '), std::string(width, '^'));
}
