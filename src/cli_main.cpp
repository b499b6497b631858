#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "strata/DotPath.hpp"
#include "strata/Errors.hpp"
#include "strata/Loader.hpp"
#include "strata/Resolver.hpp"

using nlohmann::json;
using namespace strata;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("strata", "Resolve and inspect layered editor configuration");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("g,global", "Path to the global config", cxxopts::value<std::string>())
            ("w,workspace", "Path to the workspace config", cxxopts::value<std::string>())
            ("l,lang", "Show the configuration as seen from a language", cxxopts::value<std::string>())
            ("v,verbose", "Log resolution steps to stderr")
            ("h,help", "Show help");

        // Command + sub-options captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({""}) << "\n";
            std::cout << "Commands: check | dump | get KEY | keys [MODE] | paths\n";
            return 0;
        }

        auto logger = spdlog::stderr_color_mt("strata");
        logger->set_level(result.count("verbose") ? spdlog::level::debug : spdlog::level::warn);

        ConfigPaths paths = ConfigPaths::defaults();
        if (result.count("global")) paths.global = result["global"].as<std::string>();
        if (result.count("workspace")) paths.local = result["workspace"].as<std::string>();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        // PATHS needs no resolution
        if (cmd == "paths") {
            std::cout << "global:    " << paths.global << "\n";
            std::cout << "workspace: " << paths.local << "\n";
            return 0;
        }

        ConfigLoader loader(logger);
        ResolvedConfig cfg = loader.resolve_or_default(read_source(paths.global),
                                                       read_source(paths.local));

        std::optional<std::string> lang;
        if (result.count("lang")) lang = result["lang"].as<std::string>();
        const json view = lang ? cfg.view(*lang) : cfg.to_value();

        // CHECK
        if (cmd == "check") {
            std::cout << "ok\n";
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << view.dump(2) << "\n";
            return 0;
        }

        // GET
        if (cmd == "get") {
            if (cmdv.size() < 2) {
                std::cerr << "Error: insufficient arguments for command 'get'\n";
                return 1;
            }
            const std::string key = cmdv[1];
            try {
                std::cout << get_by_dot(view, key)->dump(2) << "\n";
            } catch (const ConfigError& ex) {
                std::cerr << ex.what() << "\n";
                return 1;
            }
            return 0;
        }

        // KEYS
        if (cmd == "keys") {
            const std::string mode_arg = cmdv.size() > 1 ? cmdv[1] : "normal";
            auto mode = parse_mode(mode_arg);
            if (!mode) {
                std::cerr << "Error: unknown mode '" << mode_arg << "'\n";
                return 1;
            }
            const Keymap& keymap = lang ? cfg.keys_for(*lang) : cfg.keys;
            std::cout << keymap.at(*mode).to_value().dump(2) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ConfigParseError& bad) {
        std::cerr << "Bad config: " << bad.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
