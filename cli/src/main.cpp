#include "localelo/core/api/SessionConfig.h"
#include "localelo/core/discovery/EntrantFiles.h"
#include "localelo/core/session/JudgingSession.h"

#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

namespace {

using localelo::core::api::SessionConfig;

void PrintUsage() {
    std::cerr << "Usage: localelo [--config <file.json>] [-e <ext,ext>] [-k] [-p <power>] [-n <pool size>]\n"
                 "                [-s <top-skew size>] [--seed <n>] [--no-color] [--links] [target_dir]\n";
}

bool ParseInt(const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseDouble(const std::string& text, double& value) {
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config_path = argv[i + 1];
        }
    }

    SessionConfig config;
    if (!config_path.empty()) {
        std::string error;
        if (!SessionConfig::LoadFromFile(config_path, config, &error)) {
            std::cerr << "[localelo] " << error << '\n';
            return 1;
        }
        std::cout << "[localelo] Session config: " << config_path << '\n';
    }

    bool target_seen = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config") {
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        } else if ((arg == "-e" || arg == "--extension") && has_value) {
            config.pattern = localelo::core::discovery::ExtensionsToPattern(argv[++i]);
        } else if (arg == "-k" || arg == "--knockout") {
            config.knockout.enabled = true;
        } else if ((arg == "-p" || arg == "--power") && has_value) {
            if (!ParseDouble(argv[++i], config.selection.power)) {
                std::cerr << "[localelo] Power must be a number." << '\n';
                return 1;
            }
        } else if ((arg == "-n" || arg == "--pool-size") && has_value) {
            if (!ParseInt(argv[++i], config.knockout.pool_size)) {
                std::cerr << "[localelo] Pool size must be an integer." << '\n';
                return 1;
            }
        } else if ((arg == "-s" || arg == "--top-skew") && has_value) {
            if (!ParseInt(argv[++i], config.knockout.top_skew_size)) {
                std::cerr << "[localelo] Top-skew size must be an integer." << '\n';
                return 1;
            }
        } else if (arg == "--seed" && has_value) {
            int seed = 0;
            if (!ParseInt(argv[++i], seed) || seed < 0) {
                std::cerr << "[localelo] Seed must be a non-negative integer." << '\n';
                return 1;
            }
            config.selection.seed = static_cast<std::uint32_t>(seed);
        } else if (arg == "--no-color") {
            config.display.color = false;
        } else if (arg == "--links") {
            config.display.hyperlinks = true;
        } else if (!arg.empty() && arg.front() != '-' && !target_seen) {
            config.target_dir = arg;
            target_seen = true;
        } else {
            std::cerr << "[localelo] Unknown or incomplete argument: " << arg << '\n';
            PrintUsage();
            return 1;
        }
    }

    if (std::getenv("NO_COLOR") != nullptr || !isatty(STDOUT_FILENO)) {
        config.display.color = false;
        config.display.hyperlinks = false;
    }

    std::string error;
    if (!config.Validate(&error)) {
        std::cerr << "[localelo] " << error << '\n';
        return 1;
    }

    localelo::core::session::JudgingSession session(config, std::cin, std::cout);
    const int code = session.Run();
    std::cout << "\nGoodbye!" << '\n';
    return code;
}
