#include "localelo/core/api/SessionConfig.h"

#include "localelo/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace localelo::core::api {

namespace {

bool ParseRoot(const nlohmann::json& root, SessionConfig& config, std::string* error) {
    try {
        config.target_dir = root.value("target_dir", config.target_dir);
        config.pattern = root.value("pattern", config.pattern);

        if (root.contains("selection")) {
            const auto& node = root.at("selection");
            config.selection.power = node.value("power", config.selection.power);
            config.selection.seed = node.value("seed", config.selection.seed);
        }

        if (root.contains("knockout")) {
            const auto& node = root.at("knockout");
            config.knockout.enabled = node.value("enabled", config.knockout.enabled);
            config.knockout.pool_size = node.value("pool_size", config.knockout.pool_size);
            config.knockout.top_skew_size = node.value("top_skew_size", config.knockout.top_skew_size);
        }

        if (root.contains("display")) {
            const auto& node = root.at("display");
            config.display.color = node.value("color", config.display.color);
            config.display.hyperlinks = node.value("hyperlinks", config.display.hyperlinks);
            config.display.leaderboard_size = node.value("leaderboard_size", config.display.leaderboard_size);
        }

        if (root.contains("output")) {
            const auto& node = root.at("output");
            config.output.store_file = node.value("store_file", config.output.store_file);
            config.output.progress_log = node.value("progress_log", config.output.progress_log);
            config.output.export_dir = node.value("export_dir", config.output.export_dir);
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }
    return true;
}

}  // namespace

std::string SessionConfig::StorePath() const {
    return (std::filesystem::path(target_dir) / output.store_file).string();
}

std::string SessionConfig::ExportDir() const {
    return output.export_dir.empty() ? target_dir : output.export_dir;
}

bool SessionConfig::Validate(std::string* error) const {
    const auto fail = [error](const std::string& message) {
        if (error) {
            *error = message;
        }
        return false;
    };
    if (!std::isfinite(selection.power) || selection.power < 0.0) {
        return fail("Power must be a non-negative number (e.g. 0.5, 1.0, 2.0)");
    }
    if (knockout.pool_size != 0 && knockout.pool_size < 2) {
        return fail("Pool size must be at least 2");
    }
    if (knockout.top_skew_size < 0 || knockout.top_skew_size > knockout.pool_size) {
        return fail("Top-skew size must lie between 0 and the pool size");
    }
    if (display.leaderboard_size < 1) {
        return fail("Leaderboard size must be at least 1");
    }
    if (output.store_file.empty()) {
        return fail("Store file name must not be empty");
    }
    try {
        std::regex check(pattern);
    } catch (const std::regex_error& ex) {
        return fail("Invalid pattern '" + pattern + "': " + ex.what());
    }
    return true;
}

bool SessionConfig::FromJsonString(const std::string& payload, SessionConfig& config, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(payload);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    SessionConfig parsed;
    if (!ParseRoot(root, parsed, error)) {
        return false;
    }
    config = std::move(parsed);
    return true;
}

bool SessionConfig::LoadFromFile(const std::string& path, SessionConfig& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return FromJsonString(buffer.str(), config, error);
}

std::string SessionConfig::ToJsonString(const SessionConfig& config) {
    nlohmann::json root;
    root["target_dir"] = config.target_dir;
    root["pattern"] = config.pattern;
    root["selection"] = {
        {"power", config.selection.power},
        {"seed", config.selection.seed},
    };
    root["knockout"] = {
        {"enabled", config.knockout.enabled},
        {"pool_size", config.knockout.pool_size},
        {"top_skew_size", config.knockout.top_skew_size},
    };
    root["display"] = {
        {"color", config.display.color},
        {"hyperlinks", config.display.hyperlinks},
        {"leaderboard_size", config.display.leaderboard_size},
    };
    root["output"] = {
        {"store_file", config.output.store_file},
        {"progress_log", config.output.progress_log},
        {"export_dir", config.output.export_dir},
    };
    return root.dump(2);
}

bool SessionConfig::SaveToFile(const std::string& path, const SessionConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, ToJsonString(config), error);
}

}  // namespace localelo::core::api
