#pragma once

#include <cstdint>
#include <string>

namespace localelo::core::api {

struct SelectionConfig {
    double power = 1.0;
    std::uint32_t seed = 0;  // 0 seeds from std::random_device
};

struct KnockoutConfig {
    bool enabled = false;
    int pool_size = 0;
    int top_skew_size = 0;
};

struct DisplayConfig {
    bool color = true;
    bool hyperlinks = false;
    int leaderboard_size = 10;
};

struct OutputConfig {
    std::string store_file = "local_elo.json";
    std::string progress_log;
    std::string export_dir;  // defaults to target_dir
};

struct SessionConfig {
    std::string target_dir = ".";
    std::string pattern = ".*";
    SelectionConfig selection;
    KnockoutConfig knockout;
    DisplayConfig display;
    OutputConfig output;

    std::string StorePath() const;
    std::string ExportDir() const;
    bool Validate(std::string* error) const;

    static bool LoadFromFile(const std::string& path, SessionConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const SessionConfig& config, std::string* error);
    static bool FromJsonString(const std::string& payload, SessionConfig& config, std::string* error);
    static std::string ToJsonString(const SessionConfig& config);
};

}  // namespace localelo::core::api
