#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "color.hpp"

// Status-line look and blink/flash thresholds. Editable through the JSON file written by
// --dump-config.
struct StatusConfig {
    Rgb block_start_color{0, 255, 0};
    Rgb block_end_color{255, 255, 0};
    Rgb cooldown_start_color{255, 0, 0};
    Rgb cooldown_end_color{0, 255, 255};
    std::string idle_color = "#AAA";
    std::string warn_background = "#FF0";
    std::string error_background = "#F00";
    std::string cooldown_marker = "~";
    double fade_exponent = 2.0;
    int blink_threshold_seconds = 10;
    int warn_flash_frames = 5;
    int error_flash_frames = 7;
};

nlohmann::json StatusConfigToJson(const StatusConfig &config);

// Missing or mistyped keys keep the defaults.
StatusConfig StatusConfigFromJson(const nlohmann::json &j);

// Throws std::runtime_error when the file can't be read or isn't a JSON object.
StatusConfig LoadStatusConfig(const std::filesystem::path &path);

// Throws std::runtime_error when the file can't be written.
void WriteStatusConfig(const StatusConfig &config, const std::filesystem::path &path);
