#include "config.hpp"

#include "json.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace {
Rgb GetColor(const JsonReader &in, const std::string &key, const Rgb &fallback) {
    const std::string text = in.GetString(key, ToHexColor(fallback));
    const auto c = ParseHexColor(text);
    if (!c) {
        in.Warn(fmt::format("'{}' is not a color ('{}'), using default {}", key, text,
                            ToHexColor(fallback)));
        return fallback;
    }
    return *c;
}

std::string GetColorString(const JsonReader &in, const std::string &key,
                           const std::string &fallback) {
    const std::string text = in.GetString(key, fallback);
    if (!ParseHexColor(text)) {
        in.Warn(fmt::format("'{}' is not a color ('{}'), using default {}", key, text, fallback));
        return fallback;
    }
    return text;
}

int GetNonNegative(const JsonReader &in, const std::string &key, int fallback) {
    const int v = in.GetInt(key, fallback);
    if (v < 0) {
        in.Warn(fmt::format("'{}' must not be negative, using default {}", key, fallback));
        return fallback;
    }
    return v;
}
} // namespace

// ─────────────────────────────────────
nlohmann::json StatusConfigToJson(const StatusConfig &config) {
    return nlohmann::json{
        {"block_start_color", ToHexColor(config.block_start_color)},
        {"block_end_color", ToHexColor(config.block_end_color)},
        {"cooldown_start_color", ToHexColor(config.cooldown_start_color)},
        {"cooldown_end_color", ToHexColor(config.cooldown_end_color)},
        {"idle_color", config.idle_color},
        {"warn_background", config.warn_background},
        {"error_background", config.error_background},
        {"cooldown_marker", config.cooldown_marker},
        {"fade_exponent", config.fade_exponent},
        {"blink_threshold_seconds", config.blink_threshold_seconds},
        {"warn_flash_frames", config.warn_flash_frames},
        {"error_flash_frames", config.error_flash_frames},
    };
}

// ─────────────────────────────────────
StatusConfig StatusConfigFromJson(const nlohmann::json &j) {
    StatusConfig defaults;
    StatusConfig c;
    const JsonReader in(j, "Config");

    c.block_start_color = GetColor(in, "block_start_color", defaults.block_start_color);
    c.block_end_color = GetColor(in, "block_end_color", defaults.block_end_color);
    c.cooldown_start_color =
        GetColor(in, "cooldown_start_color", defaults.cooldown_start_color);
    c.cooldown_end_color = GetColor(in, "cooldown_end_color", defaults.cooldown_end_color);
    c.idle_color = GetColorString(in, "idle_color", defaults.idle_color);
    c.warn_background = GetColorString(in, "warn_background", defaults.warn_background);
    c.error_background = GetColorString(in, "error_background", defaults.error_background);
    c.cooldown_marker = in.GetString("cooldown_marker", defaults.cooldown_marker);

    c.fade_exponent = in.GetDouble("fade_exponent", defaults.fade_exponent);
    if (c.fade_exponent <= 0.0) {
        in.Warn(fmt::format("'fade_exponent' must be positive, using default {}",
                            defaults.fade_exponent));
        c.fade_exponent = defaults.fade_exponent;
    }

    c.blink_threshold_seconds =
        GetNonNegative(in, "blink_threshold_seconds", defaults.blink_threshold_seconds);
    c.warn_flash_frames = GetNonNegative(in, "warn_flash_frames", defaults.warn_flash_frames);
    c.error_flash_frames =
        GetNonNegative(in, "error_flash_frames", defaults.error_flash_frames);
    return c;
}

// ─────────────────────────────────────
StatusConfig LoadStatusConfig(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file " + path.string());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const std::exception &e) {
        throw std::runtime_error("invalid config file " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("config file " + path.string() + " must hold a JSON object");
    }

    spdlog::info("Config: loaded {}", path.string());
    return StatusConfigFromJson(j);
}

// ─────────────────────────────────────
void WriteStatusConfig(const StatusConfig &config, const std::filesystem::path &path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot open " + path.string() + " for writing");
    }

    file << StatusConfigToJson(config).dump(4) << "\n";
    file.flush();
    if (!file) {
        throw std::runtime_error("failed writing config to " + path.string());
    }
}
