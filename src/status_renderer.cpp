#include "status_renderer.hpp"

#include "color.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

// ─────────────────────────────────────
StatusRenderer::StatusRenderer(StatusConfig config) : m_Config(std::move(config)) {}

// ─────────────────────────────────────
std::string StatusRenderer::FormatClock(long long seconds) {
    return fmt::format("{:02}:{:02}", seconds / 60, seconds % 60);
}

// ─────────────────────────────────────
std::string StatusRenderer::Background(FlashLevel flash) const {
    switch (flash) {
    case FLASH_WARN:
        return m_Config.warn_background;
    case FLASH_ERROR:
        return m_Config.error_background;
    case FLASH_NONE:
        break;
    }
    return {};
}

// ─────────────────────────────────────
std::string StatusRenderer::Render(const BlockStatus &status, FlashLevel flash) const {
    std::string bg = Background(flash);
    const long long rem_s =
        std::chrono::duration_cast<std::chrono::seconds>(status.remaining).count();

    std::string fg = m_Config.idle_color;
    std::string text;

    switch (status.state) {
    case IDLE:
        text = "--";
        break;
    case PAUSED:
        text = FormatClock(rem_s);
        break;
    case RUNNING:
    case COOLDOWN: {
        const double fraction =
            status.duration.count() > 0
                ? static_cast<double>(status.elapsed.count()) / status.duration.count()
                : 1.0;
        const bool cooldown = status.state == COOLDOWN;
        const Rgb &from = cooldown ? m_Config.cooldown_start_color : m_Config.block_start_color;
        const Rgb &to = cooldown ? m_Config.cooldown_end_color : m_Config.block_end_color;
        fg = ToHexColor(FadeBetween(from, to, fraction, m_Config.fade_exponent));

        // blink through the final seconds
        if (rem_s < m_Config.blink_threshold_seconds && rem_s % 2 == 1) {
            bg = m_Config.warn_background;
        }

        text = FormatClock(rem_s);
        if (cooldown) {
            text = m_Config.cooldown_marker + text + m_Config.cooldown_marker;
        }
        break;
    }
    }

    if (bg.empty()) {
        return fmt::format("<fc={}>{}</fc>", fg, text);
    }
    return fmt::format("<fc={},{}>{}</fc>", fg, bg, text);
}
