#pragma once

#include <string>

#include "common.hpp"
#include "config.hpp"

// One xmobar status line per snapshot, e.g. "<fc=#33ff00>24:13</fc>".
class StatusRenderer {
  public:
    explicit StatusRenderer(StatusConfig config = StatusConfig{});

    std::string Render(const BlockStatus &status, FlashLevel flash) const;

    const StatusConfig &Config() const {
        return m_Config;
    }

  private:
    static std::string FormatClock(long long seconds);
    std::string Background(FlashLevel flash) const;

  private:
    StatusConfig m_Config;
};
