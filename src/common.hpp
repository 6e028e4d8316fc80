#pragma once

#include <chrono>
#include <string>

enum BlockState { IDLE = 0, RUNNING = 1, PAUSED = 2, COOLDOWN = 3 };

enum FlashLevel { FLASH_NONE = 0, FLASH_WARN = 1, FLASH_ERROR = 2 };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

// Fixed rest period after every completed block
constexpr std::chrono::seconds kCooldownDuration{300};

struct FocusedWindow {
    int window_id = -1;
    std::string title;
    std::string app_id;
    bool valid = false;
};

struct BlockStatus {
    BlockState state = IDLE;
    std::chrono::milliseconds remaining{0};
    // Length of the current phase (block or cooldown)
    std::chrono::milliseconds duration{0};
    std::chrono::milliseconds elapsed{0};
    std::chrono::seconds block_duration{0};
};

const char *BlockStateName(BlockState state);

// Replaces every ill-formed UTF-8 sequence with U+FFFD. Window titles are raw bytes
// (X11 WM_NAME is often Latin-1) and D-Bus strings must be UTF-8.
std::string ToValidUtf8(const std::string &text);
