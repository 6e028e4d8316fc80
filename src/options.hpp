#pragma once

#include <chrono>
#include <string>

#include "common.hpp"

// Command line of the daemon.
struct Options {
    std::chrono::milliseconds interval{1000};
    std::string config_path;
    std::string dump_config_path;
    std::string on_block_end;
    std::string task_log;
    LogLevel log_level = LOG_INFO;
    bool help = false;
};

// Accepted tick periods, inclusive.
constexpr std::chrono::milliseconds kMinInterval{1};
constexpr std::chrono::milliseconds kMaxInterval{std::chrono::hours(1)};

// Throws std::invalid_argument on unknown flags or bad values.
Options ParseArgs(int argc, const char *const *argv);

void PrintUsage(const char *argv0);
