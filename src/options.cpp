#include "options.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace {
std::chrono::milliseconds ParseInterval(const std::string &text) {
    double seconds = 0.0;
    size_t used = 0;
    try {
        seconds = std::stod(text, &used);
    } catch (const std::exception &) {
        throw std::invalid_argument("invalid --interval '" + text + "'");
    }
    if (used != text.size() || !std::isfinite(seconds)) {
        throw std::invalid_argument("invalid --interval '" + text + "'");
    }

    // compared in seconds, before the cast can overflow
    const double minSeconds = std::chrono::duration<double>(kMinInterval).count();
    const double maxSeconds = std::chrono::duration<double>(kMaxInterval).count();
    if (seconds < minSeconds || seconds > maxSeconds) {
        throw std::invalid_argument("--interval must be between 0.001 and 3600 seconds");
    }
    return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

LogLevel ParseLogLevel(const std::string &text) {
    if (text == "debug") {
        return LOG_DEBUG;
    }
    if (text == "info") {
        return LOG_INFO;
    }
    if (text == "off") {
        return LOG_OFF;
    }
    throw std::invalid_argument("invalid --log-level '" + text + "'");
}
} // namespace

// ─────────────────────────────────────
void PrintUsage(const char *argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "\n"
              << "Pomodoro block timer. Prints one xmobar status line per tick on stdout and\n"
              << "takes commands on the session bus (io.FocusBlock /io/FocusBlock).\n"
              << "\n"
              << "  --interval SECONDS      tick period, 0.001 to 3600 (default 1)\n"
              << "  --config PATH           JSON file with status-line colors and thresholds\n"
              << "  --dump-config PATH      write the effective config to PATH and exit\n"
              << "  --on-block-end COMMAND  shell command run when a block ends\n"
              << "  --task-log NAME         start with the activity log enabled as NAME\n"
              << "  --log-level LEVEL       debug, info or off (default info)\n"
              << "  --help                  show this help\n";
}

// ─────────────────────────────────────
Options ParseArgs(int argc, const char *const *argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--interval") {
            opts.interval = ParseInterval(value());
        } else if (arg == "--config") {
            opts.config_path = value();
        } else if (arg == "--dump-config") {
            opts.dump_config_path = value();
        } else if (arg == "--on-block-end") {
            opts.on_block_end = value();
        } else if (arg == "--task-log") {
            opts.task_log = value();
        } else if (arg == "--log-level") {
            opts.log_level = ParseLogLevel(value());
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }
    return opts;
}
