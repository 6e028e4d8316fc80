#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <pthread.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "command_dispatcher.hpp"
#include "config.hpp"
#include "dbus_server.hpp"
#include "options.hpp"
#include "shared_state.hpp"
#include "shell_runner.hpp"
#include "status_renderer.hpp"
#include "tick_loop.hpp"
#include "window.hpp"

namespace {
void SetupLogging(LogLevel log_level) {
    // stdout belongs to the status bar
    auto logger = spdlog::stderr_color_mt("focusblock");
    spdlog::set_default_logger(logger);

    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

int DumpConfig(const StatusConfig &config, const std::string &path) {
    try {
        WriteStatusConfig(config, path);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "Config written to " << path << "\n";
    return 0;
}

int RunDaemon(const Options &opts, const StatusConfig &config) {
    // Signals are taken synchronously by a dedicated thread.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        throw std::runtime_error("failed to block SIGINT/SIGTERM");
    }

    const std::chrono::milliseconds interval = opts.interval;

    SharedState state;
    state.log.SetNominalInterval(interval);
    state.timer.SetFlashFrames(static_cast<unsigned>(config.warn_flash_frames),
                               static_cast<unsigned>(config.error_flash_frames));
    if (!opts.task_log.empty()) {
        state.log.Enable(opts.task_log);
        spdlog::info("Task log '{}' enabled", opts.task_log);
    }

    Window window;
    ProcessShellRunner shell;
    StatusRenderer renderer(config);

    CommandDispatcher dispatcher(state);
    DBusServer bus(dispatcher);
    bus.Start();

    TickLoop loop(state, window, shell, renderer, std::cout, interval);
    loop.SetOnBlockEnd(opts.on_block_end);

    std::thread signalThread([&signals, &loop] {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            spdlog::info("Received signal {}, shutting down", sig);
        }
        loop.Stop();
    });

    loop.Run();

    signalThread.join();
    bus.Stop();
    return 0;
}
} // namespace

// ─────────────────────────────────────
int main(int argc, char **argv) {
    Options opts;
    try {
        opts = ParseArgs(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        PrintUsage(argv[0]);
        return 1;
    }

    if (opts.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    SetupLogging(opts.log_level);

    StatusConfig config;
    if (!opts.config_path.empty()) {
        try {
            config = LoadStatusConfig(opts.config_path);
            spdlog::info("Config loaded from {}", opts.config_path);
        } catch (const std::exception &e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    if (!opts.dump_config_path.empty()) {
        return DumpConfig(config, opts.dump_config_path);
    }

    try {
        return RunDaemon(opts, config);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
