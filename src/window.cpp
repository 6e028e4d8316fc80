#include "window.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <memory>

// ─────────────────────────────────────
Window::Window(std::chrono::milliseconds timeout) : m_Timeout(timeout) {
    if (m_Niri.IsAvailable()) {
        m_WM = NIRI;
        spdlog::info("Window manager detected: NIRI");
    } else if (m_Hypr.IsAvailable()) {
        m_WM = HYPRLAND;
        spdlog::info("Window manager detected: HYPRLAND");
    } else if (std::getenv("DISPLAY") != nullptr) {
        m_WM = X11;
        spdlog::info("Window manager detected: X11 (xdotool)");
    } else {
        m_WM = NONE;
        spdlog::warn("No supported window manager found; activity sampling disabled");
    }
}

// ─────────────────────────────────────
std::optional<std::string> Window::CurrentFocusedWindowTitle() {
    FocusedWindow fw = GetFocusedWindow();
    if (!fw.valid || fw.title.empty()) {
        return std::nullopt;
    }
    return fw.title;
}

// ─────────────────────────────────────
FocusedWindow Window::GetFocusedWindow() {
    switch (m_WM) {
    case NIRI:
        return GetNiriFocusedWindow();
    case HYPRLAND:
        return GetHyprlandFocusedWindow();
    case X11:
        return GetX11FocusedWindow();
    case NONE:
        break;
    }
    return {};
}

// ─────────────────────────────────────
FocusedWindow Window::GetNiriFocusedWindow() {
    return m_Niri.GetFocusedWindow(m_Timeout);
}

// ─────────────────────────────────────
FocusedWindow Window::GetHyprlandFocusedWindow() {
    return m_Hypr.GetActiveWindow(m_Timeout);
}

// ─────────────────────────────────────
FocusedWindow Window::GetX11FocusedWindow() {
    FocusedWindow focus;

    // coreutils timeout keeps a wedged X server from stalling the tick
    const double seconds = static_cast<double>(m_Timeout.count()) / 1000.0;
    char cmd[128];
    std::snprintf(cmd, sizeof(cmd), "timeout %.3f xdotool getactivewindow getwindowname 2>/dev/null",
                  seconds);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd, "r"), pclose);
    if (!pipe) {
        spdlog::debug("Failed to run xdotool");
        return focus;
    }

    std::string response;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe.get())) {
        response += buffer;
    }

    while (!response.empty() && (response.back() == '\n' || response.back() == '\r')) {
        response.pop_back();
    }

    if (response.empty()) {
        return focus;
    }

    focus.title = response;
    focus.valid = true;
    return focus;
}
