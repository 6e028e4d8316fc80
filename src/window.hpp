#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common.hpp"
#include "hyprland.hpp"
#include "niri.hpp"
#include "sampler.hpp"

// Focused-window sampler backed by whichever compositor is running.
class Window : public Sampler {
  public:
    enum WM { NIRI, HYPRLAND, X11, NONE };

    explicit Window(std::chrono::milliseconds timeout = std::chrono::milliseconds(250));
    ~Window() override = default;

    std::optional<std::string> CurrentFocusedWindowTitle() override;
    FocusedWindow GetFocusedWindow();
    bool IsAvailable() const {
        return m_WM != NONE;
    }
    WM Backend() const {
        return m_WM;
    }

  private:
    FocusedWindow GetNiriFocusedWindow();
    FocusedWindow GetHyprlandFocusedWindow();
    FocusedWindow GetX11FocusedWindow();

  private:
    WM m_WM = NONE;
    std::chrono::milliseconds m_Timeout;
    NiriIPC m_Niri;
    HyprlandIPC m_Hypr;
};
