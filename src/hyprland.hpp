#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "common.hpp"

// Request client for Hyprland's socket1. Hyprland closes the socket after every reply,
// so each request opens a fresh connection.
class HyprlandIPC {
  public:
    HyprlandIPC();

    bool IsAvailable() const;

    // hyprctl-style command ("activewindow") answered as JSON.
    std::optional<nlohmann::json> Request(const std::string &command,
                                          std::chrono::milliseconds timeout) const;

    FocusedWindow GetActiveWindow(std::chrono::milliseconds timeout) const;

    // `activewindow` answers {} when no window has focus.
    static FocusedWindow ParseActiveWindow(const nlohmann::json &reply);

  private:
    static std::filesystem::path ResolveSocketPath();

  private:
    std::filesystem::path m_SocketPath;
};
