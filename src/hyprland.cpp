#include "hyprland.hpp"

#include "unix_socket.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

// ─────────────────────────────────────
HyprlandIPC::HyprlandIPC() : m_SocketPath(ResolveSocketPath()) {}

// ─────────────────────────────────────
std::filesystem::path HyprlandIPC::ResolveSocketPath() {
    const char *sig = std::getenv("HYPRLAND_INSTANCE_SIGNATURE");
    if (sig == nullptr || !*sig) {
        return {};
    }

    // Hyprland >= 0.40 lives under $XDG_RUNTIME_DIR/hypr, older releases under /tmp/hypr
    std::filesystem::path base = "/tmp/hypr";
    if (const char *xdg = std::getenv("XDG_RUNTIME_DIR"); xdg != nullptr && *xdg) {
        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::path(xdg) / "hypr", ec)) {
            base = std::filesystem::path(xdg) / "hypr";
        }
    }
    return base / sig / ".socket.sock";
}

// ─────────────────────────────────────
bool HyprlandIPC::IsAvailable() const {
    std::error_code ec;
    return !m_SocketPath.empty() && std::filesystem::exists(m_SocketPath, ec);
}

// ─────────────────────────────────────
std::optional<nlohmann::json> HyprlandIPC::Request(const std::string &command,
                                                   std::chrono::milliseconds timeout) const {
    if (m_SocketPath.empty()) {
        return std::nullopt;
    }

    UnixSocket sock;
    std::string error;
    if (!sock.Connect(m_SocketPath.string(), error)) {
        spdlog::debug("Hyprland IPC: {}", error);
        return std::nullopt;
    }

    // "j/" asks for a JSON reply
    if (!sock.SendAll("j/" + command)) {
        spdlog::debug("Hyprland IPC: failed to send '{}'", command);
        return std::nullopt;
    }

    const std::string reply = sock.ReadToEnd(std::chrono::steady_clock::now() + timeout);
    if (reply.empty()) {
        spdlog::debug("Hyprland IPC: no reply to '{}' within {} ms", command, timeout.count());
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(reply);
    } catch (const std::exception &e) {
        spdlog::debug("Hyprland IPC: bad JSON reply to '{}': {}", command, e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
FocusedWindow HyprlandIPC::ParseActiveWindow(const nlohmann::json &reply) {
    FocusedWindow focus;
    if (!reply.is_object()) {
        return focus;
    }

    if (reply.contains("class") && reply["class"].is_string()) {
        focus.app_id = reply["class"].get<std::string>();
    }
    if (reply.contains("title") && reply["title"].is_string()) {
        focus.title = reply["title"].get<std::string>();
    }
    if (reply.contains("pid") && reply["pid"].is_number_integer()) {
        focus.window_id = reply["pid"].get<int>();
    }
    focus.valid = !focus.title.empty();
    return focus;
}

// ─────────────────────────────────────
FocusedWindow HyprlandIPC::GetActiveWindow(std::chrono::milliseconds timeout) const {
    const auto reply = Request("activewindow", timeout);
    if (!reply) {
        return {};
    }
    return ParseActiveWindow(*reply);
}
