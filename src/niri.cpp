#include "niri.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

// ─────────────────────────────────────
NiriIPC::NiriIPC() {
    if (const char *env = std::getenv("NIRI_SOCKET"); env != nullptr && *env) {
        m_SocketPath = env;
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json> NiriIPC::Request(const std::string &name,
                                               std::chrono::milliseconds timeout) {
    if (!IsAvailable()) {
        return std::nullopt;
    }

    if (!m_Query.IsOpen()) {
        std::string error;
        if (!m_Query.Connect(m_SocketPath, error)) {
            spdlog::debug("Niri IPC: {}", error);
            return std::nullopt;
        }
    }

    if (!m_Query.SendAll("\"" + name + "\"\n")) {
        spdlog::debug("Niri IPC: failed to send {} request", name);
        m_Query.Close();
        return std::nullopt;
    }

    std::string line;
    if (!m_Query.ReadLine(line, std::chrono::steady_clock::now() + timeout)) {
        // a late reply would be taken as the answer to the next request
        spdlog::debug("Niri IPC: no reply to {} within {} ms", name, timeout.count());
        m_Query.Close();
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(line);
    } catch (const std::exception &e) {
        spdlog::debug("Niri IPC: bad JSON reply to {}: {}", name, e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
FocusedWindow NiriIPC::ParseFocusedWindow(const nlohmann::json &reply) {
    FocusedWindow focus;

    const auto ok = reply.is_object() ? reply.find("Ok") : reply.end();
    if (ok == reply.end() || !ok->is_object() || !ok->contains("FocusedWindow")) {
        spdlog::debug("Niri IPC: unexpected FocusedWindow reply");
        return focus;
    }

    const auto &fw = (*ok)["FocusedWindow"];
    if (!fw.is_object()) {
        return focus;
    }

    if (fw.contains("id") && fw["id"].is_number_integer()) {
        focus.window_id = fw["id"].get<int>();
    }
    focus.title = fw.contains("title") && fw["title"].is_string() ? fw["title"].get<std::string>()
                                                                  : std::string();
    focus.app_id = fw.contains("app_id") && fw["app_id"].is_string()
                       ? fw["app_id"].get<std::string>()
                       : std::string();

    const bool focused = fw.contains("is_focused") && fw["is_focused"].is_boolean() &&
                         fw["is_focused"].get<bool>();
    focus.valid = focus.window_id != -1 && focused;
    return focus;
}

// ─────────────────────────────────────
FocusedWindow NiriIPC::GetFocusedWindow(std::chrono::milliseconds timeout) {
    const auto reply = Request("FocusedWindow", timeout);
    if (!reply) {
        return {};
    }
    return ParseFocusedWindow(*reply);
}
