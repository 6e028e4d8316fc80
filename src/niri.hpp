#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

#include "common.hpp"
#include "unix_socket.hpp"

// Query client for niri's $NIRI_SOCKET. The connection is kept open between requests.
class NiriIPC {
  public:
    NiriIPC();

    NiriIPC(const NiriIPC &) = delete;
    NiriIPC &operator=(const NiriIPC &) = delete;

    bool IsAvailable() const {
        return !m_SocketPath.empty();
    }

    // Sends a unit request such as "FocusedWindow" and parses the one-line reply.
    std::optional<nlohmann::json> Request(const std::string &name,
                                          std::chrono::milliseconds timeout);

    FocusedWindow GetFocusedWindow(std::chrono::milliseconds timeout);

    // Expected: {"Ok": {"FocusedWindow": {...}}}; the window may be null.
    static FocusedWindow ParseFocusedWindow(const nlohmann::json &reply);

  private:
    std::string m_SocketPath;
    UnixSocket m_Query;
};
