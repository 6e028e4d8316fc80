#include "unix_socket.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// ─────────────────────────────────────
UnixSocket::~UnixSocket() {
    Close();
}

// ─────────────────────────────────────
bool UnixSocket::Connect(const std::string &path, std::string &error) {
    Close();

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        error = "invalid socket path '" + path + "'";
        return false;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = std::string("socket() failed: ") + std::strerror(errno);
        return false;
    }

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        error = "connect(" + path + ") failed: " + std::strerror(errno);
        ::close(fd);
        return false;
    }

    m_Fd = fd;
    return true;
}

// ─────────────────────────────────────
void UnixSocket::Close() {
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
    }
    m_Buffer.clear();
}

// ─────────────────────────────────────
bool UnixSocket::SendAll(const std::string &data) {
    if (m_Fd < 0) {
        return false;
    }

    const char *ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t sent = ::send(m_Fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        ptr += static_cast<std::size_t>(sent);
        remaining -= static_cast<std::size_t>(sent);
    }
    return true;
}

// ─────────────────────────────────────
bool UnixSocket::WaitReadable(Deadline deadline) {
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd pfd{};
        pfd.fd = m_Fd;
        pfd.events = POLLIN;

        // round up so a sub-millisecond remainder still polls once
        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()) + 1);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc <= 0 || (pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            return false;
        }
        // POLLHUP with pending data still reports POLLIN
        return (pfd.revents & POLLIN) != 0;
    }
}

// ─────────────────────────────────────
bool UnixSocket::Receive() {
    char tmp[4096];
    while (true) {
        const ssize_t n = ::recv(m_Fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        m_Buffer.append(tmp, static_cast<std::size_t>(n));
        return true;
    }
}

// ─────────────────────────────────────
bool UnixSocket::ReadLine(std::string &line, Deadline deadline) {
    line.clear();
    if (m_Fd < 0) {
        return false;
    }

    while (true) {
        if (auto pos = m_Buffer.find('\n'); pos != std::string::npos) {
            line = m_Buffer.substr(0, pos);
            m_Buffer.erase(0, pos + 1);
            return true;
        }
        if (!WaitReadable(deadline) || !Receive()) {
            return false;
        }
    }
}

// ─────────────────────────────────────
std::string UnixSocket::ReadToEnd(Deadline deadline) {
    if (m_Fd >= 0) {
        while (WaitReadable(deadline) && Receive()) {
        }
    }
    std::string out;
    out.swap(m_Buffer);
    return out;
}
