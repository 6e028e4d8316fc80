#pragma once

#include <chrono>
#include <string>

// Blocking AF_UNIX stream client. Reads are bounded by a deadline so a stuck
// compositor can't hold up the tick.
class UnixSocket {
  public:
    using Deadline = std::chrono::steady_clock::time_point;

    UnixSocket() = default;
    ~UnixSocket();

    UnixSocket(const UnixSocket &) = delete;
    UnixSocket &operator=(const UnixSocket &) = delete;

    bool Connect(const std::string &path, std::string &error);
    void Close();
    bool IsOpen() const {
        return m_Fd >= 0;
    }

    bool SendAll(const std::string &data);

    // Next '\n'-terminated line without the newline. Bytes past it stay buffered.
    bool ReadLine(std::string &line, Deadline deadline);

    // Everything until the peer closes the connection or the deadline passes.
    std::string ReadToEnd(Deadline deadline);

  private:
    // Returns false on timeout, error or hang-up without data.
    bool WaitReadable(Deadline deadline);
    // Appends what is available; false on EOF or error.
    bool Receive();

  private:
    int m_Fd = -1;
    std::string m_Buffer;
};
