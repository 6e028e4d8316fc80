#pragma once

#include <dbus/dbus.h>

#include <atomic>
#include <string>
#include <thread>

#include "command_dispatcher.hpp"

// Exports the timer controls on the session bus as io.FocusBlock.Timer at /io/FocusBlock:
//
//   StartBlock(u seconds)  PauseBlock()  CancelBlock()
//   TaskLogAdd(s label)    TaskLogRemove()  TaskLogOutput(b reset) -> s
//
// Rejected commands come back as io.FocusBlock.Error.Rejected.
class DBusServer {
  public:
    static constexpr const char *kBusName = "io.FocusBlock";
    static constexpr const char *kObjPath = "/io/FocusBlock";
    static constexpr const char *kInterface = "io.FocusBlock.Timer";
    static constexpr const char *kErrorRejected = "io.FocusBlock.Error.Rejected";

    explicit DBusServer(CommandHandler &handler);
    ~DBusServer();

    DBusServer(const DBusServer &) = delete;
    DBusServer &operator=(const DBusServer &) = delete;

    // Connects, owns the bus name and starts the dispatch thread. Throws std::runtime_error.
    void Start();
    void Stop();

  private:
    static DBusHandlerResult MessageHandler(DBusConnection *conn, DBusMessage *msg,
                                            void *user_data);
    DBusHandlerResult HandleMessage(DBusConnection *conn, DBusMessage *msg);
    DBusHandlerResult HandleMethod(DBusConnection *conn, DBusMessage *msg, const char *member);

    void ReplyIntrospect(DBusConnection *conn, DBusMessage *msg);
    void ReplyResult(DBusConnection *conn, DBusMessage *msg, const CommandResult &result,
                     bool withPayload);
    void ReplyError(DBusConnection *conn, DBusMessage *msg, const char *name,
                    const std::string &text);

    void TeardownConnection();

  private:
    CommandHandler &m_Handler;
    DBusConnection *m_Conn = nullptr;
    bool m_Started = false;

    std::atomic<bool> m_StopDispatch{false};
    std::thread m_DispatchThread;
};
