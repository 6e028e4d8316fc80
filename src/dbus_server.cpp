#include "dbus_server.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace {
constexpr const char *kIfaceIntro = "org.freedesktop.DBus.Introspectable";
constexpr const char *kErrorInvalidArgs = "org.freedesktop.DBus.Error.InvalidArgs";
constexpr const char *kErrorUnknownMethod = "org.freedesktop.DBus.Error.UnknownMethod";
constexpr const char *kErrorFailed = "org.freedesktop.DBus.Error.Failed";

std::string TakeError(DBusError &err, const char *fallback) {
    std::string text = fallback;
    if (dbus_error_is_set(&err)) {
        text = err.message ? err.message : fallback;
        dbus_error_free(&err);
    }
    return text;
}
} // namespace

// ─────────────────────────────────────
DBusServer::DBusServer(CommandHandler &handler) : m_Handler(handler) {}

// ─────────────────────────────────────
DBusServer::~DBusServer() {
    Stop();
}

// ─────────────────────────────────────
void DBusServer::Start() {
    if (m_Started) {
        return;
    }

    // the dispatch thread owns the connection, but libdbus still takes internal locks
    dbus_threads_init_default();

    DBusError err;
    dbus_error_init(&err);

    m_Conn = dbus_bus_get_private(DBUS_BUS_SESSION, &err);
    if (!m_Conn) {
        throw std::runtime_error("DBus session connection failed: " +
                                 TakeError(err, "unknown error"));
    }
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);

    const int req = dbus_bus_request_name(m_Conn, kBusName, DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (req != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::string reason = TakeError(err, "name already owned, is another instance running?");
        TeardownConnection();
        throw std::runtime_error(std::string("DBus request_name ") + kBusName +
                                 " failed: " + reason);
    }

    static DBusObjectPathVTable vtable{};
    vtable.message_function = &DBusServer::MessageHandler;

    if (!dbus_connection_register_object_path(m_Conn, kObjPath, &vtable, this)) {
        TeardownConnection();
        throw std::runtime_error(std::string("DBus failed to register object path ") + kObjPath);
    }

    m_StopDispatch.store(false);
    m_DispatchThread = std::thread([this] {
        while (!m_StopDispatch.load()) {
            if (!dbus_connection_read_write_dispatch(m_Conn, 100)) {
                spdlog::error("DBus: connection closed, commands are no longer accepted");
                return;
            }
        }
    });

    m_Started = true;
    spdlog::info("DBus: {} exported as {}{}", kInterface, kBusName, kObjPath);
}

// ─────────────────────────────────────
void DBusServer::Stop() {
    if (!m_Started) {
        return;
    }
    m_StopDispatch.store(true);
    if (m_DispatchThread.joinable()) {
        m_DispatchThread.join();
    }
    dbus_connection_unregister_object_path(m_Conn, kObjPath);
    TeardownConnection();
    m_Started = false;
}

// ─────────────────────────────────────
void DBusServer::TeardownConnection() {
    if (!m_Conn) {
        return;
    }
    // private connections must be closed before the last unref
    dbus_connection_close(m_Conn);
    dbus_connection_unref(m_Conn);
    m_Conn = nullptr;
}

// ─────────────────────────────────────
DBusHandlerResult DBusServer::MessageHandler(DBusConnection *conn, DBusMessage *msg,
                                             void *user_data) {
    auto *self = static_cast<DBusServer *>(user_data);
    if (!self) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    return self->HandleMessage(conn, msg);
}

// ─────────────────────────────────────
DBusHandlerResult DBusServer::HandleMessage(DBusConnection *conn, DBusMessage *msg) {
    if (dbus_message_is_method_call(msg, kIfaceIntro, "Introspect")) {
        ReplyIntrospect(conn, msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (dbus_message_get_type(msg) != DBUS_MESSAGE_TYPE_METHOD_CALL ||
        !dbus_message_has_interface(msg, kInterface)) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    const char *member = dbus_message_get_member(msg);
    if (!member) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    // nothing may propagate back into libdbus
    try {
        return HandleMethod(conn, msg, member);
    } catch (const std::exception &e) {
        spdlog::error("DBus: {} failed: {}", member, e.what());
        ReplyError(conn, msg, kErrorFailed, e.what());
        return DBUS_HANDLER_RESULT_HANDLED;
    }
}

// ─────────────────────────────────────
DBusHandlerResult DBusServer::HandleMethod(DBusConnection *conn, DBusMessage *msg,
                                           const char *member) {
    const std::string name = member;
    DBusError err;
    dbus_error_init(&err);

    if (name == "StartBlock") {
        dbus_uint32_t seconds = 0;
        if (!dbus_message_get_args(msg, &err, DBUS_TYPE_UINT32, &seconds, DBUS_TYPE_INVALID)) {
            ReplyError(conn, msg, kErrorInvalidArgs, TakeError(err, "expected (u seconds)"));
            return DBUS_HANDLER_RESULT_HANDLED;
        }
        ReplyResult(conn, msg, m_Handler.StartBlock(seconds), false);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (name == "PauseBlock") {
        ReplyResult(conn, msg, m_Handler.PauseBlock(), false);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (name == "CancelBlock") {
        ReplyResult(conn, msg, m_Handler.CancelBlock(), false);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (name == "TaskLogAdd") {
        const char *label = nullptr;
        if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &label, DBUS_TYPE_INVALID)) {
            ReplyError(conn, msg, kErrorInvalidArgs, TakeError(err, "expected (s label)"));
            return DBUS_HANDLER_RESULT_HANDLED;
        }
        ReplyResult(conn, msg, m_Handler.TaskLogAdd(label ? label : ""), false);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (name == "TaskLogRemove") {
        ReplyResult(conn, msg, m_Handler.TaskLogRemove(), false);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (name == "TaskLogOutput") {
        dbus_bool_t reset = FALSE;
        if (!dbus_message_get_args(msg, &err, DBUS_TYPE_BOOLEAN, &reset, DBUS_TYPE_INVALID)) {
            ReplyError(conn, msg, kErrorInvalidArgs, TakeError(err, "expected (b reset)"));
            return DBUS_HANDLER_RESULT_HANDLED;
        }
        ReplyResult(conn, msg, m_Handler.TaskLogOutput(reset != FALSE), true);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    spdlog::debug("DBus: unknown method {}.{}", kInterface, name);
    ReplyError(conn, msg, kErrorUnknownMethod, "no method " + name + " on " + kInterface);
    return DBUS_HANDLER_RESULT_HANDLED;
}

// ─────────────────────────────────────
void DBusServer::ReplyIntrospect(DBusConnection *conn, DBusMessage *msg) {
    static const char *xml =
        "<node>"
        " <interface name='org.freedesktop.DBus.Introspectable'>"
        "  <method name='Introspect'>"
        "   <arg name='xml_data' type='s' direction='out'/>"
        "  </method>"
        " </interface>"
        " <interface name='io.FocusBlock.Timer'>"
        "  <method name='StartBlock'>"
        "   <arg name='seconds' type='u' direction='in'/>"
        "  </method>"
        "  <method name='PauseBlock'/>"
        "  <method name='CancelBlock'/>"
        "  <method name='TaskLogAdd'>"
        "   <arg name='label' type='s' direction='in'/>"
        "  </method>"
        "  <method name='TaskLogRemove'/>"
        "  <method name='TaskLogOutput'>"
        "   <arg name='reset' type='b' direction='in'/>"
        "   <arg name='report' type='s' direction='out'/>"
        "  </method>"
        " </interface>"
        "</node>";

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    dbus_message_append_args(reply, DBUS_TYPE_STRING, &xml, DBUS_TYPE_INVALID);
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void DBusServer::ReplyResult(DBusConnection *conn, DBusMessage *msg, const CommandResult &result,
                             bool withPayload) {
    if (!result.accepted) {
        spdlog::info("DBus: {} rejected: {}", dbus_message_get_member(msg), result.message);
        ReplyError(conn, msg, kErrorRejected, result.message);
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        spdlog::error("DBus: out of memory building reply");
        return;
    }

    if (withPayload) {
        // libdbus aborts the process on a non-UTF-8 string argument
        const char *payload = result.message.c_str();
        if (!dbus_validate_utf8(payload, nullptr) ||
            !dbus_message_append_args(reply, DBUS_TYPE_STRING, &payload, DBUS_TYPE_INVALID)) {
            dbus_message_unref(reply);
            spdlog::error("DBus: cannot send {} reply", dbus_message_get_member(msg));
            ReplyError(conn, msg, kErrorFailed, "reply is not a valid D-Bus string");
            return;
        }
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void DBusServer::ReplyError(DBusConnection *conn, DBusMessage *msg, const char *name,
                            const std::string &text) {
    DBusMessage *reply = dbus_message_new_error(msg, name, text.c_str());
    if (!reply) {
        spdlog::error("DBus: out of memory building error reply");
        return;
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}
