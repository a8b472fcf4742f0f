#include "notification.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Notification::Notification() {
    // Schedulers notify from their own threads.
    dbus_threads_init_default();

    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::warn("No session bus, notifications will only be logged: {}",
                     dbus_error_is_set(&m_Err) ? m_Err.message : "unknown error");
        dbus_error_free(&m_Err);
        m_Conn = nullptr;
        return;
    }
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }

    if (dbus_error_is_set(&m_Err)) {
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
void Notification::Notify(const std::string &title, const std::string &body,
                          const nlohmann::json &data) {
    spdlog::info("Notification: {} | {} | {}", title, body, data.dump());

    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_Conn) {
        return;
    }
    if (!SendDesktopNotification(title, body)) {
        spdlog::debug("Desktop notification not delivered: {}", title);
    }
}

// ─────────────────────────────────────
bool Notification::SendDesktopNotification(const std::string &summary, const std::string &body) {
    int32_t timeout = 5000; // ms

    DBusMessage *msg_dbus = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                         "/org/freedesktop/Notifications",
                                                         "org.freedesktop.Notifications", "Notify");
    if (!msg_dbus) {
        spdlog::error("Failed to create DBus message");
        return false;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(msg_dbus, &args);

    const char *app_name = "TaskAgent";
    uint32_t replaces_id = 0;
    const char *icon = "checkbox-checked-symbolic";
    const char *summary_c = summary.c_str();
    const char *body_c = body.c_str();

    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces_id);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body_c);

    DBusMessageIter array;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &array);
    dbus_message_iter_close_container(&args, &array);

    DBusMessageIter dict;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_close_container(&args, &dict);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &timeout);

    if (!dbus_connection_send(m_Conn, msg_dbus, nullptr)) {
        spdlog::error("Failed to send DBus message");
        dbus_message_unref(msg_dbus);
        return false;
    }
    dbus_connection_flush(m_Conn);

    dbus_message_unref(msg_dbus);
    return true;
}
