#pragma once

#include <dbus/dbus.h>
#include <nlohmann/json.hpp>

#include <mutex>
#include <string>

// Sink for user-facing events. Delivery is best effort.
class Notifier {
  public:
    virtual ~Notifier() = default;
    virtual void Notify(const std::string &title, const std::string &body,
                        const nlohmann::json &data) = 0;
};

// Logs every event and, when a session bus is available, shows it as a desktop
// notification through org.freedesktop.Notifications.
class Notification : public Notifier {
  public:
    Notification();
    ~Notification() override;

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    void Notify(const std::string &title, const std::string &body,
                const nlohmann::json &data) override;

  private:
    bool SendDesktopNotification(const std::string &summary, const std::string &body);

    DBusError m_Err;
    DBusConnection *m_Conn = nullptr;
    std::mutex m_Mutex;
};
