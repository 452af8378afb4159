#pragma once

/**
 * @file DesktopNotifier.hpp
 * @brief Desktop notifications over D-Bus and default-handler URI launching
 */

#include <string>

namespace pswarm {

class DesktopNotifier {
public:
    explicit DesktopNotifier(std::string app_name);
    ~DesktopNotifier();

    DesktopNotifier(const DesktopNotifier&) = delete;
    DesktopNotifier& operator=(const DesktopNotifier&) = delete;

    bool isValid() const { return connection_ != nullptr; }

    /**
     * @brief org.freedesktop.Notifications.Notify
     * @return false without a session bus or if the call failed
     */
    bool notify(const std::string& summary,
                const std::string& body,
                const std::string& icon = "dialog-information",
                int timeout_ms = 5000);

    /**
     * @brief Open a URI with the user's default handler
     */
    static bool openUri(const std::string& uri);

private:
    std::string app_name_;
    void* connection_;     // GDBusConnection*
};

}
