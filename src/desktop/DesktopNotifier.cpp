#include "popswarm/desktop/DesktopNotifier.hpp"
#include <gio/gio.h>
#include <iostream>

namespace pswarm {

DesktopNotifier::DesktopNotifier(std::string app_name)
    : app_name_(std::move(app_name)), connection_(nullptr) {
    GError* error = nullptr;
    GDBusConnection* conn = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);

    if (error) {
        std::cerr << "DesktopNotifier: No session bus: " << error->message << std::endl;
        g_error_free(error);
    } else {
        connection_ = conn;
    }
}

DesktopNotifier::~DesktopNotifier() {
    if (connection_) {
        g_object_unref(static_cast<GDBusConnection*>(connection_));
        connection_ = nullptr;
    }
}

bool DesktopNotifier::notify(const std::string& summary,
                             const std::string& body,
                             const std::string& icon,
                             int timeout_ms) {
    if (!connection_) return false;

    GVariantBuilder actions_builder;
    g_variant_builder_init(&actions_builder, G_VARIANT_TYPE("as"));

    GVariantBuilder hints_builder;
    g_variant_builder_init(&hints_builder, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&hints_builder, "{sv}", "urgency", g_variant_new_byte(1));

    GVariant* parameters = g_variant_new(
        "(susssasa{sv}i)",
        app_name_.c_str(),
        static_cast<guint32>(0),
        icon.c_str(),
        summary.c_str(),
        body.c_str(),
        &actions_builder,
        &hints_builder,
        static_cast<gint32>(timeout_ms)
    );

    GError* error = nullptr;
    GVariant* reply = g_dbus_connection_call_sync(
        static_cast<GDBusConnection*>(connection_),
        "org.freedesktop.Notifications",
        "/org/freedesktop/Notifications",
        "org.freedesktop.Notifications",
        "Notify",
        parameters,
        G_VARIANT_TYPE("(u)"),
        G_DBUS_CALL_FLAGS_NONE,
        -1,
        nullptr,
        &error
    );

    if (error) {
        std::cerr << "DesktopNotifier: Notify failed: " << error->message << std::endl;
        g_error_free(error);
        return false;
    }

    if (reply) {
        g_variant_unref(reply);
    }
    return true;
}

bool DesktopNotifier::openUri(const std::string& uri) {
    GError* error = nullptr;
    if (!g_app_info_launch_default_for_uri(uri.c_str(), nullptr, &error)) {
        std::cerr << "DesktopNotifier: Cannot open " << uri;
        if (error) {
            std::cerr << ": " << error->message;
            g_error_free(error);
        }
        std::cerr << std::endl;
        return false;
    }
    return true;
}

}
