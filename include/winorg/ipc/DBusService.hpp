#pragma once

#include <gio/gio.h>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "winorg/action/ActionParser.hpp"
#include "winorg/core/TriggerQueue.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

/**
 * @brief Session bus interface of the organizer
 *
 * Exposes org.winorg.Organizer on /org/winorg/Organizer:
 *
 *   Perform(s action, t timestamp) -> (b ok, s message)
 *   ListWindows() -> a(tsiiii)   id, title, x, y, width, height
 *
 * The GLib main loop runs on a thread of its own. Perform parses the
 * action there and pushes an ActionTrigger; the method returns once the
 * dispatch loop has resolved it. ListWindows answers from the last
 * window list published by the dispatch loop, so the D-Bus thread never
 * talks to the X server.
 */
class DBusService {
public:
    static constexpr const char* BUS_NAME = "org.winorg.Organizer";
    static constexpr const char* OBJECT_PATH = "/org/winorg/Organizer";
    static constexpr const char* INTERFACE_NAME = "org.winorg.Organizer";

    DBusService(TriggerQueue& queue, const FilterRegistry& filters);
    ~DBusService();

    DBusService(const DBusService&) = delete;
    DBusService& operator=(const DBusService&) = delete;

    // Connect to the session bus, export the object and start the loop
    bool start();

    void stop();

    bool isRunning() const { return running_.load(); }

    // Dispatch thread: replace the list served by ListWindows
    void publishWindows(std::vector<WindowSnapshot> windows);

    /**
     * @brief Desktop notification through org.freedesktop.Notifications
     *
     * Fire and forget; does nothing when the bus is not connected.
     */
    void notify(const std::string& summary, const std::string& body, bool error = false);

    // D-Bus "s" values must be UTF-8; invalid bytes become U+FFFD
    static std::string sanitizeUtf8(const std::string& text);

private:
    TriggerQueue& queue_;
    ActionParser parser_;

    GDBusConnection* connection_{nullptr};
    GDBusNodeInfo* introspection_{nullptr};
    GMainContext* context_{nullptr};
    GMainLoop* loop_{nullptr};
    guint registration_id_{0};
    guint owner_id_{0};

    std::thread thread_;
    std::atomic<bool> running_{false};

    std::mutex windows_mutex_;
    std::vector<WindowSnapshot> windows_;

    void handlePerform(GVariant* parameters, GDBusMethodInvocation* invocation);
    void handleListWindows(GDBusMethodInvocation* invocation);

    static void onMethodCall(GDBusConnection* connection, const gchar* sender,
                             const gchar* object_path, const gchar* interface_name,
                             const gchar* method_name, GVariant* parameters,
                             GDBusMethodInvocation* invocation, gpointer user_data);
    static void onNameAcquired(GDBusConnection* connection, const gchar* name, gpointer user_data);
    static void onNameLost(GDBusConnection* connection, const gchar* name, gpointer user_data);
};

}
