#include "winorg/ipc/DBusService.hpp"
#include <iostream>

namespace worg {

namespace {

const char* INTROSPECTION_XML = R"(
<node>
  <interface name="org.winorg.Organizer">
    <method name="Perform">
      <arg type="s" name="action" direction="in"/>
      <arg type="t" name="timestamp" direction="in"/>
      <arg type="b" name="ok" direction="out"/>
      <arg type="s" name="message" direction="out"/>
    </method>
    <method name="ListWindows">
      <arg type="a(tsiiii)" name="windows" direction="out"/>
    </method>
  </interface>
</node>
)";

}

DBusService::DBusService(TriggerQueue& queue, const FilterRegistry& filters)
    : queue_(queue), parser_(filters) {}

DBusService::~DBusService() {
    stop();
}

bool DBusService::start() {
    if (running_.load()) {
        return true;
    }

    GError* error = nullptr;
    connection_ = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);
    if (!connection_) {
        std::cerr << "[DBus] No session bus: " << (error ? error->message : "unknown error") << std::endl;
        if (error) {
            g_error_free(error);
        }
        return false;
    }

    introspection_ = g_dbus_node_info_new_for_xml(INTROSPECTION_XML, &error);
    if (!introspection_) {
        std::cerr << "[DBus] Bad introspection data: " << error->message << std::endl;
        g_error_free(error);
        stop();
        return false;
    }

    context_ = g_main_context_new();
    loop_ = g_main_loop_new(context_, FALSE);

    // Method calls are dispatched in the context that is thread default
    // at registration time
    g_main_context_push_thread_default(context_);

    static const GDBusInterfaceVTable vtable = {
        onMethodCall,
        nullptr,
        nullptr,
        {nullptr}
    };

    registration_id_ = g_dbus_connection_register_object(
        connection_,
        OBJECT_PATH,
        introspection_->interfaces[0],
        &vtable,
        this,
        nullptr,
        &error
    );

    if (registration_id_ == 0) {
        g_main_context_pop_thread_default(context_);
        std::cerr << "[DBus] Failed to export " << OBJECT_PATH << ": " << error->message << std::endl;
        g_error_free(error);
        stop();
        return false;
    }

    owner_id_ = g_bus_own_name_on_connection(
        connection_,
        BUS_NAME,
        G_BUS_NAME_OWNER_FLAGS_NONE,
        onNameAcquired,
        onNameLost,
        this,
        nullptr
    );

    g_main_context_pop_thread_default(context_);

    running_.store(true);
    thread_ = std::thread([this]() {
        g_main_context_push_thread_default(context_);
        g_main_loop_run(loop_);
        g_main_context_pop_thread_default(context_);
    });

    return true;
}

void DBusService::stop() {
    if (owner_id_ != 0) {
        g_bus_unown_name(owner_id_);
        owner_id_ = 0;
    }

    if (registration_id_ != 0) {
        g_dbus_connection_unregister_object(connection_, registration_id_);
        registration_id_ = 0;
    }

    if (loop_) {
        g_main_loop_quit(loop_);
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);

    if (loop_) {
        g_main_loop_unref(loop_);
        loop_ = nullptr;
    }

    if (context_) {
        g_main_context_unref(context_);
        context_ = nullptr;
    }

    if (introspection_) {
        g_dbus_node_info_unref(introspection_);
        introspection_ = nullptr;
    }

    if (connection_) {
        g_object_unref(connection_);
        connection_ = nullptr;
    }
}

std::string DBusService::sanitizeUtf8(const std::string& text) {
    if (g_utf8_validate(text.data(), static_cast<gssize>(text.size()), nullptr)) {
        return text;
    }
    gchar* valid = g_utf8_make_valid(text.data(), static_cast<gssize>(text.size()));
    std::string result(valid);
    g_free(valid);
    return result;
}

void DBusService::publishWindows(std::vector<WindowSnapshot> windows) {
    std::lock_guard<std::mutex> lock(windows_mutex_);
    windows_ = std::move(windows);
}

void DBusService::notify(const std::string& summary, const std::string& body, bool error) {
    if (!connection_) {
        return;
    }

    GVariantBuilder actions_builder;
    g_variant_builder_init(&actions_builder, G_VARIANT_TYPE("as"));

    GVariantBuilder hints_builder;
    g_variant_builder_init(&hints_builder, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&hints_builder, "{sv}", "urgency",
                          g_variant_new_byte(error ? 2 : 1));

    GVariant* parameters = g_variant_new(
        "(susssasa{sv}i)",
        "winorg",
        static_cast<guint32>(0),
        error ? "dialog-error" : "dialog-information",
        sanitizeUtf8(summary).c_str(),
        sanitizeUtf8(body).c_str(),
        &actions_builder,
        &hints_builder,
        static_cast<gint32>(error ? 0 : 5000)
    );

    g_dbus_connection_call(
        connection_,
        "org.freedesktop.Notifications",
        "/org/freedesktop/Notifications",
        "org.freedesktop.Notifications",
        "Notify",
        parameters,
        nullptr,
        G_DBUS_CALL_FLAGS_NONE,
        -1,
        nullptr,
        nullptr,
        nullptr
    );
}

// ============================================================================
// Method handlers (D-Bus thread)
// ============================================================================

void DBusService::onMethodCall(GDBusConnection*, const gchar*, const gchar*, const gchar*,
                               const gchar* method_name, GVariant* parameters,
                               GDBusMethodInvocation* invocation, gpointer user_data) {
    auto* self = static_cast<DBusService*>(user_data);
    std::string method = method_name;

    if (method == "Perform") {
        self->handlePerform(parameters, invocation);
    } else if (method == "ListWindows") {
        self->handleListWindows(invocation);
    } else {
        g_dbus_method_invocation_return_error(invocation, G_DBUS_ERROR,
                                              G_DBUS_ERROR_UNKNOWN_METHOD,
                                              "Unknown method %s", method_name);
    }
}

void DBusService::handlePerform(GVariant* parameters, GDBusMethodInvocation* invocation) {
    const gchar* text = nullptr;
    guint64 timestamp = 0;
    g_variant_get(parameters, "(&st)", &text, &timestamp);

    auto request = parser_.parse(text);
    if (!request) {
        g_dbus_method_invocation_return_value(invocation,
            g_variant_new("(bs)", FALSE, parser_.getLastError().c_str()));
        return;
    }

    request->origin = "dbus";
    request->timestamp = timestamp;

    ActionTrigger trigger;
    trigger.request = std::move(*request);
    // The invocation is consumed by exactly one return call
    trigger.reply = [invocation](const DispatchResult& result) {
        std::string message = result.message.empty() ?
            dispatchStatusToString(result.status) : result.message;
        g_dbus_method_invocation_return_value(invocation,
            g_variant_new("(bs)", result.ok() ? TRUE : FALSE, message.c_str()));
    };

    queue_.push(std::move(trigger));
}

void DBusService::handleListWindows(GDBusMethodInvocation* invocation) {
    GVariantBuilder builder;
    g_variant_builder_init(&builder, G_VARIANT_TYPE("a(tsiiii)"));

    {
        std::lock_guard<std::mutex> lock(windows_mutex_);
        for (const auto& window : windows_) {
            g_variant_builder_add(&builder, "(tsiiii)",
                                  static_cast<guint64>(window.id),
                                  sanitizeUtf8(window.name).c_str(),
                                  static_cast<gint32>(window.geometry.x),
                                  static_cast<gint32>(window.geometry.y),
                                  static_cast<gint32>(window.geometry.width),
                                  static_cast<gint32>(window.geometry.height));
        }
    }

    g_dbus_method_invocation_return_value(invocation, g_variant_new("(a(tsiiii))", &builder));
}

void DBusService::onNameAcquired(GDBusConnection*, const gchar* name, gpointer) {
    std::cout << "[DBus] Acquired " << name << std::endl;
}

void DBusService::onNameLost(GDBusConnection*, const gchar* name, gpointer) {
    std::cerr << "[DBus] Could not own " << name
              << " (another organizer running?)" << std::endl;
}

}
