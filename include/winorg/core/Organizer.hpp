#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <X11/Xlib.h>

#include "winorg/action/ActionParser.hpp"
#include "winorg/config/ConfigParser.hpp"
#include "winorg/core/Dispatcher.hpp"
#include "winorg/core/TriggerQueue.hpp"
#include "winorg/display/X11Surface.hpp"
#include "winorg/ipc/DBusService.hpp"
#include "winorg/window/KeybindManager.hpp"

namespace worg {

/**
 * @brief The organizer daemon
 *
 * Wires the X11 surface, key grabs and the D-Bus service into one
 * TriggerQueue and runs the single dispatch loop that drains it.
 */
class Organizer {
public:
    struct Options {
        std::optional<std::filesystem::path> config_path;
        std::optional<std::string> display;
        bool verbose{false};
    };

    explicit Organizer(Options options);
    ~Organizer();

    Organizer(const Organizer&) = delete;
    Organizer& operator=(const Organizer&) = delete;

    bool initialize();

    void run();

    // Safe from a signal handler
    void stop() { running_.store(false); }

    void setVerbose(bool verbose);

private:
    Options options_;
    X11Surface surface_;
    TriggerQueue queue_;
    ConfigParser config_parser_;

    std::unique_ptr<ActionParser> actions_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<KeybindManager> keybinds_;
    std::unique_ptr<DBusService> dbus_;

    std::vector<std::string> config_errors_;
    std::atomic<bool> running_{false};
    bool windows_dirty_{true};
    bool verbose_{false};

    bool loadConfig();
    void setupKeybinds();
    void startDBus();

    void handleEvent(XEvent& event);
    void publishWindows();
    void shutdown();
};

}
