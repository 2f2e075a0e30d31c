#pragma once

/**
 * @file X11Surface.hpp
 * @brief WindowSurface over Xlib and the EWMH hints of the running WM
 *
 * Commands are sent as client messages and configure requests; their
 * completion is inferred from the X events that follow (ConfigureNotify,
 * PropertyNotify on _NET_WM_STATE, _NET_ACTIVE_WINDOW changes). Only the
 * newest command per window is tracked.
 *
 * All calls, including handleEvent(), must come from the thread that owns
 * the display connection.
 */

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/Xatom.h>

#include "winorg/display/EWMHManager.hpp"
#include "winorg/display/WindowSurface.hpp"
#include "winorg/window/SizeConstraints.hpp"

namespace worg {

struct DisplayDeleter {
    void operator()(Display* display) const {
        if (display) XCloseDisplay(display);
    }
};

using DisplayPtr = std::unique_ptr<Display, DisplayDeleter>;

/**
 * @brief Per-WM coordinate quirks
 */
struct WMQuirks {
    // Client geometry is relative to the frame and must be translated to root
    bool translate_coords{true};
    // Reported position is the client's, not the frame's
    bool adjust_geometry{false};

    static WMQuirks forWM(const std::string& wm_name);
};

class X11Surface : public WindowSurface {
public:
    X11Surface();
    ~X11Surface() override;

    X11Surface(const X11Surface&) = delete;
    X11Surface& operator=(const X11Surface&) = delete;

    /**
     * @brief Open the display and check for an EWMH compliant WM
     * @param display_name X display, $DISPLAY when empty
     */
    bool connect(std::optional<std::string> display_name = std::nullopt);

    inline Display* getDisplay() const { return display_.get(); }
    inline Window getRoot() const { return root_; }

    // ========================================================================
    // WindowSurface
    // ========================================================================

    bool isAvailable() const override;

    std::vector<WindowSnapshot> listWindows() override;

    Rect getWorkarea() override;

    int currentDesktop() override;

    void applyCommand(const Command& command, CompletionCallback done) override;

    void subscribe(EventCallback callback) override;

    // ========================================================================
    // Event handling
    // ========================================================================

    // Feed every non-key event read from the display
    void handleEvent(const XEvent& event);

    // Fail commands whose windows raised X errors since the last call
    void processErrors();

private:
    struct Outstanding {
        Command command;
        CompletionCallback done;
        bool geometry_pending{false};
        bool state_pending{false};
        bool activate_pending{false};

        bool complete() const { return !geometry_pending && !state_pending && !activate_pending; }
    };

    struct XErrorRecord {
        XID resource;
        unsigned char error_code;
        unsigned char request_code;
        std::string text;
    };

    DisplayPtr display_;
    int screen_{0};
    Window root_{None};
    std::unique_ptr<ewmh::EWMHManager> ewmh_;
    WMQuirks quirks_;
    bool ewmh_ok_{false};

    std::vector<EventCallback> subscribers_;
    std::unordered_map<Window, Outstanding> outstanding_;

    // Client windows with StructureNotify/PropertyChange selected
    std::set<Window> watched_;
    Window active_window_{None};

    static X11Surface* instance_;
    static std::vector<XErrorRecord> pending_errors_;

    static int onXError(Display* display, XErrorEvent* error);

    std::optional<WindowSnapshot> readWindow(Window window, Window active);
    std::optional<Rect> readFrameGeometry(Window window, const Borders& borders);
    WindowSizeHints readSizeHints(Window window);

    void watchWindow(Window window);
    void syncClientList();

    void notify(WindowEventType type, Window window);

    void confirmGeometry(Window window);
    void confirmState(Window window);
    void confirmActivation(Window window);
    void finishIfComplete(Window window);
    void fail(Window window, bool stale, const std::string& message);
};

}
