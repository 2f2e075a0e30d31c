#include "winorg/display/X11Surface.hpp"
#include "winorg/core/ActionError.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace worg {

X11Surface* X11Surface::instance_ = nullptr;
std::vector<X11Surface::XErrorRecord> X11Surface::pending_errors_;

// ============================================================================
// WM quirks
// ============================================================================

WMQuirks WMQuirks::forWM(const std::string& wm_name) {
    static const std::set<std::string> dont_translate = {"compiz"};
    static const std::set<std::string> adjust_geometry = {
        "compiz", "kwin", "e16", "icewm", "blackbox", "fvwm"
    };

    WMQuirks quirks;
    quirks.translate_coords = dont_translate.count(wm_name) == 0;
    quirks.adjust_geometry = adjust_geometry.count(wm_name) > 0;
    return quirks;
}

// ============================================================================
// Constructor / Connection
// ============================================================================

X11Surface::X11Surface() = default;

X11Surface::~X11Surface() {
    if (instance_ == this) {
        instance_ = nullptr;
        if (display_) {
            XSetErrorHandler(nullptr);
        }
    }
}

bool X11Surface::connect(std::optional<std::string> display_name) {
    const char* display_env = std::getenv("DISPLAY");
    std::string display_to_try;

    if (display_name.has_value() && !display_name->empty()) {
        display_to_try = *display_name;
    } else if (display_env != nullptr && display_env[0] != '\0') {
        display_to_try = display_env;
    } else {
        display_to_try = ":0";
    }

    Display* raw_display = XOpenDisplay(display_to_try.c_str());
    if (!raw_display) {
        std::cerr << "[X11] Failed to open display " << display_to_try << std::endl;
        return false;
    }

    display_ = DisplayPtr(raw_display, DisplayDeleter{});
    screen_ = DefaultScreen(display_.get());
    root_ = RootWindow(display_.get(), screen_);

    instance_ = this;
    XSetErrorHandler(&X11Surface::onXError);

    ewmh_ = std::make_unique<ewmh::EWMHManager>(display_.get(), root_);
    ewmh_ok_ = ewmh_->initialize();
    if (!ewmh_ok_) {
        std::cerr << "[X11] Window manager does not support EWMH, nothing to organize" << std::endl;
        return false;
    }

    quirks_ = WMQuirks::forWM(ewmh_->getWMName());

    XSelectInput(display_.get(), root_, SubstructureNotifyMask | PropertyChangeMask);

    active_window_ = ewmh_->getActiveWindow();
    syncClientList();
    XFlush(display_.get());

    std::cout << "[X11] Connected to " << display_to_try
              << " (" << ewmh_->getNumberOfDesktops() << " desktops, "
              << watched_.size() << " windows)" << std::endl;
    return true;
}

bool X11Surface::isAvailable() const {
    return display_ != nullptr && ewmh_ok_;
}

// ============================================================================
// Window source
// ============================================================================

std::vector<WindowSnapshot> X11Surface::listWindows() {
    if (!isAvailable()) {
        throw ActionError(ErrorKind::SourceUnavailable, "no display connection");
    }

    auto stacking = ewmh_->getClientListStacking();
    if (!stacking) {
        throw ActionError(ErrorKind::SourceUnavailable,
                          "_NET_CLIENT_LIST_STACKING is not published");
    }

    Window active = ewmh_->getActiveWindow();

    // Stacking order is bottom-to-top
    std::vector<WindowSnapshot> result;
    result.reserve(stacking->size());
    for (auto it = stacking->rbegin(); it != stacking->rend(); ++it) {
        if (auto snapshot = readWindow(*it, active)) {
            result.push_back(std::move(*snapshot));
        }
    }

    processErrors();
    return result;
}

Rect X11Surface::getWorkarea() {
    if (!isAvailable()) {
        throw ActionError(ErrorKind::SourceUnavailable, "no display connection");
    }

    if (auto workarea = ewmh_->getWorkarea(currentDesktop())) {
        return *workarea;
    }
    if (auto desktop = ewmh_->getDesktopGeometry()) {
        return *desktop;
    }
    return Rect{0, 0, DisplayWidth(display_.get(), screen_), DisplayHeight(display_.get(), screen_)};
}

int X11Surface::currentDesktop() {
    if (!isAvailable()) {
        return 0;
    }
    return ewmh_->getCurrentDesktop().value_or(0);
}

std::optional<WindowSnapshot> X11Surface::readWindow(Window window, Window active) {
    XWindowAttributes attrs;
    if (!XGetWindowAttributes(display_.get(), window, &attrs)) {
        return std::nullopt;
    }

    WindowSnapshot snapshot;
    snapshot.id = window;
    snapshot.borders = ewmh_->getFrameExtents(window);

    auto geometry = readFrameGeometry(window, snapshot.borders);
    if (!geometry) {
        return std::nullopt;
    }
    snapshot.geometry = *geometry;

    snapshot.state = ewmh_->getWindowState(window);
    snapshot.desktop = ewmh_->getWindowDesktop(window);
    snapshot.type = ewmh_->getWindowType(window);
    snapshot.active = window == active;
    snapshot.name = ewmh_->getWindowTitle(window);
    snapshot.class_name = ewmh_->getWindowClass(window);
    snapshot.transient_for = ewmh_->getTransientFor(window);

    return snapshot;
}

std::optional<Rect> X11Surface::readFrameGeometry(Window window, const Borders& borders) {
    Window geom_root;
    int x, y;
    unsigned int width, height, border_width, depth;

    if (!XGetGeometry(display_.get(), window, &geom_root, &x, &y,
                      &width, &height, &border_width, &depth)) {
        return std::nullopt;
    }

    if (quirks_.translate_coords) {
        // Position inside the frame, subtracted from the absolute position
        int abs_x, abs_y;
        Window child;
        if (!XTranslateCoordinates(display_.get(), window, root_, 0, 0, &abs_x, &abs_y, &child)) {
            return std::nullopt;
        }
        x = abs_x - x;
        y = abs_y - y;
    }

    if (quirks_.adjust_geometry) {
        x -= borders.left;
        y -= borders.top;
    }

    return Rect{x, y,
                static_cast<int>(width) + borders.horizontal(),
                static_cast<int>(height) + borders.vertical()};
}

WindowSizeHints X11Surface::readSizeHints(Window window) {
    WindowSizeHints result;

    XSizeHints* hints = XAllocSizeHints();
    if (!hints) {
        return result;
    }

    long supplied_return = 0;
    if (XGetWMNormalHints(display_.get(), window, hints, &supplied_return)) {
        if ((hints->flags & PMinSize) && (hints->min_width > 0 || hints->min_height > 0)) {
            result.flags.min_size = true;
            result.min_width = hints->min_width;
            result.min_height = hints->min_height;
        }
        if ((hints->flags & PMaxSize) && (hints->max_width > 0 || hints->max_height > 0)) {
            result.flags.max_size = true;
            result.max_width = std::min(hints->max_width > 0 ? hints->max_width : X11Limits::MAX_SIZE,
                                        static_cast<int>(X11Limits::MAX_SIZE));
            result.max_height = std::min(hints->max_height > 0 ? hints->max_height : X11Limits::MAX_SIZE,
                                         static_cast<int>(X11Limits::MAX_SIZE));
        }
        if (hints->flags & PResizeInc) {
            result.flags.resize_inc = true;
            result.width_inc = std::max(1, hints->width_inc);
            result.height_inc = std::max(1, hints->height_inc);
        }
        if (hints->flags & PBaseSize) {
            result.flags.base_size = true;
            result.base_width = hints->base_width;
            result.base_height = hints->base_height;
        }
        // WINE, OpenOffice and KeePassX position their client area
        if ((hints->flags & PWinGravity) && hints->win_gravity == StaticGravity) {
            result.flags.static_gravity = true;
        }
    }

    XFree(hints);
    return result;
}

// ============================================================================
// Command sink
// ============================================================================

void X11Surface::applyCommand(const Command& command, CompletionCallback done) {
    CommandOutcome outcome;
    outcome.window = command.window;
    outcome.generation = command.generation;

    if (!isAvailable()) {
        outcome.success = false;
        outcome.message = "no display connection";
        if (done) done(outcome);
        return;
    }

    Window window = command.window;
    XWindowAttributes attrs;
    if (!XGetWindowAttributes(display_.get(), window, &attrs)) {
        processErrors();
        outcome.success = false;
        outcome.stale = true;
        outcome.message = "window vanished";
        if (done) done(outcome);
        return;
    }

    // Newest command wins; the superseded one is never completed
    Outstanding entry;
    entry.command = command;
    entry.done = std::move(done);

    StateSet current_state = ewmh_->getWindowState(window);
    Borders borders = ewmh_->getFrameExtents(window);

    // State first: unmaximizing before a move keeps the WM from undoing it
    if (command.state && !command.state->flags.empty()) {
        const StateChange& change = *command.state;
        bool changes = true;
        if (change.mode == StateMode::Set) {
            changes = !current_state.hasAll(change.flags);
        } else if (change.mode == StateMode::Unset) {
            changes = current_state.intersects(change.flags);
        }
        if (changes) {
            ewmh_->sendWindowState(window, change.flags, change.mode);
            entry.state_pending = true;
        }
    }

    if (command.geometry) {
        auto frame = readFrameGeometry(window, borders);
        if (!frame || *frame != *command.geometry) {
            SizeConstraints constraints(readSizeHints(window));
            auto fitted = constraints.fitFrame(*command.geometry, borders, command.gravity,
                                               attrs.width, attrs.height);
            XMoveResizeWindow(display_.get(), window, fitted.x, fitted.y,
                              static_cast<unsigned int>(fitted.width),
                              static_cast<unsigned int>(fitted.height));
            entry.geometry_pending = true;
        }
    }

    if (command.activate && ewmh_->getActiveWindow() != window) {
        ewmh_->sendActiveWindow(window);
        entry.activate_pending = true;
    }

    XFlush(display_.get());

    if (entry.complete()) {
        outstanding_.erase(window);
        if (entry.done) entry.done(outcome);
        return;
    }

    watchWindow(window);
    outstanding_[window] = std::move(entry);
}

void X11Surface::subscribe(EventCallback callback) {
    subscribers_.push_back(std::move(callback));
}

void X11Surface::notify(WindowEventType type, Window window) {
    WindowEvent event{type, window};
    for (const auto& callback : subscribers_) {
        callback(event);
    }
}

// ============================================================================
// Event handling
// ============================================================================

void X11Surface::handleEvent(const XEvent& event) {
    if (!isAvailable()) {
        return;
    }

    const auto& atoms = ewmh_->getAtoms();

    switch (event.type) {
        case ConfigureNotify:
            if (event.xconfigure.window != root_) {
                confirmGeometry(event.xconfigure.window);
                notify(WindowEventType::GeometryChanged, event.xconfigure.window);
            }
            break;

        case DestroyNotify: {
            Window window = event.xdestroywindow.window;
            if (watched_.erase(window) > 0) {
                fail(window, true, "window destroyed");
                notify(WindowEventType::Destroyed, window);
            }
            break;
        }

        case PropertyNotify: {
            const XPropertyEvent& prop = event.xproperty;
            if (prop.window == root_) {
                if (prop.atom == atoms.NET_ACTIVE_WINDOW) {
                    active_window_ = ewmh_->getActiveWindow();
                    confirmActivation(active_window_);
                    notify(WindowEventType::ActiveChanged, active_window_);
                } else if (prop.atom == atoms.NET_CLIENT_LIST ||
                           prop.atom == atoms.NET_CLIENT_LIST_STACKING) {
                    syncClientList();
                } else if (prop.atom == atoms.NET_CURRENT_DESKTOP) {
                    notify(WindowEventType::DesktopChanged, NoWindow);
                }
            } else if (prop.atom == atoms.NET_WM_STATE) {
                confirmState(prop.window);
                notify(WindowEventType::StateChanged, prop.window);
            } else if (prop.atom == atoms.NET_WM_DESKTOP) {
                notify(WindowEventType::DesktopChanged, prop.window);
            }
            break;
        }

        default:
            break;
    }

    processErrors();
}

void X11Surface::watchWindow(Window window) {
    if (watched_.insert(window).second) {
        XSelectInput(display_.get(), window, StructureNotifyMask | PropertyChangeMask);
    }
}

void X11Surface::syncClientList() {
    std::vector<Window> clients = ewmh_->getClientList();
    std::set<Window> current(clients.begin(), clients.end());

    std::vector<Window> gone;
    for (Window window : watched_) {
        if (current.count(window) == 0) {
            gone.push_back(window);
        }
    }

    for (Window window : gone) {
        watched_.erase(window);
        fail(window, true, "window left the client list");
        notify(WindowEventType::Destroyed, window);
    }

    for (Window window : clients) {
        if (watched_.count(window) == 0) {
            watchWindow(window);
            notify(WindowEventType::Created, window);
        }
    }
}

void X11Surface::confirmGeometry(Window window) {
    auto it = outstanding_.find(window);
    if (it == outstanding_.end()) {
        return;
    }
    it->second.geometry_pending = false;
    finishIfComplete(window);
}

void X11Surface::confirmState(Window window) {
    auto it = outstanding_.find(window);
    if (it == outstanding_.end()) {
        return;
    }
    it->second.state_pending = false;
    finishIfComplete(window);
}

void X11Surface::confirmActivation(Window window) {
    auto it = outstanding_.find(window);
    if (it == outstanding_.end()) {
        return;
    }
    it->second.activate_pending = false;
    finishIfComplete(window);
}

void X11Surface::finishIfComplete(Window window) {
    auto it = outstanding_.find(window);
    if (it == outstanding_.end() || !it->second.complete()) {
        return;
    }

    Outstanding entry = std::move(it->second);
    outstanding_.erase(it);

    CommandOutcome outcome;
    outcome.window = entry.command.window;
    outcome.generation = entry.command.generation;
    if (entry.done) entry.done(outcome);
}

void X11Surface::fail(Window window, bool stale, const std::string& message) {
    auto it = outstanding_.find(window);
    if (it == outstanding_.end()) {
        return;
    }

    Outstanding entry = std::move(it->second);
    outstanding_.erase(it);

    CommandOutcome outcome;
    outcome.window = entry.command.window;
    outcome.generation = entry.command.generation;
    outcome.success = false;
    outcome.stale = stale;
    outcome.message = message;
    if (entry.done) entry.done(outcome);
}

// ============================================================================
// X error handling
// ============================================================================

int X11Surface::onXError(Display* display, XErrorEvent* error) {
    char error_text[1024];
    XGetErrorText(display, error->error_code, error_text, sizeof(error_text));

    // Xlib must not be re-entered from here; failures are settled in processErrors()
    pending_errors_.push_back(XErrorRecord{
        error->resourceid, error->error_code, error->request_code, error_text
    });

    return 0;
}

void X11Surface::processErrors() {
    if (pending_errors_.empty()) {
        return;
    }

    std::vector<XErrorRecord> errors;
    errors.swap(pending_errors_);

    for (const auto& error : errors) {
        if (error.error_code == BadWindow) {
            // Ordinary race with a window that just went away
            fail(error.resource, true, error.text);
            continue;
        }

        std::cerr << "[X11] Error: " << error.text
                  << " (request " << static_cast<int>(error.request_code)
                  << ", resource 0x" << std::hex << error.resource << std::dec << ")" << std::endl;
        fail(error.resource, false, error.text);
    }
}

}
