/**
 * @file EWMHManager.cpp
 * @brief EWMH property reads and client messages
 */

#include "winorg/display/EWMHManager.hpp"
#include <X11/Xutil.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace worg {
namespace ewmh {

// ============================================================================
// Constructor / Initialization
// ============================================================================

EWMHManager::EWMHManager(Display* display, Window root)
    : display_(display)
    , root_(root)
{
    initAtoms();
}

bool EWMHManager::initialize() {
    auto check = getWindowArray(root_, atoms_.NET_SUPPORTING_WM_CHECK);
    if (!check || check->empty() || (*check)[0] == None) {
        std::cerr << "[EWMH] No EWMH compliant window manager found" << std::endl;
        return false;
    }

    // The WM name lives on the check window, not on the root
    std::string name = getTextProperty((*check)[0], atoms_.NET_WM_NAME);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    wm_name_ = name;

    std::cout << "[EWMH] Window manager: " << (wm_name_.empty() ? "(unnamed)" : wm_name_) << std::endl;
    return true;
}

void EWMHManager::initAtoms() {
    // Root window properties
    atoms_.NET_SUPPORTING_WM_CHECK = XInternAtom(display_, "_NET_SUPPORTING_WM_CHECK", False);
    atoms_.NET_NUMBER_OF_DESKTOPS = XInternAtom(display_, "_NET_NUMBER_OF_DESKTOPS", False);
    atoms_.NET_CURRENT_DESKTOP = XInternAtom(display_, "_NET_CURRENT_DESKTOP", False);
    atoms_.NET_DESKTOP_GEOMETRY = XInternAtom(display_, "_NET_DESKTOP_GEOMETRY", False);
    atoms_.NET_WORKAREA = XInternAtom(display_, "_NET_WORKAREA", False);
    atoms_.NET_ACTIVE_WINDOW = XInternAtom(display_, "_NET_ACTIVE_WINDOW", False);
    atoms_.NET_CLIENT_LIST = XInternAtom(display_, "_NET_CLIENT_LIST", False);
    atoms_.NET_CLIENT_LIST_STACKING = XInternAtom(display_, "_NET_CLIENT_LIST_STACKING", False);

    // Window properties
    atoms_.NET_WM_NAME = XInternAtom(display_, "_NET_WM_NAME", False);
    atoms_.NET_WM_DESKTOP = XInternAtom(display_, "_NET_WM_DESKTOP", False);
    atoms_.NET_WM_WINDOW_TYPE = XInternAtom(display_, "_NET_WM_WINDOW_TYPE", False);
    atoms_.NET_WM_STATE = XInternAtom(display_, "_NET_WM_STATE", False);
    atoms_.NET_FRAME_EXTENTS = XInternAtom(display_, "_NET_FRAME_EXTENTS", False);

    // Window types
    atoms_.NET_WM_WINDOW_TYPE_NORMAL = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_NORMAL", False);
    atoms_.NET_WM_WINDOW_TYPE_DIALOG = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_DIALOG", False);
    atoms_.NET_WM_WINDOW_TYPE_UTILITY = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_UTILITY", False);
    atoms_.NET_WM_WINDOW_TYPE_TOOLBAR = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_TOOLBAR", False);
    atoms_.NET_WM_WINDOW_TYPE_SPLASH = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_SPLASH", False);
    atoms_.NET_WM_WINDOW_TYPE_MENU = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_MENU", False);
    atoms_.NET_WM_WINDOW_TYPE_DROPDOWN_MENU = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_DROPDOWN_MENU", False);
    atoms_.NET_WM_WINDOW_TYPE_POPUP_MENU = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_POPUP_MENU", False);
    atoms_.NET_WM_WINDOW_TYPE_TOOLTIP = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_TOOLTIP", False);
    atoms_.NET_WM_WINDOW_TYPE_NOTIFICATION = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_NOTIFICATION", False);
    atoms_.NET_WM_WINDOW_TYPE_DOCK = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_DOCK", False);
    atoms_.NET_WM_WINDOW_TYPE_DESKTOP = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_DESKTOP", False);

    // Window states
    atoms_.NET_WM_STATE_MODAL = XInternAtom(display_, "_NET_WM_STATE_MODAL", False);
    atoms_.NET_WM_STATE_STICKY = XInternAtom(display_, "_NET_WM_STATE_STICKY", False);
    atoms_.NET_WM_STATE_MAXIMIZED_VERT = XInternAtom(display_, "_NET_WM_STATE_MAXIMIZED_VERT", False);
    atoms_.NET_WM_STATE_MAXIMIZED_HORZ = XInternAtom(display_, "_NET_WM_STATE_MAXIMIZED_HORZ", False);
    atoms_.NET_WM_STATE_SHADED = XInternAtom(display_, "_NET_WM_STATE_SHADED", False);
    atoms_.NET_WM_STATE_SKIP_TASKBAR = XInternAtom(display_, "_NET_WM_STATE_SKIP_TASKBAR", False);
    atoms_.NET_WM_STATE_SKIP_PAGER = XInternAtom(display_, "_NET_WM_STATE_SKIP_PAGER", False);
    atoms_.NET_WM_STATE_HIDDEN = XInternAtom(display_, "_NET_WM_STATE_HIDDEN", False);
    atoms_.NET_WM_STATE_FULLSCREEN = XInternAtom(display_, "_NET_WM_STATE_FULLSCREEN", False);
    atoms_.NET_WM_STATE_ABOVE = XInternAtom(display_, "_NET_WM_STATE_ABOVE", False);
    atoms_.NET_WM_STATE_BELOW = XInternAtom(display_, "_NET_WM_STATE_BELOW", False);
    atoms_.NET_WM_STATE_DEMANDS_ATTENTION = XInternAtom(display_, "_NET_WM_STATE_DEMANDS_ATTENTION", False);

    atoms_.UTF8_STRING = XInternAtom(display_, "UTF8_STRING", False);
}

// ============================================================================
// Root Window Properties
// ============================================================================

std::optional<std::vector<Window>> EWMHManager::getClientListStacking() {
    return getWindowArray(root_, atoms_.NET_CLIENT_LIST_STACKING);
}

std::vector<Window> EWMHManager::getClientList() {
    auto list = getWindowArray(root_, atoms_.NET_CLIENT_LIST);
    return list ? *list : std::vector<Window>{};
}

Window EWMHManager::getActiveWindow() {
    auto active = getWindowArray(root_, atoms_.NET_ACTIVE_WINDOW);
    if (!active || active->empty()) {
        return None;
    }
    return (*active)[0];
}

std::optional<int> EWMHManager::getCurrentDesktop() {
    auto value = getCardinalArray(root_, atoms_.NET_CURRENT_DESKTOP);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return static_cast<int>((*value)[0]);
}

int EWMHManager::getNumberOfDesktops() {
    auto value = getCardinalArray(root_, atoms_.NET_NUMBER_OF_DESKTOPS);
    if (!value || value->empty()) {
        return 1;
    }
    return static_cast<int>((*value)[0]);
}

std::optional<Rect> EWMHManager::getWorkarea(int desktop) {
    auto values = getCardinalArray(root_, atoms_.NET_WORKAREA);
    if (!values || values->size() < 4) {
        return std::nullopt;
    }

    // Four cardinals per desktop
    size_t offset = 0;
    if (desktop >= 0 && static_cast<size_t>(desktop) * 4 + 4 <= values->size()) {
        offset = static_cast<size_t>(desktop) * 4;
    }

    const auto& v = *values;
    return Rect{static_cast<int>(static_cast<long>(v[offset])),
                static_cast<int>(static_cast<long>(v[offset + 1])),
                static_cast<int>(v[offset + 2]),
                static_cast<int>(v[offset + 3])};
}

std::optional<Rect> EWMHManager::getDesktopGeometry() {
    auto values = getCardinalArray(root_, atoms_.NET_DESKTOP_GEOMETRY);
    if (!values || values->size() < 2) {
        return std::nullopt;
    }
    return Rect{0, 0, static_cast<int>((*values)[0]), static_cast<int>((*values)[1])};
}

// ============================================================================
// Client Window Properties
// ============================================================================

StateSet EWMHManager::getWindowState(Window window) {
    StateSet result;
    for (Atom atom : getAtomVectorProperty(window, atoms_.NET_WM_STATE)) {
        result = result.with(atomToState(atom));
    }
    return result;
}

WindowType EWMHManager::getWindowType(Window window) {
    auto types = getAtomVectorProperty(window, atoms_.NET_WM_WINDOW_TYPE);

    if (types.empty()) {
        return WindowType::Normal;
    }

    Atom type = types[0];

    if (type == atoms_.NET_WM_WINDOW_TYPE_NORMAL) return WindowType::Normal;
    if (type == atoms_.NET_WM_WINDOW_TYPE_DIALOG) return WindowType::Dialog;
    if (type == atoms_.NET_WM_WINDOW_TYPE_UTILITY) return WindowType::Utility;
    if (type == atoms_.NET_WM_WINDOW_TYPE_TOOLBAR) return WindowType::Toolbar;
    if (type == atoms_.NET_WM_WINDOW_TYPE_SPLASH) return WindowType::Splash;
    if (type == atoms_.NET_WM_WINDOW_TYPE_MENU) return WindowType::Menu;
    if (type == atoms_.NET_WM_WINDOW_TYPE_DROPDOWN_MENU) return WindowType::DropdownMenu;
    if (type == atoms_.NET_WM_WINDOW_TYPE_POPUP_MENU) return WindowType::PopupMenu;
    if (type == atoms_.NET_WM_WINDOW_TYPE_TOOLTIP) return WindowType::Tooltip;
    if (type == atoms_.NET_WM_WINDOW_TYPE_NOTIFICATION) return WindowType::Notification;
    if (type == atoms_.NET_WM_WINDOW_TYPE_DOCK) return WindowType::Dock;
    if (type == atoms_.NET_WM_WINDOW_TYPE_DESKTOP) return WindowType::Desktop;

    return WindowType::Unknown;
}

std::optional<int> EWMHManager::getWindowDesktop(Window window) {
    auto value = getCardinalArray(window, atoms_.NET_WM_DESKTOP);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    // Some WMs report -1 sign-extended, others 0xFFFFFFFF
    unsigned long desktop = (*value)[0] & 0xFFFFFFFFUL;
    if (desktop == ALL_DESKTOPS) {
        return std::nullopt;
    }
    return static_cast<int>(desktop);
}

Borders EWMHManager::getFrameExtents(Window window) {
    Borders borders;
    auto values = getCardinalArray(window, atoms_.NET_FRAME_EXTENTS);
    if (!values || values->size() < 4) {
        return borders;
    }
    borders.left = static_cast<int>((*values)[0]);
    borders.right = static_cast<int>((*values)[1]);
    borders.top = static_cast<int>((*values)[2]);
    borders.bottom = static_cast<int>((*values)[3]);
    return borders;
}

std::string EWMHManager::getWindowTitle(Window window) {
    std::string title = getTextProperty(window, atoms_.NET_WM_NAME);
    if (title.empty()) {
        title = getTextProperty(window, XA_WM_NAME);
    }
    return title;
}

std::string EWMHManager::getWindowClass(Window window) {
    XClassHint hint;
    hint.res_name = nullptr;
    hint.res_class = nullptr;

    std::string result;
    if (XGetClassHint(display_, window, &hint)) {
        if (hint.res_class) {
            result = hint.res_class;
            XFree(hint.res_class);
        }
        if (hint.res_name) {
            XFree(hint.res_name);
        }
    }
    return result;
}

Window EWMHManager::getTransientFor(Window window) {
    Window parent = None;
    if (!XGetTransientForHint(display_, window, &parent)) {
        return None;
    }
    return parent;
}

// ============================================================================
// Client Messages
// ============================================================================

void EWMHManager::sendRootMessage(Window window, Atom type,
                                  long d0, long d1, long d2, long d3, long d4) {
    XEvent event{};
    event.xclient.type = ClientMessage;
    event.xclient.serial = 0;
    event.xclient.send_event = True;
    event.xclient.display = display_;
    event.xclient.window = window;
    event.xclient.message_type = type;
    event.xclient.format = 32;
    event.xclient.data.l[0] = d0;
    event.xclient.data.l[1] = d1;
    event.xclient.data.l[2] = d2;
    event.xclient.data.l[3] = d3;
    event.xclient.data.l[4] = d4;

    XSendEvent(display_, root_, False,
               SubstructureRedirectMask | SubstructureNotifyMask, &event);
}

void EWMHManager::sendWindowState(Window window, StateSet states, StateMode mode) {
    std::vector<Atom> atoms;
    for (WindowState state : states.flags()) {
        Atom atom = stateToAtom(state);
        if (atom != None) {
            atoms.push_back(atom);
        }
    }

    // data.l[1] and data.l[2] carry up to two properties per message
    for (size_t i = 0; i < atoms.size(); i += 2) {
        Atom second = i + 1 < atoms.size() ? atoms[i + 1] : 0;
        sendRootMessage(window, atoms_.NET_WM_STATE, static_cast<long>(mode),
                        static_cast<long>(atoms[i]), static_cast<long>(second), SOURCE_PAGER, 0);
    }
}

void EWMHManager::sendActiveWindow(Window window, Time timestamp) {
    sendRootMessage(window, atoms_.NET_ACTIVE_WINDOW, SOURCE_PAGER,
                    static_cast<long>(timestamp), 0, 0, 0);
}

Atom EWMHManager::stateToAtom(WindowState state) const {
    switch (state) {
        case WindowState::MaximizedHorz: return atoms_.NET_WM_STATE_MAXIMIZED_HORZ;
        case WindowState::MaximizedVert: return atoms_.NET_WM_STATE_MAXIMIZED_VERT;
        case WindowState::Fullscreen: return atoms_.NET_WM_STATE_FULLSCREEN;
        case WindowState::Sticky: return atoms_.NET_WM_STATE_STICKY;
        case WindowState::Shaded: return atoms_.NET_WM_STATE_SHADED;
        case WindowState::Minimized: return atoms_.NET_WM_STATE_HIDDEN;
        case WindowState::Modal: return atoms_.NET_WM_STATE_MODAL;
        case WindowState::SkipTaskbar: return atoms_.NET_WM_STATE_SKIP_TASKBAR;
        case WindowState::SkipPager: return atoms_.NET_WM_STATE_SKIP_PAGER;
        case WindowState::AboveLayer: return atoms_.NET_WM_STATE_ABOVE;
        case WindowState::BelowLayer: return atoms_.NET_WM_STATE_BELOW;
        case WindowState::DemandsAttention: return atoms_.NET_WM_STATE_DEMANDS_ATTENTION;
        case WindowState::NoState: return None;
    }
    return None;
}

StateSet EWMHManager::atomToState(Atom atom) const {
    if (atom == atoms_.NET_WM_STATE_MAXIMIZED_HORZ) return WindowState::MaximizedHorz;
    if (atom == atoms_.NET_WM_STATE_MAXIMIZED_VERT) return WindowState::MaximizedVert;
    if (atom == atoms_.NET_WM_STATE_FULLSCREEN) return WindowState::Fullscreen;
    if (atom == atoms_.NET_WM_STATE_STICKY) return WindowState::Sticky;
    if (atom == atoms_.NET_WM_STATE_SHADED) return WindowState::Shaded;
    if (atom == atoms_.NET_WM_STATE_HIDDEN) return WindowState::Minimized;
    if (atom == atoms_.NET_WM_STATE_MODAL) return WindowState::Modal;
    if (atom == atoms_.NET_WM_STATE_SKIP_TASKBAR) return WindowState::SkipTaskbar;
    if (atom == atoms_.NET_WM_STATE_SKIP_PAGER) return WindowState::SkipPager;
    if (atom == atoms_.NET_WM_STATE_ABOVE) return WindowState::AboveLayer;
    if (atom == atoms_.NET_WM_STATE_BELOW) return WindowState::BelowLayer;
    if (atom == atoms_.NET_WM_STATE_DEMANDS_ATTENTION) return WindowState::DemandsAttention;
    return StateSet();
}

// ============================================================================
// Private Helper Methods
// ============================================================================

std::string EWMHManager::getTextProperty(Window window, Atom property) {
    XTextProperty prop;
    if (!XGetTextProperty(display_, window, &prop, property)) {
        return "";
    }

    if (!prop.value) {
        return "";
    }

    std::string result;
    if (prop.encoding == atoms_.UTF8_STRING) {
        result.assign(reinterpret_cast<char*>(prop.value), prop.nitems);
    } else {
        // WM_NAME is Latin-1 (STRING) or COMPOUND_TEXT
        char** list = nullptr;
        int count = 0;
        if (Xutf8TextPropertyToTextList(display_, &prop, &list, &count) >= Success &&
            list && count > 0) {
            result = list[0];
        }
        if (list) {
            XFreeStringList(list);
        }
    }
    XFree(prop.value);

    return result;
}

std::optional<std::vector<unsigned long>> EWMHManager::getCardinalArray(Window window, Atom property) {
    Atom actual_type;
    int actual_format;
    unsigned long nitems, bytes_after;
    unsigned char* prop = nullptr;

    if (XGetWindowProperty(display_, window, property, 0, 1024, False,
                          XA_CARDINAL, &actual_type, &actual_format,
                          &nitems, &bytes_after, &prop) != Success) {
        return std::nullopt;
    }

    if (!prop) {
        return std::nullopt;
    }

    // Format 32 properties come back as arrays of long
    std::optional<std::vector<unsigned long>> result;
    if (actual_format == 32) {
        unsigned long* values = reinterpret_cast<unsigned long*>(prop);
        result = std::vector<unsigned long>(values, values + nitems);
    }
    XFree(prop);

    return result;
}

std::optional<std::vector<Window>> EWMHManager::getWindowArray(Window window, Atom property) {
    Atom actual_type;
    int actual_format;
    unsigned long nitems, bytes_after;
    unsigned char* prop = nullptr;

    if (XGetWindowProperty(display_, window, property, 0, 4096, False,
                          XA_WINDOW, &actual_type, &actual_format,
                          &nitems, &bytes_after, &prop) != Success) {
        return std::nullopt;
    }

    if (!prop) {
        return std::nullopt;
    }

    std::optional<std::vector<Window>> result;
    if (actual_format == 32) {
        Window* windows = reinterpret_cast<Window*>(prop);
        result = std::vector<Window>(windows, windows + nitems);
    }
    XFree(prop);

    return result;
}

std::vector<Atom> EWMHManager::getAtomVectorProperty(Window window, Atom property) {
    Atom actual_type;
    int actual_format;
    unsigned long nitems, bytes_after;
    unsigned char* prop = nullptr;

    std::vector<Atom> result;

    if (XGetWindowProperty(display_, window, property, 0, 1024, False,
                          XA_ATOM, &actual_type, &actual_format,
                          &nitems, &bytes_after, &prop) != Success) {
        return result;
    }

    if (prop && nitems > 0) {
        Atom* atoms = reinterpret_cast<Atom*>(prop);
        result.assign(atoms, atoms + nitems);
    }
    if (prop) {
        XFree(prop);
    }

    return result;
}

}
}
