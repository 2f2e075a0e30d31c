#pragma once

/**
 * @file EWMHManager.hpp
 * @brief Extended Window Manager Hints (EWMH) client side
 *
 * winorg is not a window manager: it reads the hints the running WM
 * publishes on the root window and on client windows, and asks the WM
 * for state changes with client messages sent to the root window.
 */

#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <optional>
#include <string>
#include <vector>

#include "winorg/action/Command.hpp"
#include "winorg/geometry/Geometry.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {
namespace ewmh {

struct Atoms {

    Atom NET_SUPPORTING_WM_CHECK;
    Atom NET_NUMBER_OF_DESKTOPS;
    Atom NET_CURRENT_DESKTOP;
    Atom NET_DESKTOP_GEOMETRY;
    Atom NET_WORKAREA;
    Atom NET_ACTIVE_WINDOW;
    Atom NET_CLIENT_LIST;
    Atom NET_CLIENT_LIST_STACKING;

    Atom NET_WM_NAME;
    Atom NET_WM_DESKTOP;
    Atom NET_WM_WINDOW_TYPE;
    Atom NET_WM_STATE;
    Atom NET_FRAME_EXTENTS;

    Atom NET_WM_WINDOW_TYPE_NORMAL;
    Atom NET_WM_WINDOW_TYPE_DIALOG;
    Atom NET_WM_WINDOW_TYPE_UTILITY;
    Atom NET_WM_WINDOW_TYPE_TOOLBAR;
    Atom NET_WM_WINDOW_TYPE_SPLASH;
    Atom NET_WM_WINDOW_TYPE_MENU;
    Atom NET_WM_WINDOW_TYPE_DROPDOWN_MENU;
    Atom NET_WM_WINDOW_TYPE_POPUP_MENU;
    Atom NET_WM_WINDOW_TYPE_TOOLTIP;
    Atom NET_WM_WINDOW_TYPE_NOTIFICATION;
    Atom NET_WM_WINDOW_TYPE_DOCK;
    Atom NET_WM_WINDOW_TYPE_DESKTOP;

    Atom NET_WM_STATE_MODAL;
    Atom NET_WM_STATE_STICKY;
    Atom NET_WM_STATE_MAXIMIZED_VERT;
    Atom NET_WM_STATE_MAXIMIZED_HORZ;
    Atom NET_WM_STATE_SHADED;
    Atom NET_WM_STATE_SKIP_TASKBAR;
    Atom NET_WM_STATE_SKIP_PAGER;
    Atom NET_WM_STATE_HIDDEN;
    Atom NET_WM_STATE_FULLSCREEN;
    Atom NET_WM_STATE_ABOVE;
    Atom NET_WM_STATE_BELOW;
    Atom NET_WM_STATE_DEMANDS_ATTENTION;

    Atom UTF8_STRING;
};

// _NET_WM_DESKTOP value of windows shown on all desktops
constexpr unsigned long ALL_DESKTOPS = 0xFFFFFFFF;

// _NET_ACTIVE_WINDOW source indication: request from a pager
constexpr long SOURCE_PAGER = 2;

class EWMHManager {
public:

    EWMHManager(Display* display, Window root);

    ~EWMHManager() = default;

    EWMHManager(const EWMHManager&) = delete;
    EWMHManager& operator=(const EWMHManager&) = delete;
    EWMHManager(EWMHManager&&) = delete;
    EWMHManager& operator=(EWMHManager&&) = delete;

    /**
     * @brief Check that an EWMH compliant WM is running and read its name
     * @return false if the root window has no _NET_SUPPORTING_WM_CHECK
     */
    bool initialize();

    // Lower-case name of the running WM, empty if unknown
    inline const std::string& getWMName() const { return wm_name_; }

    // ========================================================================
    // Root window properties
    // ========================================================================

    // Bottom-to-top stacking order, nullopt if the WM does not publish it
    std::optional<std::vector<Window>> getClientListStacking();

    std::vector<Window> getClientList();

    Window getActiveWindow();

    std::optional<int> getCurrentDesktop();

    int getNumberOfDesktops();

    // Workarea of @p desktop (falls back to the first entry)
    std::optional<Rect> getWorkarea(int desktop);

    std::optional<Rect> getDesktopGeometry();

    // ========================================================================
    // Client window properties
    // ========================================================================

    StateSet getWindowState(Window window);

    WindowType getWindowType(Window window);

    // nullopt for windows shown on all desktops
    std::optional<int> getWindowDesktop(Window window);

    Borders getFrameExtents(Window window);

    std::string getWindowTitle(Window window);

    std::string getWindowClass(Window window);

    Window getTransientFor(Window window);

    // ========================================================================
    // Requests to the WM
    // ========================================================================

    /**
     * @brief Send a _NET_WM_STATE client message
     *
     * Up to two states fit in one message; larger sets are split.
     */
    void sendWindowState(Window window, StateSet states, StateMode mode);

    void sendActiveWindow(Window window, Time timestamp = CurrentTime);

    Atom stateToAtom(WindowState state) const;

    StateSet atomToState(Atom atom) const;

    inline const Atoms& getAtoms() const { return atoms_; }

private:
    Display* display_;
    Window root_;
    Atoms atoms_;

    std::string wm_name_;

    void initAtoms();

    void sendRootMessage(Window window, Atom type, long d0, long d1, long d2, long d3, long d4);

    std::string getTextProperty(Window window, Atom property);

    std::optional<std::vector<unsigned long>> getCardinalArray(Window window, Atom property);

    std::optional<std::vector<Window>> getWindowArray(Window window, Atom property);

    std::vector<Atom> getAtomVectorProperty(Window window, Atom property);
};

}
}
