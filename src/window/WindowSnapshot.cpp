/**
 * @file WindowSnapshot.cpp
 * @brief Snapshot helpers and capture from a WindowSurface
 */

#include "winorg/window/WindowSnapshot.hpp"
#include "winorg/action/Command.hpp"
#include "winorg/core/ActionError.hpp"
#include "winorg/display/WindowSurface.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace worg {

namespace {

std::string lowerKey(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

}

std::optional<WindowType> windowTypeFromString(std::string_view name) {
    static const std::unordered_map<std::string, WindowType> names = {
        {"normal", WindowType::Normal},
        {"dialog", WindowType::Dialog},
        {"utility", WindowType::Utility},
        {"toolbar", WindowType::Toolbar},
        {"splash", WindowType::Splash},
        {"menu", WindowType::Menu},
        {"dropdownmenu", WindowType::DropdownMenu},
        {"popupmenu", WindowType::PopupMenu},
        {"tooltip", WindowType::Tooltip},
        {"notification", WindowType::Notification},
        {"dock", WindowType::Dock},
        {"desktop", WindowType::Desktop},
    };
    auto it = names.find(lowerKey(name));
    if (it == names.end()) return std::nullopt;
    return it->second;
}

const char* windowTypeToString(WindowType type) {
    switch (type) {
        case WindowType::Normal: return "normal";
        case WindowType::Dialog: return "dialog";
        case WindowType::Utility: return "utility";
        case WindowType::Toolbar: return "toolbar";
        case WindowType::Splash: return "splash";
        case WindowType::Menu: return "menu";
        case WindowType::DropdownMenu: return "dropdown-menu";
        case WindowType::PopupMenu: return "popup-menu";
        case WindowType::Tooltip: return "tooltip";
        case WindowType::Notification: return "notification";
        case WindowType::Dock: return "dock";
        case WindowType::Desktop: return "desktop";
        case WindowType::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<WindowState> windowStateFromString(std::string_view name) {
    static const std::unordered_map<std::string, WindowState> names = {
        {"maximizedhorz", WindowState::MaximizedHorz},
        {"maximizedvert", WindowState::MaximizedVert},
        {"fullscreen", WindowState::Fullscreen},
        {"sticky", WindowState::Sticky},
        {"shaded", WindowState::Shaded},
        {"minimized", WindowState::Minimized},
        {"hidden", WindowState::Minimized},
        {"modal", WindowState::Modal},
        {"skiptaskbar", WindowState::SkipTaskbar},
        {"skippager", WindowState::SkipPager},
        {"above", WindowState::AboveLayer},
        {"below", WindowState::BelowLayer},
        {"demandsattention", WindowState::DemandsAttention},
        {"urgent", WindowState::DemandsAttention},
    };
    auto it = names.find(lowerKey(name));
    if (it == names.end()) return std::nullopt;
    return it->second;
}

const char* windowStateToString(WindowState state) {
    switch (state) {
        case WindowState::NoState: return "none";
        case WindowState::MaximizedHorz: return "maximized-horz";
        case WindowState::MaximizedVert: return "maximized-vert";
        case WindowState::Fullscreen: return "fullscreen";
        case WindowState::Sticky: return "sticky";
        case WindowState::Shaded: return "shaded";
        case WindowState::Minimized: return "minimized";
        case WindowState::Modal: return "modal";
        case WindowState::SkipTaskbar: return "skip-taskbar";
        case WindowState::SkipPager: return "skip-pager";
        case WindowState::AboveLayer: return "above";
        case WindowState::BelowLayer: return "below";
        case WindowState::DemandsAttention: return "demands-attention";
    }
    return "unknown";
}

std::vector<WindowState> StateSet::flags() const {
    std::vector<WindowState> result;
    for (uint32_t bit = 1; bit != 0 && bit <= bits_; bit <<= 1) {
        if (bits_ & bit) {
            result.push_back(static_cast<WindowState>(bit));
        }
    }
    return result;
}

std::string StateSet::toString() const {
    if (empty()) return "[]";
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (WindowState flag : flags()) {
        if (!first) oss << ", ";
        oss << windowStateToString(flag);
        first = false;
    }
    oss << "]";
    return oss.str();
}

std::string Command::toString() const {
    std::ostringstream oss;
    oss << "command(window=0x" << std::hex << window << std::dec << ", gen=" << generation;
    if (state) {
        static const char* modes[] = {"unset", "set", "toggle"};
        oss << ", state " << modes[static_cast<int>(state->mode)] << " " << state->flags.toString();
    }
    if (geometry) {
        oss << ", geometry " << geometry->toString();
    }
    if (activate) {
        oss << ", activate";
    }
    oss << ")";
    return oss.str();
}

const char* windowEventTypeToString(WindowEventType type) {
    switch (type) {
        case WindowEventType::Created: return "created";
        case WindowEventType::Destroyed: return "destroyed";
        case WindowEventType::StateChanged: return "state-changed";
        case WindowEventType::GeometryChanged: return "geometry-changed";
        case WindowEventType::ActiveChanged: return "active-changed";
        case WindowEventType::DesktopChanged: return "desktop-changed";
    }
    return "unknown";
}

// ============================================================================
// SnapshotSet
// ============================================================================

SnapshotSet::SnapshotSet(std::vector<WindowSnapshot> windows)
    : windows_(std::move(windows)) {}

const WindowSnapshot* SnapshotSet::find(WindowId id) const {
    auto it = std::find_if(windows_.begin(), windows_.end(),
        [id](const WindowSnapshot& w) { return w.id == id; });
    return it != windows_.end() ? &*it : nullptr;
}

const WindowSnapshot* SnapshotSet::active() const {
    auto it = std::find_if(windows_.begin(), windows_.end(),
        [](const WindowSnapshot& w) { return w.active; });
    return it != windows_.end() ? &*it : nullptr;
}

std::vector<WindowId> SnapshotSet::ids() const {
    std::vector<WindowId> result;
    result.reserve(windows_.size());
    for (const auto& w : windows_) {
        result.push_back(w.id);
    }
    return result;
}

// ============================================================================
// Capture
// ============================================================================

Capture capture(WindowSurface& surface) {
    if (!surface.isAvailable()) {
        throw ActionError(ErrorKind::SourceUnavailable, "window surface is not connected");
    }

    Capture result;
    result.windows = SnapshotSet(surface.listWindows());
    result.workarea = surface.getWorkarea();
    result.current_desktop = surface.currentDesktop();

    if (!result.workarea.isValid()) {
        throw ActionError(ErrorKind::SourceUnavailable,
                          "window surface reported an empty workarea " + result.workarea.toString());
    }
    return result;
}

}
