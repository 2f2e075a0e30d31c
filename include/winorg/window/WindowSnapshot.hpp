#pragma once

/**
 * @file WindowSnapshot.hpp
 * @brief Read-only per-window records captured at dispatch time
 *
 * A snapshot is a value: it is never updated in place. The dispatcher
 * captures a fresh SnapshotSet at the start of every dispatch and throws
 * it away once the commands are issued.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "winorg/geometry/Geometry.hpp"

namespace worg {

// Opaque window identifier, stable for the lifetime of the window (an XID
// on X11)
using WindowId = unsigned long;

constexpr WindowId NoWindow = 0;

enum class WindowType {
    Normal,
    Dialog,
    Utility,
    Toolbar,
    Splash,
    Menu,
    DropdownMenu,
    PopupMenu,
    Tooltip,
    Notification,
    Dock,
    Desktop,
    Unknown
};

std::optional<WindowType> windowTypeFromString(std::string_view name);
const char* windowTypeToString(WindowType type);

enum class WindowState : uint32_t {
    NoState          = 0,
    MaximizedHorz    = 1 << 0,
    MaximizedVert    = 1 << 1,
    Fullscreen       = 1 << 2,
    Sticky           = 1 << 3,
    Shaded           = 1 << 4,
    Minimized        = 1 << 5,
    Modal            = 1 << 6,
    SkipTaskbar      = 1 << 7,
    SkipPager        = 1 << 8,
    AboveLayer       = 1 << 9,
    BelowLayer       = 1 << 10,
    DemandsAttention = 1 << 11
};

std::optional<WindowState> windowStateFromString(std::string_view name);
const char* windowStateToString(WindowState state);

/**
 * @brief Set of WindowState flags
 */
class StateSet {
public:
    constexpr StateSet() = default;
    constexpr StateSet(WindowState state) : bits_(static_cast<uint32_t>(state)) {}
    constexpr explicit StateSet(uint32_t bits) : bits_(bits) {}

    constexpr bool has(WindowState state) const {
        return (bits_ & static_cast<uint32_t>(state)) == static_cast<uint32_t>(state) &&
               state != WindowState::NoState;
    }

    constexpr bool hasAll(StateSet other) const {
        return !other.empty() && (bits_ & other.bits_) == other.bits_;
    }

    constexpr bool intersects(StateSet other) const { return (bits_ & other.bits_) != 0; }

    constexpr bool empty() const { return bits_ == 0; }

    constexpr StateSet with(StateSet other) const { return StateSet(bits_ | other.bits_); }
    constexpr StateSet without(StateSet other) const { return StateSet(bits_ & ~other.bits_); }
    constexpr StateSet toggled(StateSet other) const { return StateSet(bits_ ^ other.bits_); }

    constexpr uint32_t bits() const { return bits_; }

    // Individual flags, lowest bit first
    std::vector<WindowState> flags() const;

    std::string toString() const;

    constexpr bool operator==(const StateSet& other) const { return bits_ == other.bits_; }
    constexpr bool operator!=(const StateSet& other) const { return bits_ != other.bits_; }

private:
    uint32_t bits_{0};
};

constexpr StateSet operator|(WindowState a, WindowState b) {
    return StateSet(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr StateSet operator|(StateSet a, WindowState b) { return a.with(b); }

namespace states {
    constexpr StateSet Maximized = WindowState::MaximizedHorz | WindowState::MaximizedVert;
    // States under which the window manager owns the geometry
    constexpr StateSet GeometryLocked = Maximized | WindowState::Fullscreen;
}

struct WindowSnapshot {
    WindowId id{NoWindow};

    // Outer frame rectangle (client area plus borders), desktop coordinates
    Rect geometry;
    Borders borders;

    StateSet state;

    // Empty for windows shown on all desktops
    std::optional<int> desktop;

    WindowType type{WindowType::Normal};
    bool active{false};

    std::string name;
    std::string class_name;
    WindowId transient_for{NoWindow};

    bool hasState(WindowState s) const { return state.has(s); }
    bool isMaximized() const { return state.hasAll(states::Maximized); }
    bool isGeometryLocked() const { return state.intersects(states::GeometryLocked); }
};

/**
 * @brief Ordered snapshots of all managed windows, topmost first
 */
class SnapshotSet {
public:
    SnapshotSet() = default;
    explicit SnapshotSet(std::vector<WindowSnapshot> windows);

    const WindowSnapshot* find(WindowId id) const;

    const WindowSnapshot* active() const;

    bool contains(WindowId id) const { return find(id) != nullptr; }

    std::vector<WindowId> ids() const;

    size_t size() const { return windows_.size(); }
    bool empty() const { return windows_.empty(); }

    const std::vector<WindowSnapshot>& windows() const { return windows_; }

    std::vector<WindowSnapshot>::const_iterator begin() const { return windows_.begin(); }
    std::vector<WindowSnapshot>::const_iterator end() const { return windows_.end(); }

private:
    std::vector<WindowSnapshot> windows_;
};

class WindowSurface;

/**
 * @brief Everything one dispatch resolves against
 */
struct Capture {
    SnapshotSet windows;
    Rect workarea;
    int current_desktop{0};
};

/**
 * @brief Capture the current window set and workarea from @p surface
 * @throws ActionError(SourceUnavailable) if the surface cannot be read
 */
Capture capture(WindowSurface& surface);

}
