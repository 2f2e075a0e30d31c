#pragma once

/**
 * @file Action.hpp
 * @brief Action requests handled by the resolver
 *
 * Each action kind is a plain struct; Action is the closed sum of them and
 * is consumed by a single std::visit in ActionResolver.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "winorg/filter/Filter.hpp"
#include "winorg/geometry/Geometry.hpp"
#include "winorg/geometry/GridModel.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

enum class CycleDirection {
    Next,
    Previous
};

// Deltas are either pixels or multiples of one grid column/row
enum class Unit {
    Pixels,
    Cells
};

struct CycleAction {
    CycleDirection direction{CycleDirection::Next};
};

/**
 * @brief Put the window on a grid cell
 *
 * Exactly one of cell (absolute placement) and direction (one cell away
 * from the window's current cell) is set.
 */
struct GridPutAction {
    std::optional<GridCell> cell;
    std::optional<Direction> direction;

    bool isRelative() const { return direction.has_value(); }
};

struct MoveAction {
    int dx{0};
    int dy{0};
    Unit unit{Unit::Pixels};
};

struct ResizeAction {
    Edge edge{Edge::Right};
    int delta{0};
    Unit unit{Unit::Pixels};
};

struct ToggleStateAction {
    StateSet flags;
};

/**
 * @brief Align the window's gravity point with the workarea's
 *
 * With fractions set the window is also resized to that share of the
 * workarea.
 */
struct PlaceAction {
    Gravity gravity{Gravity::center()};
    std::optional<double> width_fraction;
    std::optional<double> height_fraction;
};

// Drop maximize, fullscreen and shade
struct ResetAction {};

using Action = std::variant<CycleAction,
                            GridPutAction,
                            MoveAction,
                            ResizeAction,
                            ToggleStateAction,
                            PlaceAction,
                            ResetAction>;

std::string describeAction(const Action& action);

struct ActionRequest {
    Action action;
    Filter target;

    // Trigger source, e.g. "keybind" or "dbus"
    std::string origin;

    // Source timestamp (X server time, or caller supplied); 0 means none
    uint64_t timestamp{0};

    // Identity of a redelivered request, empty when it has no timestamp
    std::string dedupKey() const;
};

}
