/**
 * @file ActionResolver.cpp
 * @brief Resolution of cycle, grid, move/resize, state and placement actions
 */

#include "winorg/action/ActionResolver.hpp"
#include "winorg/core/ActionError.hpp"
#include <cmath>
#include <type_traits>

namespace worg {

namespace {

template<typename>
inline constexpr bool always_false = false;

StateSet lockedFlags(const StateSet& state) {
    return StateSet(state.bits() & states::GeometryLocked.bits());
}

}

ActionResolver::ActionResolver(CycleTracker& cycles, RestoreTable& restore)
    : cycles_(cycles)
    , restore_(restore) {}

std::vector<Command> ActionResolver::resolve(const ActionRequest& request,
                                             const Capture& capture,
                                             const GridSpec& grid) {
    FilterContext context;
    context.current_desktop = capture.current_desktop;

    const std::vector<WindowSnapshot> selection = request.target.select(capture.windows, context);

    return std::visit([&](auto&& action) -> std::vector<Command> {
        using T = std::decay_t<decltype(action)>;

        if constexpr (std::is_same_v<T, CycleAction>) {
            return resolveCycle(action, request.target, selection, capture);
        } else {
            if (selection.empty()) {
                return {};
            }
            // Topmost matching window
            const WindowSnapshot& window = selection.front();

            if constexpr (std::is_same_v<T, GridPutAction>) {
                return resolveGridPut(action, window, capture, grid);
            } else if constexpr (std::is_same_v<T, MoveAction>) {
                return resolveMove(action, window, capture, grid);
            } else if constexpr (std::is_same_v<T, ResizeAction>) {
                return resolveResize(action, window, capture, grid);
            } else if constexpr (std::is_same_v<T, ToggleStateAction>) {
                return resolveToggle(action, window, capture);
            } else if constexpr (std::is_same_v<T, PlaceAction>) {
                return resolvePlace(action, window, capture);
            } else if constexpr (std::is_same_v<T, ResetAction>) {
                return resolveReset(window);
            } else {
                static_assert(always_false<T>, "unhandled action kind");
            }
        }
    }, request.action);
}

// ============================================================================
// Cycle
// ============================================================================

std::vector<Command> ActionResolver::resolveCycle(const CycleAction& action, const Filter& filter,
                                                  const std::vector<WindowSnapshot>& selection,
                                                  const Capture& capture) {
    std::vector<WindowId> ids;
    ids.reserve(selection.size());
    for (const auto& window : selection) {
        ids.push_back(window.id);
    }

    const WindowSnapshot* active = capture.windows.active();
    auto target = cycles_.advance(filter, ids, active ? active->id : NoWindow, action.direction);
    if (!target) {
        return {};
    }

    Command command;
    command.window = *target;
    command.activate = true;
    return {command};
}

// ============================================================================
// Grid
// ============================================================================

GridCell ActionResolver::growSpan(const GridCell& current, Direction direction, const GridSpec& grid) {
    GridCell next = current;
    switch (direction) {
        case Direction::Right:
            if (current.lastCol() < grid.columns - 1) {
                next.col_span++;
            } else {
                next.col = grid.columns - 1;
                next.col_span = 1;
            }
            break;
        case Direction::Left:
            if (current.col > 0) {
                next.col--;
                next.col_span++;
            } else {
                next.col_span = 1;
            }
            break;
        case Direction::Down:
            if (current.lastRow() < grid.rows - 1) {
                next.row_span++;
            } else {
                next.row = grid.rows - 1;
                next.row_span = 1;
            }
            break;
        case Direction::Up:
            if (current.row > 0) {
                next.row--;
                next.row_span++;
            } else {
                next.row_span = 1;
            }
            break;
    }
    return next;
}

GridCell ActionResolver::shiftSpan(const GridCell& current, Direction direction, const GridSpec& grid) {
    GridCell next = current;
    switch (direction) {
        case Direction::Right:
            if (current.lastCol() < grid.columns - 1) next.col++;
            break;
        case Direction::Left:
            if (current.col > 0) next.col--;
            break;
        case Direction::Down:
            if (current.lastRow() < grid.rows - 1) next.row++;
            break;
        case Direction::Up:
            if (current.row > 0) next.row--;
            break;
    }
    return next;
}

std::vector<Command> ActionResolver::resolveGridPut(const GridPutAction& action,
                                                    const WindowSnapshot& window,
                                                    const Capture& capture,
                                                    const GridSpec& grid) {
    const Rect& workarea = capture.workarea;

    if (!action.isRelative()) {
        if (!action.cell) {
            throw ActionError(ErrorKind::InvalidGrid, "grid action names neither a cell nor a direction");
        }
        return geometryCommand(window, spanRect(grid, workarea, *action.cell), Gravity::topLeft());
    }

    GridCell target;
    if (auto current = exactSpan(grid, workarea, window.geometry)) {
        target = grid.span_grow ? growSpan(*current, *action.direction, grid)
                                : shiftSpan(*current, *action.direction, grid);
    } else {
        auto best = bestCell(grid, workarea, window.geometry);
        if (!best) {
            throw ActionError(ErrorKind::OutOfBounds,
                              "window " + window.geometry.toString() +
                              " does not overlap the workarea " + workarea.toString());
        }
        // Not aligned yet: snap next to the cell it mostly covers
        target = shiftSpan(*best, *action.direction, grid);
    }

    return geometryCommand(window, spanRect(grid, workarea, target), Gravity::topLeft());
}

// ============================================================================
// Move / resize
// ============================================================================

void ActionResolver::requireVisible(const Rect& target, const Rect& workarea) {
    if (overlapArea(target, workarea) <= 0) {
        throw ActionError(ErrorKind::OutOfBounds,
                          target.toString() + " lies entirely outside the workarea " +
                          workarea.toString());
    }
}

std::vector<Command> ActionResolver::resolveMove(const MoveAction& action, const WindowSnapshot& window,
                                                 const Capture& capture, const GridSpec& grid) {
    int dx = action.dx;
    int dy = action.dy;
    if (action.unit == Unit::Cells) {
        dx *= columnWidth(grid, capture.workarea);
        dy *= rowHeight(grid, capture.workarea);
    }

    Rect target = window.geometry.translated(dx, dy);
    requireVisible(target, capture.workarea);
    return geometryCommand(window, target, Gravity::topLeft());
}

std::vector<Command> ActionResolver::resolveResize(const ResizeAction& action, const WindowSnapshot& window,
                                                   const Capture& capture, const GridSpec& grid) {
    const Edge edge = action.edge;
    const bool moves_left = edge == Edge::Left || edge == Edge::TopLeft || edge == Edge::BottomLeft;
    const bool moves_right = edge == Edge::Right || edge == Edge::TopRight || edge == Edge::BottomRight;
    const bool moves_top = edge == Edge::Top || edge == Edge::TopLeft || edge == Edge::TopRight;
    const bool moves_bottom = edge == Edge::Bottom || edge == Edge::BottomLeft || edge == Edge::BottomRight;

    Rect target = window.geometry;
    if (action.unit == Unit::Pixels) {
        target = edgeResize(target, edge, action.delta);
    } else {
        if (moves_left || moves_right) {
            target = edgeResize(target, moves_left ? Edge::Left : Edge::Right,
                                action.delta * columnWidth(grid, capture.workarea));
        }
        if (moves_top || moves_bottom) {
            target = edgeResize(target, moves_top ? Edge::Top : Edge::Bottom,
                                action.delta * rowHeight(grid, capture.workarea));
        }
    }

    requireVisible(target, capture.workarea);

    // Size hints may refuse the exact size; keep the fixed edges in place
    Gravity anchor(moves_left ? 1.0 : 0.0, moves_top ? 1.0 : 0.0);
    return geometryCommand(window, target, anchor);
}

std::vector<Command> ActionResolver::geometryCommand(const WindowSnapshot& window, const Rect& target,
                                                     const Gravity& gravity) {
    if (!target.isValid()) {
        throw ActionError(ErrorKind::DegenerateGeometry,
                          "target geometry " + target.toString() + " is empty");
    }

    StateSet locked = lockedFlags(window.state);
    if (target == window.geometry && locked.empty()) {
        return {};
    }

    Command command;
    command.window = window.id;
    command.geometry = target;
    command.gravity = gravity;
    if (!locked.empty()) {
        command.state = StateChange{locked, StateMode::Unset};
        restore_.erase(window.id);
    }
    return {command};
}

// ============================================================================
// State toggles
// ============================================================================

std::vector<Command> ActionResolver::resolveToggle(const ToggleStateAction& action,
                                                   const WindowSnapshot& window,
                                                   const Capture& capture) {
    const StateSet flags = action.flags;
    if (flags.empty()) {
        return {};
    }

    const bool turning_on = !window.state.hasAll(flags);

    Command command;
    command.window = window.id;

    if (!flags.intersects(states::GeometryLocked)) {
        command.state = StateChange{flags, turning_on ? StateMode::Set : StateMode::Unset};
        return {command};
    }

    const Rect& workarea = capture.workarea;

    if (turning_on) {
        command.state = StateChange{flags, StateMode::Set};

        if (!flags.has(WindowState::Fullscreen)) {
            Rect target = window.geometry;
            if (flags.has(WindowState::MaximizedHorz)) {
                target.x = workarea.x;
                target.width = workarea.width;
            }
            if (flags.has(WindowState::MaximizedVert)) {
                target.y = workarea.y;
                target.height = workarea.height;
            }
            command.geometry = target;
        }

        if (lockedFlags(window.state).empty()) {
            // Nothing locks the window now; an older entry is stale
            restore_.erase(window.id);
        }
        restore_.store(window.id, window.geometry, lockedFlags(flags));
        return {command};
    }

    command.state = StateChange{flags, StateMode::Unset};

    const StateSet remaining = window.state.without(flags);
    auto entry = restore_.find(window.id);
    if (entry && !remaining.intersects(states::GeometryLocked)) {
        command.geometry = entry->geometry;
        restore_.erase(window.id);
    }
    return {command};
}

std::vector<Command> ActionResolver::resolveReset(const WindowSnapshot& window) {
    const StateSet flags = StateSet(window.state.bits() &
                                    states::GeometryLocked.with(WindowState::Shaded).bits());
    if (flags.empty()) {
        return {};
    }

    Command command;
    command.window = window.id;
    command.state = StateChange{flags, StateMode::Unset};

    if (auto entry = restore_.find(window.id)) {
        command.geometry = entry->geometry;
        restore_.erase(window.id);
    }
    return {command};
}

// ============================================================================
// Placement
// ============================================================================

std::vector<Command> ActionResolver::resolvePlace(const PlaceAction& action, const WindowSnapshot& window,
                                                  const Capture& capture) {
    const Rect& workarea = capture.workarea;

    int width = window.geometry.width;
    int height = window.geometry.height;
    if (action.width_fraction && action.height_fraction) {
        width = static_cast<int>(std::lround(workarea.width * *action.width_fraction));
        height = static_cast<int>(std::lround(workarea.height * *action.height_fraction));
    }

    int px = 0;
    int py = 0;
    gravityPoint(workarea, action.gravity, px, py);

    Rect target = rectAtGravity(px, py, width, height, action.gravity);
    if (!target.isValid()) {
        throw ActionError(ErrorKind::DegenerateGeometry,
                          "placing at " + action.gravity.toString() + " yields " + target.toString());
    }
    requireVisible(target, workarea);
    return geometryCommand(window, target, action.gravity);
}

}
