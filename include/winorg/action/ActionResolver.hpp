#pragma once

/**
 * @file ActionResolver.hpp
 * @brief Turns an ActionRequest into the commands that carry it out
 *
 * Resolution never touches the snapshots it reads. It either returns a
 * complete, valid command list or throws ActionError and leaves the cycle
 * and restore tables exactly as they were.
 */

#include <vector>

#include "winorg/action/Action.hpp"
#include "winorg/action/Command.hpp"
#include "winorg/action/CycleTracker.hpp"
#include "winorg/action/RestoreTable.hpp"
#include "winorg/geometry/GridModel.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

class ActionResolver {
public:
    ActionResolver(CycleTracker& cycles, RestoreTable& restore);

    /**
     * @brief Commands for @p request against @p capture
     *
     * Returns an empty list when there is nothing to do (no matching
     * window, cycling a single window, a grid move stopped by the border).
     * @throws ActionError(InvalidGrid, DegenerateGeometry, OutOfBounds)
     */
    std::vector<Command> resolve(const ActionRequest& request,
                                 const Capture& capture,
                                 const GridSpec& grid);

private:
    CycleTracker& cycles_;
    RestoreTable& restore_;

    std::vector<Command> resolveCycle(const CycleAction& action, const Filter& filter,
                                      const std::vector<WindowSnapshot>& selection,
                                      const Capture& capture);

    std::vector<Command> resolveGridPut(const GridPutAction& action, const WindowSnapshot& window,
                                        const Capture& capture, const GridSpec& grid);

    std::vector<Command> resolveMove(const MoveAction& action, const WindowSnapshot& window,
                                     const Capture& capture, const GridSpec& grid);

    std::vector<Command> resolveResize(const ResizeAction& action, const WindowSnapshot& window,
                                       const Capture& capture, const GridSpec& grid);

    std::vector<Command> resolveToggle(const ToggleStateAction& action, const WindowSnapshot& window,
                                       const Capture& capture);

    std::vector<Command> resolvePlace(const PlaceAction& action, const WindowSnapshot& window,
                                      const Capture& capture);

    std::vector<Command> resolveReset(const WindowSnapshot& window);

    // Geometry change for @p window; unlocks a maximized/fullscreen window
    // first so the window manager accepts the new size
    std::vector<Command> geometryCommand(const WindowSnapshot& window, const Rect& target,
                                         const Gravity& gravity);

    static GridCell growSpan(const GridCell& current, Direction direction, const GridSpec& grid);
    static GridCell shiftSpan(const GridCell& current, Direction direction, const GridSpec& grid);

    static void requireVisible(const Rect& target, const Rect& workarea);
};

}
