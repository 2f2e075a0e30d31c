#pragma once

/**
 * @file WindowSurface.hpp
 * @brief Boundary between the organizer core and the windowing system
 *
 * A WindowSurface lists windows, reports the workarea and applies
 * commands. Command results arrive asynchronously through the completion
 * callback handed to applyCommand(); window-system notifications arrive
 * through the subscribed event callback.
 */

#include <functional>
#include <vector>

#include "winorg/action/Command.hpp"
#include "winorg/geometry/Geometry.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

enum class WindowEventType {
    Created,
    Destroyed,
    StateChanged,
    GeometryChanged,
    ActiveChanged,
    DesktopChanged
};

const char* windowEventTypeToString(WindowEventType type);

struct WindowEvent {
    WindowEventType type;
    WindowId window{NoWindow};
};

class WindowSurface {
public:
    using CompletionCallback = std::function<void(const CommandOutcome&)>;
    using EventCallback = std::function<void(const WindowEvent&)>;

    virtual ~WindowSurface() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Snapshots of all client windows, topmost first
     * @throws ActionError(SourceUnavailable)
     */
    virtual std::vector<WindowSnapshot> listWindows() = 0;

    /**
     * @brief Workarea of the current desktop (desktop minus panels/docks)
     * @throws ActionError(SourceUnavailable)
     */
    virtual Rect getWorkarea() = 0;

    virtual int currentDesktop() = 0;

    /**
     * @brief Start applying @p command; @p done fires once the window
     *        system confirmed or rejected it (possibly never, for a
     *        superseded or expired command)
     */
    virtual void applyCommand(const Command& command, CompletionCallback done) = 0;

    virtual void subscribe(EventCallback callback) = 0;
};

}
