#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "winorg/geometry/Geometry.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

/**
 * @brief _NET_WM_STATE change modes, values match the EWMH wire format
 */
enum class StateMode {
    Unset = 0,
    Set = 1,
    Toggle = 2
};

struct StateChange {
    StateSet flags;
    StateMode mode{StateMode::Set};
};

/**
 * @brief One state-change request for one window
 *
 * A command is self-contained: the sink applies the state change first,
 * then the geometry, then activation. Generation is assigned by the
 * dispatcher when the command is issued.
 */
struct Command {
    WindowId window{NoWindow};
    uint64_t generation{0};

    std::optional<Rect> geometry;
    std::optional<StateChange> state;
    bool activate{false};

    // Anchor kept in place if size hints force a different size
    Gravity gravity{Gravity::topLeft()};

    bool isEmpty() const { return !geometry && !state && !activate; }

    std::string toString() const;
};

/**
 * @brief Asynchronous result of applying a Command
 */
struct CommandOutcome {
    WindowId window{NoWindow};
    uint64_t generation{0};
    bool success{true};
    bool stale{false};
    std::string message;
};

}
