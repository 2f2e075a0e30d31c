#pragma once

/**
 * @file Dispatcher.hpp
 * @brief Single-consumer dispatch pipeline
 *
 * Each trigger runs start to finish before the next one:
 *
 *   ActionTrigger:     normalize -> capture -> filter -> resolve -> emit
 *   InvalidationEvent: purge cycle groups and restore entries
 *   Confirmation:      correlate by window + generation, log failures
 *
 * The dispatcher owns all state that outlives a dispatch (cycle groups,
 * restore geometry, pending commands, recent request keys). Commands are
 * handed to the surface without waiting; their outcome comes back later
 * as a Confirmation trigger through the queue.
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <unordered_map>
#include <unordered_set>

#include "winorg/action/ActionResolver.hpp"
#include "winorg/action/CycleTracker.hpp"
#include "winorg/action/RestoreTable.hpp"
#include "winorg/core/TriggerQueue.hpp"
#include "winorg/display/WindowSurface.hpp"
#include "winorg/geometry/GridModel.hpp"

namespace worg {

class Dispatcher {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds DEFAULT_CONFIRM_TIMEOUT{500};
    static constexpr size_t DEFAULT_DEDUP_CAPACITY = 256;

    Dispatcher(WindowSurface& surface, TriggerQueue& queue, GridSpec grid = {});
    ~Dispatcher() = default;

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    DispatchResult dispatch(Trigger trigger);

    // Dispatch everything currently queued; returns the number handled
    size_t drain();

    // Forget commands that were never confirmed within the timeout
    size_t expirePending(Clock::time_point now = Clock::now());

    void setGrid(const GridSpec& grid) { grid_ = grid; }
    const GridSpec& getGrid() const { return grid_; }

    void setVerbose(bool verbose) { verbose_ = verbose; }
    void setConfirmTimeout(std::chrono::milliseconds timeout) { confirm_timeout_ = timeout; }
    void setDedupCapacity(size_t capacity) { dedup_capacity_ = capacity; }

    // Drop all cross-dispatch state (config reload)
    void reset();

    size_t pendingCount() const { return pending_.size(); }
    bool hasPending(WindowId window) const { return pending_.count(window) > 0; }
    // Generation of the newest command issued for @p window, 0 if none
    uint64_t latestGeneration(WindowId window) const;

    const CycleTracker& cycles() const { return cycles_; }
    const RestoreTable& restoreTable() const { return restore_; }

private:
    struct PendingCommand {
        Command command;
        Clock::time_point issued;
    };

    WindowSurface& surface_;
    TriggerQueue& queue_;
    GridSpec grid_;

    CycleTracker cycles_;
    RestoreTable restore_;
    ActionResolver resolver_;

    // Last writer per window
    std::unordered_map<WindowId, PendingCommand> pending_;
    std::unordered_map<WindowId, uint64_t> latest_generation_;
    uint64_t next_generation_{1};

    std::deque<std::string> dedup_order_;
    std::unordered_set<std::string> dedup_keys_;
    size_t dedup_capacity_{DEFAULT_DEDUP_CAPACITY};

    std::chrono::milliseconds confirm_timeout_{DEFAULT_CONFIRM_TIMEOUT};
    bool verbose_{false};

    DispatchResult handleAction(const ActionTrigger& trigger);
    DispatchResult handleInvalidation(const InvalidationEvent& event);
    DispatchResult handleConfirmation(const Confirmation& confirmation);

    // Forget the restore entry of a window that no longer carries a lock
    void dropUnlockedRestore(WindowId window);

    // False when the key was seen recently
    bool rememberRequest(const std::string& key);

    void emit(std::vector<Command>& commands);
};

}
