/**
 * @file Dispatcher.cpp
 * @brief Dispatch pipeline: dedup, capture, resolve, emit, confirm
 */

#include "winorg/core/Dispatcher.hpp"
#include "winorg/core/ActionError.hpp"
#include <algorithm>
#include <iostream>
#include <type_traits>

namespace worg {

namespace {

template<typename>
inline constexpr bool always_false = false;

}

const char* dispatchStatusToString(DispatchStatus status) {
    switch (status) {
        case DispatchStatus::Applied: return "applied";
        case DispatchStatus::NoOp: return "no-op";
        case DispatchStatus::Duplicate: return "duplicate";
        case DispatchStatus::Dropped: return "dropped";
        case DispatchStatus::Failed: return "failed";
    }
    return "unknown";
}

Dispatcher::Dispatcher(WindowSurface& surface, TriggerQueue& queue, GridSpec grid)
    : surface_(surface)
    , queue_(queue)
    , grid_(grid)
    , resolver_(cycles_, restore_) {}

DispatchResult Dispatcher::dispatch(Trigger trigger) {
    expirePending();

    return std::visit([this](auto&& value) -> DispatchResult {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, ActionTrigger>) {
            DispatchResult result = handleAction(value);
            if (value.reply) {
                value.reply(result);
            }
            return result;
        } else if constexpr (std::is_same_v<T, InvalidationEvent>) {
            return handleInvalidation(value);
        } else if constexpr (std::is_same_v<T, Confirmation>) {
            return handleConfirmation(value);
        } else {
            static_assert(always_false<T>, "unhandled trigger kind");
        }
    }, trigger);
}

size_t Dispatcher::drain() {
    size_t handled = 0;
    while (auto trigger = queue_.pop()) {
        dispatch(std::move(*trigger));
        handled++;
    }
    return handled;
}

void Dispatcher::reset() {
    cycles_.clear();
    restore_.clear();
    pending_.clear();
    latest_generation_.clear();
    dedup_order_.clear();
    dedup_keys_.clear();
}

uint64_t Dispatcher::latestGeneration(WindowId window) const {
    auto it = latest_generation_.find(window);
    return it != latest_generation_.end() ? it->second : 0;
}

// ============================================================================
// Action requests
// ============================================================================

bool Dispatcher::rememberRequest(const std::string& key) {
    if (dedup_keys_.count(key) > 0) {
        return false;
    }

    dedup_keys_.insert(key);
    dedup_order_.push_back(key);

    while (dedup_order_.size() > dedup_capacity_) {
        dedup_keys_.erase(dedup_order_.front());
        dedup_order_.pop_front();
    }
    return true;
}

DispatchResult Dispatcher::handleAction(const ActionTrigger& trigger) {
    const ActionRequest& request = trigger.request;
    const std::string description = describeAction(request.action);

    DispatchResult result;

    // Normalize: a redelivered request is applied at most once
    std::string key = request.dedupKey();
    if (!key.empty() && !rememberRequest(key)) {
        if (verbose_) {
            std::cout << "[Dispatch] Ignoring redelivered '" << description
                      << "' (t=" << request.timestamp << ")" << std::endl;
        }
        result.status = DispatchStatus::Duplicate;
        result.message = "duplicate request";
        return result;
    }

    try {
        Capture snapshot = capture(surface_);
        restore_.retainOnly(snapshot.windows.ids());

        result.commands = resolver_.resolve(request, snapshot, grid_);

    } catch (const ActionError& e) {
        result.error = e.kind();
        result.message = e.what();

        if (e.kind() == ErrorKind::StaleReference) {
            result.status = DispatchStatus::Dropped;
            if (verbose_) {
                std::cout << "[Dispatch] Dropped '" << description << "': " << e.what() << std::endl;
            }
        } else {
            result.status = DispatchStatus::Failed;
            std::cerr << "[Dispatch] '" << description << "' failed: " << e.what() << std::endl;
        }
        return result;
    }

    if (result.commands.empty()) {
        result.status = DispatchStatus::NoOp;
        result.message = "nothing to do";
        if (verbose_) {
            std::cout << "[Dispatch] '" << description << "' is a no-op" << std::endl;
        }
        return result;
    }

    emit(result.commands);

    result.status = DispatchStatus::Applied;
    result.message = std::to_string(result.commands.size()) + " command(s) issued";
    return result;
}

void Dispatcher::emit(std::vector<Command>& commands) {
    const Clock::time_point now = Clock::now();

    for (Command& command : commands) {
        command.generation = next_generation_++;

        auto it = pending_.find(command.window);
        if (it != pending_.end() && verbose_) {
            std::cout << "[Dispatch] Superseding gen " << it->second.command.generation
                      << " for window 0x" << std::hex << command.window << std::dec << std::endl;
        }

        pending_[command.window] = PendingCommand{command, now};
        latest_generation_[command.window] = command.generation;

        if (verbose_) {
            std::cout << "[Dispatch] Issuing " << command.toString() << std::endl;
        }

        TriggerQueue& queue = queue_;
        surface_.applyCommand(command, [&queue](const CommandOutcome& outcome) {
            queue.push(Confirmation{outcome});
        });
    }
}

// ============================================================================
// Invalidation
// ============================================================================

DispatchResult Dispatcher::handleInvalidation(const InvalidationEvent& event) {
    DispatchResult result;
    result.status = DispatchStatus::NoOp;

    switch (event.type) {
        case WindowEventType::Destroyed: {
            cycles_.invalidate(event.window);
            restore_.erase(event.window);
            latest_generation_.erase(event.window);
            if (pending_.erase(event.window) > 0 && verbose_) {
                std::cout << "[Dispatch] Window 0x" << std::hex << event.window << std::dec
                          << " destroyed with a command in flight" << std::endl;
            }
            break;
        }
        case WindowEventType::Created:
            cycles_.invalidateAll();
            break;
        case WindowEventType::StateChanged:
            dropUnlockedRestore(event.window);
            break;
        case WindowEventType::GeometryChanged:
        case WindowEventType::ActiveChanged:
        case WindowEventType::DesktopChanged:
            // Re-captured on the next dispatch
            break;
    }

    if (verbose_) {
        std::cout << "[Dispatch] Invalidation: " << windowEventTypeToString(event.type)
                  << " 0x" << std::hex << event.window << std::dec << std::endl;
    }
    return result;
}

void Dispatcher::dropUnlockedRestore(WindowId window) {
    if (!restore_.find(window)) {
        return;
    }

    std::vector<WindowSnapshot> windows;
    try {
        windows = surface_.listWindows();
    } catch (const ActionError& e) {
        if (verbose_) {
            std::cerr << "[Dispatch] Cannot re-check state of 0x" << std::hex << window << std::dec
                      << ": " << e.what() << std::endl;
        }
        return;
    }

    auto it = std::find_if(windows.begin(), windows.end(),
        [window](const WindowSnapshot& w) { return w.id == window; });
    if (it == windows.end() || !it->isGeometryLocked()) {
        // Unmaximized behind our back, the saved geometry no longer applies
        restore_.erase(window);
        if (verbose_) {
            std::cout << "[Dispatch] Window 0x" << std::hex << window << std::dec
                      << " unlocked externally, restore entry dropped" << std::endl;
        }
    }
}

// ============================================================================
// Confirmation
// ============================================================================

DispatchResult Dispatcher::handleConfirmation(const Confirmation& confirmation) {
    const CommandOutcome& outcome = confirmation.outcome;
    DispatchResult result;

    auto it = pending_.find(outcome.window);
    if (it == pending_.end() || it->second.command.generation != outcome.generation) {
        // Superseded by a later command, or already expired
        result.status = DispatchStatus::Dropped;
        if (verbose_) {
            std::cout << "[Dispatch] Dropping confirmation of gen " << outcome.generation
                      << " for window 0x" << std::hex << outcome.window << std::dec << std::endl;
        }
        return result;
    }

    pending_.erase(it);

    if (outcome.success) {
        result.status = DispatchStatus::Applied;
        if (verbose_) {
            std::cout << "[Dispatch] Confirmed gen " << outcome.generation << " for window 0x"
                      << std::hex << outcome.window << std::dec << std::endl;
        }
        return result;
    }

    result.message = outcome.message;

    if (outcome.stale) {
        result.status = DispatchStatus::Dropped;
        result.error = ErrorKind::StaleReference;
        if (verbose_) {
            std::cout << "[Dispatch] Window 0x" << std::hex << outcome.window << std::dec
                      << " vanished before gen " << outcome.generation << " applied" << std::endl;
        }
        return result;
    }

    // Not retried: the user re-issuing the action is the recovery path
    result.status = DispatchStatus::Failed;
    std::cerr << "[Dispatch] Command gen " << outcome.generation << " for window 0x"
              << std::hex << outcome.window << std::dec << " failed: " << outcome.message << std::endl;
    return result;
}

size_t Dispatcher::expirePending(Clock::time_point now) {
    size_t expired = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now - it->second.issued > confirm_timeout_) {
            if (verbose_) {
                std::cout << "[Dispatch] No confirmation for " << it->second.command.toString()
                          << ", giving up" << std::endl;
            }
            it = pending_.erase(it);
            expired++;
        } else {
            ++it;
        }
    }
    return expired;
}

}
