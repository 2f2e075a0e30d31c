#pragma once

/**
 * @file TriggerQueue.hpp
 * @brief Multi-producer single-consumer FIFO feeding the dispatch loop
 *
 * Key grabs, window-system notifications, command confirmations and D-Bus
 * calls arrive from independent sources (the D-Bus service runs on its
 * own thread). They all push into one TriggerQueue; only the dispatch
 * loop pops, so triggers are handled one at a time in arrival order.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "winorg/action/Action.hpp"
#include "winorg/action/Command.hpp"
#include "winorg/core/ActionError.hpp"
#include "winorg/display/WindowSurface.hpp"

namespace worg {
namespace lockfree {

constexpr size_t CACHE_LINE_SIZE = 64;

/**
 * @brief Intrusive Vyukov-style MPSC queue
 *
 * push() is wait-free and safe from any thread; pop() must only be called
 * from the single consumer. T must be default constructible (stub node).
 */
template<typename T>
class MPSCQueue {
    struct Node {
        T data;
        std::atomic<Node*> next{nullptr};

        template<typename... Args>
        explicit Node(Args&&... args) : data(std::forward<Args>(args)...) {}
    };

    alignas(CACHE_LINE_SIZE) std::atomic<Node*> head_;
    alignas(CACHE_LINE_SIZE) Node* tail_;

public:
    MPSCQueue() {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }

    ~MPSCQueue() {
        while (pop()) {}
        delete tail_;
    }

    MPSCQueue(const MPSCQueue&) = delete;
    MPSCQueue& operator=(const MPSCQueue&) = delete;

    void push(T&& item) {
        Node* node = new Node(std::move(item));
        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    std::optional<T> pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);

        if (next == nullptr) {
            return std::nullopt;
        }

        T item = std::move(next->data);
        delete tail;
        tail_ = next;

        return item;
    }

    bool empty() const {
        return tail_->next.load(std::memory_order_acquire) == nullptr;
    }
};

}

// ============================================================================
// Triggers
// ============================================================================

enum class DispatchStatus {
    Applied,    // commands issued
    NoOp,       // nothing to change
    Duplicate,  // redelivered request, ignored
    Dropped,    // stale reference or superseded confirmation
    Failed
};

const char* dispatchStatusToString(DispatchStatus status);

/**
 * @brief Outcome of one dispatch, handed back to the trigger source
 */
struct DispatchResult {
    DispatchStatus status{DispatchStatus::NoOp};
    std::optional<ErrorKind> error;
    std::string message;
    std::vector<Command> commands;

    // Stale references are ordinary races, not failures of the request
    bool ok() const { return status != DispatchStatus::Failed; }
};

struct ActionTrigger {
    ActionRequest request;
    // Called on the dispatch thread once the request is resolved
    std::function<void(const DispatchResult&)> reply;
};

// Window created/destroyed/changed; never produces commands
using InvalidationEvent = WindowEvent;

struct Confirmation {
    CommandOutcome outcome;
};

using Trigger = std::variant<ActionTrigger, InvalidationEvent, Confirmation>;

class TriggerQueue {
public:
    TriggerQueue() = default;

    TriggerQueue(const TriggerQueue&) = delete;
    TriggerQueue& operator=(const TriggerQueue&) = delete;

    // Any thread
    void push(Trigger trigger) {
        queue_.push(std::move(trigger));
        pushed_.fetch_add(1, std::memory_order_relaxed);
    }

    // Consumer thread only
    std::optional<Trigger> pop() { return queue_.pop(); }

    bool empty() const { return queue_.empty(); }

    uint64_t totalPushed() const { return pushed_.load(std::memory_order_relaxed); }

private:
    lockfree::MPSCQueue<Trigger> queue_;
    std::atomic<uint64_t> pushed_{0};
};

}
