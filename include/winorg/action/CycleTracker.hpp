#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "winorg/action/Action.hpp"
#include "winorg/filter/Filter.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

/**
 * @brief Next/previous bookkeeping per filter group
 *
 * A group is keyed by the filter's identity. It remembers the member order
 * from the moment the group was (re)built, so raising the activated window
 * does not reshuffle the cycle. When the selected id set differs from the
 * remembered one the group is rebuilt from the fresh selection.
 */
class CycleTracker {
public:
    CycleTracker() = default;

    /**
     * @brief Window to activate for one cycle step, or nullopt for a no-op
     *
     * @p selection is the filter result in stacking order. On a rebuilt
     * group the step starts from the active window's position; with no
     * active member the first window is chosen.
     */
    std::optional<WindowId> advance(const Filter& filter,
                                    const std::vector<WindowId>& selection,
                                    WindowId active,
                                    CycleDirection direction);

    // Drop @p window from every group; its group is rebuilt on next use
    void invalidate(WindowId window);

    // Force every group to be rebuilt on next use
    void invalidateAll();

    void clear() { groups_.clear(); }

    size_t groupCount() const { return groups_.size(); }

    std::optional<size_t> currentIndex(const Filter& filter) const;

private:
    struct CycleState {
        Filter filter;  // keeps the identity alive
        std::vector<WindowId> members;
        size_t current_index{0};
        bool valid{true};
    };

    std::unordered_map<const void*, CycleState> groups_;

    static bool sameMembers(const std::vector<WindowId>& a, const std::vector<WindowId>& b);
};

}
