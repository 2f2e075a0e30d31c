#include "winorg/action/CycleTracker.hpp"
#include <algorithm>

namespace worg {

bool CycleTracker::sameMembers(const std::vector<WindowId>& a, const std::vector<WindowId>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    std::vector<WindowId> lhs = a;
    std::vector<WindowId> rhs = b;
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    return lhs == rhs;
}

std::optional<WindowId> CycleTracker::advance(const Filter& filter,
                                              const std::vector<WindowId>& selection,
                                              WindowId active,
                                              CycleDirection direction) {
    if (selection.empty()) {
        groups_.erase(filter.identity());
        return std::nullopt;
    }

    auto it = groups_.find(filter.identity());

    if (it == groups_.end()) {
        it = groups_.emplace(filter.identity(), CycleState{filter, {}, 0, false}).first;
    }

    CycleState& state = it->second;

    if (!state.valid || !sameMembers(state.members, selection)) {
        state.members = selection;
        state.valid = true;

        auto pos = std::find(state.members.begin(), state.members.end(), active);
        if (pos == state.members.end()) {
            // Not cycling from inside the group yet: enter at the first window
            state.current_index = 0;
            return state.members[0];
        }
        state.current_index = static_cast<size_t>(pos - state.members.begin());
    }

    if (state.members.size() < 2) {
        return std::nullopt;
    }

    if (state.current_index >= state.members.size()) {
        state.current_index = 0;
    }

    if (direction == CycleDirection::Next) {
        state.current_index = (state.current_index + 1) % state.members.size();
    } else if (state.current_index == 0) {
        state.current_index = state.members.size() - 1;
    } else {
        state.current_index--;
    }

    return state.members[state.current_index];
}

void CycleTracker::invalidate(WindowId window) {
    for (auto& [key, state] : groups_) {
        auto it = std::remove(state.members.begin(), state.members.end(), window);
        if (it != state.members.end()) {
            state.members.erase(it, state.members.end());
            state.valid = false;
        }
        if (state.current_index >= state.members.size()) {
            state.current_index = 0;
        }
    }
}

void CycleTracker::invalidateAll() {
    for (auto& [key, state] : groups_) {
        state.valid = false;
    }
}

std::optional<size_t> CycleTracker::currentIndex(const Filter& filter) const {
    auto it = groups_.find(filter.identity());
    if (it == groups_.end() || !it->second.valid) {
        return std::nullopt;
    }
    return it->second.current_index;
}

}
