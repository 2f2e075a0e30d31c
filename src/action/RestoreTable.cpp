#include "winorg/action/RestoreTable.hpp"
#include <algorithm>

namespace worg {

void RestoreTable::store(WindowId window, const Rect& geometry, StateSet flags) {
    auto it = entries_.find(window);
    if (it != entries_.end()) {
        it->second.flags = it->second.flags.with(flags);
        return;
    }
    entries_.emplace(window, Entry{geometry, flags});
}

std::optional<RestoreTable::Entry> RestoreTable::find(WindowId window) const {
    auto it = entries_.find(window);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t RestoreTable::retainOnly(const std::vector<WindowId>& alive) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (std::find(alive.begin(), alive.end(), it->first) == alive.end()) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}
