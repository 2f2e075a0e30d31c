#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "winorg/geometry/Geometry.hpp"
#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

/**
 * @brief Geometry to return to when a maximize/fullscreen state is undone
 */
class RestoreTable {
public:
    struct Entry {
        Rect geometry;
        // Geometry-locking flags set since the entry was stored
        StateSet flags;
    };

    // Keeps an existing entry, so stacking locks (horizontal then vertical)
    // restores the geometry from before the first one
    void store(WindowId window, const Rect& geometry, StateSet flags);

    std::optional<Entry> find(WindowId window) const;

    void erase(WindowId window) { entries_.erase(window); }

    // Drop entries of windows missing from @p alive
    size_t retainOnly(const std::vector<WindowId>& alive);

    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<WindowId, Entry> entries_;
};

}
