/**
 * @file SizeConstraints.cpp
 * @brief Size hint arithmetic
 */

#include "winorg/window/SizeConstraints.hpp"
#include <algorithm>
#include <cmath>

namespace worg {

SizeConstraints::SizeConstraints(WindowSizeHints hints)
    : hints_(hints)
{
    hints_.width_inc = std::max(1, hints_.width_inc);
    hints_.height_inc = std::max(1, hints_.height_inc);
}

ConstraintResult SizeConstraints::applyConstraints(int width, int height,
                                                   int current_width, int current_height) const {
    ConstraintResult result;
    result.width = width;
    result.height = height;

    // Reduce size to the maximum first
    if (hints_.flags.max_size) {
        if (hints_.max_width > 0 && result.width > hints_.max_width) {
            result.width = hints_.max_width;
            result.hit_max_limit = true;
        }
        if (hints_.max_height > 0 && result.height > hints_.max_height) {
            result.height = hints_.max_height;
            result.hit_max_limit = true;
        }
    }

    // Minimum wins over maximum
    if (hints_.flags.min_size) {
        if (result.width < hints_.min_width) {
            result.width = hints_.min_width;
            result.hit_min_limit = true;
        }
        if (result.height < hints_.min_height) {
            result.height = hints_.min_height;
            result.hit_min_limit = true;
        }
    }

    if (hints_.flags.resize_inc) {
        int base_w = hints_.flags.base_size && hints_.base_width > 0
            ? hints_.base_width : current_width % hints_.width_inc;
        int base_h = hints_.flags.base_size && hints_.base_height > 0
            ? hints_.base_height : current_height % hints_.height_inc;

        int min_w = hints_.flags.min_size ? hints_.min_width : 0;
        int min_h = hints_.flags.min_size ? hints_.min_height : 0;

        result.width = applyResizeIncrement(result.width, base_w, hints_.width_inc, min_w);
        result.height = applyResizeIncrement(result.height, base_h, hints_.height_inc, min_h);
    }

    auto [clamped_w, clamped_h] = clampToX11Limits(result.width, result.height);
    result.width = clamped_w;
    result.height = clamped_h;

    result.was_constrained = result.width != width || result.height != height;
    return result;
}

SizeConstraints::PositionResult SizeConstraints::fitFrame(
    const Rect& frame, const Borders& borders, const Gravity& anchor,
    int current_width, int current_height
) const {
    PositionResult result;
    result.x = frame.x;
    result.y = frame.y;
    result.width = frame.width - borders.horizontal();
    result.height = frame.height - borders.vertical();

    const int requested_w = result.width;
    const int requested_h = result.height;

    // StaticGravity clients are positioned by their client area
    if (hints_.flags.static_gravity) {
        result.x += borders.left;
        result.y += borders.top;
    }

    ConstraintResult size = applyConstraints(requested_w, requested_h,
                                             current_width, current_height);
    result.width = size.width;
    result.height = size.height;
    result.was_constrained = size.was_constrained;

    // Keep the anchor point in place when the size had to change
    if (result.was_constrained) {
        result.x += static_cast<int>(std::lround((requested_w - result.width) * anchor.x));
        result.y += static_cast<int>(std::lround((requested_h - result.height) * anchor.y));
    }

    result.x = std::clamp(result.x, static_cast<int>(X11Limits::MIN_COORD),
                          static_cast<int>(X11Limits::MAX_COORD));
    result.y = std::clamp(result.y, static_cast<int>(X11Limits::MIN_COORD),
                          static_cast<int>(X11Limits::MAX_COORD));

    return result;
}

std::pair<int, int> SizeConstraints::clampToX11Limits(int width, int height) {
    return {
        std::clamp(width, X11Limits::MIN_WINDOW_SIZE,
                   static_cast<int>(X11Limits::MAX_SIZE)),
        std::clamp(height, X11Limits::MIN_WINDOW_SIZE,
                   static_cast<int>(X11Limits::MAX_SIZE))
    };
}

bool SizeConstraints::isValidPosition(int x, int y) {
    return x >= X11Limits::MIN_COORD && x <= X11Limits::MAX_COORD &&
           y >= X11Limits::MIN_COORD && y <= X11Limits::MAX_COORD;
}

bool SizeConstraints::isValidSize(int width, int height) {
    return width >= X11Limits::MIN_WINDOW_SIZE &&
           width <= X11Limits::MAX_SIZE &&
           height >= X11Limits::MIN_WINDOW_SIZE &&
           height <= X11Limits::MAX_SIZE;
}

int SizeConstraints::applyResizeIncrement(int size, int base, int increment, int min_size) {
    if (increment <= 1) {
        return size;
    }

    int cells = (size - base) / increment;
    int snapped = base + cells * increment;

    // Snapping down must not undercut the minimum
    if (min_size > 0 && snapped < min_size) {
        snapped += increment;
    }
    return snapped;
}

}
