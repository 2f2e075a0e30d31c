/**
 * @file SizeConstraints.hpp
 * @brief Fitting requested frame geometry to a client's size hints
 *
 * Handles:
 * - X11 16-bit coordinate limits (32767 pixel hard-cap)
 * - Application-specified size hints (WM_NORMAL_HINTS)
 * - Resize increment constraints (terminal character cells)
 * - StaticGravity clients that position their client area, not the frame
 *
 * Pure arithmetic: the X11 adapter reads the hints and hands them in.
 */

#ifndef WINORG_SIZECONSTRAINTS_HPP
#define WINORG_SIZECONSTRAINTS_HPP

#include <cstdint>
#include <utility>

#include "winorg/geometry/Geometry.hpp"

namespace worg {

namespace X11Limits {
    constexpr int16_t MIN_COORD = -32768;
    constexpr int16_t MAX_COORD = 32767;
    constexpr uint16_t MAX_SIZE = 32767;
    constexpr int MIN_WINDOW_SIZE = 1;
}

struct SizeHintFlags {
    bool min_size{false};
    bool max_size{false};
    bool resize_inc{false};
    bool base_size{false};
    bool static_gravity{false};
};

struct WindowSizeHints {
    SizeHintFlags flags;

    int min_width{0};
    int min_height{0};
    int max_width{X11Limits::MAX_SIZE};
    int max_height{X11Limits::MAX_SIZE};

    int base_width{0};
    int base_height{0};

    int width_inc{1};
    int height_inc{1};
};

struct ConstraintResult {
    int width;
    int height;
    bool was_constrained{false};
    bool hit_min_limit{false};
    bool hit_max_limit{false};
};

class SizeConstraints {
public:
    explicit SizeConstraints(WindowSizeHints hints = {});

    const WindowSizeHints& getHints() const { return hints_; }

    /**
     * @brief Clamp a client size to max, then min, then snap to increments
     *
     * @p current_width and @p current_height are the client's present
     * size; without a base size the remainder of the present size modulo
     * the increment is kept as base.
     */
    ConstraintResult applyConstraints(int width, int height,
                                      int current_width, int current_height) const;

    struct PositionResult {
        int x, y, width, height;
        bool was_constrained;
    };

    /**
     * @brief Turn a requested frame rect into a client configure request
     *
     * The frame minus @p borders gives the client size. When the size
     * hints force a different size, the window is shifted so that the
     * point selected by @p anchor stays where it was requested.
     */
    PositionResult fitFrame(const Rect& frame, const Borders& borders,
                            const Gravity& anchor,
                            int current_width, int current_height) const;

    static std::pair<int, int> clampToX11Limits(int width, int height);

    static bool isValidPosition(int x, int y);

    static bool isValidSize(int width, int height);

    static int applyResizeIncrement(int size, int base, int increment, int min_size);

private:
    WindowSizeHints hints_;
};

}

#endif
