#pragma once

/**
 * @file GapConfig.hpp
 * @brief Configurable gaps for grid cells
 *
 * Outer gaps apply on cell edges that touch the workarea border, inner
 * gaps are split evenly between two adjacent cells. Directional
 * overrides replace the outer gap on one side of the workarea.
 */

#include "winorg/geometry/Geometry.hpp"

namespace worg {

struct GapConfig {
    int outer_gap{DEFAULT_OUTER};
    int inner_gap{DEFAULT_INNER};

    int top_gap{-1};
    int bottom_gap{-1};
    int left_gap{-1};
    int right_gap{-1};

    static constexpr int DEFAULT_INNER = 0;
    static constexpr int DEFAULT_OUTER = 0;

    bool isEmpty() const {
        return inner_gap == 0 && getLeftGap() == 0 && getRightGap() == 0 &&
               getTopGap() == 0 && getBottomGap() == 0;
    }

    int getInnerGap() const { return inner_gap; }

    int getOuterGap() const { return outer_gap; }

    int getLeftGap() const { return left_gap >= 0 ? left_gap : outer_gap; }

    int getRightGap() const { return right_gap >= 0 ? right_gap : outer_gap; }

    int getTopGap() const { return top_gap >= 0 ? top_gap : outer_gap; }

    int getBottomGap() const { return bottom_gap >= 0 ? bottom_gap : outer_gap; }
};

/**
 * @brief Which sides of a cell border the workarea
 */
struct CellEdges {
    bool touches_top{false};
    bool touches_bottom{false};
    bool touches_left{false};
    bool touches_right{false};
};

/**
 * @brief Shrink a raw cell rectangle by the configured gaps
 *
 * Edges touching the workarea get the (directional) outer gap, the other
 * edges get half of the inner gap. The result may be degenerate when the
 * gaps exceed the cell size; callers validate it.
 */
Rect applyGaps(const Rect& cell, const GapConfig& config, const CellEdges& edges);

}
