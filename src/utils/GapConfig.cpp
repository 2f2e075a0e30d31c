/**
 * @file GapConfig.cpp
 * @brief Implementation of the grid gap system
 */

#include "winorg/utils/GapConfig.hpp"

namespace worg {

namespace {

int edgeGap(bool touches_border, int outer, int inner) {
    // Inner gap is split between the two adjacent cells
    return touches_border ? outer : inner / 2;
}

}

Rect applyGaps(const Rect& cell, const GapConfig& config, const CellEdges& edges) {
    if (config.isEmpty()) {
        return cell;
    }

    int left = edgeGap(edges.touches_left, config.getLeftGap(), config.inner_gap);
    int right = edgeGap(edges.touches_right, config.getRightGap(), config.inner_gap);
    int top = edgeGap(edges.touches_top, config.getTopGap(), config.inner_gap);
    int bottom = edgeGap(edges.touches_bottom, config.getBottomGap(), config.inner_gap);

    return {cell.x + left,
            cell.y + top,
            cell.width - left - right,
            cell.height - top - bottom};
}

} // namespace worg
