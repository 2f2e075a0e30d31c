#pragma once

/**
 * @file GridModel.hpp
 * @brief Grid partitioning of the workarea and edge resize math
 *
 * Pure functions only. A grid divides the workarea into columns x rows
 * cells; column and row boundaries are computed with integer division so
 * that, without gaps, the cells tile the workarea exactly and the last
 * column/row absorbs the rounding remainder.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "winorg/geometry/Geometry.hpp"
#include "winorg/utils/GapConfig.hpp"

namespace worg {

enum class Direction {
    Left,
    Right,
    Up,
    Down
};

/**
 * @brief Edge (or corner) moved by an edge resize
 */
enum class Edge {
    Left,
    Right,
    Top,
    Bottom,
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight
};

std::optional<Direction> directionFromString(std::string_view name);
const char* directionToString(Direction direction);

std::optional<Edge> edgeFromString(std::string_view name);
const char* edgeToString(Edge edge);

struct GridSpec {
    int columns{2};
    int rows{2};
    GapConfig gaps;

    // Repeated relative grid-put on a window that already fills a cell
    // span grows the span instead of moving the window
    bool span_grow{true};

    bool isValid() const { return columns > 0 && rows > 0; }
};

struct GridCell {
    int col{0};
    int row{0};
    int col_span{1};
    int row_span{1};

    int lastCol() const { return col + col_span - 1; }
    int lastRow() const { return row + row_span - 1; }

    bool operator==(const GridCell& other) const {
        return col == other.col && row == other.row &&
               col_span == other.col_span && row_span == other.row_span;
    }
    bool operator!=(const GridCell& other) const { return !(*this == other); }

    std::string toString() const;
};

/**
 * @brief Rectangle of a single grid cell
 * @throws ActionError(InvalidGrid) on a non-positive grid size or a cell
 *         outside the grid, ActionError(DegenerateGeometry) when gaps
 *         leave nothing of the cell
 */
Rect cellRect(const GridSpec& grid, const Rect& workarea, int col, int row);

/**
 * @brief Rectangle covering a span of cells (gaps applied on the span's
 *        outside edges only)
 */
Rect spanRect(const GridSpec& grid, const Rect& workarea, const GridCell& cell);

/**
 * @brief Move one edge (or two, for a corner) by @p delta pixels
 *
 * Positive delta grows the rectangle outward on that edge, negative
 * shrinks it. The opposite edge stays fixed.
 * @throws ActionError(DegenerateGeometry) if width or height becomes <= 0
 */
Rect edgeResize(const Rect& rect, Edge edge, int delta);

/**
 * @brief Cell with the largest overlap with @p rect
 *
 * Ties go to the lowest (col, row) pair. Returns nullopt when @p rect
 * does not overlap the workarea at all.
 */
std::optional<GridCell> bestCell(const GridSpec& grid, const Rect& workarea, const Rect& rect);

/**
 * @brief The cell span whose rectangle equals @p rect exactly, if any
 */
std::optional<GridCell> exactSpan(const GridSpec& grid, const Rect& workarea, const Rect& rect);

/**
 * @brief Width of one column / height of one row, used to convert grid
 *        fractions into pixels
 */
int columnWidth(const GridSpec& grid, const Rect& workarea);
int rowHeight(const GridSpec& grid, const Rect& workarea);

/**
 * @brief All single cells in row-major order
 */
std::vector<Rect> allCells(const GridSpec& grid, const Rect& workarea);

}
