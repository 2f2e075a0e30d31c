/**
 * @file GridModel.cpp
 * @brief Grid cell computation and edge resizing
 */

#include "winorg/geometry/GridModel.hpp"
#include "winorg/core/ActionError.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace worg {

namespace {

std::string normalizeName(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

// Boundary i of n divisions of [origin, origin + length)
int boundary(int origin, int length, int i, int n) {
    return origin + static_cast<int>((static_cast<int64_t>(i) * length) / n);
}

void validateGrid(const GridSpec& grid) {
    if (!grid.isValid()) {
        throw ActionError(ErrorKind::InvalidGrid,
                          "grid needs at least one column and one row, got " +
                          std::to_string(grid.columns) + "x" + std::to_string(grid.rows));
    }
}

}

// ============================================================================
// Names
// ============================================================================

std::optional<Direction> directionFromString(std::string_view name) {
    static const std::unordered_map<std::string, Direction> names = {
        {"left", Direction::Left},   {"west", Direction::Left},
        {"right", Direction::Right}, {"east", Direction::Right},
        {"up", Direction::Up},       {"north", Direction::Up},
        {"down", Direction::Down},   {"south", Direction::Down},
    };
    auto it = names.find(normalizeName(name));
    if (it == names.end()) return std::nullopt;
    return it->second;
}

const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::Left: return "left";
        case Direction::Right: return "right";
        case Direction::Up: return "up";
        case Direction::Down: return "down";
    }
    return "unknown";
}

std::optional<Edge> edgeFromString(std::string_view name) {
    static const std::unordered_map<std::string, Edge> names = {
        {"left", Edge::Left},             {"w", Edge::Left},
        {"right", Edge::Right},           {"e", Edge::Right},
        {"top", Edge::Top},               {"n", Edge::Top},
        {"bottom", Edge::Bottom},         {"s", Edge::Bottom},
        {"topleft", Edge::TopLeft},       {"nw", Edge::TopLeft},
        {"topright", Edge::TopRight},     {"ne", Edge::TopRight},
        {"bottomleft", Edge::BottomLeft}, {"sw", Edge::BottomLeft},
        {"bottomright", Edge::BottomRight}, {"se", Edge::BottomRight},
    };
    auto it = names.find(normalizeName(name));
    if (it == names.end()) return std::nullopt;
    return it->second;
}

const char* edgeToString(Edge edge) {
    switch (edge) {
        case Edge::Left: return "left";
        case Edge::Right: return "right";
        case Edge::Top: return "top";
        case Edge::Bottom: return "bottom";
        case Edge::TopLeft: return "top-left";
        case Edge::TopRight: return "top-right";
        case Edge::BottomLeft: return "bottom-left";
        case Edge::BottomRight: return "bottom-right";
    }
    return "unknown";
}

std::string GridCell::toString() const {
    std::ostringstream oss;
    oss << "(" << col << ", " << row << ")";
    if (col_span != 1 || row_span != 1) {
        oss << " span " << col_span << "x" << row_span;
    }
    return oss.str();
}

// ============================================================================
// Cells
// ============================================================================

Rect cellRect(const GridSpec& grid, const Rect& workarea, int col, int row) {
    return spanRect(grid, workarea, GridCell{col, row, 1, 1});
}

Rect spanRect(const GridSpec& grid, const Rect& workarea, const GridCell& cell) {
    validateGrid(grid);

    if (cell.col_span < 1 || cell.row_span < 1 ||
        cell.col < 0 || cell.row < 0 ||
        cell.lastCol() >= grid.columns || cell.lastRow() >= grid.rows) {
        throw ActionError(ErrorKind::InvalidGrid,
                          "cell " + cell.toString() + " is outside the " +
                          std::to_string(grid.columns) + "x" + std::to_string(grid.rows) + " grid");
    }

    int left = boundary(workarea.x, workarea.width, cell.col, grid.columns);
    int right = boundary(workarea.x, workarea.width, cell.col + cell.col_span, grid.columns);
    int top = boundary(workarea.y, workarea.height, cell.row, grid.rows);
    int bottom = boundary(workarea.y, workarea.height, cell.row + cell.row_span, grid.rows);

    CellEdges edges;
    edges.touches_left = cell.col == 0;
    edges.touches_right = cell.lastCol() == grid.columns - 1;
    edges.touches_top = cell.row == 0;
    edges.touches_bottom = cell.lastRow() == grid.rows - 1;

    Rect result = applyGaps(Rect{left, top, right - left, bottom - top}, grid.gaps, edges);

    if (!result.isValid()) {
        throw ActionError(ErrorKind::DegenerateGeometry,
                          "cell " + cell.toString() + " collapses to " + result.toString());
    }
    return result;
}

int columnWidth(const GridSpec& grid, const Rect& workarea) {
    validateGrid(grid);
    return workarea.width / grid.columns;
}

int rowHeight(const GridSpec& grid, const Rect& workarea) {
    validateGrid(grid);
    return workarea.height / grid.rows;
}

std::vector<Rect> allCells(const GridSpec& grid, const Rect& workarea) {
    validateGrid(grid);

    std::vector<Rect> cells;
    cells.reserve(static_cast<size_t>(grid.columns) * static_cast<size_t>(grid.rows));
    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.columns; ++col) {
            cells.push_back(cellRect(grid, workarea, col, row));
        }
    }
    return cells;
}

std::optional<GridCell> bestCell(const GridSpec& grid, const Rect& workarea, const Rect& rect) {
    validateGrid(grid);

    std::optional<GridCell> best;
    int64_t best_overlap = 0;

    // Column-major walk so that a strict '>' keeps the lowest (col, row)
    for (int col = 0; col < grid.columns; ++col) {
        for (int row = 0; row < grid.rows; ++row) {
            int64_t overlap = overlapArea(cellRect(grid, workarea, col, row), rect);
            if (overlap > best_overlap) {
                best_overlap = overlap;
                best = GridCell{col, row, 1, 1};
            }
        }
    }
    return best;
}

std::optional<GridCell> exactSpan(const GridSpec& grid, const Rect& workarea, const Rect& rect) {
    auto anchor = bestCell(grid, workarea, rect);
    if (!anchor) {
        return std::nullopt;
    }

    // The span must contain the best cell; try every span that does
    for (int col = 0; col <= anchor->col; ++col) {
        for (int row = 0; row <= anchor->row; ++row) {
            for (int last_col = anchor->col; last_col < grid.columns; ++last_col) {
                for (int last_row = anchor->row; last_row < grid.rows; ++last_row) {
                    GridCell span{col, row, last_col - col + 1, last_row - row + 1};
                    if (spanRect(grid, workarea, span) == rect) {
                        return span;
                    }
                }
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// Edge resize
// ============================================================================

Rect edgeResize(const Rect& rect, Edge edge, int delta) {
    Rect result = rect;

    bool moves_left = edge == Edge::Left || edge == Edge::TopLeft || edge == Edge::BottomLeft;
    bool moves_right = edge == Edge::Right || edge == Edge::TopRight || edge == Edge::BottomRight;
    bool moves_top = edge == Edge::Top || edge == Edge::TopLeft || edge == Edge::TopRight;
    bool moves_bottom = edge == Edge::Bottom || edge == Edge::BottomLeft || edge == Edge::BottomRight;

    if (moves_left) {
        result.x -= delta;
        result.width += delta;
    }
    if (moves_right) {
        result.width += delta;
    }
    if (moves_top) {
        result.y -= delta;
        result.height += delta;
    }
    if (moves_bottom) {
        result.height += delta;
    }

    if (!result.isValid()) {
        throw ActionError(ErrorKind::DegenerateGeometry,
                          std::string("resizing ") + edgeToString(edge) + " edge of " +
                          rect.toString() + " by " + std::to_string(delta) +
                          " yields " + result.toString());
    }
    return result;
}

} // namespace worg
