#include <winorg/core/ActionError.hpp>
#include <winorg/geometry/GridModel.hpp>

#include <gtest/gtest.h>

using namespace worg;

namespace {

const Rect SCREEN{0, 0, 1920, 1080};

GridSpec grid(int columns, int rows) {
    GridSpec layout;
    layout.columns = columns;
    layout.rows = rows;
    return layout;
}

}

TEST(GridModel, cellRectExample) {
    EXPECT_EQ(cellRect(grid(2, 2), SCREEN, 1, 0), Rect(960, 0, 960, 540));
    EXPECT_EQ(cellRect(grid(2, 2), SCREEN, 0, 1), Rect(0, 540, 960, 540));
}

TEST(GridModel, cellsTileWorkarea) {
    const Rect workareas[] = {SCREEN, Rect{0, 27, 1366, 741}, Rect{13, 7, 1001, 997}};

    for (const Rect& workarea : workareas) {
        for (int columns = 1; columns <= 7; ++columns) {
            for (int rows = 1; rows <= 5; ++rows) {
                auto cells = allCells(grid(columns, rows), workarea);
                ASSERT_EQ(cells.size(), static_cast<size_t>(columns * rows));

                int64_t total = 0;
                for (size_t i = 0; i < cells.size(); ++i) {
                    EXPECT_TRUE(workarea.contains(cells[i]));
                    total += cells[i].area();
                    for (size_t j = i + 1; j < cells.size(); ++j) {
                        EXPECT_EQ(overlapArea(cells[i], cells[j]), 0)
                            << columns << "x" << rows << " cells " << i << " and " << j;
                    }
                }
                EXPECT_EQ(total, workarea.area()) << columns << "x" << rows;
            }
        }
    }
}

TEST(GridModel, gapsApplied) {
    GridSpec layout = grid(2, 1);
    layout.gaps.outer_gap = 10;
    layout.gaps.inner_gap = 8;

    EXPECT_EQ(cellRect(layout, SCREEN, 0, 0), Rect(10, 10, 960 - 10 - 4, 1080 - 20));
    EXPECT_EQ(cellRect(layout, SCREEN, 1, 0), Rect(964, 10, 960 - 4 - 10, 1080 - 20));

    // Adjacent cells keep exactly the inner gap between them
    EXPECT_EQ(cellRect(layout, SCREEN, 1, 0).left() - cellRect(layout, SCREEN, 0, 0).right(), 8);
}

TEST(GridModel, invalidGrid) {
    try {
        cellRect(grid(0, 2), SCREEN, 0, 0);
        FAIL() << "expected InvalidGrid";
    } catch (const ActionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidGrid);
    }

    EXPECT_THROW(cellRect(grid(2, -1), SCREEN, 0, 0), ActionError);
    EXPECT_THROW(cellRect(grid(2, 2), SCREEN, 2, 0), ActionError);
    EXPECT_THROW(spanRect(grid(2, 2), SCREEN, GridCell{1, 0, 2, 1}), ActionError);
}

TEST(GridModel, gapsLargerThanCell) {
    GridSpec layout = grid(4, 4);
    layout.gaps.outer_gap = 400;

    try {
        cellRect(layout, Rect{0, 0, 800, 800}, 0, 0);
        FAIL() << "expected DegenerateGeometry";
    } catch (const ActionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateGeometry);
    }
}

TEST(GridModel, spanRect) {
    EXPECT_EQ(spanRect(grid(2, 2), SCREEN, GridCell{0, 0, 2, 1}), Rect(0, 0, 1920, 540));
    EXPECT_EQ(spanRect(grid(3, 3), SCREEN, GridCell{1, 1, 2, 2}), Rect(640, 360, 1280, 720));
}

TEST(GridModel, edgeResize) {
    Rect r{100, 100, 400, 300};

    EXPECT_EQ(edgeResize(r, Edge::Right, 50), Rect(100, 100, 450, 300));
    EXPECT_EQ(edgeResize(r, Edge::Left, 50), Rect(50, 100, 450, 300));
    EXPECT_EQ(edgeResize(r, Edge::Top, -20), Rect(100, 120, 400, 280));
    EXPECT_EQ(edgeResize(r, Edge::Bottom, -20), Rect(100, 100, 400, 280));
    EXPECT_EQ(edgeResize(r, Edge::TopLeft, 10), Rect(90, 90, 410, 310));
    EXPECT_EQ(edgeResize(r, Edge::BottomRight, 10), Rect(100, 100, 410, 310));

    // The opposite edge stays put
    EXPECT_EQ(edgeResize(r, Edge::Left, -100).right(), r.right());
    EXPECT_EQ(edgeResize(r, Edge::Top, 40).bottom(), r.bottom());
}

TEST(GridModel, edgeResizeRejectsDegenerate) {
    Rect r{100, 100, 400, 300};

    try {
        edgeResize(r, Edge::Right, -400);
        FAIL() << "expected DegenerateGeometry";
    } catch (const ActionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateGeometry);
    }

    EXPECT_THROW(edgeResize(r, Edge::Bottom, -301), ActionError);
    EXPECT_THROW(edgeResize(r, Edge::TopLeft, -300), ActionError);
    EXPECT_NO_THROW(edgeResize(r, Edge::Left, -399));
}

TEST(GridModel, bestCell) {
    GridSpec layout = grid(2, 2);

    auto cell = bestCell(layout, SCREEN, Rect{1000, 600, 300, 300});
    ASSERT_TRUE(cell.has_value());
    EXPECT_EQ(*cell, (GridCell{1, 1, 1, 1}));

    // Equal overlap with all four cells: lowest (col, row) wins
    cell = bestCell(layout, SCREEN, Rect{860, 440, 200, 200});
    ASSERT_TRUE(cell.has_value());
    EXPECT_EQ(*cell, (GridCell{0, 0, 1, 1}));

    cell = bestCell(layout, SCREEN, Rect{860, 700, 200, 100});
    ASSERT_TRUE(cell.has_value());
    EXPECT_EQ(*cell, (GridCell{0, 1, 1, 1}));

    EXPECT_FALSE(bestCell(layout, SCREEN, Rect{-500, -500, 100, 100}).has_value());
}

TEST(GridModel, exactSpan) {
    GridSpec layout = grid(3, 2);

    auto span = exactSpan(layout, SCREEN, Rect{640, 0, 1280, 540});
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(*span, (GridCell{1, 0, 2, 1}));

    EXPECT_FALSE(exactSpan(layout, SCREEN, Rect{641, 0, 1280, 540}).has_value());
}

TEST(GridModel, names) {
    EXPECT_EQ(directionFromString("Left"), Direction::Left);
    EXPECT_EQ(directionFromString("east"), Direction::Right);
    EXPECT_FALSE(directionFromString("forward").has_value());

    EXPECT_EQ(edgeFromString("bottom-right"), Edge::BottomRight);
    EXPECT_EQ(edgeFromString("NW"), Edge::TopLeft);
    EXPECT_STREQ(edgeToString(Edge::TopRight), "top-right");
}
