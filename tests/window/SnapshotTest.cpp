#include <winorg/window/WindowSnapshot.hpp>
#include <winorg/core/ActionError.hpp>

#include "../helpers/FakeSurface.hpp"

#include <gtest/gtest.h>

using namespace worg;
using worg::test::FakeSurface;

TEST(StateSet, flags) {
    StateSet set = WindowState::Shaded | WindowState::MaximizedHorz;

    EXPECT_TRUE(set.has(WindowState::Shaded));
    EXPECT_FALSE(set.has(WindowState::MaximizedVert));
    EXPECT_FALSE(set.hasAll(states::Maximized));
    EXPECT_TRUE(set.intersects(states::GeometryLocked));
    EXPECT_FALSE(set.has(WindowState::NoState));

    EXPECT_EQ(set.flags(), (std::vector<WindowState>{WindowState::MaximizedHorz, WindowState::Shaded}));
    EXPECT_EQ(set.toString(), "[maximized-horz, shaded]");
    EXPECT_EQ(StateSet().toString(), "[]");

    EXPECT_EQ(set.without(WindowState::Shaded), StateSet(WindowState::MaximizedHorz));
    EXPECT_EQ(set.toggled(states::Maximized), StateSet(WindowState::Shaded | WindowState::MaximizedVert));

    // An empty set is never "all present"
    EXPECT_FALSE(set.hasAll(StateSet()));
}

TEST(StateSet, names) {
    EXPECT_EQ(windowStateFromString("Maximized_Horz"), WindowState::MaximizedHorz);
    EXPECT_EQ(windowStateFromString("hidden"), WindowState::Minimized);
    EXPECT_EQ(windowStateFromString("skip-taskbar"), WindowState::SkipTaskbar);
    EXPECT_FALSE(windowStateFromString("translucent").has_value());

    EXPECT_EQ(windowTypeFromString("DROPDOWN_MENU"), WindowType::DropdownMenu);
    EXPECT_STREQ(windowTypeToString(WindowType::PopupMenu), "popup-menu");
    EXPECT_FALSE(windowTypeFromString("panel").has_value());
}

TEST(SnapshotSet, lookup) {
    WindowSnapshot a;
    a.id = 5;
    WindowSnapshot b;
    b.id = 9;
    b.active = true;

    SnapshotSet set({a, b});

    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.contains(9));
    EXPECT_FALSE(set.contains(4));
    ASSERT_NE(set.active(), nullptr);
    EXPECT_EQ(set.active()->id, 9u);
    EXPECT_EQ(set.ids(), (std::vector<WindowId>{5, 9}));
}

TEST(Capture, readsSurface) {
    FakeSurface surface;
    surface.desktop = 2;
    surface.addWindow(1, Rect{0, 0, 100, 100}, 2, true);

    Capture snapshot = capture(surface);

    EXPECT_EQ(snapshot.windows.size(), 1u);
    EXPECT_EQ(snapshot.workarea, surface.workarea);
    EXPECT_EQ(snapshot.current_desktop, 2);
}

TEST(Capture, unavailableSurfaceThrows) {
    FakeSurface surface;
    surface.available = false;

    try {
        capture(surface);
        FAIL() << "capture should throw";
    } catch (const ActionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SourceUnavailable);
    }

    surface.available = true;
    surface.workarea = Rect{0, 0, 0, 0};
    EXPECT_THROW(capture(surface), ActionError);
}
