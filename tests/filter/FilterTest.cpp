#include <winorg/filter/Filter.hpp>

#include <gtest/gtest.h>

using namespace worg;

namespace {

WindowSnapshot window(WindowId id, std::optional<int> desktop, bool active = false) {
    WindowSnapshot w;
    w.id = id;
    w.geometry = Rect{static_cast<int>(id) * 10, 0, 100, 100};
    w.desktop = desktop;
    w.active = active;
    return w;
}

}

TEST(Filter, activeOnDesktopSelectsOne) {
    SnapshotSet windows({
        window(3, 2),
        window(5, 1),
        window(7, 2, true),
        window(9, std::nullopt),
        window(11, 0),
    });

    Filter filter = Filter::isActive() && Filter::desktopIs(2);
    auto selected = filter.select(windows);

    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0].id, 7u);
}

TEST(Filter, selectPreservesOrder) {
    SnapshotSet windows({window(9, 1), window(2, 1), window(4, 0), window(1, 1)});

    auto selected = select(Filter::desktopIs(1), windows);

    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(selected[0].id, 9u);
    EXPECT_EQ(selected[1].id, 2u);
    EXPECT_EQ(selected[2].id, 1u);
}

TEST(Filter, missingAttributesAreFalse) {
    WindowSnapshot sticky = window(1, std::nullopt);
    sticky.state = WindowState::Sticky;

    EXPECT_FALSE(Filter::desktopIs(0).evaluate(sticky));
    EXPECT_FALSE(Filter::desktopIn({0, 1, 2}).evaluate(sticky));
    EXPECT_FALSE(Filter::desktopIsCurrent().evaluate(sticky, FilterContext{0}));
    EXPECT_FALSE(Filter::classIs("").evaluate(sticky));

    // Negating an unknown is true, as for any other false leaf
    EXPECT_TRUE((!Filter::desktopIs(0)).evaluate(sticky));
}

TEST(Filter, currentDesktop) {
    WindowSnapshot here = window(1, 3);
    WindowSnapshot there = window(2, 4);
    WindowSnapshot sticky = window(3, std::nullopt);

    FilterContext context{3};
    Filter on_current = Filter::onCurrentDesktop();

    EXPECT_TRUE(on_current.evaluate(here, context));
    EXPECT_FALSE(on_current.evaluate(there, context));
    EXPECT_TRUE(on_current.evaluate(sticky, context));

    // Without a known current desktop nothing matches
    EXPECT_FALSE(on_current.evaluate(here));
    EXPECT_FALSE(Filter::desktopIsCurrent().evaluate(here));
    EXPECT_TRUE(Filter::desktopIsCurrent().evaluate(here, context));
}

TEST(Filter, leaves) {
    WindowSnapshot w = window(42, 0);
    w.type = WindowType::Dialog;
    w.class_name = "Firefox";
    w.state = WindowState::Shaded | WindowState::AboveLayer;

    EXPECT_TRUE(Filter::typeIs(WindowType::Dialog).evaluate(w));
    EXPECT_FALSE(Filter::typeIs(WindowType::Normal).evaluate(w));
    EXPECT_TRUE(Filter::typeIn({WindowType::Normal, WindowType::Dialog}).evaluate(w));
    EXPECT_TRUE(Filter::classIs("Firefox").evaluate(w));
    EXPECT_TRUE(Filter::hasState(WindowState::Shaded).evaluate(w));
    EXPECT_FALSE(Filter::hasState(WindowState::Fullscreen).evaluate(w));
    EXPECT_TRUE(Filter::idIs(42).evaluate(w));
    EXPECT_TRUE(Filter::containsPoint(420, 50).evaluate(w));
    EXPECT_FALSE(Filter::containsPoint(520, 50).evaluate(w));
    EXPECT_TRUE(Filter::always().evaluate(w));
}

TEST(Filter, shortCircuitComposition) {
    WindowSnapshot w = window(1, 0, true);

    Filter yes = Filter::isActive();
    Filter no = Filter::desktopIs(5);

    EXPECT_FALSE((yes && no).evaluate(w));
    EXPECT_TRUE((yes || no).evaluate(w));
    EXPECT_TRUE((no || yes).evaluate(w));
    EXPECT_TRUE((!no).evaluate(w));
    EXPECT_TRUE((!(no && yes)).evaluate(w));
}

TEST(Filter, compositionKeepsOperandsIntact) {
    Filter a = Filter::isActive();
    Filter b = Filter::desktopIs(1);
    const void* a_id = a.identity();

    Filter both = a && b;

    EXPECT_EQ(a.identity(), a_id);
    EXPECT_EQ(a.kind(), Filter::Kind::IsActive);
    EXPECT_EQ(both.kind(), Filter::Kind::And);
    EXPECT_NE(both.identity(), a.identity());

    // Copies share identity
    Filter copy = both;
    EXPECT_EQ(copy.identity(), both.identity());

    EXPECT_EQ(both.describe(), "(active && desktop == 1)");
}

TEST(Filter, registryPresetsShareIdentity) {
    FilterRegistry registry;

    auto first = registry.find("normal");
    auto second = registry.find("normal");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->identity(), second->identity());

    EXPECT_FALSE(registry.find("missing").has_value());
    EXPECT_EQ(registry.defaultFilter().kind(), Filter::Kind::IsActive);

    registry.define("terminals", Filter::classIs("XTerm"));
    EXPECT_TRUE(registry.contains("terminals"));
}
