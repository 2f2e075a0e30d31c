#include <winorg/action/CycleTracker.hpp>

#include <gtest/gtest.h>

using namespace worg;

TEST(CycleTracker, wrapsAround) {
    CycleTracker tracker;
    Filter group = Filter::always();
    const std::vector<WindowId> selection{10, 20, 30, 40};

    WindowId active = 10;
    std::vector<WindowId> visited;
    for (size_t i = 0; i < selection.size(); ++i) {
        auto next = tracker.advance(group, selection, active, CycleDirection::Next);
        ASSERT_TRUE(next.has_value());
        visited.push_back(*next);
        active = *next;
    }

    EXPECT_EQ(visited, (std::vector<WindowId>{20, 30, 40, 10}));
    EXPECT_EQ(active, 10u);
}

TEST(CycleTracker, previousWrapsAround) {
    CycleTracker tracker;
    Filter group = Filter::always();
    const std::vector<WindowId> selection{10, 20, 30};

    auto prev = tracker.advance(group, selection, 10, CycleDirection::Previous);
    ASSERT_TRUE(prev.has_value());
    EXPECT_EQ(*prev, 30u);

    prev = tracker.advance(group, selection, 30, CycleDirection::Previous);
    ASSERT_TRUE(prev.has_value());
    EXPECT_EQ(*prev, 20u);
}

TEST(CycleTracker, orderSurvivesRestacking) {
    CycleTracker tracker;
    Filter group = Filter::always();

    auto next = tracker.advance(group, {1, 2, 3}, 1, CycleDirection::Next);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 2u);

    // Activating 2 raised it to the top; the group keeps its own order
    next = tracker.advance(group, {2, 1, 3}, 2, CycleDirection::Next);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 3u);
}

TEST(CycleTracker, singleWindowIsNoOp) {
    CycleTracker tracker;
    Filter group = Filter::always();

    EXPECT_FALSE(tracker.advance(group, {7}, 7, CycleDirection::Next).has_value());
    EXPECT_FALSE(tracker.advance(group, {7}, 7, CycleDirection::Next).has_value());
    EXPECT_FALSE(tracker.advance(group, {}, NoWindow, CycleDirection::Next).has_value());
}

TEST(CycleTracker, membershipChangeResets) {
    CycleTracker tracker;
    Filter group = Filter::always();

    tracker.advance(group, {1, 2, 3, 4}, 1, CycleDirection::Next);
    tracker.advance(group, {1, 2, 3, 4}, 2, CycleDirection::Next);
    EXPECT_EQ(tracker.currentIndex(group), 2u);

    // New window 5 appeared; restart from the active window's position
    auto next = tracker.advance(group, {5, 1, 2, 3, 4}, 3, CycleDirection::Next);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 4u);
}

TEST(CycleTracker, destroyedActiveFallsBackToFirst) {
    CycleTracker tracker;
    Filter group = Filter::always();

    tracker.advance(group, {1, 2, 3}, 1, CycleDirection::Next);
    tracker.advance(group, {1, 2, 3}, 2, CycleDirection::Next);
    EXPECT_EQ(tracker.currentIndex(group), 2u);

    // Window 3 (current) goes away; no window is active any more
    tracker.invalidate(3);
    EXPECT_FALSE(tracker.currentIndex(group).has_value());

    auto next = tracker.advance(group, {1, 2}, NoWindow, CycleDirection::Next);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 1u);
    EXPECT_EQ(tracker.currentIndex(group), 0u);
}

TEST(CycleTracker, groupsAreKeyedByFilterIdentity) {
    CycleTracker tracker;
    Filter a = Filter::always();
    Filter b = Filter::always();

    tracker.advance(a, {1, 2, 3}, 1, CycleDirection::Next);
    tracker.advance(b, {1, 2, 3}, 1, CycleDirection::Next);
    tracker.advance(b, {1, 2, 3}, 2, CycleDirection::Next);

    EXPECT_EQ(tracker.groupCount(), 2u);
    EXPECT_EQ(tracker.currentIndex(a), 1u);
    EXPECT_EQ(tracker.currentIndex(b), 2u);
}
