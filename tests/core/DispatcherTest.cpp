#include <winorg/core/Dispatcher.hpp>

#include "../helpers/FakeSurface.hpp"

#include <gtest/gtest.h>

using namespace worg;
using worg::test::FakeSurface;

namespace {

class DispatcherTest : public ::testing::Test {
protected:
    FakeSurface surface;
    TriggerQueue queue;
    Dispatcher dispatcher{surface, queue};

    ActionTrigger trigger(Action action, uint64_t timestamp = 0, Filter target = Filter::isActive()) {
        ActionTrigger t;
        t.request.action = action;
        t.request.target = target;
        t.request.origin = "test";
        t.request.timestamp = timestamp;
        return t;
    }

    GridPutAction cell(int col, int row) {
        GridPutAction put;
        put.cell = GridCell{col, row, 1, 1};
        return put;
    }
};

}

TEST_F(DispatcherTest, appliesGridPut) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);

    DispatchResult result = dispatcher.dispatch(trigger(cell(1, 0)));

    EXPECT_EQ(result.status, DispatchStatus::Applied);
    ASSERT_EQ(surface.applied.size(), 1u);
    EXPECT_EQ(*surface.applied[0].geometry, Rect(960, 0, 960, 540));
    EXPECT_GT(surface.applied[0].generation, 0u);

    // The confirmation comes back through the queue
    EXPECT_EQ(dispatcher.pendingCount(), 1u);
    EXPECT_EQ(dispatcher.drain(), 1u);
    EXPECT_EQ(dispatcher.pendingCount(), 0u);
}

TEST_F(DispatcherTest, replyCallbackReceivesResult) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);

    ActionTrigger t = trigger(MoveAction{10000, 0, Unit::Pixels});
    std::optional<DispatchResult> reply;
    t.reply = [&reply](const DispatchResult& r) { reply = r; };

    queue.push(std::move(t));
    dispatcher.drain();

    ASSERT_TRUE(reply.has_value());
    EXPECT_FALSE(reply->ok());
    EXPECT_EQ(reply->error, ErrorKind::OutOfBounds);
    EXPECT_TRUE(surface.applied.empty());
}

TEST_F(DispatcherTest, redeliveryIsIgnored) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);

    EXPECT_EQ(dispatcher.dispatch(trigger(MoveAction{10, 0, Unit::Pixels}, 4242)).status,
              DispatchStatus::Applied);
    EXPECT_EQ(dispatcher.dispatch(trigger(MoveAction{10, 0, Unit::Pixels}, 4242)).status,
              DispatchStatus::Duplicate);
    EXPECT_EQ(surface.applied.size(), 1u);
    EXPECT_EQ(surface.find(1)->geometry, Rect(110, 100, 300, 200));

    // A new timestamp is a new request
    EXPECT_EQ(dispatcher.dispatch(trigger(MoveAction{10, 0, Unit::Pixels}, 4243)).status,
              DispatchStatus::Applied);
    EXPECT_EQ(surface.find(1)->geometry, Rect(120, 100, 300, 200));

    // Without a timestamp nothing can be deduplicated
    dispatcher.dispatch(trigger(MoveAction{10, 0, Unit::Pixels}));
    dispatcher.dispatch(trigger(MoveAction{10, 0, Unit::Pixels}));
    EXPECT_EQ(surface.applied.size(), 4u);
}

TEST_F(DispatcherTest, sourceUnavailableAbortsDispatch) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);
    surface.available = false;

    DispatchResult result = dispatcher.dispatch(trigger(cell(0, 0)));

    EXPECT_EQ(result.status, DispatchStatus::Failed);
    EXPECT_EQ(result.error, ErrorKind::SourceUnavailable);
    EXPECT_TRUE(surface.applied.empty());
}

TEST_F(DispatcherTest, supersededConfirmationIsDropped) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);
    surface.auto_confirm = false;

    dispatcher.dispatch(trigger(cell(0, 0)));
    dispatcher.dispatch(trigger(cell(1, 1)));
    ASSERT_EQ(surface.held.size(), 2u);

    const uint64_t first = surface.held[0].command.generation;
    const uint64_t second = surface.held[1].command.generation;
    EXPECT_LT(first, second);
    EXPECT_EQ(dispatcher.latestGeneration(1), second);

    DispatchResult stale = dispatcher.dispatch(Confirmation{CommandOutcome{1, first, true, false, ""}});
    EXPECT_EQ(stale.status, DispatchStatus::Dropped);
    EXPECT_TRUE(dispatcher.hasPending(1));

    DispatchResult current = dispatcher.dispatch(Confirmation{CommandOutcome{1, second, true, false, ""}});
    EXPECT_EQ(current.status, DispatchStatus::Applied);
    EXPECT_FALSE(dispatcher.hasPending(1));
}

TEST_F(DispatcherTest, failedConfirmationIsNotRetried) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);
    surface.auto_confirm = false;

    dispatcher.dispatch(trigger(cell(0, 0)));
    ASSERT_EQ(surface.held.size(), 1u);

    CommandOutcome outcome;
    outcome.window = 1;
    outcome.generation = surface.held[0].command.generation;
    outcome.success = false;
    outcome.message = "BadValue";
    surface.held[0].done(outcome);

    EXPECT_EQ(dispatcher.drain(), 1u);
    EXPECT_EQ(dispatcher.pendingCount(), 0u);
    EXPECT_EQ(surface.applied.size(), 1u);
}

TEST_F(DispatcherTest, pendingCommandsExpire) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);
    surface.auto_confirm = false;
    dispatcher.setConfirmTimeout(std::chrono::milliseconds(500));

    dispatcher.dispatch(trigger(cell(0, 0)));
    EXPECT_EQ(dispatcher.pendingCount(), 1u);

    EXPECT_EQ(dispatcher.expirePending(Dispatcher::Clock::now()), 0u);
    EXPECT_EQ(dispatcher.expirePending(Dispatcher::Clock::now() + std::chrono::seconds(1)), 1u);
    EXPECT_EQ(dispatcher.pendingCount(), 0u);
}

TEST_F(DispatcherTest, invalidationNeverEmitsCommands) {
    surface.addWindow(1, Rect{0, 0, 400, 300}, 0, true);

    DispatchResult result = dispatcher.dispatch(InvalidationEvent{WindowEventType::Created, 2});
    EXPECT_EQ(result.status, DispatchStatus::NoOp);
    EXPECT_TRUE(result.commands.empty());
    EXPECT_TRUE(surface.applied.empty());
}

TEST_F(DispatcherTest, destroyPurgesRestoreEntry) {
    surface.addWindow(1, Rect{10, 10, 400, 300}, 0, true);

    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    EXPECT_EQ(dispatcher.restoreTable().size(), 1u);

    surface.destroy(1);
    dispatcher.dispatch(InvalidationEvent{WindowEventType::Destroyed, 1});
    EXPECT_EQ(dispatcher.restoreTable().size(), 0u);
}

TEST_F(DispatcherTest, toggleRoundTripThroughSurface) {
    const Rect original{37, 58, 640, 480};
    surface.addWindow(1, original, 0, true);

    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    EXPECT_TRUE(surface.find(1)->isMaximized());
    EXPECT_EQ(surface.find(1)->geometry, surface.workarea);

    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    EXPECT_FALSE(surface.find(1)->isMaximized());
    EXPECT_EQ(surface.find(1)->geometry, original);
}

TEST_F(DispatcherTest, externalUnmaximizeForgetsRestoreGeometry) {
    surface.addWindow(1, Rect{100, 100, 400, 300}, 0, true);

    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    dispatcher.drain();
    EXPECT_EQ(dispatcher.restoreTable().size(), 1u);

    // The window manager's title bar button undoes the maximize
    WindowSnapshot* w = surface.find(1);
    w->state = w->state.without(states::Maximized);
    w->geometry = Rect{100, 100, 400, 300};
    dispatcher.dispatch(InvalidationEvent{WindowEventType::StateChanged, 1});
    EXPECT_EQ(dispatcher.restoreTable().size(), 0u);

    dispatcher.dispatch(trigger(MoveAction{600, 400, Unit::Pixels}));
    EXPECT_EQ(surface.find(1)->geometry, Rect(700, 500, 400, 300));

    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    EXPECT_EQ(surface.find(1)->geometry, surface.workarea);
    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    EXPECT_EQ(surface.find(1)->geometry, Rect(700, 500, 400, 300));
}

TEST_F(DispatcherTest, ignoredMaximizeDoesNotPinOldGeometry) {
    surface.addWindow(1, Rect{100, 100, 400, 300}, 0, true);

    // The window manager refuses the maximize
    surface.apply_changes = false;
    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    surface.apply_changes = true;
    EXPECT_FALSE(surface.find(1)->isMaximized());

    dispatcher.dispatch(trigger(MoveAction{200, 0, Unit::Pixels}));
    EXPECT_EQ(surface.find(1)->geometry, Rect(300, 100, 400, 300));

    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    EXPECT_TRUE(surface.find(1)->isMaximized());
    dispatcher.dispatch(trigger(ToggleStateAction{states::Maximized}));
    EXPECT_FALSE(surface.find(1)->isMaximized());
    EXPECT_EQ(surface.find(1)->geometry, Rect(300, 100, 400, 300));
}

TEST_F(DispatcherTest, spanGrowExample) {
    surface.addWindow(1, Rect{0, 0, 960, 540}, 0, true);

    GridPutAction right;
    right.direction = Direction::Right;
    dispatcher.dispatch(trigger(right));

    EXPECT_EQ(surface.find(1)->geometry, Rect(0, 0, 1920, 540));
}

TEST_F(DispatcherTest, cycleWrapsAroundThroughSurface) {
    surface.addWindow(1, Rect{0, 0, 400, 300}, 0, true);
    surface.addWindow(2, Rect{10, 0, 400, 300}, 0);
    surface.addWindow(3, Rect{20, 0, 400, 300}, 0);

    Filter all = Filter::always();
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(dispatcher.dispatch(trigger(CycleAction{CycleDirection::Next}, 0, all)).status,
                  DispatchStatus::Applied);
    }

    EXPECT_TRUE(surface.find(1)->active);
    ASSERT_EQ(surface.applied.size(), 3u);
    EXPECT_EQ(surface.applied[0].window, 2u);
    EXPECT_EQ(surface.applied[1].window, 3u);
    EXPECT_EQ(surface.applied[2].window, 1u);
}

TEST_F(DispatcherTest, cycleAfterActiveWindowDestroyed) {
    surface.addWindow(1, Rect{0, 0, 400, 300}, 0, true);
    surface.addWindow(2, Rect{10, 0, 400, 300}, 0);
    surface.addWindow(3, Rect{20, 0, 400, 300}, 0);

    Filter all = Filter::always();
    dispatcher.dispatch(trigger(CycleAction{CycleDirection::Next}, 0, all));
    dispatcher.dispatch(trigger(CycleAction{CycleDirection::Next}, 0, all));
    ASSERT_TRUE(surface.find(3)->active);

    surface.destroy(3);
    dispatcher.dispatch(InvalidationEvent{WindowEventType::Destroyed, 3});

    DispatchResult result = dispatcher.dispatch(trigger(CycleAction{CycleDirection::Next}, 0, all));
    EXPECT_EQ(result.status, DispatchStatus::Applied);
    ASSERT_EQ(result.commands.size(), 1u);
    EXPECT_EQ(result.commands[0].window, 1u);
}

TEST_F(DispatcherTest, staleTargetIsDroppedQuietly) {
    surface.addWindow(1, Rect{100, 100, 300, 200}, 0, true);
    surface.auto_confirm = false;

    dispatcher.dispatch(trigger(cell(0, 0)));
    ASSERT_EQ(surface.held.size(), 1u);

    CommandOutcome outcome;
    outcome.window = 1;
    outcome.generation = surface.held[0].command.generation;
    outcome.success = false;
    outcome.stale = true;

    DispatchResult result = dispatcher.dispatch(Confirmation{outcome});
    EXPECT_EQ(result.status, DispatchStatus::Dropped);
    EXPECT_EQ(result.error, ErrorKind::StaleReference);
    EXPECT_TRUE(result.ok());
}
