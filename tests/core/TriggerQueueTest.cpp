#include <winorg/core/TriggerQueue.hpp>

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

using namespace worg;

TEST(TriggerQueue, fifoOrder) {
    TriggerQueue queue;
    EXPECT_TRUE(queue.empty());

    queue.push(InvalidationEvent{WindowEventType::Created, 1});
    queue.push(InvalidationEvent{WindowEventType::Destroyed, 2});
    queue.push(Confirmation{CommandOutcome{3, 7, true, false, ""}});

    EXPECT_FALSE(queue.empty());
    EXPECT_EQ(queue.totalPushed(), 3u);

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(std::holds_alternative<InvalidationEvent>(*first));
    EXPECT_EQ(std::get<InvalidationEvent>(*first).window, 1u);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(std::get<InvalidationEvent>(*second).type, WindowEventType::Destroyed);

    auto third = queue.pop();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(std::get<Confirmation>(*third).outcome.generation, 7u);

    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_TRUE(queue.empty());
}

TEST(TriggerQueue, manyProducersOneConsumer) {
    TriggerQueue queue;
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 1000;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                WindowId id = static_cast<WindowId>(p * PER_PRODUCER + i + 1);
                queue.push(InvalidationEvent{WindowEventType::GeometryChanged, id});
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    std::set<WindowId> seen;
    std::vector<WindowId> last_per_producer(PRODUCERS, 0);
    while (auto trigger = queue.pop()) {
        WindowId id = std::get<InvalidationEvent>(*trigger).window;
        size_t producer = (id - 1) / PER_PRODUCER;

        // Each producer's pushes stay in order
        EXPECT_GT(id, last_per_producer[producer]);
        last_per_producer[producer] = id;
        seen.insert(id);
    }

    EXPECT_EQ(seen.size(), static_cast<size_t>(PRODUCERS * PER_PRODUCER));
    EXPECT_EQ(queue.totalPushed(), static_cast<uint64_t>(PRODUCERS * PER_PRODUCER));
}
