#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "printmon/command_queue.hpp"
#include "printmon/latest_value.hpp"

using printmon::CommandQueue;
using printmon::LatestValue;

TEST(LatestValue, EmptyUntilFirstPut) {
    LatestValue<int> cell;
    EXPECT_FALSE(cell.peek().has_value());
}

TEST(LatestValue, NewestValueWins) {
    LatestValue<int> cell;
    cell.put(1);
    cell.put(2);
    cell.put(3);
    ASSERT_TRUE(cell.peek().has_value());
    EXPECT_EQ(*cell.peek(), 3);
}

TEST(LatestValue, ClearMakesValueUnavailable) {
    LatestValue<int> cell;
    cell.put(5);
    cell.clear();
    EXPECT_FALSE(cell.peek().has_value());
}

TEST(LatestValue, ReaderNeverSeesValuesGoBackwards) {
    LatestValue<int> cell;
    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 1; i <= 5000; ++i) cell.put(i);
        done = true;
    });

    int last = 0;
    bool ordered = true;
    while (!done) {
        if (auto v = cell.peek()) {
            if (*v < last) ordered = false;
            last = *v;
        }
    }
    writer.join();
    EXPECT_TRUE(ordered);
    EXPECT_EQ(*cell.peek(), 5000);
}

TEST(CommandQueue, PopsInOrderAndStops) {
    CommandQueue<int> q;
    q.push(1);
    q.push(2);
    int out = 0;
    ASSERT_TRUE(q.pop(out));
    EXPECT_EQ(out, 1);
    ASSERT_TRUE(q.pop(out));
    EXPECT_EQ(out, 2);

    std::thread stopper([&] { q.stop(); });
    EXPECT_FALSE(q.pop(out));
    stopper.join();

    // pushes after stop are dropped
    q.push(3);
    EXPECT_FALSE(q.pop(out));
}

TEST(CommandQueue, SleepReturnsFalseWhenStopped) {
    CommandQueue<int> q;
    EXPECT_TRUE(q.sleep_for(std::chrono::milliseconds(1)));
    q.stop();
    EXPECT_FALSE(q.sleep_for(std::chrono::seconds(10)));
}
