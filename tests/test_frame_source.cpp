#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "fakes.hpp"
#include "printmon/frame_source.hpp"

using namespace printmon;
using namespace printmon::fakes;
using namespace std::chrono_literals;

namespace {

ReconnectPolicy fast_policy() {
    ReconnectPolicy p;
    p.initial = 5ms;
    p.max = 20ms;
    return p;
}

}  // namespace

TEST(ReconnectPolicy, DoublesUpToCap) {
    ReconnectPolicy p;
    p.initial = 1000ms;
    p.max = 60000ms;
    auto d = p.initial;
    d = p.next(d);
    EXPECT_EQ(d, 2000ms);
    for (int i = 0; i < 10; ++i) d = p.next(d);
    EXPECT_EQ(d, 60000ms);
}

TEST(FrameSource, UnavailableBeforeStart) {
    FrameSource src(std::make_unique<FakeVideoSource>(), fast_policy());
    EXPECT_FALSE(src.get_frame().has_value());
    EXPECT_FALSE(src.connected());
}

TEST(FrameSource, ServesNewestFrameWhileConnected) {
    auto fake = std::make_unique<FakeVideoSource>();
    fake->opens = {true};
    fake->frames_per_connection = 1000000;
    FrameSource src(std::move(fake), fast_policy());
    src.start();

    ASSERT_TRUE(eventually([&] { return src.get_frame().has_value(); }));
    EXPECT_TRUE(src.connected());
    EXPECT_FALSE(src.get_frame()->empty());

    src.stop();
    EXPECT_FALSE(src.get_frame().has_value());
}

TEST(FrameSource, RetriesAfterFailedOpenAndDroppedConnection) {
    auto fake = std::make_unique<FakeVideoSource>();
    auto* raw = fake.get();
    fake->opens = {false, true, true};
    fake->frames_per_connection = 3;
    FrameSource src(std::move(fake), fast_policy());
    src.start();

    ASSERT_TRUE(eventually([&] { return src.frames_read() >= 6; }));
    // every scripted open consumed, further attempts keep failing
    ASSERT_TRUE(eventually([&] { return raw->open_calls >= 5; }));
    EXPECT_TRUE(eventually([&] { return !src.connected() && !src.get_frame().has_value(); }));
    EXPECT_GE(src.connect_attempts(), 5u);

    src.stop();
}

TEST(FrameSource, BackoffGrowsWhenConnectionsDeliverNoFrames) {
    ReconnectPolicy p;
    p.initial = 20ms;
    p.max = 5s;
    auto fake = std::make_unique<FakeVideoSource>();
    auto* raw = fake.get();
    fake->open_when_unscripted = true;
    fake->frames_per_connection = 0;
    FrameSource src(std::move(fake), p);
    src.start();

    // waits of 20, 40, 80, 160, 320ms: about five attempts in 600ms,
    // a fixed 20ms retry would make around twenty-five
    std::this_thread::sleep_for(600ms);
    const int opens = raw->open_calls;
    src.stop();

    EXPECT_GE(opens, 2);
    EXPECT_LE(opens, 8);
    EXPECT_EQ(src.frames_read(), 0u);
    EXPECT_FALSE(src.connected());
}

TEST(FrameSource, FirstFrameResetsBackoff) {
    ReconnectPolicy p;
    p.initial = 20ms;
    p.max = 5s;
    auto fake = std::make_unique<FakeVideoSource>();
    auto* raw = fake.get();
    fake->opens = {false, false, false, false, true};
    fake->open_when_unscripted = true;
    fake->frames_per_connection = 1;
    FrameSource src(std::move(fake), p);
    src.start();

    // after the fifth open delivers, the next waits restart at 20ms
    ASSERT_TRUE(eventually([&] { return src.frames_read() >= 1; }, 3000ms));
    const int before = raw->open_calls;
    std::this_thread::sleep_for(200ms);
    const int after = raw->open_calls;
    src.stop();

    EXPECT_GE(after - before, 2);
}

TEST(FrameSource, BlockedReadStopsServingOldFrame) {
    ReconnectPolicy p = fast_policy();
    p.max_frame_age = 100ms;
    auto fake = std::make_unique<FakeVideoSource>();
    auto* raw = fake.get();
    fake->opens = {true};
    fake->frames_per_connection = 1000000;
    FrameSource src(std::move(fake), p);
    src.start();
    ASSERT_TRUE(eventually([&] { return src.get_frame().has_value(); }));

    raw->stall = true;
    EXPECT_TRUE(eventually([&] { return !src.get_frame().has_value(); }, 1000ms));
    EXPECT_TRUE(src.connected());

    raw->stall = false;
    EXPECT_TRUE(eventually([&] { return src.get_frame().has_value(); }));
    src.stop();
}

TEST(FrameSource, TransportErrorCountsAsFailedAttempt) {
    auto fake = std::make_unique<FakeVideoSource>();
    auto* raw = fake.get();
    fake->throw_on_open = true;
    fake->open_when_unscripted = true;
    fake->frames_per_connection = 1000000;
    FrameSource src(std::move(fake), fast_policy());
    src.start();

    ASSERT_TRUE(eventually([&] { return src.connect_attempts() >= 3; }));
    EXPECT_FALSE(src.get_frame().has_value());

    raw->throw_on_open = false;
    EXPECT_TRUE(eventually([&] { return src.get_frame().has_value(); }));
    src.stop();
}

TEST(FrameSource, StopInterruptsBackoff) {
    ReconnectPolicy slow;
    slow.initial = 60s;
    slow.max = 60s;
    auto fake = std::make_unique<FakeVideoSource>();
    FrameSource src(std::move(fake), slow);
    src.start();
    ASSERT_TRUE(eventually([&] { return src.connect_attempts() >= 1; }));

    const auto t0 = Clock::now();
    src.stop();
    EXPECT_LT(Clock::now() - t0, 5s);
}
