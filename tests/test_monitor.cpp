#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include <nlohmann/json.hpp>

#include "fakes.hpp"
#include "printmon/control_api.hpp"
#include "printmon/event_publisher.hpp"
#include "printmon/frame_snapshot.hpp"
#include "printmon/inference_gate.hpp"
#include "printmon/monitor.hpp"
#include "printmon/standby_controller.hpp"

using namespace printmon;
using namespace printmon::fakes;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {
constexpr const char* kFailureTopic = "printer/mk4s/failure";
constexpr const char* kHeartbeatTopic = "printer/mk4s/heartbeat";
constexpr const char* kControlTopic = "printer/mk4s/control";
}  // namespace

class MonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime = std::make_shared<FakeContainerRuntime>();
        inference = std::make_shared<FakeInference>();

        sopts.auto_timeout = 300s;
        sopts.op_timeout = 500ms;
        sopts.retry_backoff = 1h;
        sopts.resume_max_wait = 500ms;
        sopts.resume_poll_interval = 10ms;

        mopts.check_interval = 10s;
        mopts.idle_timeout = 60s;
        mopts.stream_grace = 30s;
        mopts.mqtt_grace = 120s;
        mopts.failure_threshold = 0.6f;
        mopts.motion = MotionOptions{30, 500, 0};
    }

    void TearDown() override {
        if (controller) controller->stop();
        monitor.reset();
        controller.reset();
    }

    void build() {
        t0 = Clock::now();
        gate = std::make_unique<InferenceGate>(*inference, 0s);
        controller = std::make_unique<StandbyController>(sopts, runtime, inference);
        publisher = std::make_unique<EventPublisher>(&broker, kFailureTopic, kHeartbeatTopic);
        monitor = std::make_unique<Monitor>(mopts, frames, *gate, *controller, *publisher, &broker, snapshot);
        api = std::make_unique<ControlApi>(*controller, *monitor);
        controller->start(t0);
    }

    void cycle(std::chrono::seconds at, const cv::Mat& image) {
        frames.set(image);
        monitor->run_cycle(t0 + at, std::chrono::system_clock::now());
    }

    void cycle_without_frame(std::chrono::seconds at) {
        frames.drop();
        monitor->run_cycle(t0 + at, std::chrono::system_clock::now());
    }

    std::vector<std::string> heartbeat_statuses() const {
        std::vector<std::string> out;
        for (const auto& m : broker.on(kHeartbeatTopic)) out.push_back(json::parse(m.payload)["status"].get<std::string>());
        return out;
    }

    StandbyOptions sopts;
    MonitorOptions mopts;
    Clock::time_point t0;

    std::shared_ptr<FakeContainerRuntime> runtime;
    std::shared_ptr<FakeInference> inference;
    FakeFrameProvider frames;
    FakeBroker broker;
    FrameSnapshot snapshot;

    std::unique_ptr<InferenceGate> gate;
    std::unique_ptr<StandbyController> controller;
    std::unique_ptr<EventPublisher> publisher;
    std::unique_ptr<Monitor> monitor;
    std::unique_ptr<ControlApi> api;
};

TEST_F(MonitorTest, StillPrinterIsIdleAndNotAnalyzed) {
    build();
    cycle(1s, solid(40));
    cycle(11s, solid(40));

    EXPECT_EQ(monitor->status(), SystemStatus::Idle);
    EXPECT_EQ(inference->detect_calls, 0);
    EXPECT_NE(snapshot.jpeg(), nullptr);

    auto snap = monitor->snapshot();
    EXPECT_EQ(snap.stats.total_checks, 2u);
    EXPECT_TRUE(snap.last_check_time.has_value());
    EXPECT_FALSE(snap.last_motion_time.has_value());
}

TEST_F(MonitorTest, MotionRunsInference) {
    inference->respond(0.1f);
    build();
    cycle(1s, solid(0));
    cycle(2s, solid(255));

    EXPECT_EQ(inference->detect_calls, 1);
    EXPECT_EQ(monitor->status(), SystemStatus::Ok);
    EXPECT_FLOAT_EQ(monitor->snapshot().detection_confidence, 0.1f);
    EXPECT_TRUE(monitor->snapshot().last_motion_time.has_value());
}

TEST_F(MonitorTest, HighConfidencePublishesFailure) {
    inference->respond(0.85f);
    build();
    cycle(1s, solid(0));
    cycle(2s, solid(255));

    EXPECT_EQ(monitor->status(), SystemStatus::Failure);
    EXPECT_EQ(monitor->snapshot().stats.failed_checks, 1u);
    EXPECT_TRUE(monitor->snapshot().failure_detected);

    auto failures = broker.on(kFailureTopic);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].qos, 2);
    EXPECT_FLOAT_EQ(json::parse(failures[0].payload)["confidence"].get<float>(), 0.85f);
    EXPECT_EQ(heartbeat_statuses().back(), "failure");

    // a lower verdict on the next motion clears it
    inference->respond(0.2f);
    cycle(3s, solid(0));
    EXPECT_EQ(monitor->status(), SystemStatus::Ok);
    EXPECT_EQ(broker.on(kFailureTopic).size(), 1u);
}

TEST_F(MonitorTest, InferenceErrorsNeverFlipToFailure) {
    inference->fail = true;
    build();
    cycle(1s, solid(0));
    cycle(2s, solid(255));
    cycle(3s, solid(0));

    EXPECT_EQ(inference->detect_calls, 2);
    EXPECT_EQ(monitor->status(), SystemStatus::Ok);
    EXPECT_EQ(monitor->snapshot().stats.failed_checks, 0u);
    EXPECT_TRUE(broker.on(kFailureTopic).empty());
}

TEST_F(MonitorTest, MotionStoppingReturnsToIdle) {
    inference->respond(0.1f);
    build();
    cycle(1s, solid(0));
    cycle(2s, solid(255));
    ASSERT_EQ(monitor->status(), SystemStatus::Ok);

    cycle(30s, solid(255));
    EXPECT_EQ(monitor->status(), SystemStatus::Ok);
    cycle(62s, solid(255));
    EXPECT_EQ(monitor->status(), SystemStatus::Idle);
}

TEST_F(MonitorTest, IdleTimeoutEntersStandbyAndStopsInference) {
    build();
    cycle(0s, solid(40));
    for (int s = 10; s <= 290; s += 10) cycle(std::chrono::seconds(s), solid(40));
    EXPECT_EQ(runtime->stop_calls, 0);

    cycle(301s, solid(40));
    ASSERT_TRUE(controller->wait_until_settled(2s));

    EXPECT_EQ(controller->state().mode, StandbyMode::Standby);
    EXPECT_EQ(runtime->stop_calls, 1);
    ASSERT_TRUE(eventually([&] { return monitor->status() == SystemStatus::Standby; }));
    EXPECT_TRUE(eventually([&] {
        auto statuses = heartbeat_statuses();
        return !statuses.empty() && statuses.back() == "standby";
    }));

    cycle(311s, solid(40));
    cycle(321s, solid(40));
    EXPECT_EQ(monitor->status(), SystemStatus::Standby);
    EXPECT_EQ(inference->detect_calls, 0);
    EXPECT_FALSE(monitor->snapshot().ml_api_healthy);
}

TEST_F(MonitorTest, FailedStopRaisesError) {
    runtime->fail_stop = true;
    build();
    cycle(1s, solid(40));

    auto out = api->enable_standby();
    EXPECT_EQ(out.code, OutcomeCode::Failed);
    EXPECT_EQ(controller->state().mode, StandbyMode::Active);
    ASSERT_TRUE(eventually([&] { return monitor->status() == SystemStatus::Error; }));

    auto snap = monitor->snapshot();
    ASSERT_TRUE(snap.error_message.has_value());
    EXPECT_NE(snap.error_message->find("Failed to enter standby"), std::string::npos);

    // the error stays visible on the next cycle
    cycle(11s, solid(40));
    EXPECT_EQ(monitor->status(), SystemStatus::Error);
}

TEST_F(MonitorTest, MotionInStandbyResumesThenAnalyzes) {
    runtime->running = false;
    runtime->op_delay = 50ms;
    inference->respond(0.1f);
    build();
    ASSERT_EQ(controller->state().mode, StandbyMode::Standby);

    cycle(1s, solid(0));
    EXPECT_EQ(monitor->status(), SystemStatus::Standby);

    cycle(2s, solid(255));
    // resume was requested this cycle, so the gate stayed closed
    EXPECT_EQ(inference->detect_calls, 0);
    ASSERT_TRUE(controller->wait_until_settled(2s));
    EXPECT_EQ(controller->state().mode, StandbyMode::Active);
    // motion is still recent, so the printer counts as active again
    ASSERT_TRUE(eventually([&] { return monitor->status() == SystemStatus::Ok; }));

    cycle(3s, solid(0));
    EXPECT_EQ(inference->detect_calls, 1);
    EXPECT_EQ(monitor->status(), SystemStatus::Ok);
}

TEST_F(MonitorTest, RemoteCommandsGoThroughTheController) {
    build();
    broker.subscribe(kControlTopic, 1, [this](const std::string& topic, const std::string& payload) {
        api->handle_remote(topic, payload);
    });
    cycle(1s, solid(40));

    broker.deliver(kControlTopic, R"({"command": "Standby"})");
    ASSERT_TRUE(controller->wait_until_settled(2s));
    EXPECT_EQ(controller->state().mode, StandbyMode::Standby);
    ASSERT_TRUE(eventually([&] { return monitor->status() == SystemStatus::Standby; }));

    broker.deliver(kControlTopic, "{not json");
    broker.deliver(kControlTopic, R"({"command": "reboot"})");
    EXPECT_EQ(controller->state().mode, StandbyMode::Standby);

    broker.deliver(kControlTopic, R"({"command": "ACTIVE"})");
    ASSERT_TRUE(controller->wait_until_settled(2s));
    EXPECT_EQ(controller->state().mode, StandbyMode::Active);
    EXPECT_EQ(runtime->stop_calls, 1);
    EXPECT_EQ(runtime->start_calls, 1);
}

TEST_F(MonitorTest, RemoteResumeThatNeverBecomesReadyReportsError) {
    runtime->running = false;
    inference->ready = false;
    build();
    cycle(1s, solid(40));

    api->handle_remote(kControlTopic, R"({"command": "active"})");
    ASSERT_TRUE(controller->wait_until_settled(2s));

    EXPECT_EQ(controller->state().mode, StandbyMode::Standby);
    EXPECT_EQ(monitor->status(), SystemStatus::Standby);
    ASSERT_TRUE(eventually([&] { return monitor->snapshot().error_message.has_value(); }));
    EXPECT_NE(monitor->snapshot().error_message->find("not ready"), std::string::npos);
}

TEST_F(MonitorTest, StreamLossBeyondGraceIsError) {
    build();
    cycle(1s, solid(40));
    ASSERT_EQ(monitor->status(), SystemStatus::Idle);

    cycle_without_frame(10s);
    EXPECT_EQ(monitor->status(), SystemStatus::Idle);
    cycle_without_frame(41s);
    EXPECT_EQ(monitor->status(), SystemStatus::Error);
    ASSERT_TRUE(monitor->snapshot().error_message.has_value());
    EXPECT_NE(monitor->snapshot().error_message->find("Video stream"), std::string::npos);

    cycle(50s, solid(40));
    EXPECT_EQ(monitor->status(), SystemStatus::Idle);
    EXPECT_FALSE(monitor->snapshot().error_message.has_value());
}

TEST_F(MonitorTest, BrokerOutageBeyondGraceIsError) {
    build();
    cycle(1s, solid(40));
    broker.up = false;
    cycle(10s, solid(40));
    EXPECT_EQ(monitor->status(), SystemStatus::Idle);
    cycle(131s, solid(40));
    EXPECT_EQ(monitor->status(), SystemStatus::Error);

    broker.up = true;
    cycle(141s, solid(40));
    EXPECT_EQ(monitor->status(), SystemStatus::Idle);
}

TEST_F(MonitorTest, StatusChangesArePublished) {
    inference->respond(0.1f);
    build();
    cycle(1s, solid(0));
    cycle(2s, solid(255));
    cycle(3s, solid(255));

    auto statuses = heartbeat_statuses();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0], "idle");
    EXPECT_EQ(statuses[1], "ok");
}
