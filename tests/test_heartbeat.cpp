#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "fakes.hpp"
#include "printmon/event_publisher.hpp"
#include "printmon/heartbeat.hpp"

using namespace printmon;
using namespace printmon::fakes;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

MonitorSnapshot sample() {
    MonitorSnapshot s;
    s.status = SystemStatus::Standby;
    s.detection_confidence = 0.25f;
    s.stream_connected = true;
    s.mqtt_connected = true;
    s.ml_api_healthy = false;
    s.stats.total_checks = 42;
    s.stats.failed_checks = 3;
    s.standby.mode = StandbyMode::Standby;
    s.standby.enabled = true;
    s.standby.container_running = false;
    return s;
}

}  // namespace

TEST(HeartbeatJson, CarriesStatusStandbyAndHealth) {
    const auto now = std::chrono::system_clock::time_point{} + 86400s;
    json j = heartbeat_json(sample(), now);

    EXPECT_EQ(j["status"], "standby");
    EXPECT_EQ(j["timestamp"], "1970-01-02T00:00:00Z");
    EXPECT_EQ(j["total_checks"], 42);
    EXPECT_EQ(j["failed_checks"], 3);
    EXPECT_EQ(j["standby_mode"], true);
    EXPECT_EQ(j["standby_state"], "standby");
    EXPECT_EQ(j["standby_enabled"], true);
    EXPECT_EQ(j["ml_container_running"], false);
    EXPECT_EQ(j["stream_connected"], true);
    EXPECT_EQ(j["mqtt_connected"], true);
    EXPECT_EQ(j["ml_api_healthy"], false);
    EXPECT_TRUE(j["error_message"].is_null());
}

TEST(StatusJson, IncludesErrorAndTimes) {
    MonitorSnapshot s = sample();
    s.status = SystemStatus::Error;
    s.error_message = "Video stream unavailable for 31s";
    s.last_check_time = std::chrono::system_clock::time_point{};
    json j = status_json(s);

    EXPECT_EQ(j["current_status"], "error");
    EXPECT_EQ(j["error_message"], "Video stream unavailable for 31s");
    EXPECT_EQ(j["last_check_time"], "1970-01-01T00:00:00Z");
    EXPECT_TRUE(j["last_motion_time"].is_null());
    EXPECT_EQ(j["auto_timeout"], 300);
}

TEST(EventPublisher, FailureGoesOutAtQos2) {
    FakeBroker broker;
    EventPublisher pub(&broker, "printer/failure", "printer/heartbeat");
    std::vector<Detection> dets{{"failure", 0.85f, cv::Rect(512, 384, 128, 96)}};

    ASSERT_TRUE(pub.publish_failure(0.85f, dets, std::chrono::system_clock::now()));
    auto msgs = broker.on("printer/failure");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].qos, 2);

    json j = json::parse(msgs[0].payload);
    EXPECT_EQ(j["status"], "failure");
    EXPECT_FLOAT_EQ(j["confidence"].get<float>(), 0.85f);
    EXPECT_EQ(j["detections"][0][2], json::array({512, 384, 128, 96}));
}

TEST(EventPublisher, WithoutBrokerEverythingIsDropped) {
    EventPublisher pub(nullptr, "a", "b");
    EXPECT_FALSE(pub.enabled());
    EXPECT_FALSE(pub.publish_failure(0.9f, {}, std::chrono::system_clock::now()));
    EXPECT_FALSE(pub.publish_heartbeat(sample(), std::chrono::system_clock::now()));
}

TEST(HeartbeatEmitter, PublishesSnapshotsAtQos0) {
    FakeBroker broker;
    EventPublisher pub(&broker, "printer/failure", "printer/heartbeat");
    HeartbeatEmitter hb([] { return sample(); }, pub, 3600s);

    hb.start();
    ASSERT_TRUE(eventually([&] { return hb.sent() >= 1; }));
    hb.stop();

    auto msgs = broker.on("printer/heartbeat");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].qos, 0);
    EXPECT_EQ(json::parse(msgs[0].payload)["status"], "standby");
}

TEST(HeartbeatEmitter, DropsWhileBrokerIsDown) {
    FakeBroker broker;
    broker.up = false;
    EventPublisher pub(&broker, "f", "h");
    HeartbeatEmitter hb([] { return sample(); }, pub, 3600s);

    EXPECT_FALSE(hb.beat());
    EXPECT_FALSE(hb.beat());
    EXPECT_EQ(hb.dropped(), 2u);

    broker.up = true;
    EXPECT_TRUE(hb.beat());
    EXPECT_EQ(hb.sent(), 1u);
}
