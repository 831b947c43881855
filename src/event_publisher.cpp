#include "printmon/event_publisher.hpp"

#include <ctime>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "printmon/inference_client.hpp"

namespace printmon {

using nlohmann::json;

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}

static json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? json(iso_timestamp(*tp)) : json(nullptr);
}

json heartbeat_json(const MonitorSnapshot& snap, std::chrono::system_clock::time_point now) {
    return json{
        {"status", system_status_to_string(snap.status)},
        {"timestamp", iso_timestamp(now)},
        {"mqtt_connected", snap.mqtt_connected},
        {"ml_api_healthy", snap.ml_api_healthy},
        {"stream_connected", snap.stream_connected},
        {"total_checks", snap.stats.total_checks},
        {"failed_checks", snap.stats.failed_checks},
        {"detection_confidence", snap.detection_confidence},
        {"standby_mode", snap.standby.mode == StandbyMode::Standby},
        {"standby_state", standby_mode_to_string(snap.standby.mode)},
        {"standby_enabled", snap.standby.enabled},
        {"ml_container_running", snap.standby.container_running},
        {"error_message", snap.error_message ? json(*snap.error_message) : json(nullptr)},
    };
}

json status_json(const MonitorSnapshot& snap) {
    return json{
        {"current_status", system_status_to_string(snap.status)},
        {"error_message", snap.error_message ? json(*snap.error_message) : json(nullptr)},
        {"failure_detected", snap.failure_detected},
        {"detection_confidence", snap.detection_confidence},
        {"last_check_time", optional_time(snap.last_check_time)},
        {"last_motion_time", optional_time(snap.last_motion_time)},
        {"mqtt_connected", snap.mqtt_connected},
        {"ml_api_healthy", snap.ml_api_healthy},
        {"stream_connected", snap.stream_connected},
        {"total_checks", snap.stats.total_checks},
        {"failed_checks", snap.stats.failed_checks},
        {"standby_mode", snap.standby.mode == StandbyMode::Standby},
        {"standby_state", standby_mode_to_string(snap.standby.mode)},
        {"standby_enabled", snap.standby.enabled},
        {"auto_timeout", snap.standby.auto_timeout.count()},
        {"ml_container_running", snap.standby.container_running},
    };
}

EventPublisher::EventPublisher(MessageBroker* broker, std::string failure_topic, std::string heartbeat_topic)
    : broker_(broker), failure_topic_(std::move(failure_topic)), heartbeat_topic_(std::move(heartbeat_topic)) {}

bool EventPublisher::publish_failure(float confidence, const std::vector<Detection>& dets,
                                     std::chrono::system_clock::time_point when) {
    if (!broker_) return false;
    json msg{
        {"status", "failure"},
        {"confidence", confidence},
        {"timestamp", iso_timestamp(when)},
        {"detections", detections_to_json(dets)},
    };
    return broker_->publish(failure_topic_, msg.dump(), 2);
}

bool EventPublisher::publish_heartbeat(const MonitorSnapshot& snap, std::chrono::system_clock::time_point when) {
    if (!broker_) return false;
    return broker_->publish(heartbeat_topic_, heartbeat_json(snap, when).dump(), 0);
}

}  // namespace printmon
