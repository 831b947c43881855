#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "standby_state.hpp"
#include "status_machine.hpp"

namespace printmon {

// Read-only copy of the engine state for heartbeats and the control API.
struct MonitorSnapshot {
    SystemStatus status{SystemStatus::Starting};
    std::optional<std::string> error_message;
    float detection_confidence{0.0f};
    bool failure_detected{false};
    std::optional<std::chrono::system_clock::time_point> last_check_time;
    std::optional<std::chrono::system_clock::time_point> last_motion_time;

    bool stream_connected{false};
    bool mqtt_connected{false};
    bool ml_api_healthy{false};

    Statistics stats;
    StandbyState standby;
};

std::string iso_timestamp(std::chrono::system_clock::time_point tp);

// Payload published on the heartbeat topic.
nlohmann::json heartbeat_json(const MonitorSnapshot& snap, std::chrono::system_clock::time_point now);

// Body of GET /api/status, without the frame preview.
nlohmann::json status_json(const MonitorSnapshot& snap);

}  // namespace printmon
