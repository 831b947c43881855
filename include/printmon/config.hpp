#pragma once

#include <string>
#include <vector>

namespace printmon {

struct AppConfig {
    // Stream
    std::string rtsp_url{"rtsp://localhost:8554/stream"};
    int rtsp_timeout_sec{10};
    int stream_retry_min_sec{1};
    int stream_retry_max_sec{60};
    int stream_grace_sec{30};           // frames missing this long -> status error

    // MQTT
    std::string mqtt_host{"localhost"};  // empty disables messaging
    int mqtt_port{1883};
    std::string mqtt_username{};
    std::string mqtt_password{};
    std::string mqtt_client_id{"print-monitor"};
    std::string topic_failure{"printer/mk4s/failure"};
    std::string topic_heartbeat{"printer/mk4s/heartbeat"};
    std::string topic_control{"printer/mk4s/control"};
    int heartbeat_interval_sec{30};
    int mqtt_grace_sec{120};

    // Detection
    int check_interval_sec{10};
    std::string ml_api_url{"http://ml_api:3333"};
    int ml_api_timeout_sec{15};
    int ml_health_interval_sec{30};
    std::string frame_url{"http://print-monitor:8080/latest_frame.jpg"};
    float detection_threshold{0.6f};

    // Motion
    int motion_intensity_threshold{30};
    int motion_pixel_threshold{500};
    int motion_blur_kernel{5};          // 0 disables the blur
    int idle_timeout_sec{60};

    // Standby
    bool standby_enabled{true};
    int standby_auto_timeout_sec{300};  // 0 disables auto-standby
    std::string container_name{"ml_api"};
    std::string docker_socket{"/var/run/docker.sock"};
    int container_op_timeout_sec{30};
    int container_stop_grace_sec{10};
    int container_retry_sec{60};
    int resume_max_wait_sec{60};
    int resume_poll_interval_sec{1};

    // HTTP
    std::string web_host{"0.0.0.0"};
    int web_port{8080};
    std::string web_root{"./public"};

    // Logging
    std::string log_level{"info"};
    std::string log_file{};
};

// Defaults, then environment, then command line.
AppConfig parse_args(int argc, char** argv);

// Empty when the config is usable.
std::vector<std::string> config_problems(const AppConfig& cfg);

// Throws ConfigError naming every problem found.
void validate_config(const AppConfig& cfg);

// Non-fatal hints such as placeholder defaults still in place.
std::vector<std::string> config_warnings(const AppConfig& cfg);

}  // namespace printmon
