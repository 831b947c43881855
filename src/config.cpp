#include "printmon/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#include "printmon/errors.hpp"

namespace printmon {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static void env_str(const char* key, std::string& out) {
    if (const char* v = std::getenv(key)) out = v;
}

static void env_int(const char* key, int& out) {
    if (const char* v = std::getenv(key)) out = std::atoi(v);
}

static void env_float(const char* key, float& out) {
    if (const char* v = std::getenv(key)) out = static_cast<float>(std::atof(v));
}

static void env_bool(const char* key, bool& out) {
    if (const char* v = std::getenv(key)) out = lower(v) == "true" || std::strcmp(v, "1") == 0;
}

static void print_usage() {
    std::cout << "Usage: print_monitor [options]\n"
              << "  --rtsp-url <url>          camera stream (RTSP_STREAM_URL)\n"
              << "  --rtsp-timeout <s>        stream open/read timeout\n"
              << "  --stream-retry-min <s>    first reconnect delay\n"
              << "  --stream-retry-max <s>    reconnect delay cap\n"
              << "  --stream-grace <s>        missing frames before status error\n"
              << "  --mqtt-host <host>        broker host, empty disables MQTT\n"
              << "  --mqtt-port <port>\n"
              << "  --mqtt-user <name>  --mqtt-password <pw>  --mqtt-client-id <id>\n"
              << "  --topic-failure <t>  --topic-heartbeat <t>  --topic-control <t>\n"
              << "  --heartbeat-interval <s>  --mqtt-grace <s>\n"
              << "  --check-interval <s>      monitoring cycle period\n"
              << "  --ml-api-url <url>  --ml-api-timeout <s>  --ml-health-interval <s>\n"
              << "  --frame-url <url>         where the ML API fetches frames from\n"
              << "  --threshold <0..1>        failure confidence threshold\n"
              << "  --motion-intensity <n>  --motion-pixels <n>  --motion-blur <k>\n"
              << "  --idle-timeout <s>\n"
              << "  --standby | --no-standby  --standby-timeout <s>\n"
              << "  --container <name>  --docker-socket <path>\n"
              << "  --container-timeout <s>  --container-stop-grace <s>  --container-retry <s>\n"
              << "  --resume-max-wait <s>  --resume-poll <s>\n"
              << "  --host <addr>  --port <port>  --web-root <dir>\n"
              << "  --log-level <level>  --log-file <path>\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    env_str("RTSP_STREAM_URL", cfg.rtsp_url);
    env_int("RTSP_TIMEOUT", cfg.rtsp_timeout_sec);
    env_int("STREAM_RETRY_MIN", cfg.stream_retry_min_sec);
    env_int("STREAM_RETRY_MAX", cfg.stream_retry_max_sec);
    env_int("STREAM_GRACE_SECONDS", cfg.stream_grace_sec);

    env_str("MQTT_BROKER_HOST", cfg.mqtt_host);
    env_int("MQTT_BROKER_PORT", cfg.mqtt_port);
    env_str("MQTT_USERNAME", cfg.mqtt_username);
    env_str("MQTT_PASSWORD", cfg.mqtt_password);
    env_str("MQTT_CLIENT_ID", cfg.mqtt_client_id);
    env_str("MQTT_TOPIC_FAILURE", cfg.topic_failure);
    env_str("MQTT_TOPIC_HEARTBEAT", cfg.topic_heartbeat);
    env_str("MQTT_TOPIC_CONTROL", cfg.topic_control);
    env_int("MQTT_HEARTBEAT_INTERVAL", cfg.heartbeat_interval_sec);
    env_int("MQTT_GRACE_SECONDS", cfg.mqtt_grace_sec);

    env_int("CHECK_INTERVAL_SECONDS", cfg.check_interval_sec);
    env_str("ML_API_URL", cfg.ml_api_url);
    env_int("ML_API_TIMEOUT", cfg.ml_api_timeout_sec);
    env_int("ML_API_HEALTH_INTERVAL", cfg.ml_health_interval_sec);
    env_str("FRAME_URL", cfg.frame_url);
    env_float("DETECTION_THRESHOLD", cfg.detection_threshold);

    env_int("MOTION_INTENSITY_THRESHOLD", cfg.motion_intensity_threshold);
    env_int("MOTION_PIXEL_THRESHOLD", cfg.motion_pixel_threshold);
    env_int("MOTION_BLUR_KERNEL", cfg.motion_blur_kernel);
    env_int("IDLE_TIMEOUT", cfg.idle_timeout_sec);

    env_bool("STANDBY_MODE_ENABLED", cfg.standby_enabled);
    env_int("STANDBY_AUTO_TIMEOUT", cfg.standby_auto_timeout_sec);
    env_str("ML_API_CONTAINER_NAME", cfg.container_name);
    env_str("DOCKER_SOCKET", cfg.docker_socket);
    env_int("CONTAINER_OP_TIMEOUT", cfg.container_op_timeout_sec);
    env_int("CONTAINER_STOP_GRACE", cfg.container_stop_grace_sec);
    env_int("CONTAINER_RETRY_SECONDS", cfg.container_retry_sec);
    env_int("RESUME_MAX_WAIT", cfg.resume_max_wait_sec);
    env_int("RESUME_POLL_INTERVAL", cfg.resume_poll_interval_sec);

    env_str("WEB_HOST", cfg.web_host);
    env_int("WEB_PORT", cfg.web_port);
    env_str("WEB_ROOT", cfg.web_root);

    env_str("LOG_LEVEL", cfg.log_level);
    env_str("LOG_FILE", cfg.log_file);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* next = i + 1 < argc ? argv[i + 1] : nullptr;

        auto take_str = [&](const char* flag, std::string& out) {
            if (!arg_eq(arg, flag) || !next) return false;
            out = next;
            i++;
            return true;
        };
        auto take_int = [&](const char* flag, int& out) {
            if (!arg_eq(arg, flag) || !next) return false;
            out = std::atoi(next);
            i++;
            return true;
        };

        if (take_str("--rtsp-url", cfg.rtsp_url) ||
            take_int("--rtsp-timeout", cfg.rtsp_timeout_sec) ||
            take_int("--stream-retry-min", cfg.stream_retry_min_sec) ||
            take_int("--stream-retry-max", cfg.stream_retry_max_sec) ||
            take_int("--stream-grace", cfg.stream_grace_sec) ||
            take_str("--mqtt-host", cfg.mqtt_host) ||
            take_int("--mqtt-port", cfg.mqtt_port) ||
            take_str("--mqtt-user", cfg.mqtt_username) ||
            take_str("--mqtt-password", cfg.mqtt_password) ||
            take_str("--mqtt-client-id", cfg.mqtt_client_id) ||
            take_str("--topic-failure", cfg.topic_failure) ||
            take_str("--topic-heartbeat", cfg.topic_heartbeat) ||
            take_str("--topic-control", cfg.topic_control) ||
            take_int("--heartbeat-interval", cfg.heartbeat_interval_sec) ||
            take_int("--mqtt-grace", cfg.mqtt_grace_sec) ||
            take_int("--check-interval", cfg.check_interval_sec) ||
            take_str("--ml-api-url", cfg.ml_api_url) ||
            take_int("--ml-api-timeout", cfg.ml_api_timeout_sec) ||
            take_int("--ml-health-interval", cfg.ml_health_interval_sec) ||
            take_str("--frame-url", cfg.frame_url) ||
            take_int("--motion-intensity", cfg.motion_intensity_threshold) ||
            take_int("--motion-pixels", cfg.motion_pixel_threshold) ||
            take_int("--motion-blur", cfg.motion_blur_kernel) ||
            take_int("--idle-timeout", cfg.idle_timeout_sec) ||
            take_int("--standby-timeout", cfg.standby_auto_timeout_sec) ||
            take_str("--container", cfg.container_name) ||
            take_str("--docker-socket", cfg.docker_socket) ||
            take_int("--container-timeout", cfg.container_op_timeout_sec) ||
            take_int("--container-stop-grace", cfg.container_stop_grace_sec) ||
            take_int("--container-retry", cfg.container_retry_sec) ||
            take_int("--resume-max-wait", cfg.resume_max_wait_sec) ||
            take_int("--resume-poll", cfg.resume_poll_interval_sec) ||
            take_str("--host", cfg.web_host) ||
            take_int("--port", cfg.web_port) ||
            take_str("--web-root", cfg.web_root) ||
            take_str("--log-level", cfg.log_level) ||
            take_str("--log-file", cfg.log_file)) {
            continue;
        }

        if (arg_eq(arg, "--threshold") && next) {
            cfg.detection_threshold = static_cast<float>(std::atof(next));
            i++;
        } else if (arg_eq(arg, "--standby")) {
            cfg.standby_enabled = true;
        } else if (arg_eq(arg, "--no-standby")) {
            cfg.standby_enabled = false;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }

    return cfg;
}

std::vector<std::string> config_problems(const AppConfig& cfg) {
    std::vector<std::string> out;
    auto positive = [&](int v, const char* name) {
        if (v <= 0) out.push_back(std::string(name) + " must be > 0");
    };
    auto non_negative = [&](int v, const char* name) {
        if (v < 0) out.push_back(std::string(name) + " must be >= 0");
    };

    if (cfg.rtsp_url.empty()) out.push_back("RTSP_STREAM_URL must not be empty");
    positive(cfg.rtsp_timeout_sec, "RTSP_TIMEOUT");
    positive(cfg.stream_retry_min_sec, "STREAM_RETRY_MIN");
    if (cfg.stream_retry_max_sec < cfg.stream_retry_min_sec) {
        out.push_back("STREAM_RETRY_MAX must be >= STREAM_RETRY_MIN");
    }
    non_negative(cfg.stream_grace_sec, "STREAM_GRACE_SECONDS");

    if (!cfg.mqtt_host.empty()) {
        if (cfg.mqtt_port <= 0 || cfg.mqtt_port > 65535) out.push_back("MQTT_BROKER_PORT must be in 1..65535");
        if (cfg.topic_failure.empty() || cfg.topic_heartbeat.empty() || cfg.topic_control.empty()) {
            out.push_back("MQTT topics must not be empty");
        }
        if (cfg.mqtt_client_id.empty()) out.push_back("MQTT_CLIENT_ID must not be empty");
    }
    positive(cfg.heartbeat_interval_sec, "MQTT_HEARTBEAT_INTERVAL");
    non_negative(cfg.mqtt_grace_sec, "MQTT_GRACE_SECONDS");

    positive(cfg.check_interval_sec, "CHECK_INTERVAL_SECONDS");
    if (cfg.ml_api_url.empty()) out.push_back("ML_API_URL must not be empty");
    positive(cfg.ml_api_timeout_sec, "ML_API_TIMEOUT");
    non_negative(cfg.ml_health_interval_sec, "ML_API_HEALTH_INTERVAL");
    if (!(cfg.detection_threshold >= 0.0f && cfg.detection_threshold <= 1.0f)) {
        out.push_back("DETECTION_THRESHOLD must be within [0, 1]");
    }

    if (cfg.motion_intensity_threshold < 0 || cfg.motion_intensity_threshold > 255) {
        out.push_back("MOTION_INTENSITY_THRESHOLD must be within [0, 255]");
    }
    non_negative(cfg.motion_pixel_threshold, "MOTION_PIXEL_THRESHOLD");
    if (cfg.motion_blur_kernel < 0 || (cfg.motion_blur_kernel > 0 && cfg.motion_blur_kernel % 2 == 0)) {
        out.push_back("MOTION_BLUR_KERNEL must be 0 or an odd positive number");
    }
    positive(cfg.idle_timeout_sec, "IDLE_TIMEOUT");

    non_negative(cfg.standby_auto_timeout_sec, "STANDBY_AUTO_TIMEOUT");
    if (cfg.standby_enabled) {
        if (cfg.container_name.empty()) out.push_back("ML_API_CONTAINER_NAME must not be empty");
        if (cfg.docker_socket.empty()) out.push_back("DOCKER_SOCKET must not be empty");
    }
    positive(cfg.container_op_timeout_sec, "CONTAINER_OP_TIMEOUT");
    non_negative(cfg.container_stop_grace_sec, "CONTAINER_STOP_GRACE");
    non_negative(cfg.container_retry_sec, "CONTAINER_RETRY_SECONDS");
    positive(cfg.resume_max_wait_sec, "RESUME_MAX_WAIT");
    positive(cfg.resume_poll_interval_sec, "RESUME_POLL_INTERVAL");

    if (cfg.web_port <= 0 || cfg.web_port > 65535) out.push_back("WEB_PORT must be in 1..65535");

    static const char* levels[] = {"trace", "debug", "info", "warning", "warn", "error", "critical", "off"};
    const std::string lvl = lower(cfg.log_level);
    if (std::none_of(std::begin(levels), std::end(levels), [&](const char* l) { return lvl == l; })) {
        out.push_back("LOG_LEVEL '" + cfg.log_level + "' is not a known level");
    }
    return out;
}

void validate_config(const AppConfig& cfg) {
    const auto problems = config_problems(cfg);
    if (problems.empty()) return;
    std::ostringstream oss;
    oss << "invalid configuration:";
    for (const auto& p : problems) oss << "\n  - " << p;
    throw ConfigError(oss.str());
}

std::vector<std::string> config_warnings(const AppConfig& cfg) {
    std::vector<std::string> out;
    if (cfg.rtsp_url == AppConfig{}.rtsp_url) {
        out.push_back("RTSP_STREAM_URL is set to default - you need to configure your camera stream");
    }
    if (cfg.mqtt_host == "localhost") {
        out.push_back("MQTT_BROKER_HOST is set to localhost - ensure your MQTT broker is accessible");
    }
    if (cfg.mqtt_host.empty()) {
        out.push_back("MQTT_BROKER_HOST is empty - heartbeats, failure alerts and remote control are off");
    }
    return out;
}

}  // namespace printmon
