#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "printmon/config.hpp"
#include "printmon/container_runtime.hpp"
#include "printmon/control_api.hpp"
#include "printmon/errors.hpp"
#include "printmon/event_publisher.hpp"
#include "printmon/frame_snapshot.hpp"
#include "printmon/frame_source.hpp"
#include "printmon/heartbeat.hpp"
#include "printmon/inference_client.hpp"
#include "printmon/inference_gate.hpp"
#include "printmon/logging.hpp"
#include "printmon/message_broker.hpp"
#include "printmon/monitor.hpp"
#include "printmon/server_app.hpp"
#include "printmon/standby_controller.hpp"

using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

void log_config(const printmon::AppConfig& cfg) {
    spdlog::info("Starting print monitor");
    spdlog::info("  stream   : {} (timeout {}s)", cfg.rtsp_url, cfg.rtsp_timeout_sec);
    spdlog::info("  mqtt     : {}", cfg.mqtt_host.empty() ? std::string("disabled") : cfg.mqtt_host + ":" + std::to_string(cfg.mqtt_port));
    spdlog::info("  ml api   : {} (frame url {})", cfg.ml_api_url, cfg.frame_url);
    spdlog::info("  check    : every {}s, threshold {:.2f}, idle after {}s", cfg.check_interval_sec,
                 cfg.detection_threshold, cfg.idle_timeout_sec);
    spdlog::info("  motion   : intensity {}, pixels {}, blur {}", cfg.motion_intensity_threshold,
                 cfg.motion_pixel_threshold, cfg.motion_blur_kernel);
    spdlog::info("  standby  : {} (auto after {}s, container {})", cfg.standby_enabled ? "enabled" : "disabled",
                 cfg.standby_auto_timeout_sec, cfg.container_name);
    spdlog::info("  web      : http://{}:{} (root {})", cfg.web_host, cfg.web_port, cfg.web_root);
}

}  // namespace

int main(int argc, char** argv) {
    printmon::AppConfig cfg = printmon::parse_args(argc, argv);
    printmon::init_logging(cfg.log_level, cfg.log_file);

    try {
        printmon::validate_config(cfg);
    } catch (const printmon::ConfigError& e) {
        spdlog::critical("invalid configuration: {}", e.what());
        return 1;
    }
    log_config(cfg);
    for (const auto& w : printmon::config_warnings(cfg)) spdlog::warn("{}", w);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // Messaging
    std::unique_ptr<printmon::MosquittoBroker> broker;
    if (!cfg.mqtt_host.empty()) {
        printmon::MqttOptions mo;
        mo.host = cfg.mqtt_host;
        mo.port = cfg.mqtt_port;
        mo.username = cfg.mqtt_username;
        mo.password = cfg.mqtt_password;
        mo.client_id = cfg.mqtt_client_id;
        broker = std::make_unique<printmon::MosquittoBroker>(mo);
    }
    printmon::EventPublisher publisher(broker.get(), cfg.topic_failure, cfg.topic_heartbeat);

    // Stream
    printmon::ReconnectPolicy policy;
    policy.initial = std::chrono::seconds(cfg.stream_retry_min_sec);
    policy.max = std::chrono::seconds(cfg.stream_retry_max_sec);
    // a read blocked up to the transport timeout must not keep serving the last frame
    policy.max_frame_age = std::chrono::seconds(cfg.rtsp_timeout_sec);
    printmon::FrameSource frames(
        std::make_unique<printmon::CvVideoSource>(cfg.rtsp_url, std::chrono::seconds(cfg.rtsp_timeout_sec)), policy);

    // Inference
    printmon::FrameSnapshot snapshot;
    auto inference = std::make_shared<printmon::HttpInferenceClient>(
        cfg.ml_api_url, cfg.frame_url, std::chrono::seconds(cfg.ml_api_timeout_sec), snapshot);
    printmon::InferenceGate gate(*inference, std::chrono::seconds(cfg.ml_health_interval_sec));

    // Standby
    printmon::StandbyOptions so;
    so.enabled = cfg.standby_enabled;
    so.container_name = cfg.container_name;
    so.auto_timeout = std::chrono::seconds(cfg.standby_auto_timeout_sec);
    so.op_timeout = std::chrono::seconds(cfg.container_op_timeout_sec + cfg.container_stop_grace_sec);
    so.retry_backoff = std::chrono::seconds(cfg.container_retry_sec);
    so.resume_max_wait = std::chrono::seconds(cfg.resume_max_wait_sec);
    so.resume_poll_interval = std::chrono::seconds(cfg.resume_poll_interval_sec);
    auto runtime = std::make_shared<printmon::DockerRuntime>(
        cfg.docker_socket, std::chrono::seconds(cfg.container_op_timeout_sec),
        std::chrono::seconds(cfg.container_stop_grace_sec));
    printmon::StandbyController standby(so, runtime, inference);

    // Engine
    printmon::MonitorOptions mopts;
    mopts.check_interval = std::chrono::seconds(cfg.check_interval_sec);
    mopts.idle_timeout = std::chrono::seconds(cfg.idle_timeout_sec);
    mopts.stream_grace = std::chrono::seconds(cfg.stream_grace_sec);
    mopts.mqtt_grace = std::chrono::seconds(cfg.mqtt_grace_sec);
    mopts.failure_threshold = cfg.detection_threshold;
    mopts.motion.intensity_threshold = cfg.motion_intensity_threshold;
    mopts.motion.pixel_threshold = cfg.motion_pixel_threshold;
    mopts.motion.blur_kernel = cfg.motion_blur_kernel;
    printmon::Monitor monitor(mopts, frames, gate, standby, publisher, broker.get(), snapshot);

    printmon::ControlApi api(standby, monitor);
    printmon::HeartbeatEmitter heartbeat([&monitor] { return monitor.snapshot(); }, publisher,
                                         std::chrono::seconds(cfg.heartbeat_interval_sec));
    printmon::ServerApp server(cfg, api, snapshot);

    try {
        if (broker) {
            if (cfg.standby_enabled) {
                broker->subscribe(cfg.topic_control, 1, [&api](const std::string& topic, const std::string& payload) {
                    api.handle_remote(topic, payload);
                });
            }
            broker->connect();
        }
        frames.start();
        standby.start(printmon::Clock::now());
        monitor.start();
        heartbeat.start();
        server.start();
    } catch (const printmon::MonitorError& e) {
        spdlog::critical("startup failed: {}", e.what());
        server.stop();
        heartbeat.stop();
        monitor.stop();
        standby.stop();
        frames.stop();
        if (broker) broker->disconnect();
        return 1;
    }

    while (!g_stop) std::this_thread::sleep_for(200ms);

    spdlog::info("Shutting down...");
    server.stop();
    heartbeat.stop();
    monitor.stop();
    standby.stop();
    frames.stop();
    if (broker) broker->disconnect();
    spdlog::info("Stopped print monitor");
    return 0;
}
