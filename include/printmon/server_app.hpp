#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "config.hpp"
#include "control_api.hpp"
#include "frame_snapshot.hpp"

namespace printmon {

// HTTP status for a synchronous control call.
int http_status_for(OutcomeCode code);

// Dashboard, control API and frame endpoint on one cpp-httplib server.
class ServerApp {
public:
    ServerApp(const AppConfig& cfg, ControlApi& api, FrameSnapshot& snapshot);
    ~ServerApp();

    // Binds and serves on a background thread. Throws MonitorError if the port cannot be bound.
    void start();
    void stop();

    int port() const { return bound_port_; }

private:
    void run_http();
    void setup_routes();
    void serve_static(httplib::Server& srv);

    AppConfig cfg_;
    ControlApi& api_;
    FrameSnapshot& snapshot_;

    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
    int bound_port_{0};
};

}  // namespace printmon
