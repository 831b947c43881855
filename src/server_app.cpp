#include "printmon/server_app.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "printmon/errors.hpp"

namespace printmon {

using nlohmann::json;

int http_status_for(OutcomeCode code) {
    switch (code) {
        case OutcomeCode::Succeeded:
        case OutcomeCode::Already:
            return 200;
        case OutcomeCode::Disabled:
            return 400;
        case OutcomeCode::Busy:
            return 409;
        case OutcomeCode::Failed:
        case OutcomeCode::TimedOut:
            return 500;
    }
    return 500;
}

namespace {

void reply_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void reply_outcome(httplib::Response& res, const TransitionOutcome& out) {
    const int status = http_status_for(out.code);
    if (status == 200) {
        reply_json(res, status, {{"success", true},
                                 {"standby_mode", out.mode == StandbyMode::Standby},
                                 {"message", out.message}});
    } else {
        reply_json(res, status, {{"success", false}, {"error", out.message}});
    }
}

}  // namespace

ServerApp::ServerApp(const AppConfig& cfg, ControlApi& api, FrameSnapshot& snapshot)
    : cfg_(cfg), api_(api), snapshot_(snapshot) {}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::start() {
    if (http_running_) return;
    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();
    if (!http_srv_->bind_to_port(cfg_.web_host, cfg_.web_port)) {
        http_srv_.reset();
        throw MonitorError("cannot bind HTTP server to " + cfg_.web_host + ":" + std::to_string(cfg_.web_port));
    }
    bound_port_ = cfg_.web_port;
    http_running_ = true;
    http_thread_ = std::thread(&ServerApp::run_http, this);
    spdlog::info("[http] listening on http://{}:{}", cfg_.web_host, bound_port_);
}

void ServerApp::stop() {
    if (!http_running_.exchange(false)) return;
    if (http_srv_) http_srv_->stop();
    if (http_thread_.joinable()) http_thread_.join();
    http_srv_.reset();
}

void ServerApp::run_http() {
    if (!http_srv_->listen_after_bind()) {
        spdlog::error("[http] server loop exited unexpectedly");
    }
}

void ServerApp::setup_routes() {
    http_srv_->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        json body = status_json(api_.get_status());
        const std::string preview = snapshot_.preview_base64();
        body["last_frame"] = preview.empty() ? json(nullptr) : json(preview);
        reply_json(res, 200, body);
    });

    http_srv_->Post("/api/standby/enable", [this](const httplib::Request&, httplib::Response& res) {
        reply_outcome(res, api_.enable_standby());
    });

    http_srv_->Post("/api/standby/disable", [this](const httplib::Request&, httplib::Response& res) {
        reply_outcome(res, api_.disable_standby());
    });

    http_srv_->Get("/api/standby/status", [this](const httplib::Request&, httplib::Response& res) {
        const StandbyState st = api_.standby_status();
        reply_json(res, 200, {{"standby_mode", st.mode == StandbyMode::Standby},
                              {"mode", standby_mode_to_string(st.mode)},
                              {"standby_enabled", st.enabled},
                              {"auto_timeout", st.auto_timeout.count()},
                              {"ml_container_running", st.container_running}});
    });

    http_srv_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        const MonitorSnapshot snap = api_.get_status();
        if (snap.status == SystemStatus::Error) {
            reply_json(res, 503, {{"status", "unhealthy"},
                                  {"error", snap.error_message ? json(*snap.error_message) : json(nullptr)}});
            return;
        }
        reply_json(res, 200, {{"status", "healthy"}});
    });

    http_srv_->Get("/latest_frame.jpg", [this](const httplib::Request&, httplib::Response& res) {
        const auto jpeg = snapshot_.jpeg();
        if (!jpeg) {
            res.status = 404;
            res.set_content("no frame available", "text/plain");
            return;
        }
        res.set_content(reinterpret_cast<const char*>(jpeg->data()), jpeg->size(), "image/jpeg");
    });

    http_srv_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        }
        spdlog::error("[http] {} {} failed: {}", req.method, req.path, what);
        reply_json(res, 500, {{"success", false}, {"error", what}});
    });

    serve_static(*http_srv_);
}

void ServerApp::serve_static(httplib::Server& srv) {
    if (!std::filesystem::is_directory(cfg_.web_root)) {
        spdlog::warn("[http] web root {} not found, dashboard disabled", cfg_.web_root);
        return;
    }
    srv.set_mount_point("/", cfg_.web_root);
    srv.set_file_extension_and_mimetype_mapping("js", "application/javascript");
    srv.set_file_extension_and_mimetype_mapping("css", "text/css");
    srv.set_default_headers({{"Cache-Control", "no-store"}});
}

}  // namespace printmon
