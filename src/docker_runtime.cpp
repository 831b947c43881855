#include "printmon/container_runtime.hpp"

#include <sys/socket.h>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "printmon/errors.hpp"

namespace printmon {

namespace {

std::unique_ptr<httplib::Client> unix_client(const std::string& socket_path, std::chrono::seconds timeout) {
    auto cli = std::make_unique<httplib::Client>(socket_path);
    cli->set_address_family(AF_UNIX);
    cli->set_connection_timeout(timeout);
    cli->set_read_timeout(timeout);
    cli->set_write_timeout(timeout);
    return cli;
}

std::string describe(const httplib::Result& res) {
    if (!res) return httplib::to_string(res.error());
    std::string msg = "HTTP " + std::to_string(res->status);
    try {
        auto body = nlohmann::json::parse(res->body);
        if (body.contains("message")) msg += ": " + body["message"].get<std::string>();
    } catch (const nlohmann::json::exception&) {
        if (!res->body.empty()) msg += ": " + res->body;
    }
    return msg;
}

}  // namespace

DockerRuntime::DockerRuntime(std::string socket_path, std::chrono::seconds timeout, std::chrono::seconds stop_grace)
    : socket_path_(std::move(socket_path)), timeout_(timeout), stop_grace_(stop_grace) {}

void DockerRuntime::start(const std::string& name) {
    auto cli = unix_client(socket_path_, timeout_);
    auto res = cli->Post("/containers/" + name + "/start");
    // 304: already running
    if (res && (res->status == 204 || res->status == 304)) return;
    throw ContainerOpError("start " + name + " failed: " + describe(res));
}

void DockerRuntime::stop(const std::string& name) {
    // the daemon waits up to stop_grace before killing, so the read timeout must cover it
    auto cli = unix_client(socket_path_, timeout_ + stop_grace_);
    auto res = cli->Post("/containers/" + name + "/stop?t=" + std::to_string(stop_grace_.count()));
    // 304: already stopped
    if (res && (res->status == 204 || res->status == 304)) return;
    throw ContainerOpError("stop " + name + " failed: " + describe(res));
}

bool DockerRuntime::is_running(const std::string& name) {
    auto cli = unix_client(socket_path_, timeout_);
    auto res = cli->Get("/containers/" + name + "/json");
    if (!res || res->status != 200) {
        throw ContainerOpError("inspect " + name + " failed: " + describe(res));
    }
    try {
        auto doc = nlohmann::json::parse(res->body);
        return doc.at("State").at("Running").get<bool>();
    } catch (const nlohmann::json::exception& e) {
        throw ContainerOpError("inspect " + name + " returned unexpected body: " + e.what());
    }
}

}  // namespace printmon
