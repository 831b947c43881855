#include "printmon/control_api.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace printmon {

std::optional<ControlCommand> parse_control_command(const std::string& payload) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("[mqtt] invalid JSON in control message: {}", e.what());
        return std::nullopt;
    }
    if (!j.is_object() || !j.contains("command") || !j["command"].is_string()) {
        spdlog::warn("[mqtt] control message without a command: {}", payload);
        return std::nullopt;
    }

    std::string cmd = j["command"].get<std::string>();
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) { return std::tolower(c); });
    if (cmd == "standby") return ControlCommand::Standby;
    if (cmd == "active") return ControlCommand::Active;

    spdlog::warn("[mqtt] unknown command: {}", cmd);
    return std::nullopt;
}

ControlApi::ControlApi(StandbyController& standby, Monitor& monitor) : standby_(standby), monitor_(monitor) {}

TransitionOutcome ControlApi::enable_standby() {
    return standby_.enable_standby(TriggerSource::Manual);
}

TransitionOutcome ControlApi::disable_standby() {
    return standby_.disable_standby(TriggerSource::Manual);
}

MonitorSnapshot ControlApi::get_status() const {
    return monitor_.snapshot();
}

StandbyState ControlApi::standby_status() const {
    return standby_.state();
}

void ControlApi::handle_remote(const std::string& topic, const std::string& payload) {
    spdlog::info("[mqtt] control message on {}: {}", topic, payload);
    const auto cmd = parse_control_command(payload);
    if (!cmd) return;

    const RequestResult r = *cmd == ControlCommand::Standby ? standby_.request_standby(TriggerSource::Remote)
                                                            : standby_.request_active(TriggerSource::Remote);
    switch (r) {
        case RequestResult::Accepted:
            break;
        case RequestResult::AlreadyInState:
            spdlog::info("[mqtt] already {}", *cmd == ControlCommand::Standby ? "in standby" : "active");
            break;
        case RequestResult::Busy:
            spdlog::info("[mqtt] command ignored, transition in progress");
            break;
        case RequestResult::Disabled:
            spdlog::warn("[mqtt] command ignored, standby mode is disabled");
            break;
    }
}

}  // namespace printmon
