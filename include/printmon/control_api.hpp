#pragma once

#include <optional>
#include <string>

#include "monitor.hpp"
#include "standby_controller.hpp"

namespace printmon {

enum class ControlCommand { Standby, Active };

// {"command": "standby" | "active"}, case-insensitive. Anything else is
// logged and yields nullopt.
std::optional<ControlCommand> parse_control_command(const std::string& payload);

// Entry points for manual (HTTP) and remote (MQTT) control.
class ControlApi {
public:
    ControlApi(StandbyController& standby, Monitor& monitor);

    // Block until the transition settles.
    TransitionOutcome enable_standby();
    TransitionOutcome disable_standby();

    MonitorSnapshot get_status() const;
    StandbyState standby_status() const;

    // MQTT handler; queues the transition and returns.
    void handle_remote(const std::string& topic, const std::string& payload);

private:
    StandbyController& standby_;
    Monitor& monitor_;
};

}  // namespace printmon
