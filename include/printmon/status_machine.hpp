#pragma once

#include <optional>
#include <string>

#include "standby_state.hpp"

namespace printmon {

enum class SystemStatus { Starting, Idle, Ok, Failure, Error, Standby };

inline const char* system_status_to_string(SystemStatus s) {
    switch (s) {
        case SystemStatus::Starting: return "starting";
        case SystemStatus::Idle: return "idle";
        case SystemStatus::Ok: return "ok";
        case SystemStatus::Failure: return "failure";
        case SystemStatus::Error: return "error";
        case SystemStatus::Standby: return "standby";
    }
    return "error";
}

struct Statistics {
    unsigned long long total_checks{0};
    unsigned long long failed_checks{0};
};

// Everything the status depends on, sampled once per evaluation.
struct StatusInputs {
    SystemStatus previous{SystemStatus::Starting};
    StandbyMode standby_mode{StandbyMode::Active};
    std::optional<std::string> collaborator_failure;  // stream, broker or container problem
    bool frame_available{true};
    bool printer_active{false};                       // motion seen within the idle timeout
    std::optional<float> confidence;                  // set only when inference ran
    float failure_threshold{0.6f};
};

// Precedence: standby mode, leaving standby, collaborator failure, missing frame
// (hold), idle, inference threshold, held failure, ok.
SystemStatus evaluate_status(const StatusInputs& in);

struct StatusTransition {
    SystemStatus from{SystemStatus::Starting};
    SystemStatus to{SystemStatus::Starting};

    bool changed() const { return from != to; }
};

// Holds the current status and the counters. Not synchronized; the owner locks.
class StatusTracker {
public:
    StatusTransition apply(StatusInputs in);

    SystemStatus current() const { return current_; }
    const Statistics& statistics() const { return stats_; }

private:
    SystemStatus current_{SystemStatus::Starting};
    Statistics stats_;
};

}  // namespace printmon
