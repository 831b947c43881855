#pragma once

#include <chrono>
#include <string>

#include "frame_types.hpp"

namespace printmon {

enum class StandbyMode { Active, Entering, Standby, Resuming };

inline const char* standby_mode_to_string(StandbyMode mode) {
    switch (mode) {
        case StandbyMode::Active: return "active";
        case StandbyMode::Entering: return "entering";
        case StandbyMode::Standby: return "standby";
        case StandbyMode::Resuming: return "resuming";
    }
    return "active";
}

struct StandbyState {
    StandbyMode mode{StandbyMode::Active};
    bool enabled{true};
    std::chrono::seconds auto_timeout{300};
    bool container_running{true};          // mirror of the runtime, may lag a transition
    Clock::time_point last_activity_at{};
};

}  // namespace printmon
