#include "printmon/status_machine.hpp"

namespace printmon {

SystemStatus evaluate_status(const StatusInputs& in) {
    if (in.standby_mode == StandbyMode::Standby) return SystemStatus::Standby;
    if (in.previous == SystemStatus::Standby) return SystemStatus::Idle;
    if (in.collaborator_failure) return SystemStatus::Error;

    if (!in.frame_available) {
        return in.previous == SystemStatus::Error ? SystemStatus::Idle : in.previous;
    }
    if (!in.printer_active) return SystemStatus::Idle;

    if (in.confidence) {
        return *in.confidence >= in.failure_threshold ? SystemStatus::Failure : SystemStatus::Ok;
    }
    if (in.previous == SystemStatus::Failure) return SystemStatus::Failure;
    return SystemStatus::Ok;
}

StatusTransition StatusTracker::apply(StatusInputs in) {
    in.previous = current_;
    StatusTransition t{current_, evaluate_status(in)};

    stats_.total_checks++;
    if (t.to == SystemStatus::Failure && t.from != SystemStatus::Failure) stats_.failed_checks++;
    current_ = t.to;
    return t;
}

}  // namespace printmon
