#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "frame_types.hpp"
#include "inference_client.hpp"
#include "standby_state.hpp"

namespace printmon {

enum class GateDecision { Ran, SkippedStandby, SkippedNoMotion, SkippedError };

struct InferenceResult {
    GateDecision decision{GateDecision::SkippedNoMotion};
    Detection detection;               // highest-confidence entry, valid when ran()
    std::vector<Detection> detections;
    std::string error;

    bool ran() const { return decision == GateDecision::Ran; }
};

class InferenceGate {
public:
    InferenceGate(InferenceService& service, std::chrono::seconds health_interval);

    // Calls the service only while standby mode is active and the frame pair showed motion.
    // Service errors come back as SkippedError, never as a detection.
    InferenceResult maybe_infer(const Frame& frame, const MotionState& motion, StandbyMode mode);

    // Probes the health endpoint at most once per interval while active;
    // any other mode means the container is (being) stopped.
    bool refresh_health(StandbyMode mode, Clock::time_point now);

    bool healthy() const { return healthy_; }

private:
    InferenceService& service_;
    std::chrono::seconds health_interval_;
    std::optional<Clock::time_point> last_probe_;
    std::atomic<bool> healthy_{false};
};

}  // namespace printmon
