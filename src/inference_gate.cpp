#include "printmon/inference_gate.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "printmon/errors.hpp"

namespace printmon {

InferenceGate::InferenceGate(InferenceService& service, std::chrono::seconds health_interval)
    : service_(service), health_interval_(health_interval) {}

InferenceResult InferenceGate::maybe_infer(const Frame& frame, const MotionState& motion, StandbyMode mode) {
    InferenceResult result;
    if (mode != StandbyMode::Active) {
        result.decision = GateDecision::SkippedStandby;
        return result;
    }
    if (!motion.has_motion) {
        result.decision = GateDecision::SkippedNoMotion;
        return result;
    }

    try {
        result.detections = service_.detect(frame);
    } catch (const InferenceError& e) {
        spdlog::warn("[inference] analysis skipped: {}", e.what());
        result.decision = GateDecision::SkippedError;
        result.error = e.what();
        return result;
    }

    result.decision = GateDecision::Ran;
    auto best = std::max_element(result.detections.begin(), result.detections.end(),
                                 [](const Detection& a, const Detection& b) { return a.confidence < b.confidence; });
    if (best != result.detections.end()) result.detection = *best;
    return result;
}

bool InferenceGate::refresh_health(StandbyMode mode, Clock::time_point now) {
    if (mode != StandbyMode::Active) {
        healthy_ = false;
        last_probe_.reset();
        return false;
    }
    if (last_probe_ && now - *last_probe_ < health_interval_) return healthy_;

    last_probe_ = now;
    const bool ok = service_.healthy();
    if (ok != healthy_) {
        spdlog::info("[inference] ML API is {}", ok ? "healthy" : "unhealthy");
    }
    healthy_ = ok;
    return ok;
}

}  // namespace printmon
