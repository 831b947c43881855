#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace printmon {

using Clock = std::chrono::steady_clock;

struct Frame {
    cv::Mat image;               // BGR, never written after capture
    Clock::time_point captured_at{};
    std::chrono::system_clock::time_point wall_time{};

    bool empty() const { return image.empty(); }
};

struct Detection {
    std::string label;
    float confidence{0.0f};              // 0..1
    std::optional<cv::Rect> bbox;        // x, y, w, h as reported by the service
};

// Highest confidence among the detections, 0 for an empty list.
inline float max_confidence(const std::vector<Detection>& dets) {
    float best = 0.0f;
    for (const auto& d : dets) {
        if (d.confidence > best) best = d.confidence;
    }
    return best;
}

struct MotionState {
    bool has_motion{false};
    Clock::time_point last_motion_at{};
    bool ever_moved{false};

    Clock::duration idle_duration(Clock::time_point now) const {
        return now > last_motion_at ? now - last_motion_at : Clock::duration::zero();
    }
};

}  // namespace printmon
