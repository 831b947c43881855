#pragma once

#include <opencv2/core.hpp>

#include "frame_types.hpp"

namespace printmon {

// Single-channel 8-bit luminance of `image`, optionally Gaussian-blurred
// with an odd `blur_kernel` (0 skips the blur).
cv::Mat to_luma(const cv::Mat& image, int blur_kernel = 0);

// Pixels whose absolute luminance difference is strictly above `intensity_threshold`.
int count_changed_pixels(const cv::Mat& prev_luma, const cv::Mat& curr_luma, int intensity_threshold);

// True when more than `pixel_threshold` pixels changed by more than `intensity_threshold`.
// Frames of different size never count as motion.
bool detect_motion(const cv::Mat& prev, const cv::Mat& curr, int intensity_threshold, int pixel_threshold);

struct MotionOptions {
    int intensity_threshold{30};
    int pixel_threshold{500};
    int blur_kernel{5};
};

class MotionDetector {
public:
    MotionDetector(const MotionOptions& opts, Clock::time_point start);

    // Compares against the previous frame; the first frame never reports motion.
    bool update(const Frame& frame, Clock::time_point now);

    const MotionState& state() const { return state_; }
    int last_changed_pixels() const { return last_changed_; }

    // Forget the previous frame, e.g. after the stream reconnects.
    void reset_reference() { prev_luma_.release(); }

private:
    MotionOptions opts_;
    MotionState state_;
    cv::Mat prev_luma_;
    int last_changed_{0};
};

}  // namespace printmon
