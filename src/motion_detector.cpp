#include "printmon/motion_detector.hpp"

#include <algorithm>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace printmon {

cv::Mat to_luma(const cv::Mat& image, int blur_kernel) {
    cv::Mat gray;
    switch (image.channels()) {
        case 3: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
        default: gray = image.clone(); break;
    }
    if (gray.depth() != CV_8U) gray.convertTo(gray, CV_8U);
    if (blur_kernel > 1) {
        cv::GaussianBlur(gray, gray, cv::Size(blur_kernel, blur_kernel), 0);
    }
    return gray;
}

int count_changed_pixels(const cv::Mat& prev_luma, const cv::Mat& curr_luma, int intensity_threshold) {
    cv::Mat diff;
    cv::absdiff(prev_luma, curr_luma, diff);
    cv::Mat changed = diff > std::max(intensity_threshold, 0);
    return cv::countNonZero(changed);
}

bool detect_motion(const cv::Mat& prev, const cv::Mat& curr, int intensity_threshold, int pixel_threshold) {
    if (prev.empty() || curr.empty() || prev.size() != curr.size()) return false;
    const int changed = count_changed_pixels(to_luma(prev), to_luma(curr), intensity_threshold);
    return changed > 0 && changed > pixel_threshold;
}

MotionDetector::MotionDetector(const MotionOptions& opts, Clock::time_point start) : opts_(opts) {
    state_.last_motion_at = start;
}

bool MotionDetector::update(const Frame& frame, Clock::time_point now) {
    cv::Mat luma = to_luma(frame.image, opts_.blur_kernel);

    bool motion = false;
    last_changed_ = 0;
    if (!prev_luma_.empty() && prev_luma_.size() == luma.size()) {
        last_changed_ = count_changed_pixels(prev_luma_, luma, opts_.intensity_threshold);
        motion = last_changed_ > 0 && last_changed_ > opts_.pixel_threshold;
        spdlog::debug("[motion] {} changed pixels (threshold: {})", last_changed_, opts_.pixel_threshold);
    }
    prev_luma_ = luma;

    state_.has_motion = motion;
    if (motion) {
        state_.last_motion_at = now;
        state_.ever_moved = true;
    }
    return motion;
}

}  // namespace printmon
