#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "frame_types.hpp"

namespace printmon {

std::string base64_encode(const unsigned char* data, size_t len);

// Last analyzed frame, stamped with its capture time, for the dashboard and
// for the inference service to fetch.
class FrameSnapshot {
public:
    using Jpeg = std::shared_ptr<const std::vector<unsigned char>>;

    // Copies the frame; the caller's image is left untouched.
    void publish(const Frame& frame);

    // Full-quality JPEG, or null if nothing was published yet.
    Jpeg jpeg() const;

    // Reduced-quality JPEG as base64, empty if nothing was published.
    std::string preview_base64() const;

private:
    mutable std::mutex mu_;
    cv::Mat stamped_;
    Jpeg jpeg_;
    mutable std::string preview_;
    mutable bool preview_dirty_{false};
};

}  // namespace printmon
