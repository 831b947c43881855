#include "printmon/frame_snapshot.hpp"

#include <ctime>

#include <openssl/evp.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace printmon {

namespace {
constexpr int kJpegQuality = 95;
constexpr int kPreviewQuality = 70;

std::string local_time_text(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

void stamp(cv::Mat& frame, const std::string& text) {
    // outline pass, then the text
    cv::putText(frame, text, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.8,
                cv::Scalar(0, 0, 0), 3, cv::LINE_AA);
    cv::putText(frame, text, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.8,
                cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
}
}  // namespace

std::string base64_encode(const unsigned char* data, size_t len) {
    if (len == 0) return {};
    // room for the terminating NUL EVP_EncodeBlock appends
    std::vector<unsigned char> buf(4 * ((len + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(buf.data(), data, static_cast<int>(len));
    if (n <= 0) return {};
    return std::string(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
}

void FrameSnapshot::publish(const Frame& frame) {
    if (frame.empty()) return;
    cv::Mat copy = frame.image.clone();
    stamp(copy, local_time_text(frame.wall_time));

    auto buf = std::make_shared<std::vector<unsigned char>>();
    if (!cv::imencode(".jpg", copy, *buf, {cv::IMWRITE_JPEG_QUALITY, kJpegQuality})) {
        spdlog::error("[snapshot] JPEG encoding failed");
        return;
    }

    std::lock_guard<std::mutex> lock(mu_);
    stamped_ = copy;
    jpeg_ = std::move(buf);
    preview_dirty_ = true;
}

FrameSnapshot::Jpeg FrameSnapshot::jpeg() const {
    std::lock_guard<std::mutex> lock(mu_);
    return jpeg_;
}

std::string FrameSnapshot::preview_base64() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (stamped_.empty()) return {};
    if (preview_dirty_) {
        std::vector<unsigned char> buf;
        if (cv::imencode(".jpg", stamped_, buf, {cv::IMWRITE_JPEG_QUALITY, kPreviewQuality})) {
            preview_ = base64_encode(buf.data(), buf.size());
        } else {
            spdlog::error("[snapshot] preview encoding failed");
            preview_.clear();
        }
        preview_dirty_ = false;
    }
    return preview_;
}

}  // namespace printmon
