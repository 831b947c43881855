#include "printmon/frame_source.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <spdlog/spdlog.h>

#include "printmon/errors.hpp"

namespace printmon {

CvVideoSource::CvVideoSource(std::string source, std::chrono::milliseconds timeout)
    : source_(std::move(source)), timeout_(timeout) {}

bool CvVideoSource::open() {
    release();
    const int timeout_ms = static_cast<int>(timeout_.count());

    // Allow numeric index or URL
    const bool is_index = !source_.empty() &&
        std::all_of(source_.begin(), source_.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    try {
        if (is_index) {
            cap_.open(std::stoi(source_));
        } else {
            const std::vector<int> params{cv::CAP_PROP_OPEN_TIMEOUT_MSEC, timeout_ms,
                                          cv::CAP_PROP_READ_TIMEOUT_MSEC, timeout_ms};
            cap_.open(source_, cv::CAP_FFMPEG, params);
        }
    } catch (const cv::Exception& e) {
        throw TransportError("open " + source_ + ": " + e.what());
    }
    if (!cap_.isOpened()) return false;

    cap_.set(cv::CAP_PROP_BUFFERSIZE, 1);
    return true;
}

bool CvVideoSource::read(cv::Mat& out) {
    if (!cap_.isOpened()) return false;
    try {
        return cap_.read(out) && !out.empty();
    } catch (const cv::Exception& e) {
        throw TransportError("read " + source_ + ": " + e.what());
    }
}

void CvVideoSource::release() {
    if (cap_.isOpened()) cap_.release();
}

FrameSource::FrameSource(std::unique_ptr<VideoSource> source, ReconnectPolicy policy)
    : source_(std::move(source)), policy_(policy) {}

FrameSource::~FrameSource() {
    stop();
}

void FrameSource::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&FrameSource::run, this);
}

void FrameSource::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mu_);
        if (!running_.exchange(false)) return;
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    connected_ = false;
    slot_.clear();
}

std::optional<Frame> FrameSource::get_frame() {
    if (!connected_) return std::nullopt;
    auto frame = slot_.peek();
    if (!frame) return std::nullopt;
    if (policy_.max_frame_age.count() > 0 && Clock::now() - frame->captured_at > policy_.max_frame_age) {
        return std::nullopt;
    }
    return frame;
}

bool FrameSource::try_open() {
    try {
        return source_->open();
    } catch (const TransportError& e) {
        spdlog::debug("[stream] {}", e.what());
        return false;
    }
}

bool FrameSource::try_read(cv::Mat& out) {
    try {
        return source_->read(out);
    } catch (const TransportError& e) {
        spdlog::debug("[stream] {}", e.what());
        return false;
    }
}

bool FrameSource::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wait_mu_);
    wait_cv_.wait_for(lock, delay, [&] { return !running_.load(); });
    return running_;
}

void FrameSource::run() {
    auto delay = policy_.initial;
    // true while the stream is down and that has already been logged
    bool logged_error = false;

    while (running_) {
        connect_attempts_++;
        if (!try_open()) {
            if (!logged_error) {
                spdlog::error("[stream] cannot open {}; retrying with backoff up to {}s",
                              source_->describe(), policy_.max.count() / 1000);
                logged_error = true;
            } else {
                spdlog::debug("[stream] reconnect attempt {} failed, next in {}ms",
                              connect_attempts_.load(), delay.count());
            }
            if (!wait_backoff(delay)) break;
            delay = policy_.next(delay);
            continue;
        }

        // the connection only counts once it delivers a frame
        bool delivered = false;
        while (running_) {
            // fresh Mat per read so a published frame never shares a buffer with the next decode
            cv::Mat image;
            if (!try_read(image)) break;
            if (!delivered) {
                delivered = true;
                delay = policy_.initial;
                logged_error = false;
                connected_ = true;
                spdlog::info("[stream] connected to {}", source_->describe());
            }
            Frame f;
            f.image = image;
            f.captured_at = Clock::now();
            f.wall_time = std::chrono::system_clock::now();
            slot_.put(std::move(f));
            frames_read_++;
        }

        if (running_) {
            if (delivered) {
                spdlog::warn("[stream] read failed, dropping connection");
                logged_error = true;
            } else if (!logged_error) {
                spdlog::error("[stream] {} opened but delivered no frames; retrying with backoff up to {}s",
                              source_->describe(), policy_.max.count() / 1000);
                logged_error = true;
            } else {
                spdlog::debug("[stream] reconnect attempt {} delivered no frames, next in {}ms",
                              connect_attempts_.load(), delay.count());
            }
        }

        connected_ = false;
        slot_.clear();
        source_->release();
        if (running_ && !wait_backoff(delay)) break;
        delay = policy_.next(delay);
    }

    source_->release();
    spdlog::info("[stream] reader thread stopped");
}

}  // namespace printmon
