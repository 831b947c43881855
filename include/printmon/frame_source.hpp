#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <opencv2/videoio.hpp>

#include "frame_types.hpp"
#include "latest_value.hpp"

namespace printmon {

// One connection to the camera. read() may block for up to the transport timeout.
// Either call may throw TransportError; the reader counts that as a failed attempt.
class VideoSource {
public:
    virtual ~VideoSource() = default;
    virtual bool open() = 0;
    virtual bool read(cv::Mat& out) = 0;
    virtual void release() = 0;
    virtual std::string describe() const = 0;
};

class CvVideoSource : public VideoSource {
public:
    CvVideoSource(std::string source, std::chrono::milliseconds timeout);

    bool open() override;
    bool read(cv::Mat& out) override;
    void release() override;
    std::string describe() const override { return source_; }

private:
    std::string source_;
    std::chrono::milliseconds timeout_;
    cv::VideoCapture cap_;
};

class FrameProvider {
public:
    virtual ~FrameProvider() = default;
    // Newest frame, or nullopt while the stream is down.
    virtual std::optional<Frame> get_frame() = 0;
    virtual bool connected() const = 0;
};

struct ReconnectPolicy {
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max{60000};
    // Frames older than this are treated as unavailable; zero disables the check.
    std::chrono::milliseconds max_frame_age{0};

    std::chrono::milliseconds next(std::chrono::milliseconds current) const {
        auto doubled = current * 2;
        return doubled > max ? max : doubled;
    }
};

// Drains the video source on its own thread and keeps only the latest frame.
class FrameSource : public FrameProvider {
public:
    FrameSource(std::unique_ptr<VideoSource> source, ReconnectPolicy policy);
    ~FrameSource() override;

    void start();
    void stop();

    std::optional<Frame> get_frame() override;
    bool connected() const override { return connected_; }

    unsigned long long frames_read() const { return frames_read_; }
    unsigned connect_attempts() const { return connect_attempts_; }

private:
    void run();
    bool try_open();
    bool try_read(cv::Mat& out);
    bool wait_backoff(std::chrono::milliseconds delay);

    std::unique_ptr<VideoSource> source_;
    ReconnectPolicy policy_;
    LatestValue<Frame> slot_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<unsigned long long> frames_read_{0};
    std::atomic<unsigned> connect_attempts_{0};

    std::mutex wait_mu_;
    std::condition_variable wait_cv_;
};

}  // namespace printmon
