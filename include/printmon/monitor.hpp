#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "event_publisher.hpp"
#include "frame_snapshot.hpp"
#include "frame_source.hpp"
#include "inference_gate.hpp"
#include "message_broker.hpp"
#include "monitor_snapshot.hpp"
#include "motion_detector.hpp"
#include "standby_controller.hpp"
#include "status_machine.hpp"

namespace printmon {

struct MonitorOptions {
    std::chrono::seconds check_interval{10};
    std::chrono::seconds idle_timeout{60};
    std::chrono::seconds stream_grace{30};
    std::chrono::seconds mqtt_grace{120};
    float failure_threshold{0.6f};
    MotionOptions motion;
};

// The monitoring cycle: frame, motion, standby triggers, gated inference,
// status. Collaborators are borrowed and must outlive the monitor; the
// standby controller must be stopped before the monitor is destroyed.
class Monitor {
public:
    Monitor(MonitorOptions opts,
            FrameProvider& frames,
            InferenceGate& gate,
            StandbyController& standby,
            EventPublisher& publisher,
            const MessageBroker* broker,
            FrameSnapshot& snapshot);
    ~Monitor();

    void start();
    void stop();

    // One monitoring cycle. Public so it can be driven with a synthetic clock.
    void run_cycle(Clock::time_point now, std::chrono::system_clock::time_point wall);

    MonitorSnapshot snapshot() const;
    SystemStatus status() const;

private:
    void run();
    void on_mode_change(StandbyMode from, StandbyMode to, TriggerSource source);
    std::optional<std::string> link_failure(Clock::time_point now);
    void apply_locked(const StatusInputs& in, StatusTransition& transition, MonitorSnapshot& out);
    void announce(const StatusTransition& t, const MonitorSnapshot& snap, const std::vector<Detection>& dets,
                  std::chrono::system_clock::time_point wall);

    MonitorOptions opts_;
    FrameProvider& frames_;
    InferenceGate& gate_;
    StandbyController& standby_;
    EventPublisher& publisher_;
    const MessageBroker* broker_;
    FrameSnapshot& snapshot_;

    // touched only by the cycle
    MotionDetector motion_;
    std::optional<Clock::time_point> frame_missing_since_;
    std::optional<Clock::time_point> broker_down_since_;

    mutable std::mutex mu_;
    StatusTracker tracker_;
    StatusInputs last_inputs_;
    std::optional<std::string> link_failure_;
    std::optional<std::string> error_message_;
    float detection_confidence_{0.0f};
    std::optional<std::chrono::system_clock::time_point> last_check_time_;
    std::optional<std::chrono::system_clock::time_point> last_motion_time_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wait_mu_;
    std::condition_variable wait_cv_;
};

}  // namespace printmon
