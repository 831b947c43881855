#include "printmon/monitor.hpp"

#include <spdlog/spdlog.h>

namespace printmon {

namespace {

std::optional<std::string> join_failures(const std::optional<std::string>& a, const std::optional<std::string>& b) {
    if (a && b) return *a + "; " + *b;
    if (a) return a;
    return b;
}

long long whole_seconds(Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

}  // namespace

Monitor::Monitor(MonitorOptions opts,
                 FrameProvider& frames,
                 InferenceGate& gate,
                 StandbyController& standby,
                 EventPublisher& publisher,
                 const MessageBroker* broker,
                 FrameSnapshot& snapshot)
    : opts_(opts),
      frames_(frames),
      gate_(gate),
      standby_(standby),
      publisher_(publisher),
      broker_(broker),
      snapshot_(snapshot),
      motion_(opts.motion, Clock::now()) {
    last_inputs_.failure_threshold = opts_.failure_threshold;
    standby_.add_listener([this](StandbyMode from, StandbyMode to, TriggerSource source) {
        on_mode_change(from, to, source);
    });
}

Monitor::~Monitor() {
    stop();
}

void Monitor::start() {
    if (running_.exchange(true)) return;
    spdlog::info("[monitor] checking every {}s, idle after {}s, failure threshold {:.2f}",
                 opts_.check_interval.count(), opts_.idle_timeout.count(), opts_.failure_threshold);
    worker_ = std::thread(&Monitor::run, this);
}

void Monitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mu_);
        if (!running_.exchange(false)) return;
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void Monitor::run() {
    while (running_) {
        try {
            run_cycle(Clock::now(), std::chrono::system_clock::now());
        } catch (const std::exception& e) {
            spdlog::error("[monitor] cycle failed: {}", e.what());
        }
        std::unique_lock<std::mutex> lock(wait_mu_);
        wait_cv_.wait_for(lock, opts_.check_interval, [&] { return !running_; });
    }
}

void Monitor::run_cycle(Clock::time_point now, std::chrono::system_clock::time_point wall) {
    auto frame = frames_.get_frame();
    const bool have_frame = frame && !frame->empty();
    if (!have_frame) {
        if (!frame_missing_since_) {
            spdlog::warn("[monitor] no frame available");
            frame_missing_since_ = now;
            motion_.reset_reference();
        }
    } else if (frame_missing_since_) {
        spdlog::info("[monitor] frames available again after {}s", whole_seconds(now - *frame_missing_since_));
        frame_missing_since_.reset();
    }

    MotionState motion = motion_.state();
    if (have_frame) {
        motion_.update(*frame, now);
        motion = motion_.state();
    } else {
        motion.has_motion = false;
    }

    standby_.on_cycle(motion, now);
    const StandbyState standby = standby_.state();

    std::optional<float> confidence;
    std::vector<Detection> detections;
    if (have_frame) {
        // a standby entered from here on waits for this request before stopping the container
        const auto lease = standby_.hold_active();
        InferenceResult result = gate_.maybe_infer(*frame, motion, lease.mode());
        if (result.ran()) {
            confidence = result.detection.confidence;
            detections = std::move(result.detections);
            spdlog::debug("[monitor] {} detections, max confidence {:.3f}", detections.size(), *confidence);
        }
        // the service was not asked, so nothing refreshed the snapshot yet
        if (result.decision == GateDecision::SkippedStandby || result.decision == GateDecision::SkippedNoMotion) {
            snapshot_.publish(*frame);
        }
    }
    gate_.refresh_health(standby.mode, now);

    const auto link = link_failure(now);
    const auto container = standby_.last_error();

    StatusInputs in;
    in.standby_mode = standby.mode;
    in.collaborator_failure = join_failures(link, container);
    in.frame_available = have_frame;
    in.printer_active = motion.ever_moved && motion.idle_duration(now) < opts_.idle_timeout;
    in.confidence = confidence;
    in.failure_threshold = opts_.failure_threshold;

    StatusTransition transition;
    MonitorSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mu_);
        // a transition may have settled since the cycle sampled the mode
        in.standby_mode = standby_.state().mode;
        link_failure_ = link;
        last_check_time_ = wall;
        if (motion.has_motion) last_motion_time_ = wall;
        if (confidence) detection_confidence_ = *confidence;
        apply_locked(in, transition, snap);
    }
    announce(transition, snap, detections, wall);
}

std::optional<std::string> Monitor::link_failure(Clock::time_point now) {
    std::optional<std::string> stream;
    if (frame_missing_since_ && now - *frame_missing_since_ >= opts_.stream_grace) {
        stream = "Video stream unavailable for " + std::to_string(whole_seconds(now - *frame_missing_since_)) + "s";
    }

    std::optional<std::string> messaging;
    if (broker_) {
        if (broker_->connected()) {
            broker_down_since_.reset();
        } else {
            if (!broker_down_since_) broker_down_since_ = now;
            if (now - *broker_down_since_ >= opts_.mqtt_grace) {
                messaging = "MQTT broker unreachable for " + std::to_string(whole_seconds(now - *broker_down_since_)) + "s";
            }
        }
    }
    return join_failures(stream, messaging);
}

void Monitor::on_mode_change(StandbyMode from, StandbyMode to, TriggerSource source) {
    // transitional modes leave the status alone until they settle
    if (to == StandbyMode::Entering || to == StandbyMode::Resuming) return;

    const auto container = standby_.last_error();
    const auto wall = std::chrono::system_clock::now();
    StatusTransition transition;
    MonitorSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mu_);
        StatusInputs in = last_inputs_;
        in.standby_mode = to;
        in.collaborator_failure = join_failures(link_failure_, container);
        in.confidence.reset();
        apply_locked(in, transition, snap);
    }
    spdlog::debug("[monitor] standby {} -> {} ({}) re-evaluated status", standby_mode_to_string(from),
                  standby_mode_to_string(to), trigger_source_to_string(source));
    announce(transition, snap, {}, wall);
}

void Monitor::apply_locked(const StatusInputs& in, StatusTransition& transition, MonitorSnapshot& out) {
    transition = tracker_.apply(in);
    last_inputs_ = in;
    error_message_ = in.collaborator_failure;

    out.status = tracker_.current();
    out.error_message = error_message_;
    out.detection_confidence = detection_confidence_;
    out.failure_detected = out.status == SystemStatus::Failure;
    out.last_check_time = last_check_time_;
    out.last_motion_time = last_motion_time_;
    out.stats = tracker_.statistics();
}

void Monitor::announce(const StatusTransition& t, const MonitorSnapshot& partial, const std::vector<Detection>& dets,
                       std::chrono::system_clock::time_point wall) {
    if (!t.changed()) return;

    MonitorSnapshot snap = partial;
    snap.standby = standby_.state();
    snap.stream_connected = frames_.connected();
    snap.mqtt_connected = broker_ && broker_->connected();
    snap.ml_api_healthy = gate_.healthy();

    if (t.to == SystemStatus::Error) {
        spdlog::error("[monitor] status {} -> error: {}", system_status_to_string(t.from),
                      snap.error_message.value_or("unknown"));
    } else {
        spdlog::info("[monitor] status {} -> {}", system_status_to_string(t.from), system_status_to_string(t.to));
    }

    if (t.to == SystemStatus::Failure) {
        spdlog::warn("[monitor] print failure detected (confidence {:.2f})", snap.detection_confidence);
        if (!publisher_.publish_failure(snap.detection_confidence, dets, wall) && publisher_.enabled()) {
            spdlog::error("[monitor] failure notification could not be published");
        }
    }
    if (!publisher_.publish_heartbeat(snap, wall) && publisher_.enabled()) {
        spdlog::debug("[monitor] status update dropped, broker not connected");
    }
}

MonitorSnapshot Monitor::snapshot() const {
    MonitorSnapshot snap;
    snap.standby = standby_.state();
    snap.stream_connected = frames_.connected();
    snap.mqtt_connected = broker_ && broker_->connected();
    snap.ml_api_healthy = gate_.healthy();

    std::lock_guard<std::mutex> lock(mu_);
    snap.status = tracker_.current();
    snap.error_message = error_message_;
    snap.detection_confidence = detection_confidence_;
    snap.failure_detected = snap.status == SystemStatus::Failure;
    snap.last_check_time = last_check_time_;
    snap.last_motion_time = last_motion_time_;
    snap.stats = tracker_.statistics();
    return snap;
}

SystemStatus Monitor::status() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tracker_.current();
}

}  // namespace printmon
