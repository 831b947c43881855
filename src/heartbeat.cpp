#include "printmon/heartbeat.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <spdlog/spdlog.h>

namespace printmon {

struct HeartbeatEmitter::Impl {
    SnapshotFn snapshot;
    EventPublisher& publisher;
    std::chrono::seconds interval;

    std::atomic<bool> running{false};
    std::atomic<unsigned long long> sent{0};
    std::atomic<unsigned long long> dropped{0};
    std::atomic<bool> was_dropping{false};
    std::thread th;
    std::mutex mu;
    std::condition_variable cv;

    Impl(SnapshotFn fn, EventPublisher& pub, std::chrono::seconds iv)
        : snapshot(std::move(fn)), publisher(pub), interval(iv) {}

    bool beat() {
        const MonitorSnapshot snap = snapshot();
        if (publisher.publish_heartbeat(snap, std::chrono::system_clock::now())) {
            sent++;
            if (was_dropping) spdlog::info("[heartbeat] publishing again");
            was_dropping = false;
            spdlog::debug("[heartbeat] status={} standby={}", system_status_to_string(snap.status),
                          standby_mode_to_string(snap.standby.mode));
            return true;
        }
        dropped++;
        if (!was_dropping && publisher.enabled()) spdlog::warn("[heartbeat] dropped, broker not connected");
        was_dropping = true;
        return false;
    }

    void loop() {
        while (running) {
            try {
                beat();
            } catch (const std::exception& e) {
                spdlog::error("[heartbeat] failed: {}", e.what());
            }
            std::unique_lock<std::mutex> lock(mu);
            cv.wait_for(lock, interval, [&] { return !running; });
        }
    }
};

HeartbeatEmitter::HeartbeatEmitter(SnapshotFn snapshot, EventPublisher& publisher, std::chrono::seconds interval)
    : d_(new Impl(std::move(snapshot), publisher, interval)) {}

HeartbeatEmitter::~HeartbeatEmitter() {
    stop();
    delete d_;
}

void HeartbeatEmitter::start() {
    if (d_->running.exchange(true)) return;
    spdlog::info("[heartbeat] every {}s", d_->interval.count());
    d_->th = std::thread([this] { d_->loop(); });
}

void HeartbeatEmitter::stop() {
    {
        std::lock_guard<std::mutex> lock(d_->mu);
        if (!d_->running.exchange(false)) return;
    }
    d_->cv.notify_all();
    if (d_->th.joinable()) d_->th.join();
}

bool HeartbeatEmitter::beat() {
    return d_->beat();
}

unsigned long long HeartbeatEmitter::sent() const {
    return d_->sent;
}

unsigned long long HeartbeatEmitter::dropped() const {
    return d_->dropped;
}

}  // namespace printmon
