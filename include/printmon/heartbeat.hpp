#pragma once

#include <chrono>
#include <functional>

#include "event_publisher.hpp"
#include "monitor_snapshot.hpp"

namespace printmon {

// Publishes a state snapshot right after start() and then once per interval.
class HeartbeatEmitter {
public:
    using SnapshotFn = std::function<MonitorSnapshot()>;

    HeartbeatEmitter(SnapshotFn snapshot, EventPublisher& publisher, std::chrono::seconds interval);
    ~HeartbeatEmitter();

    HeartbeatEmitter(const HeartbeatEmitter&) = delete;
    HeartbeatEmitter& operator=(const HeartbeatEmitter&) = delete;

    void start();
    void stop();

    // Builds and publishes one heartbeat; false if it was dropped.
    bool beat();

    unsigned long long sent() const;
    unsigned long long dropped() const;

private:
    struct Impl;
    Impl* d_;
};

}  // namespace printmon
