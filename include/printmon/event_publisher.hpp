#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "frame_types.hpp"
#include "message_broker.hpp"
#include "monitor_snapshot.hpp"

namespace printmon {

// Formats and publishes outbound MQTT messages. A null broker turns every
// publish into a no-op.
class EventPublisher {
public:
    EventPublisher(MessageBroker* broker, std::string failure_topic, std::string heartbeat_topic);

    bool publish_failure(float confidence, const std::vector<Detection>& dets,
                         std::chrono::system_clock::time_point when);
    bool publish_heartbeat(const MonitorSnapshot& snap, std::chrono::system_clock::time_point when);

    bool enabled() const { return broker_ != nullptr; }

private:
    MessageBroker* broker_;
    std::string failure_topic_;
    std::string heartbeat_topic_;
};

}  // namespace printmon
