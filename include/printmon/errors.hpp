#pragma once

#include <stdexcept>
#include <string>

namespace printmon {

class MonitorError : public std::runtime_error {
public:
    explicit MonitorError(const std::string& what) : std::runtime_error(what) {}
};

// Stream unreachable or dropped.
class TransportError : public MonitorError {
public:
    using MonitorError::MonitorError;
};

// Inference service unreachable, timed out or answered with something unparsable.
class InferenceError : public MonitorError {
public:
    using MonitorError::MonitorError;
};

// Container start/stop/inspect failed or timed out.
class ContainerOpError : public MonitorError {
public:
    using MonitorError::MonitorError;
};

class MessagingError : public MonitorError {
public:
    using MonitorError::MonitorError;
};

class ConfigError : public MonitorError {
public:
    using MonitorError::MonitorError;
};

}  // namespace printmon
