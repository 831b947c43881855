#pragma once

#include <chrono>
#include <string>

namespace printmon {

// All calls throw ContainerOpError on failure or timeout.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;
    virtual void start(const std::string& name) = 0;
    virtual void stop(const std::string& name) = 0;
    virtual bool is_running(const std::string& name) = 0;
};

// Docker Engine API over its Unix socket.
class DockerRuntime : public ContainerRuntime {
public:
    DockerRuntime(std::string socket_path, std::chrono::seconds timeout, std::chrono::seconds stop_grace);

    void start(const std::string& name) override;
    void stop(const std::string& name) override;
    bool is_running(const std::string& name) override;

private:
    std::string socket_path_;
    std::chrono::seconds timeout_;
    std::chrono::seconds stop_grace_;
};

}  // namespace printmon
