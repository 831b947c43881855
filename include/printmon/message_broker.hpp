#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct mosquitto;
struct mosquitto_message;

namespace printmon {

class MessageBroker {
public:
    using Handler = std::function<void(const std::string& topic, const std::string& payload)>;

    virtual ~MessageBroker() = default;

    // False when the message could not be handed to the client (e.g. disconnected).
    virtual bool publish(const std::string& topic, const std::string& payload, int qos) = 0;

    // Kept across reconnects.
    virtual void subscribe(const std::string& topic, int qos, Handler handler) = 0;

    virtual bool connected() const = 0;
};

struct MqttOptions {
    std::string host{"localhost"};
    int port{1883};
    std::string username;
    std::string password;
    std::string client_id{"print-monitor"};
    int keepalive_sec{60};
    unsigned reconnect_min_sec{1};
    unsigned reconnect_max_sec{60};
};

// libmosquitto client with its own network thread; reconnects with exponential backoff.
class MosquittoBroker : public MessageBroker {
public:
    explicit MosquittoBroker(MqttOptions opts);
    ~MosquittoBroker() override;

    // Starts the network loop. Throws MessagingError if the client cannot be set up;
    // an unreachable broker is retried in the background.
    void connect();
    void disconnect();

    bool publish(const std::string& topic, const std::string& payload, int qos) override;
    void subscribe(const std::string& topic, int qos, Handler handler) override;
    bool connected() const override { return connected_; }

private:
    struct Subscription {
        std::string topic;
        int qos{0};
        Handler handler;
    };

    static void on_connect(struct mosquitto* mosq, void* obj, int rc);
    static void on_disconnect(struct mosquitto* mosq, void* obj, int rc);
    static void on_message(struct mosquitto* mosq, void* obj, const struct mosquitto_message* msg);

    MqttOptions opts_;
    struct mosquitto* mosq_{nullptr};
    std::atomic<bool> connected_{false};
    std::atomic<bool> logged_error_{false};
    bool loop_started_{false};

    std::mutex subs_mu_;
    std::vector<Subscription> subs_;
};

}  // namespace printmon
