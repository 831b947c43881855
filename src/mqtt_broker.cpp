#include "printmon/message_broker.hpp"

#include <mosquitto.h>
#include <spdlog/spdlog.h>

#include "printmon/errors.hpp"

namespace printmon {

MosquittoBroker::MosquittoBroker(MqttOptions opts) : opts_(std::move(opts)) {
    mosquitto_lib_init();
}

MosquittoBroker::~MosquittoBroker() {
    disconnect();
    if (mosq_) mosquitto_destroy(mosq_);
    mosquitto_lib_cleanup();
}

void MosquittoBroker::connect() {
    if (mosq_) return;
    mosq_ = mosquitto_new(opts_.client_id.c_str(), true, this);
    if (!mosq_) throw MessagingError("cannot create MQTT client " + opts_.client_id);

    if (!opts_.username.empty() && !opts_.password.empty()) {
        mosquitto_username_pw_set(mosq_, opts_.username.c_str(), opts_.password.c_str());
    }
    mosquitto_connect_callback_set(mosq_, &MosquittoBroker::on_connect);
    mosquitto_disconnect_callback_set(mosq_, &MosquittoBroker::on_disconnect);
    mosquitto_message_callback_set(mosq_, &MosquittoBroker::on_message);
    mosquitto_reconnect_delay_set(mosq_, opts_.reconnect_min_sec, opts_.reconnect_max_sec, true);

    int rc = mosquitto_connect_async(mosq_, opts_.host.c_str(), opts_.port, opts_.keepalive_sec);
    if (rc != MOSQ_ERR_SUCCESS) {
        // the loop thread keeps retrying
        spdlog::error("[mqtt] cannot reach broker {}:{} ({}); check MQTT_BROKER_HOST and MQTT_BROKER_PORT",
                      opts_.host, opts_.port, mosquitto_strerror(rc));
        logged_error_ = true;
    }

    rc = mosquitto_loop_start(mosq_);
    if (rc != MOSQ_ERR_SUCCESS) {
        throw MessagingError(std::string("cannot start MQTT network loop: ") + mosquitto_strerror(rc));
    }
    loop_started_ = true;
}

void MosquittoBroker::disconnect() {
    if (!mosq_ || !loop_started_) return;
    mosquitto_disconnect(mosq_);
    mosquitto_loop_stop(mosq_, true);
    loop_started_ = false;
    connected_ = false;
}

bool MosquittoBroker::publish(const std::string& topic, const std::string& payload, int qos) {
    if (!mosq_ || !connected_) {
        spdlog::debug("[mqtt] cannot publish to {}: not connected", topic);
        return false;
    }
    const int rc = mosquitto_publish(mosq_, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                     payload.data(), qos, false);
    if (rc != MOSQ_ERR_SUCCESS) {
        spdlog::error("[mqtt] failed to publish to {}: {}", topic, mosquitto_strerror(rc));
        return false;
    }
    spdlog::debug("[mqtt] published to {}: {}", topic, payload);
    return true;
}

void MosquittoBroker::subscribe(const std::string& topic, int qos, Handler handler) {
    {
        std::lock_guard<std::mutex> lock(subs_mu_);
        subs_.push_back({topic, qos, std::move(handler)});
    }
    if (mosq_ && connected_) {
        const int rc = mosquitto_subscribe(mosq_, nullptr, topic.c_str(), qos);
        if (rc != MOSQ_ERR_SUCCESS) {
            spdlog::error("[mqtt] subscribe to {} failed: {}", topic, mosquitto_strerror(rc));
        }
    }
}

void MosquittoBroker::on_connect(struct mosquitto* mosq, void* obj, int rc) {
    auto* self = static_cast<MosquittoBroker*>(obj);
    if (rc != 0) {
        if (!self->logged_error_.exchange(true)) {
            spdlog::error("[mqtt] connection refused by {}:{}: {}", self->opts_.host, self->opts_.port,
                          mosquitto_connack_string(rc));
        }
        self->connected_ = false;
        return;
    }

    spdlog::info("[mqtt] connected to broker {}:{}", self->opts_.host, self->opts_.port);
    self->connected_ = true;
    self->logged_error_ = false;

    std::lock_guard<std::mutex> lock(self->subs_mu_);
    for (const auto& s : self->subs_) {
        const int src = mosquitto_subscribe(mosq, nullptr, s.topic.c_str(), s.qos);
        if (src == MOSQ_ERR_SUCCESS) {
            spdlog::info("[mqtt] subscribed to {}", s.topic);
        } else {
            spdlog::error("[mqtt] subscribe to {} failed: {}", s.topic, mosquitto_strerror(src));
        }
    }
}

void MosquittoBroker::on_disconnect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MosquittoBroker*>(obj);
    self->connected_ = false;
    if (rc != 0) spdlog::warn("[mqtt] disconnected from broker (code {}), reconnecting", rc);
}

void MosquittoBroker::on_message(struct mosquitto*, void* obj, const struct mosquitto_message* msg) {
    auto* self = static_cast<MosquittoBroker*>(obj);
    const std::string topic = msg->topic ? msg->topic : "";
    const std::string payload = msg->payloadlen > 0
        ? std::string(static_cast<const char*>(msg->payload), static_cast<size_t>(msg->payloadlen))
        : std::string();

    std::vector<Handler> matched;
    {
        std::lock_guard<std::mutex> lock(self->subs_mu_);
        for (const auto& s : self->subs_) {
            bool match = false;
            if (mosquitto_topic_matches_sub(s.topic.c_str(), topic.c_str(), &match) == MOSQ_ERR_SUCCESS && match) {
                matched.push_back(s.handler);
            }
        }
    }
    for (auto& h : matched) h(topic, payload);
}

}  // namespace printmon
