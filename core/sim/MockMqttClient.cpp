#include "MockMqttClient.hpp"
#include <algorithm>

namespace worktrack::sim {

bool MockMqttClient::connect(const std::string& host, std::uint16_t port,
                             const std::string& clientId,
                             const std::string& username,
                             const std::string& password) {
    (void)host;
    (void)port;
    (void)clientId;
    (void)username;
    (void)password;
    setConnected(true);
    return true;
}

bool MockMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const std::string& username,
                                    const std::string& password,
                                    const TlsConfig& tlsConfig) {
    (void)tlsConfig;
    return connect(host, port, clientId, username, password);
}

void MockMqttClient::disconnect() {
    setConnected(false);
}

bool MockMqttClient::isConnected() const {
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    if (!connected_ || failPublish_) {
        return false;
    }

    MqttMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;

    publishedMessages_.push_back(msg);
    return true;
}

bool MockMqttClient::subscribe(const std::string& topic, int qos) {
    (void)qos;
    if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
        subscriptions_.push_back(topic);
    }
    return connected_;
}

bool MockMqttClient::unsubscribe(const std::string& topic) {
    subscriptions_.erase(std::remove(subscriptions_.begin(), subscriptions_.end(), topic),
                         subscriptions_.end());
    return connected_;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::setConnected(bool connected) {
    bool wasConnected = connected_;
    connected_ = connected;

    if (connectionCallback_ && wasConnected != connected) {
        connectionCallback_(connected, connected ? "Connected" : "Disconnected");
    }
}

void MockMqttClient::injectMessage(std::string_view topic, std::string_view payload) {
    MqttMessage msg;
    msg.topic = std::string(topic);
    msg.payload = std::string(payload);

    incomingMessages_.push(msg);
}

void MockMqttClient::processEvents() {
    while (!incomingMessages_.empty()) {
        if (messageCallback_) {
            messageCallback_(incomingMessages_.front());
        }
        incomingMessages_.pop();
    }
}

} // namespace worktrack::sim
