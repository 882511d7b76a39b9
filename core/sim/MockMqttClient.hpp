#pragma once

#include "../IMqttClient.hpp"
#include <queue>
#include <string>
#include <string_view>
#include <vector>

namespace worktrack::sim {

/// In-process IMqttClient that records publications and replays injected messages
class MockMqttClient : public IMqttClient {
public:
    MockMqttClient() = default;
    ~MockMqttClient() override = default;

    bool connect(const std::string& host, std::uint16_t port,
                 const std::string& clientId,
                 const std::string& username,
                 const std::string& password) override;

    bool connectWithTls(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const std::string& username,
                        const std::string& password,
                        const TlsConfig& tlsConfig) override;

    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    // Mock-specific methods for testing
    void setConnected(bool connected);
    void injectMessage(std::string_view topic, std::string_view payload);

    /// Deliver every injected message to the message callback
    void processEvents();

    const std::vector<MqttMessage>& getPublishedMessages() const { return publishedMessages_; }
    void clearPublishedMessages() { publishedMessages_.clear(); }
    const std::vector<std::string>& getSubscriptions() const { return subscriptions_; }

    void setFailPublish(bool fail) { failPublish_ = fail; }

private:
    bool connected_ = false;
    bool failPublish_ = false;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    std::vector<MqttMessage> publishedMessages_;
    std::queue<MqttMessage> incomingMessages_;
    std::vector<std::string> subscriptions_;
};

} // namespace worktrack::sim
