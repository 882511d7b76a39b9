/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 *
 * Used by the desktop daemon to reach the broker that relays geofence
 * transitions and position fixes from the device. Messages published while
 * offline are queued and flushed on reconnect; subscriptions requested while
 * offline are replayed once the connection is up.
 */

#pragma once

#include "../../core/IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace worktrack {

class PahoMqttClient : public IMqttClient {
public:
    /**
     * @brief Construct new Paho MQTT client instance
     * @note Client is not connected after construction - call connect() method
     */
    PahoMqttClient();
    
    /**
     * @brief Destructor - ensures clean disconnection and resource cleanup
     */
    ~PahoMqttClient() override;
    
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;
    
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
    
private:
    /// Maximum number of messages to queue when offline
    static constexpr std::size_t kMaxOfflineQueueSize = 100;
    
    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 30;
    
    struct Subscription {
        std::string topic;
        int qos = 0;
    };
    
    bool createClient(const std::string& serverUri, const std::string& clientId);
    bool startConnect(MQTTAsync_connectOptions& connOpts);
    
    MQTTAsync client_;                    ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};  ///< Current connection state
    
    MessageCallback messageCallback_;     ///< User callback for incoming messages
    ConnectionCallback connectionCallback_; ///< User callback for connection events
    
    std::queue<MqttMessage> offlineQueue_; ///< Queue for messages when offline
    std::vector<Subscription> subscriptions_; ///< Replayed after every (re)connect
    std::mutex queueMutex_;               ///< Protects offlineQueue_ and subscriptions_
    
    /**
     * @brief Static callback for incoming MQTT messages
     * @param context Pointer to PahoMqttClient instance
     * @return 1 to indicate successful message processing
     */
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    
    /**
     * @brief Send all queued messages when connection is restored
     */
    void flushOfflineQueue();
    
    /**
     * @brief Re-issue every recorded subscription
     */
    void restoreSubscriptions();
    
    /**
     * @brief Add message to offline queue when not connected
     * @note Queue drops the oldest message once kMaxOfflineQueueSize is reached
     */
    void queueMessage(const std::string& topic, const std::string& payload, 
                     int qos, bool retained);
    
    bool sendMessage(const std::string& topic, const std::string& payload, int qos, bool retained);
    
    /**
     * @brief Validate certificate files exist and are readable
     * @return true if every configured file is accessible
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace worktrack
