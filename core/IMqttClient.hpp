/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface used by the broker-backed adapters
 *
 * The location capability and the notification channel both run over MQTT
 * when the engine is deployed next to a broker. This interface keeps the
 * adapters independent of the concrete client library.
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace worktrack {

/**
 * @brief MQTT message structure for both directions
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g., "worktrack/phone-1/transitions")
    std::string payload;            ///< Message payload (JSON)
    int qos = 0;                   ///< Quality of Service level (0, 1, or 2)
    bool retained = false;         ///< Retain flag for persistent messages
};

/**
 * @brief TLS settings for broker connections
 *
 * certPath/keyPath are optional; when empty only the server is
 * authenticated. Files must be PEM encoded.
 */
struct TlsConfig {
    std::string certPath;          ///< Path to client certificate file (.pem)
    std::string keyPath;           ///< Path to private key file (.pem)
    std::string caPath;            ///< Path to root CA certificate file (.pem)
    bool verifyServer = true;      ///< Enable server certificate validation
};

/**
 * @brief Platform-independent MQTT client interface
 * @note Callbacks may be invoked from the client library's own thread
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    using MessageCallback = std::function<void(const MqttMessage&)>;
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Connect over plain TCP with optional username/password
     * @return true if connection initiated successfully, false otherwise
     * @note Asynchronous - use the connection callback for the outcome
     */
    virtual bool connect(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const std::string& username,
                        const std::string& password) = 0;

    /**
     * @brief Connect over TLS
     * @return true if connection initiated successfully, false otherwise
     * @note Asynchronous - use the connection callback for the outcome
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                               const std::string& clientId,
                               const std::string& username,
                               const std::string& password,
                               const TlsConfig& tlsConfig) = 0;

    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @return true if handed to the broker, false if queued or failed
     * @note Message may be queued if not currently connected
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos = 0, bool retained = false) = 0;

    /**
     * @brief Subscribe to MQTT topic
     * @note Subscriptions requested while offline are applied on connect
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;

    virtual bool unsubscribe(const std::string& topic) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;

    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace worktrack
