#include "PahoMqttClient.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>

namespace worktrack {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::createClient(const std::string& serverUri, const std::string& clientId) {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
    
    int rc = MQTTAsync_create(&client_, serverUri.c_str(), clientId.c_str(), 
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }
    
    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    return true;
}

bool PahoMqttClient::startConnect(MQTTAsync_connectOptions& connOpts) {
    connOpts.keepAliveInterval = kKeepAliveIntervalSeconds;
    connOpts.cleansession = 1;
    connOpts.connectTimeout = kConnectionTimeoutSeconds;
    connOpts.automaticReconnect = 1;
    connOpts.minRetryInterval = 1;
    connOpts.maxRetryInterval = 60;
    connOpts.onSuccess = onConnected;
    connOpts.onFailure = onConnectFailure;
    connOpts.context = this;
    
    std::cout << "[MQTT] Attempting connection..." << std::endl;
    int rc = MQTTAsync_connect(client_, &connOpts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port, 
                            const std::string& clientId,
                            const std::string& username, 
                            const std::string& password) {
    std::string serverURI = "tcp://" + host + ":" + std::to_string(port);
    std::cout << "[MQTT] Connecting to " << serverURI << " as " << clientId << std::endl;
    
    if (!createClient(serverURI, clientId)) {
        return false;
    }
    
    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    if (!username.empty()) {
        conn_opts.username = username.c_str();
        conn_opts.password = password.c_str();
    }
    
    return startConnect(conn_opts);
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                   const std::string& clientId,
                                   const std::string& username,
                                   const std::string& password,
                                   const TlsConfig& tlsConfig) {
    std::cout << "[MQTT] Connecting with TLS to " << host << ":" << port << std::endl;
    std::cout << "[MQTT] Client ID: " << clientId << std::endl;
    
    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }
    
    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);
    if (!createClient(serverURI, clientId)) {
        return false;
    }
    
    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    
    if (!username.empty()) {
        conn_opts.username = username.c_str();
        conn_opts.password = password.c_str();
    }
    conn_opts.ssl = &ssl_opts;
    
    if (!tlsConfig.certPath.empty()) {
        ssl_opts.keyStore = tlsConfig.certPath.c_str();
    }
    if (!tlsConfig.keyPath.empty()) {
        ssl_opts.privateKey = tlsConfig.keyPath.c_str();
    }
    if (!tlsConfig.caPath.empty()) {
        ssl_opts.trustStore = tlsConfig.caPath.c_str();
    }
    ssl_opts.enableServerCertAuth = tlsConfig.verifyServer ? 1 : 0;
    ssl_opts.verify = tlsConfig.verifyServer ? 1 : 0;
    ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
    
    return startConnect(conn_opts);
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;
        
        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload, 
                           int qos, bool retained) {
    if (!connected_) {
        queueMessage(topic, payload, qos, retained);
        return false;
    }
    return sendMessage(topic, payload, qos, retained);
}

bool PahoMqttClient::sendMessage(const std::string& topic, const std::string& payload,
                                 int qos, bool retained) {
    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    
    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.data()));
    pubmsg.payloadlen = static_cast<int>(payload.length());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;
    
    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                               [&](const Subscription& s) { return s.topic == topic; });
        if (it == subscriptions_.end()) {
            subscriptions_.push_back({topic, qos});
        } else {
            it->qos = qos;
        }
    }
    
    if (!connected_) {
        return false;
    }
    
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                            [&](const Subscription& s) { return s.topic == topic; }),
                             subscriptions_.end());
    }
    
    if (!connected_) {
        return false;
    }
    
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);
    
    if (client->messageCallback_) {
        MqttMessage msg;
        msg.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
        msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
        msg.qos = message->qos;
        msg.retained = message->retained != 0;
        
        try {
            client->messageCallback_(msg);
        } catch (const std::exception& e) {
            std::cerr << "[MQTT] Message handler for " << msg.topic << " failed: " << e.what() << std::endl;
        }
    }
    
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;
    
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    std::cout << "[MQTT] Connected" << std::endl;
    
    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }
    
    client->restoreSubscriptions();
    client->flushOfflineQueue();
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    
    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    std::cerr << "[MQTT] " << reason << std::endl;
    
    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    
    std::string reason = cause ? std::string(cause) : "Connection lost";
    std::cerr << "[MQTT] " << reason << std::endl;
    
    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;
    
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    std::cout << "[MQTT] Disconnected" << std::endl;
}

void PahoMqttClient::flushOfflineQueue() {
    std::queue<MqttMessage> pending;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        std::swap(pending, offlineQueue_);
    }
    
    if (!pending.empty()) {
        std::cout << "[MQTT] Flushing " << pending.size() << " queued message(s)" << std::endl;
    }
    
    while (!pending.empty()) {
        const auto& msg = pending.front();
        publish(msg.topic, msg.payload, msg.qos, msg.retained);
        pending.pop();
    }
}

void PahoMqttClient::restoreSubscriptions() {
    std::vector<Subscription> subscriptions;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        subscriptions = subscriptions_;
    }
    
    for (const auto& subscription : subscriptions) {
        MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
        int rc = MQTTAsync_subscribe(client_, subscription.topic.c_str(), subscription.qos, &opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Subscribe to " << subscription.topic
                      << " failed, error code: " << rc << std::endl;
        }
    }
}

void PahoMqttClient::queueMessage(const std::string& topic, const std::string& payload, 
                                int qos, bool retained) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    
    // Remove oldest message if queue is full (FIFO behavior)
    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        offlineQueue_.pop();
    }
    
    MqttMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;
    
    offlineQueue_.push(msg);
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    const std::pair<const char*, const std::string*> files[] = {
        {"Certificate", &tlsConfig.certPath},
        {"Private key", &tlsConfig.keyPath},
        {"CA", &tlsConfig.caPath},
    };
    
    for (const auto& [label, path] : files) {
        if (path->empty()) {
            continue;
        }
        std::ifstream file(*path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: " << label << " file not found: " << *path << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace worktrack
