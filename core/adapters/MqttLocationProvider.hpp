/**
 * @file MqttLocationProvider.hpp
 * @brief ILocationProvider fed by a device over an MQTT broker
 *
 * Topics, relative to "<prefix>/<deviceId>":
 * - transitions          inbound geofence enter/exit payloads
 * - position             inbound position fixes
 * - position/request     outbound request for a fresh fix
 * - monitors/<siteId>    outbound retained site geometry (empty clears it)
 *
 * fetchCurrentPosition() cannot block on the device, so it answers with the
 * newest fix that is fresh enough and otherwise asks for a new one and
 * reports failure; the verification scheduler treats that like any other
 * inconclusive sample.
 */

#pragma once

#include "../IClock.hpp"
#include "../IMqttClient.hpp"
#include "../ports/ILocationProvider.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace worktrack::adapters {

struct MqttTopicConfig {
    std::string topicPrefix = "worktrack";
    std::string deviceId = "device";

    std::string base() const { return topicPrefix + "/" + deviceId; }
    std::string transitions() const { return base() + "/transitions"; }
    std::string position() const { return base() + "/position"; }
    std::string positionRequest() const { return base() + "/position/request"; }
    std::string monitor(const std::string& siteId) const { return base() + "/monitors/" + siteId; }
    std::string notifications() const { return base() + "/notifications"; }
};

class MqttLocationProvider : public ports::ILocationProvider {
public:
    MqttLocationProvider(std::shared_ptr<IMqttClient> mqttClient,
                         std::shared_ptr<IClock> clock,
                         MqttTopicConfig topics,
                         std::chrono::seconds maxFixAge = std::chrono::seconds(60));

    /// Install the message callback and subscribe to the inbound topics
    void start();

    void registerMonitor(const Site& site) override;
    void unregisterMonitor(const std::string& siteId) override;
    void setTransitionCallback(TransitionCallback callback) override;
    std::optional<PositionFix> fetchCurrentPosition() override;

    /// Entry point for messages from the broker
    void handleMessage(const MqttMessage& message);

    std::optional<PositionFix> lastFix() const;

private:
    void handleTransition(const std::string& payload);
    void handlePosition(const std::string& payload);

    std::shared_ptr<IMqttClient> mqttClient_;
    std::shared_ptr<IClock> clock_;
    MqttTopicConfig topics_;
    std::chrono::seconds maxFixAge_;

    TransitionCallback transitionCallback_;
    std::optional<PositionFix> lastFix_;
    mutable std::mutex mutex_;
};

} // namespace worktrack::adapters
