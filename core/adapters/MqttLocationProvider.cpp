#include "MqttLocationProvider.hpp"
#include "../Errors.hpp"
#include "../JsonCodec.hpp"
#include <iostream>

namespace worktrack::adapters {

MqttLocationProvider::MqttLocationProvider(std::shared_ptr<IMqttClient> mqttClient,
                                           std::shared_ptr<IClock> clock,
                                           MqttTopicConfig topics,
                                           std::chrono::seconds maxFixAge)
    : mqttClient_(std::move(mqttClient))
    , clock_(std::move(clock))
    , topics_(std::move(topics))
    , maxFixAge_(maxFixAge) {
}

void MqttLocationProvider::start() {
    mqttClient_->setMessageCallback([this](const MqttMessage& message) {
        handleMessage(message);
    });
    mqttClient_->subscribe(topics_.transitions(), 1);
    mqttClient_->subscribe(topics_.position(), 0);

    std::cout << "[MQTT] Listening for transitions on " << topics_.transitions() << std::endl;
}

void MqttLocationProvider::registerMonitor(const Site& site) {
    nlohmann::json region;
    region["siteId"] = site.id;
    region["name"] = site.name;
    region["latitude"] = site.latitude;
    region["longitude"] = site.longitude;
    region["radiusMeters"] = site.radiusMeters;

    mqttClient_->publish(topics_.monitor(site.id), region.dump(), 1, true);
}

void MqttLocationProvider::unregisterMonitor(const std::string& siteId) {
    mqttClient_->publish(topics_.monitor(siteId), "", 1, true);
}

void MqttLocationProvider::setTransitionCallback(TransitionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    transitionCallback_ = std::move(callback);
}

std::optional<PositionFix> MqttLocationProvider::fetchCurrentPosition() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lastFix_) {
            auto age = clock_->now() - lastFix_->timestamp;
            if (age <= maxFixAge_) {
                return lastFix_;
            }
        }
    }

    nlohmann::json request;
    request["ts"] = JsonCodec::timestampToJson(clock_->now());
    mqttClient_->publish(topics_.positionRequest(), request.dump(), 1, false);

    std::cout << "[MQTT] No fresh position, requested one from " << topics_.deviceId << std::endl;
    return std::nullopt;
}

void MqttLocationProvider::handleMessage(const MqttMessage& message) {
    if (message.topic == topics_.transitions()) {
        handleTransition(message.payload);
    } else if (message.topic == topics_.position()) {
        handlePosition(message.payload);
    }
}

std::optional<PositionFix> MqttLocationProvider::lastFix() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastFix_;
}

void MqttLocationProvider::handleTransition(const std::string& payload) {
    LocationTransition transition;
    try {
        transition = JsonCodec::parseTransition(payload);
    } catch (const InvalidTransition& e) {
        std::cerr << "[MQTT] Rejected transition payload: " << e.what() << std::endl;
        return;
    }

    TransitionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = transitionCallback_;
    }

    if (!callback) {
        std::cerr << "[MQTT] Transition for " << transition.siteId << " dropped: no handler" << std::endl;
        return;
    }
    callback(transition);
}

void MqttLocationProvider::handlePosition(const std::string& payload) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[MQTT] Malformed position payload: " << e.what() << std::endl;
        return;
    }

    auto fix = JsonCodec::parsePositionFix(json);
    if (!fix) {
        std::cerr << "[MQTT] Position payload without usable fix" << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!lastFix_ || fix->timestamp >= lastFix_->timestamp) {
        lastFix_ = fix;
    }
}

} // namespace worktrack::adapters
