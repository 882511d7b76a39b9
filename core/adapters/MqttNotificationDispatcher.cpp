#include "MqttNotificationDispatcher.hpp"
#include "../JsonCodec.hpp"
#include <iostream>

namespace worktrack::adapters {

MqttNotificationDispatcher::MqttNotificationDispatcher(std::shared_ptr<IMqttClient> mqttClient,
                                                       std::shared_ptr<IClock> clock,
                                                       MqttTopicConfig topics)
    : mqttClient_(std::move(mqttClient))
    , clock_(std::move(clock))
    , topics_(std::move(topics)) {
}

void MqttNotificationDispatcher::notify(ports::NotificationKind kind, const std::string& siteId,
                                        const std::string& summary) {
    auto payload = JsonCodec::notificationToJson(ports::notificationKindToString(kind), siteId,
                                                 summary, clock_->now());

    if (!mqttClient_->publish(topics_.notifications(), payload.dump(), 1, false)) {
        std::cerr << "[Notify] " << ports::notificationKindToString(kind) << " for " << siteId
                  << " not delivered yet (queued or failed)" << std::endl;
        return;
    }
    std::cout << "[Notify] " << summary << std::endl;
}

} // namespace worktrack::adapters
