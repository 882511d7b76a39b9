#pragma once

#include "MqttLocationProvider.hpp"
#include "../IClock.hpp"
#include "../IMqttClient.hpp"
#include "../ports/INotificationDispatcher.hpp"
#include <memory>

namespace worktrack::adapters {

/// Publishes clock-in/out notifications to "<prefix>/<deviceId>/notifications"
class MqttNotificationDispatcher : public ports::INotificationDispatcher {
public:
    MqttNotificationDispatcher(std::shared_ptr<IMqttClient> mqttClient,
                               std::shared_ptr<IClock> clock,
                               MqttTopicConfig topics);

    void notify(ports::NotificationKind kind, const std::string& siteId, const std::string& summary) override;

private:
    std::shared_ptr<IMqttClient> mqttClient_;
    std::shared_ptr<IClock> clock_;
    MqttTopicConfig topics_;
};

} // namespace worktrack::adapters
