#pragma once

#include <string>

namespace worktrack::ports {

enum class NotificationKind {
    ClockedIn,
    ClockedOut
};

inline std::string notificationKindToString(NotificationKind kind) {
    return kind == NotificationKind::ClockedIn ? "clocked_in" : "clocked_out";
}

/// Fire-and-forget user notifications; failures never affect session state
class INotificationDispatcher {
public:
    virtual ~INotificationDispatcher() = default;

    virtual void notify(NotificationKind kind, const std::string& siteId, const std::string& summary) = 0;
};

} // namespace worktrack::ports
