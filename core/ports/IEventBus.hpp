#pragma once

#include "../Types.hpp"
#include <functional>
#include <string>

namespace worktrack::ports {

enum class ChangeKind {
    SessionOpened,
    SessionPendingExit,
    SessionResumed,
    SessionCompleted,
    TransitionIgnored
};

inline std::string changeKindToString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::SessionOpened: return "session_opened";
        case ChangeKind::SessionPendingExit: return "session_pending_exit";
        case ChangeKind::SessionResumed: return "session_resumed";
        case ChangeKind::SessionCompleted: return "session_completed";
        case ChangeKind::TransitionIgnored: return "transition_ignored";
    }
    return "session_opened";
}

/// Notification that the tracking timeline changed
struct TrackingChange {
    ChangeKind kind = ChangeKind::SessionOpened;
    std::string siteId;
    std::string sessionId;
    Timestamp at{};
    std::string detail;
};

class IEventBus {
public:
    virtual ~IEventBus() = default;
    
    using Handler = std::function<void(const TrackingChange&)>;
    
    virtual void publish(const TrackingChange& change) = 0;
    virtual void subscribe(ChangeKind kind, Handler handler) = 0;
    virtual void unsubscribe(ChangeKind kind) = 0;
    virtual void processEvents() = 0;
};

} // namespace worktrack::ports
