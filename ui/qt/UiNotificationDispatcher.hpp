#pragma once

#include "../../core/ports/INotificationDispatcher.hpp"
#include <functional>
#include <mutex>
#include <string>

namespace worktrack {
namespace qt {

/// Forwards clock-in/out notifications to the window; the sink must not call back into the engine synchronously
class UiNotificationDispatcher : public ports::INotificationDispatcher {
public:
    using Sink = std::function<void(ports::NotificationKind, const std::string&, const std::string&)>;

    void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void notify(ports::NotificationKind kind, const std::string& siteId, const std::string& summary) override {
        Sink sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink = sink_;
        }
        if (sink) {
            sink(kind, siteId, summary);
        }
    }

private:
    Sink sink_;
    std::mutex mutex_;
};

} // namespace qt
} // namespace worktrack
