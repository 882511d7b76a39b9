#pragma once

#include "../ports/INotificationDispatcher.hpp"
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace worktrack::sim {

struct SentNotification {
    ports::NotificationKind kind;
    std::string siteId;
    std::string summary;
};

class MockNotificationDispatcher : public ports::INotificationDispatcher {
public:
    void notify(ports::NotificationKind kind, const std::string& siteId, const std::string& summary) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            throw std::runtime_error("notification channel unavailable");
        }
        sent_.push_back({kind, siteId, summary});
    }

    std::vector<SentNotification> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::size_t count(ports::NotificationKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& notification : sent_) {
            if (notification.kind == kind) ++n;
        }
        return n;
    }

    void setFail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

private:
    std::vector<SentNotification> sent_;
    bool fail_ = false;
    mutable std::mutex mutex_;
};

} // namespace worktrack::sim
