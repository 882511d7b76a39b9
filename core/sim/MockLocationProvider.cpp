#include "MockLocationProvider.hpp"

namespace worktrack::sim {

void MockLocationProvider::registerMonitor(const Site& site) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitors_[site.id] = site;
    ++registrationCount_;
}

void MockLocationProvider::unregisterMonitor(const std::string& siteId) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitors_.erase(siteId);
}

void MockLocationProvider::setTransitionCallback(TransitionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

std::optional<PositionFix> MockLocationProvider::fetchCurrentPosition() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetchCount_;

    if (script_.empty()) {
        return fallback_;
    }
    auto result = script_.front();
    script_.pop_front();
    return result;
}

void MockLocationProvider::pushFix(const PositionFix& fix) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(fix);
}

void MockLocationProvider::pushFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(std::nullopt);
}

void MockLocationProvider::setFallbackFix(std::optional<PositionFix> fix) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallback_ = fix;
}

void MockLocationProvider::clearScript() {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.clear();
}

void MockLocationProvider::emitTransition(const LocationTransition& transition) {
    TransitionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    if (callback) {
        callback(transition);
    }
}

bool MockLocationProvider::isMonitoring(const std::string& siteId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitors_.count(siteId) > 0;
}

std::map<std::string, Site> MockLocationProvider::monitoredSites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitors_;
}

std::size_t MockLocationProvider::fetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchCount_;
}

std::size_t MockLocationProvider::registrationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrationCount_;
}

} // namespace worktrack::sim
