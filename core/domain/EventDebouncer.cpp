#include "EventDebouncer.hpp"
#include "../IClock.hpp"
#include <iostream>

namespace worktrack::domain {

EventDebouncer::EventDebouncer(std::shared_ptr<ports::ITrackingStore> store, const TrackingConfig& config)
    : store_(std::move(store))
    , cooldown_(std::chrono::duration_cast<std::chrono::milliseconds>(config.cooldown())) {
}

bool EventDebouncer::admits(const std::string& siteId, Timestamp timestamp) {
    auto last = lastAdmitted(siteId);
    if (!last) {
        return true;
    }

    auto delta = timestamp > *last ? timestamp - *last : *last - timestamp;
    if (delta < cooldown_) {
        std::cout << "[Debouncer] Suppressing transition for " << siteId << " at "
                  << formatIso8601(timestamp) << " (last admitted "
                  << formatIso8601(*last) << ")" << std::endl;
        return false;
    }
    return true;
}

void EventDebouncer::recordAdmitted(const std::string& siteId, Timestamp timestamp) {
    lastAdmitted_[siteId] = timestamp;
}

std::optional<Timestamp> EventDebouncer::lastAdmitted(const std::string& siteId) {
    auto it = lastAdmitted_.find(siteId);
    if (it != lastAdmitted_.end()) {
        return it->second;
    }

    std::optional<Timestamp> recovered;
    if (auto event = store_->lastAdmittedEvent(siteId)) {
        recovered = event->timestamp;
    }
    lastAdmitted_.emplace(siteId, recovered);
    return recovered;
}

void EventDebouncer::reset() {
    lastAdmitted_.clear();
}

} // namespace worktrack::domain
