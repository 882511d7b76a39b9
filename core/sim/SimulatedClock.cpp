#include "SimulatedClock.hpp"
#include <stdexcept>

namespace worktrack::sim {

SimulatedClock::SimulatedClock(Timestamp startTime)
    : simulatedTime_(startTime) {
}

Timestamp SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedTime_;
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
}

void SimulatedClock::setCurrentTime(Timestamp time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
}

void SimulatedClock::setCurrentTime(const std::string& iso8601) {
    auto parsed = parseIso8601(iso8601);
    if (!parsed) {
        throw std::invalid_argument("not an ISO 8601 timestamp: " + iso8601);
    }
    setCurrentTime(*parsed);
}

} // namespace worktrack::sim
