#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace worktrack::sim {

/// Manually driven wall clock for tests and replays
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(Timestamp startTime = Timestamp{});
    ~SimulatedClock() override = default;

    Timestamp now() const override;

    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(Timestamp time);

    /// @throws std::invalid_argument on malformed input
    void setCurrentTime(const std::string& iso8601);

private:
    Timestamp simulatedTime_;
    mutable std::mutex mutex_;
};

} // namespace worktrack::sim
