#pragma once

#include "../ports/ILocationProvider.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace worktrack::sim {

/**
 * @brief Scripted location capability
 *
 * fetchCurrentPosition() pops queued results in order; an empty queue
 * behaves like a failed fetch unless a fallback fix is set.
 */
class MockLocationProvider : public ports::ILocationProvider {
public:
    MockLocationProvider() = default;
    ~MockLocationProvider() override = default;

    void registerMonitor(const Site& site) override;
    void unregisterMonitor(const std::string& siteId) override;
    void setTransitionCallback(TransitionCallback callback) override;
    std::optional<PositionFix> fetchCurrentPosition() override;

    // Mock-specific methods for testing
    void pushFix(const PositionFix& fix);
    void pushFailure();
    void setFallbackFix(std::optional<PositionFix> fix);
    void clearScript();

    /// Deliver a transition the way the platform callback would
    void emitTransition(const LocationTransition& transition);

    bool isMonitoring(const std::string& siteId) const;
    std::map<std::string, Site> monitoredSites() const;
    std::size_t fetchCount() const;
    std::size_t registrationCount() const;

private:
    TransitionCallback callback_;
    std::deque<std::optional<PositionFix>> script_;
    std::optional<PositionFix> fallback_;
    std::map<std::string, Site> monitors_;
    std::size_t fetchCount_ = 0;
    std::size_t registrationCount_ = 0;
    mutable std::mutex mutex_;
};

} // namespace worktrack::sim
