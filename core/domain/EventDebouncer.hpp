#pragma once

#include "../TrackingConfig.hpp"
#include "../ports/ITrackingStore.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace worktrack::domain {

/**
 * @brief Per-site cooldown between admitted transitions
 *
 * The last admitted timestamp of a site is loaded from the store the first
 * time the site is seen, so the window survives process restarts. The
 * in-memory value only advances through recordAdmitted(), which callers
 * invoke after the event has been persisted.
 */
class EventDebouncer {
public:
    EventDebouncer(std::shared_ptr<ports::ITrackingStore> store, const TrackingConfig& config);

    /// True if the event is outside the cooldown of the last admitted event
    bool admits(const std::string& siteId, Timestamp timestamp);

    void recordAdmitted(const std::string& siteId, Timestamp timestamp);

    std::optional<Timestamp> lastAdmitted(const std::string& siteId);

    /// Drop cached state so the next lookup goes back to the store
    void reset();

private:
    std::shared_ptr<ports::ITrackingStore> store_;
    std::chrono::milliseconds cooldown_;

    // nullopt marks a site whose store lookup found nothing
    std::unordered_map<std::string, std::optional<Timestamp>> lastAdmitted_;
};

} // namespace worktrack::domain
