#pragma once

#include "../Types.hpp"
#include <functional>
#include <optional>
#include <string>

namespace worktrack::ports {

/**
 * @brief Narrow capability over the platform geofencing and positioning APIs
 *
 * Implementations deliver transitions through the callback, possibly from a
 * foreign thread. fetchCurrentPosition() returns nullopt when no usable fix
 * can be obtained; that is an expected outcome, not an error.
 */
class ILocationProvider {
public:
    virtual ~ILocationProvider() = default;

    using TransitionCallback = std::function<void(const LocationTransition&)>;

    virtual void registerMonitor(const Site& site) = 0;
    virtual void unregisterMonitor(const std::string& siteId) = 0;

    virtual void setTransitionCallback(TransitionCallback callback) = 0;

    virtual std::optional<PositionFix> fetchCurrentPosition() = 0;
};

} // namespace worktrack::ports
