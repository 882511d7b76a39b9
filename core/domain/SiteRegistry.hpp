#pragma once

#include "../IClock.hpp"
#include "../IRng.hpp"
#include "../TrackingConfig.hpp"
#include "../Types.hpp"
#include "../ports/ILocationProvider.hpp"
#include "../ports/ITrackingStore.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace worktrack::domain {

/**
 * @brief Site CRUD with radius bounds and monitor registration
 *
 * Every change to an active site's geometry re-registers its monitor, since
 * the platform keeps its own copy of the region.
 */
class SiteRegistry {
public:
    SiteRegistry(std::shared_ptr<ports::ITrackingStore> store,
                 std::shared_ptr<ports::ILocationProvider> locationProvider,
                 std::shared_ptr<IClock> clock,
                 std::shared_ptr<IRng> rng,
                 const TrackingConfig& config);

    /**
     * @brief Create and start monitoring a site
     * @param radiusMeters Uses the configured default when unset
     * @throws InvalidSiteError on empty name, invalid coordinates or radius out of bounds
     */
    Site createSite(const std::string& name, double latitude, double longitude,
                    std::optional<double> radiusMeters = std::nullopt);

    /// Insert a site with a caller-chosen id, or update it if it exists
    Site defineSite(const Site& site);

    /// @throws InvalidSiteError if the site does not exist or fails validation
    Site updateSite(const Site& site);

    /// @throws InvalidSiteError if the site has an open session
    void deleteSite(const std::string& siteId);

    std::optional<Site> getSite(const std::string& siteId) const;
    std::vector<Site> listSites() const;

    /// Register monitors for every active site, e.g. after startup
    std::size_t registerAll();

    void validate(const Site& site) const;

private:
    void syncMonitor(const Site& site);

    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<ports::ILocationProvider> locationProvider_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IRng> rng_;
    TrackingConfig config_;
};

} // namespace worktrack::domain
