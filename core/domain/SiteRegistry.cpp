#include "SiteRegistry.hpp"
#include "../Errors.hpp"
#include "../Geo.hpp"
#include <cmath>
#include <iostream>
#include <sstream>

namespace worktrack::domain {

SiteRegistry::SiteRegistry(std::shared_ptr<ports::ITrackingStore> store,
                           std::shared_ptr<ports::ILocationProvider> locationProvider,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<IRng> rng,
                           const TrackingConfig& config)
    : store_(std::move(store))
    , locationProvider_(std::move(locationProvider))
    , clock_(std::move(clock))
    , rng_(std::move(rng))
    , config_(config) {
}

Site SiteRegistry::createSite(const std::string& name, double latitude, double longitude,
                              std::optional<double> radiusMeters) {
    Site site;
    site.id = rng_->uuid();
    site.name = name;
    site.latitude = latitude;
    site.longitude = longitude;
    site.radiusMeters = radiusMeters.value_or(config_.defaultRadiusMeters);
    site.active = true;
    site.createdAt = clock_->now();
    site.updatedAt = site.createdAt;

    validate(site);
    store_->upsertSite(site);
    syncMonitor(site);

    std::cout << "[Sites] Created " << site.name << " (" << site.id << ", radius "
              << site.radiusMeters << "m)" << std::endl;
    return site;
}

Site SiteRegistry::defineSite(const Site& site) {
    if (site.id.empty()) {
        throw InvalidSiteError("site id must not be empty");
    }
    if (store_->getSite(site.id)) {
        return updateSite(site);
    }

    Site created = site;
    created.createdAt = clock_->now();
    created.updatedAt = created.createdAt;

    validate(created);
    store_->upsertSite(created);
    syncMonitor(created);
    return created;
}

Site SiteRegistry::updateSite(const Site& site) {
    auto existing = store_->getSite(site.id);
    if (!existing) {
        throw InvalidSiteError("unknown site '" + site.id + "'");
    }

    Site updated = site;
    updated.createdAt = existing->createdAt;
    updated.updatedAt = clock_->now();

    validate(updated);
    store_->upsertSite(updated);

    locationProvider_->unregisterMonitor(updated.id);
    syncMonitor(updated);

    std::cout << "[Sites] Updated " << updated.name << " (" << updated.id << ")" << std::endl;
    return updated;
}

void SiteRegistry::deleteSite(const std::string& siteId) {
    if (store_->getActiveOrPendingSession(siteId)) {
        throw InvalidSiteError("site '" + siteId + "' has an open session");
    }

    store_->deleteSite(siteId);
    locationProvider_->unregisterMonitor(siteId);

    std::cout << "[Sites] Deleted " << siteId << std::endl;
}

std::optional<Site> SiteRegistry::getSite(const std::string& siteId) const {
    return store_->getSite(siteId);
}

std::vector<Site> SiteRegistry::listSites() const {
    return store_->listSites();
}

std::size_t SiteRegistry::registerAll() {
    std::size_t registered = 0;
    for (const auto& site : store_->listSites()) {
        if (site.active) {
            locationProvider_->registerMonitor(site);
            ++registered;
        }
    }
    std::cout << "[Sites] Monitoring " << registered << " site(s)" << std::endl;
    return registered;
}

void SiteRegistry::validate(const Site& site) const {
    if (site.name.empty()) {
        throw InvalidSiteError("name must not be empty");
    }
    if (!Geo::isValidLatitude(site.latitude) || !Geo::isValidLongitude(site.longitude)) {
        throw InvalidSiteError("coordinates out of range");
    }
    if (!std::isfinite(site.radiusMeters) ||
        site.radiusMeters < config_.minRadiusMeters ||
        site.radiusMeters > config_.maxRadiusMeters) {
        std::ostringstream ss;
        ss << "radius " << site.radiusMeters << "m outside [" << config_.minRadiusMeters
           << ", " << config_.maxRadiusMeters << "]";
        throw InvalidSiteError(ss.str());
    }
}

void SiteRegistry::syncMonitor(const Site& site) {
    if (site.active) {
        locationProvider_->registerMonitor(site);
    } else {
        locationProvider_->unregisterMonitor(site.id);
    }
}

} // namespace worktrack::domain
