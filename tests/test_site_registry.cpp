#include <gtest/gtest.h>
#include "../core/Errors.hpp"
#include "../core/adapters/InMemoryTrackingStore.hpp"
#include "../core/domain/SiteRegistry.hpp"
#include "../core/sim/MockLocationProvider.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace worktrack;

class SiteRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::InMemoryTrackingStore>();
        provider_ = std::make_shared<sim::MockLocationProvider>();
        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->setCurrentTime("2025-04-01T09:00:00Z");
        registry_ = std::make_unique<domain::SiteRegistry>(store_, provider_, clock_,
                                                           std::make_shared<StandardRng>(7u), config_);
    }

    TrackingConfig config_;
    std::shared_ptr<adapters::InMemoryTrackingStore> store_;
    std::shared_ptr<sim::MockLocationProvider> provider_;
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<domain::SiteRegistry> registry_;
};

TEST_F(SiteRegistryTest, CreateSiteStoresAndMonitors) {
    auto site = registry_->createSite("Warehouse", 40.7128, -74.0060, 300.0);

    EXPECT_EQ(site.id.size(), 36u);
    EXPECT_EQ(site.name, "Warehouse");
    EXPECT_DOUBLE_EQ(site.radiusMeters, 300.0);
    EXPECT_TRUE(site.active);
    EXPECT_EQ(site.createdAt, *parseIso8601("2025-04-01T09:00:00Z"));

    ASSERT_TRUE(registry_->getSite(site.id));
    EXPECT_TRUE(provider_->isMonitoring(site.id));
}

TEST_F(SiteRegistryTest, DefaultRadiusWhenUnset) {
    auto site = registry_->createSite("Client HQ", 40.0, -74.0);
    EXPECT_DOUBLE_EQ(site.radiusMeters, config_.defaultRadiusMeters);
}

TEST_F(SiteRegistryTest, RejectsOutOfBoundsSites) {
    EXPECT_THROW(registry_->createSite("", 40.0, -74.0), InvalidSiteError);
    EXPECT_THROW(registry_->createSite("Tiny", 40.0, -74.0, 50.0), InvalidSiteError);
    EXPECT_THROW(registry_->createSite("Huge", 40.0, -74.0, 1500.0), InvalidSiteError);
    EXPECT_THROW(registry_->createSite("Nowhere", 95.0, -74.0), InvalidSiteError);
    EXPECT_THROW(registry_->createSite("Nowhere", 40.0, 181.0), InvalidSiteError);

    EXPECT_TRUE(registry_->listSites().empty());
    EXPECT_EQ(provider_->registrationCount(), 0u);
}

TEST_F(SiteRegistryTest, RadiusBoundsAreInclusive) {
    EXPECT_NO_THROW(registry_->createSite("Min", 40.0, -74.0, 100.0));
    EXPECT_NO_THROW(registry_->createSite("Max", 40.0, -74.0, 1000.0));
}

TEST_F(SiteRegistryTest, UpdateReRegistersMonitor) {
    auto site = registry_->createSite("Office", 40.0, -74.0, 200.0);

    clock_->advance(std::chrono::minutes(5));
    site.radiusMeters = 400.0;
    auto updated = registry_->updateSite(site);

    EXPECT_DOUBLE_EQ(updated.radiusMeters, 400.0);
    EXPECT_EQ(updated.createdAt, site.createdAt);
    EXPECT_GT(updated.updatedAt, site.createdAt);
    EXPECT_DOUBLE_EQ(provider_->monitoredSites().at(site.id).radiusMeters, 400.0);
}

TEST_F(SiteRegistryTest, DeactivatingStopsMonitoring) {
    auto site = registry_->createSite("Office", 40.0, -74.0);

    site.active = false;
    registry_->updateSite(site);

    EXPECT_FALSE(provider_->isMonitoring(site.id));
    EXPECT_EQ(registry_->registerAll(), 0u);
}

TEST_F(SiteRegistryTest, UpdateUnknownSiteFails) {
    Site ghost;
    ghost.id = "ghost";
    ghost.name = "Ghost";
    EXPECT_THROW(registry_->updateSite(ghost), InvalidSiteError);
}

TEST_F(SiteRegistryTest, DefineSiteKeepsCallerId) {
    Site site;
    site.id = "depot-7";
    site.name = "Depot 7";
    site.latitude = 35.0;
    site.longitude = 139.0;
    site.radiusMeters = 250.0;

    auto defined = registry_->defineSite(site);
    EXPECT_EQ(defined.id, "depot-7");

    site.name = "Depot Seven";
    auto redefined = registry_->defineSite(site);
    EXPECT_EQ(redefined.name, "Depot Seven");
    EXPECT_EQ(registry_->listSites().size(), 1u);

    site.id.clear();
    EXPECT_THROW(registry_->defineSite(site), InvalidSiteError);
}

TEST_F(SiteRegistryTest, DeleteRefusedWhileSessionOpen) {
    auto site = registry_->createSite("Office", 40.0, -74.0);

    TrackingSession session;
    session.id = "open-1";
    session.siteId = site.id;
    session.clockIn = clock_->now();
    store_->createSession(session);

    EXPECT_THROW(registry_->deleteSite(site.id), InvalidSiteError);
    EXPECT_TRUE(registry_->getSite(site.id));
    EXPECT_TRUE(provider_->isMonitoring(site.id));
}

TEST_F(SiteRegistryTest, DeleteRemovesSiteAndMonitor) {
    auto site = registry_->createSite("Office", 40.0, -74.0);

    registry_->deleteSite(site.id);

    EXPECT_FALSE(registry_->getSite(site.id));
    EXPECT_FALSE(provider_->isMonitoring(site.id));
}

TEST_F(SiteRegistryTest, RegisterAllCoversActiveSites) {
    registry_->createSite("A", 1.0, 1.0);
    registry_->createSite("B", 2.0, 2.0);
    auto c = registry_->createSite("C", 3.0, 3.0);
    c.active = false;
    registry_->updateSite(c);

    EXPECT_EQ(registry_->registerAll(), 2u);
}
