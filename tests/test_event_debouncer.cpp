#include <gtest/gtest.h>
#include "../core/IClock.hpp"
#include "../core/adapters/InMemoryTrackingStore.hpp"
#include "../core/domain/EventDebouncer.hpp"
#include <memory>

using namespace worktrack;

namespace {

Timestamp at(const std::string& iso) {
    return *parseIso8601(iso);
}

TransitionEvent storedEvent(const std::string& id, const std::string& siteId, Timestamp when,
                            IgnoreReason reason = IgnoreReason::None) {
    TransitionEvent event;
    event.id = id;
    event.siteId = siteId;
    event.timestamp = when;
    event.ignored = reason != IgnoreReason::None;
    event.ignoreReason = reason;
    return event;
}

} // namespace

class EventDebouncerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::InMemoryTrackingStore>();
        debouncer_ = std::make_unique<domain::EventDebouncer>(store_, config_);
    }

    TrackingConfig config_;
    std::shared_ptr<adapters::InMemoryTrackingStore> store_;
    std::unique_ptr<domain::EventDebouncer> debouncer_;
};

TEST_F(EventDebouncerTest, FirstEventIsAdmitted) {
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T08:00:00Z")));
    EXPECT_FALSE(debouncer_->lastAdmitted("office"));
}

TEST_F(EventDebouncerTest, CooldownIsPerSite) {
    debouncer_->recordAdmitted("office", at("2025-03-03T08:00:00Z"));

    EXPECT_FALSE(debouncer_->admits("office", at("2025-03-03T08:00:09.999Z")));
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T08:00:10Z")));
    EXPECT_TRUE(debouncer_->admits("depot", at("2025-03-03T08:00:01Z")));
}

TEST_F(EventDebouncerTest, OutOfOrderEventsInsideWindowAreSuppressed) {
    debouncer_->recordAdmitted("office", at("2025-03-03T08:00:00Z"));
    EXPECT_FALSE(debouncer_->admits("office", at("2025-03-03T07:59:55Z")));
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T07:59:00Z")));
}

TEST_F(EventDebouncerTest, AdmitsDoesNotMoveTheWindow) {
    debouncer_->recordAdmitted("office", at("2025-03-03T08:00:00Z"));
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T08:00:20Z")));

    // Not recorded, so the window is still anchored at 08:00:00
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T08:00:25Z")));
}

TEST_F(EventDebouncerTest, WindowIsRecoveredFromStore) {
    store_->appendEvent(storedEvent("e1", "office", at("2025-03-03T08:00:00Z")));
    store_->appendEvent(storedEvent("e2", "office", at("2025-03-03T08:00:06Z"), IgnoreReason::Debounced));

    EXPECT_EQ(debouncer_->lastAdmitted("office"), at("2025-03-03T08:00:00Z"));
    EXPECT_FALSE(debouncer_->admits("office", at("2025-03-03T08:00:08Z")));
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T08:00:12Z")));
}

TEST_F(EventDebouncerTest, IgnoredButNotDebouncedEventsCount) {
    store_->appendEvent(storedEvent("e1", "office", at("2025-03-03T08:00:00Z"), IgnoreReason::PoorAccuracy));
    EXPECT_FALSE(debouncer_->admits("office", at("2025-03-03T08:00:05Z")));
}

TEST_F(EventDebouncerTest, ResetReloadsFromStore) {
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T08:00:00Z")));

    store_->appendEvent(storedEvent("e1", "office", at("2025-03-03T08:00:00Z")));
    // Cached negative lookup
    EXPECT_TRUE(debouncer_->admits("office", at("2025-03-03T08:00:01Z")));

    debouncer_->reset();
    EXPECT_FALSE(debouncer_->admits("office", at("2025-03-03T08:00:01Z")));
}

TEST_F(EventDebouncerTest, ZeroCooldownAdmitsEverything) {
    config_.cooldownSeconds = 0;
    domain::EventDebouncer relaxed(store_, config_);

    relaxed.recordAdmitted("office", at("2025-03-03T08:00:00Z"));
    EXPECT_TRUE(relaxed.admits("office", at("2025-03-03T08:00:00Z")));
}
