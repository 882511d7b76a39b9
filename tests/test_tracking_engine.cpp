#include <gtest/gtest.h>
#include "../core/Errors.hpp"
#include "../core/adapters/InMemoryTrackingStore.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/domain/TrackingEngine.hpp"
#include "../core/sim/MockLocationProvider.hpp"
#include "../core/sim/MockNotificationDispatcher.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <map>
#include <memory>

using namespace worktrack;

namespace {

Timestamp T(const std::string& hhmmss) {
    return *parseIso8601("2025-03-03T" + hhmmss + "Z");
}

const Coordinates kSiteCenter{-26.2041, 28.0473};
const Coordinates kFarAway{-26.2141, 28.0473};   // roughly 1.1 km south

} // namespace

class TrackingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(T("07:00:00"));
        store_ = std::make_shared<adapters::InMemoryTrackingStore>();
        provider_ = std::make_shared<sim::MockLocationProvider>();
        notifications_ = std::make_shared<sim::MockNotificationDispatcher>();
        rng_ = std::make_shared<StandardRng>(42u);
        eventBus_ = std::make_shared<domain::EventBus>();

        Site site;
        site.id = "office";
        site.name = "Head Office";
        site.latitude = kSiteCenter.latitude;
        site.longitude = kSiteCenter.longitude;
        site.radiusMeters = 150.0;
        store_->upsertSite(site);

        engine_ = makeEngine();
    }

    std::unique_ptr<domain::TrackingEngine> makeEngine() {
        return std::make_unique<domain::TrackingEngine>(store_, provider_, notifications_, clock_, rng_,
                                                        config_, eventBus_);
    }

    domain::TransitionOutcome enter(const std::string& time, std::optional<double> accuracy = 10.0) {
        clock_->setCurrentTime(T(time));
        LocationTransition transition;
        transition.siteId = "office";
        transition.type = TransitionType::Enter;
        transition.timestamp = T(time);
        transition.position = kSiteCenter;
        transition.accuracy = accuracy;
        return engine_->handleTransition(transition);
    }

    domain::TransitionOutcome exit(const std::string& time, std::optional<double> accuracy = std::nullopt,
                                   std::optional<Coordinates> position = std::nullopt) {
        clock_->setCurrentTime(T(time));
        LocationTransition transition;
        transition.siteId = "office";
        transition.type = TransitionType::Exit;
        transition.timestamp = T(time);
        transition.position = position;
        transition.accuracy = accuracy;
        return engine_->handleTransition(transition);
    }

    PositionFix fix(const std::string& time, const Coordinates& where, double accuracy) {
        PositionFix f;
        f.latitude = where.latitude;
        f.longitude = where.longitude;
        f.accuracy = accuracy;
        f.timestamp = T(time);
        return f;
    }

    std::vector<TrackingSession> tickAt(const std::string& time) {
        clock_->setCurrentTime(T(time));
        return engine_->tick();
    }

    TrackingConfig config_;
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryTrackingStore> store_;
    std::shared_ptr<sim::MockLocationProvider> provider_;
    std::shared_ptr<sim::MockNotificationDispatcher> notifications_;
    std::shared_ptr<StandardRng> rng_;
    std::shared_ptr<domain::EventBus> eventBus_;
    std::unique_ptr<domain::TrackingEngine> engine_;
};

TEST_F(TrackingEngineTest, EnterOpensActiveSession) {
    auto outcome = enter("08:00:00", 10.0);

    EXPECT_TRUE(outcome.accepted());
    EXPECT_EQ(outcome.action, domain::SessionAction::Opened);
    ASSERT_TRUE(outcome.session);
    EXPECT_EQ(outcome.session->state, SessionState::Active);
    EXPECT_EQ(outcome.session->clockIn, T("08:00:00"));
    EXPECT_EQ(outcome.session->trackingMethod, TrackingMethod::Auto);
    EXPECT_EQ(outcome.session->checkinAccuracy, 10.0);

    auto active = engine_->getActiveSession("office");
    ASSERT_TRUE(active);
    EXPECT_EQ(active->id, outcome.session->id);
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedIn), 1u);
    EXPECT_EQ(notifications_->sent().front().summary, "Clocked in at Head Office");

    auto events = store_->allEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(events[0].ignored);
    EXPECT_EQ(events[0].type, TransitionType::Enter);
}

TEST_F(TrackingEngineTest, UncertainExitIsVerifiedOutsideAtFirstCheck) {
    enter("08:00:00", 10.0);

    auto outcome = exit("16:00:00");
    EXPECT_EQ(outcome.action, domain::SessionAction::PendingExit);
    ASSERT_TRUE(outcome.session);
    EXPECT_EQ(outcome.session->state, SessionState::PendingExit);
    EXPECT_EQ(outcome.session->pendingExitAt, T("16:00:00"));
    EXPECT_TRUE(engine_->isVerificationPending(outcome.session->id));
    EXPECT_EQ(engine_->nextVerificationAt(outcome.session->id), T("16:01:00"));

    provider_->pushFix(fix("16:01:00", kFarAway, 20.0));

    EXPECT_TRUE(tickAt("16:00:30").empty());
    EXPECT_EQ(provider_->fetchCount(), 0u);

    auto resolved = tickAt("16:01:00");
    ASSERT_EQ(resolved.size(), 1u);
    const auto& session = resolved[0];
    EXPECT_EQ(session.state, SessionState::Completed);
    EXPECT_EQ(session.clockOut, T("16:01:00"));
    EXPECT_EQ(session.durationMinutes, 481);
    EXPECT_EQ(session.exitResolution, ExitResolution::Verified);
    EXPECT_EQ(session.exitAccuracy, 20.0);
    EXPECT_FALSE(session.belowMinimum);
    EXPECT_FALSE(session.pendingExitAt);

    EXPECT_FALSE(engine_->isVerificationPending(session.id));
    EXPECT_FALSE(engine_->getActiveSession("office"));
    ASSERT_EQ(notifications_->count(ports::NotificationKind::ClockedOut), 1u);
    EXPECT_EQ(notifications_->sent().back().summary, "Clocked out of Head Office after 8h 1m");
}

TEST_F(TrackingEngineTest, ReentryBeforeFirstCheckResumesSession) {
    auto opened = enter("08:00:00", 10.0);
    exit("12:00:00");

    auto outcome = enter("12:02:00", 10.0);
    EXPECT_EQ(outcome.action, domain::SessionAction::Resumed);
    ASSERT_TRUE(outcome.session);
    EXPECT_EQ(outcome.session->id, opened.session->id);
    EXPECT_EQ(outcome.session->state, SessionState::Active);
    EXPECT_EQ(outcome.session->clockIn, T("08:00:00"));
    EXPECT_FALSE(outcome.session->pendingExitAt);
    EXPECT_FALSE(engine_->isVerificationPending(opened.session->id));

    EXPECT_TRUE(tickAt("12:10:00").empty());
    EXPECT_EQ(provider_->fetchCount(), 0u);

    auto history = engine_->getHistory("office", 0);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].clockOut);
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedOut), 0u);
}

TEST_F(TrackingEngineTest, InconclusiveChecksExitByDefault) {
    enter("08:00:00", 10.0);
    exit("16:00:00");

    provider_->pushFix(fix("16:01:00", kFarAway, 80.0));
    provider_->pushFix(fix("16:03:00", kFarAway, 80.0));
    provider_->pushFix(fix("16:05:00", kFarAway, 80.0));

    EXPECT_TRUE(tickAt("16:01:00").empty());
    EXPECT_TRUE(tickAt("16:03:00").empty());

    auto resolved = tickAt("16:05:00");
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].state, SessionState::Completed);
    EXPECT_EQ(resolved[0].exitResolution, ExitResolution::ExitByDefault);
    EXPECT_EQ(resolved[0].clockOut, T("16:05:00"));
    EXPECT_EQ(resolved[0].durationMinutes, 485);
    EXPECT_EQ(resolved[0].exitAccuracy, 80.0);
    EXPECT_EQ(provider_->fetchCount(), 3u);
}

TEST_F(TrackingEngineTest, ManualClockInWhileActiveConflicts) {
    auto opened = enter("08:00:00", 10.0);

    clock_->setCurrentTime(T("09:00:00"));
    EXPECT_THROW(engine_->clockIn("office"), ManualCommandConflict);

    auto active = engine_->getActiveSession("office");
    ASSERT_TRUE(active);
    EXPECT_EQ(active->id, opened.session->id);
    EXPECT_EQ(active->trackingMethod, TrackingMethod::Auto);
    EXPECT_EQ(engine_->getHistory("office", 0).size(), 1u);
}

TEST_F(TrackingEngineTest, RepeatedEnterWithinCooldownIsDebounced) {
    enter("08:00:00");
    auto second = enter("08:00:05");

    EXPECT_FALSE(second.accepted());
    EXPECT_EQ(second.event.ignoreReason, IgnoreReason::Debounced);
    EXPECT_EQ(second.action, domain::SessionAction::None);
    EXPECT_EQ(engine_->getHistory("office", 0).size(), 1u);

    // The suppressed event is still on record
    EXPECT_EQ(store_->allEvents().size(), 2u);
}

TEST_F(TrackingEngineTest, EnterWhileActiveAfterCooldownIsDuplicate) {
    enter("08:00:00");
    auto second = enter("08:01:00");

    EXPECT_FALSE(second.accepted());
    EXPECT_EQ(second.event.ignoreReason, IgnoreReason::Duplicate);
    EXPECT_EQ(engine_->getHistory("office", 0).size(), 1u);
}

TEST_F(TrackingEngineTest, DebouncedEventDoesNotExtendCooldown) {
    enter("08:00:00");
    enter("08:00:05");

    // 12 s after the last admitted event, 7 s after the suppressed one
    auto outcome = exit("08:00:12", 10.0, kFarAway);
    EXPECT_TRUE(outcome.accepted());
    EXPECT_EQ(outcome.action, domain::SessionAction::Completed);
}

TEST_F(TrackingEngineTest, HighConfidenceExitOutsideCommitsImmediately) {
    enter("08:00:00", 10.0);
    auto outcome = exit("09:30:00", 10.0, kFarAway);

    EXPECT_EQ(outcome.action, domain::SessionAction::Completed);
    ASSERT_TRUE(outcome.session);
    EXPECT_EQ(outcome.session->exitResolution, ExitResolution::Immediate);
    EXPECT_EQ(outcome.session->clockOut, T("09:30:00"));
    EXPECT_EQ(outcome.session->durationMinutes, 90);
    EXPECT_EQ(outcome.session->exitAccuracy, 10.0);
    EXPECT_FALSE(engine_->isVerificationPending(outcome.session->id));
}

TEST_F(TrackingEngineTest, HighConfidenceExitWithoutPositionCommitsImmediately) {
    enter("08:00:00", 10.0);
    auto outcome = exit("09:00:00", 12.0);

    EXPECT_EQ(outcome.action, domain::SessionAction::Completed);
    EXPECT_EQ(outcome.session->exitResolution, ExitResolution::Immediate);
}

TEST_F(TrackingEngineTest, HighConfidenceExitInsideSiteIsVerified) {
    enter("08:00:00", 10.0);
    auto outcome = exit("09:00:00", 10.0, kSiteCenter);

    EXPECT_EQ(outcome.action, domain::SessionAction::PendingExit);
    EXPECT_TRUE(engine_->isVerificationPending(outcome.session->id));
}

TEST_F(TrackingEngineTest, PoorAccuracyExitIsIgnored) {
    enter("08:00:00", 10.0);
    auto outcome = exit("09:00:00", 150.0);

    EXPECT_FALSE(outcome.accepted());
    EXPECT_EQ(outcome.event.ignoreReason, IgnoreReason::PoorAccuracy);
    EXPECT_EQ(engine_->getActiveSession("office")->state, SessionState::Active);
}

TEST_F(TrackingEngineTest, DegradedSignalExitIsIgnored) {
    enter("08:00:00", 10.0);
    auto outcome = exit("09:00:00", 40.0);

    EXPECT_FALSE(outcome.accepted());
    EXPECT_EQ(outcome.event.ignoreReason, IgnoreReason::SignalDegradation);
    EXPECT_EQ(engine_->getActiveSession("office")->state, SessionState::Active);
}

TEST_F(TrackingEngineTest, ExitWithoutSessionIsIgnored) {
    auto outcome = exit("09:00:00", 10.0, kFarAway);

    EXPECT_FALSE(outcome.accepted());
    EXPECT_EQ(outcome.event.ignoreReason, IgnoreReason::NoSession);
    EXPECT_TRUE(engine_->getHistory("office", 0).empty());
}

TEST_F(TrackingEngineTest, SecondExitWhilePendingIsDuplicate) {
    enter("08:00:00", 10.0);
    exit("16:00:00");
    auto outcome = exit("16:00:30");

    EXPECT_EQ(outcome.event.ignoreReason, IgnoreReason::Duplicate);
    EXPECT_EQ(engine_->nextVerificationAt(engine_->getActiveSession("office")->id), T("16:01:00"));
}

TEST_F(TrackingEngineTest, VerificationInsideSiteResumesSession) {
    int resumed = 0;
    eventBus_->subscribe(ports::ChangeKind::SessionResumed, [&](const ports::TrackingChange&) {
        resumed++;
    });

    auto opened = enter("08:00:00", 10.0);
    exit("16:00:00");
    provider_->pushFix(fix("16:01:00", kSiteCenter, 10.0));

    auto resolved = tickAt("16:01:00");
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].id, opened.session->id);
    EXPECT_EQ(resolved[0].state, SessionState::Active);
    EXPECT_FALSE(resolved[0].pendingExitAt);
    EXPECT_FALSE(engine_->isVerificationPending(opened.session->id));

    eventBus_->processEvents();
    EXPECT_EQ(resumed, 1);
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedOut), 0u);
}

TEST_F(TrackingEngineTest, FetchFailuresFallBackToExitEventAccuracy) {
    enter("08:00:00", 30.0);
    exit("16:00:00", 60.0);

    provider_->pushFailure();
    provider_->pushFailure();
    provider_->pushFailure();

    tickAt("16:01:00");
    tickAt("16:03:00");
    auto resolved = tickAt("16:05:00");

    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].exitResolution, ExitResolution::ExitByDefault);
    EXPECT_EQ(resolved[0].exitAccuracy, 60.0);
}

TEST_F(TrackingEngineTest, FixFromBeforeExitDoesNotResumeSession) {
    enter("08:00:00", 10.0);
    auto pending = exit("16:00:00");
    provider_->setFallbackFix(fix("15:58:00", kSiteCenter, 10.0));

    EXPECT_TRUE(tickAt("16:01:00").empty());
    EXPECT_TRUE(tickAt("16:03:00").empty());
    EXPECT_EQ(engine_->getActiveSession("office")->state, SessionState::PendingExit);

    auto resolved = tickAt("16:05:00");
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].id, pending.session->id);
    EXPECT_EQ(resolved[0].state, SessionState::Completed);
    EXPECT_EQ(resolved[0].exitResolution, ExitResolution::ExitByDefault);
    EXPECT_EQ(resolved[0].clockOut, T("16:05:00"));
}

TEST_F(TrackingEngineTest, OverdueChecksCollapseIntoOneFetch) {
    enter("08:00:00", 10.0);
    exit("16:00:00");
    provider_->pushFailure();

    auto resolved = tickAt("16:09:00");

    EXPECT_EQ(provider_->fetchCount(), 1u);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].exitResolution, ExitResolution::ExitByDefault);
    EXPECT_EQ(resolved[0].clockOut, T("16:05:00"));
}

TEST_F(TrackingEngineTest, LateVerifiedFixIsClampedToCheckTime) {
    enter("08:00:00", 10.0);
    exit("16:00:00");
    provider_->pushFix(fix("16:04:00", kFarAway, 15.0));

    auto resolved = tickAt("16:04:00");

    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].exitResolution, ExitResolution::Verified);
    EXPECT_EQ(resolved[0].clockOut, T("16:03:00"));
}

TEST_F(TrackingEngineTest, ShortSessionIsFlaggedAndExcludedFromQueries) {
    enter("08:00:00", 10.0);
    auto outcome = exit("08:03:00", 10.0);

    ASSERT_TRUE(outcome.session);
    EXPECT_EQ(outcome.session->durationMinutes, 3);
    EXPECT_TRUE(outcome.session->belowMinimum);

    EXPECT_TRUE(engine_->getSessionsOverlapping(T("07:00:00"), T("09:00:00")).empty());
    EXPECT_EQ(engine_->getHistory("office", 0).size(), 1u);
    EXPECT_NE(notifications_->sent().back().summary.find("short session"), std::string::npos);
}

TEST_F(TrackingEngineTest, ReentryAfterVerificationWindowStartsNewVisit) {
    auto first = enter("08:00:00", 10.0);
    exit("12:00:00");

    auto outcome = enter("12:07:00", 10.0);

    EXPECT_EQ(outcome.action, domain::SessionAction::CompletedAndOpened);
    ASSERT_TRUE(outcome.closedSession);
    EXPECT_EQ(outcome.closedSession->id, first.session->id);
    EXPECT_EQ(outcome.closedSession->clockOut, T("12:05:00"));
    EXPECT_EQ(outcome.closedSession->exitResolution, ExitResolution::ExitByDefault);
    ASSERT_TRUE(outcome.session);
    EXPECT_NE(outcome.session->id, first.session->id);
    EXPECT_EQ(outcome.session->clockIn, T("12:07:00"));
    EXPECT_FALSE(engine_->isVerificationPending(first.session->id));
    EXPECT_EQ(engine_->getHistory("office", 0).size(), 2u);
}

TEST_F(TrackingEngineTest, ManualClockInAndOut) {
    clock_->setCurrentTime(T("09:00:00"));
    auto session = engine_->clockIn("office");
    EXPECT_EQ(session.trackingMethod, TrackingMethod::Manual);
    EXPECT_EQ(session.clockIn, T("09:00:00"));
    EXPECT_FALSE(session.checkinAccuracy);

    clock_->setCurrentTime(T("11:30:00"));
    auto closed = engine_->clockOut("office");
    EXPECT_EQ(closed.state, SessionState::Completed);
    EXPECT_EQ(closed.exitResolution, ExitResolution::Manual);
    EXPECT_EQ(closed.durationMinutes, 150);

    EXPECT_THROW(engine_->clockOut("office"), ManualCommandConflict);
}

TEST_F(TrackingEngineTest, ManualClockOutCancelsVerification) {
    enter("08:00:00", 10.0);
    auto pending = exit("16:00:00");

    clock_->setCurrentTime(T("16:02:00"));
    auto closed = engine_->clockOut("office");
    EXPECT_EQ(closed.clockOut, T("16:02:00"));
    EXPECT_EQ(closed.exitResolution, ExitResolution::Manual);
    EXPECT_FALSE(engine_->isVerificationPending(pending.session->id));

    EXPECT_TRUE(tickAt("16:05:00").empty());
    EXPECT_EQ(provider_->fetchCount(), 0u);
}

TEST_F(TrackingEngineTest, ClockInAtUnknownSiteConflicts) {
    EXPECT_THROW(engine_->clockIn("warehouse"), ManualCommandConflict);
}

TEST_F(TrackingEngineTest, TransitionForUnknownSiteIsRejected) {
    LocationTransition transition;
    transition.siteId = "warehouse";
    transition.type = TransitionType::Enter;
    transition.timestamp = T("08:00:00");

    EXPECT_THROW(engine_->handleTransition(transition), InvalidTransition);
    EXPECT_TRUE(store_->allEvents().empty());
}

TEST_F(TrackingEngineTest, FailedWriteLeavesDebouncerUntouched) {
    store_->setFailWrites(true);
    EXPECT_THROW(enter("08:00:00"), PersistenceError);
    EXPECT_FALSE(engine_->getActiveSession("office"));

    store_->setFailWrites(false);
    auto retry = enter("08:00:00");
    EXPECT_EQ(retry.action, domain::SessionAction::Opened);
}

TEST_F(TrackingEngineTest, RejectedEventRecordLeavesSessionUntouched) {
    store_->setFailEventWrites(true);
    EXPECT_THROW(enter("08:00:00"), PersistenceError);

    EXPECT_FALSE(engine_->getActiveSession("office"));
    EXPECT_TRUE(store_->allSessions().empty());
    EXPECT_TRUE(store_->allEvents().empty());
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedIn), 0u);

    store_->setFailEventWrites(false);
    auto retry = enter("08:00:00");
    EXPECT_EQ(retry.action, domain::SessionAction::Opened);
    EXPECT_TRUE(retry.accepted());
    EXPECT_EQ(store_->allEvents().size(), 1u);
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedIn), 1u);
}

TEST_F(TrackingEngineTest, RejectedEventRecordKeepsSessionActiveOnExit) {
    auto opened = enter("08:00:00", 10.0);

    store_->setFailEventWrites(true);
    EXPECT_THROW(exit("16:00:00"), PersistenceError);
    EXPECT_EQ(engine_->getActiveSession("office")->state, SessionState::Active);
    EXPECT_FALSE(engine_->isVerificationPending(opened.session->id));

    store_->setFailEventWrites(false);
    auto retry = exit("16:00:00");
    EXPECT_EQ(retry.action, domain::SessionAction::PendingExit);
    EXPECT_TRUE(engine_->isVerificationPending(opened.session->id));
}

TEST_F(TrackingEngineTest, RejectedEventRecordKeepsPendingSessionOnLateReentry) {
    auto first = enter("08:00:00", 10.0);
    exit("12:00:00");

    store_->setFailEventWrites(true);
    EXPECT_THROW(enter("12:07:00", 10.0), PersistenceError);

    auto current = engine_->getActiveSession("office");
    ASSERT_TRUE(current);
    EXPECT_EQ(current->id, first.session->id);
    EXPECT_EQ(current->state, SessionState::PendingExit);
    EXPECT_EQ(store_->allSessions().size(), 1u);
    EXPECT_TRUE(engine_->isVerificationPending(first.session->id));
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedOut), 0u);

    store_->setFailEventWrites(false);
    auto retry = enter("12:07:00", 10.0);
    EXPECT_EQ(retry.action, domain::SessionAction::CompletedAndOpened);
    EXPECT_EQ(retry.closedSession->clockOut, T("12:05:00"));
    EXPECT_FALSE(engine_->isVerificationPending(first.session->id));
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedOut), 1u);
    EXPECT_EQ(notifications_->count(ports::NotificationKind::ClockedIn), 2u);
}

TEST_F(TrackingEngineTest, FailedCommitIsRetriedOnNextTick) {
    enter("08:00:00", 10.0);
    auto pending = exit("16:00:00");
    provider_->pushFix(fix("16:01:00", kFarAway, 20.0));

    store_->setFailWrites(true);
    clock_->setCurrentTime(T("16:01:00"));
    EXPECT_THROW(engine_->tick(), PersistenceError);
    EXPECT_EQ(engine_->getActiveSession("office")->state, SessionState::PendingExit);
    EXPECT_TRUE(engine_->isVerificationPending(pending.session->id));

    store_->setFailWrites(false);
    auto resolved = tickAt("16:01:05");
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].exitResolution, ExitResolution::Verified);
    EXPECT_EQ(resolved[0].clockOut, T("16:01:00"));
    EXPECT_EQ(provider_->fetchCount(), 1u);
}

TEST_F(TrackingEngineTest, NotificationFailureDoesNotAffectSession) {
    notifications_->setFail(true);

    auto outcome = enter("08:00:00");
    EXPECT_EQ(outcome.action, domain::SessionAction::Opened);
    EXPECT_TRUE(engine_->getActiveSession("office"));
}

TEST_F(TrackingEngineTest, RecoverReschedulesRecentPendingExit) {
    enter("08:00:00", 10.0);
    auto pending = exit("16:00:00");

    // Cold start two minutes later
    clock_->setCurrentTime(T("16:02:00"));
    engine_ = makeEngine();
    auto report = engine_->recover();

    EXPECT_EQ(report.rescheduled, 1u);
    EXPECT_EQ(report.resolved, 0u);
    EXPECT_TRUE(engine_->isVerificationPending(pending.session->id));

    provider_->setFallbackFix(fix("16:02:00", kFarAway, 15.0));
    auto resolved = engine_->tick();
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].exitResolution, ExitResolution::Verified);
    EXPECT_EQ(resolved[0].clockOut, T("16:01:00"));
}

TEST_F(TrackingEngineTest, RecoverResolvesStalePendingExit) {
    enter("08:00:00", 10.0);
    auto pending = exit("16:00:00");

    clock_->setCurrentTime(T("16:30:00"));
    engine_ = makeEngine();
    auto report = engine_->recover();

    EXPECT_EQ(report.resolved, 1u);
    auto session = store_->getSession(pending.session->id);
    ASSERT_TRUE(session);
    EXPECT_EQ(session->state, SessionState::Completed);
    EXPECT_EQ(session->clockOut, T("16:05:00"));
    EXPECT_EQ(session->exitResolution, ExitResolution::ExitByDefault);
    EXPECT_EQ(provider_->fetchCount(), 0u);
}

TEST_F(TrackingEngineTest, RecoverResolvesPendingExitOfRemovedSite) {
    enter("08:00:00", 10.0);
    auto pending = exit("16:00:00");
    store_->deleteSite("office");

    clock_->setCurrentTime(T("16:02:00"));
    engine_ = makeEngine();
    auto report = engine_->recover();

    EXPECT_EQ(report.resolved, 1u);
    EXPECT_EQ(store_->getSession(pending.session->id)->clockOut, T("16:02:00"));
}

TEST_F(TrackingEngineTest, DebounceWindowSurvivesRestart) {
    enter("08:00:00");

    engine_ = makeEngine();
    auto outcome = enter("08:00:05");

    EXPECT_EQ(outcome.event.ignoreReason, IgnoreReason::Debounced);
}

TEST_F(TrackingEngineTest, InvalidConfigurationIsRejected) {
    config_.verificationOffsetsMinutes = {3, 1};
    EXPECT_THROW(makeEngine(), std::invalid_argument);
}

TEST_F(TrackingEngineTest, AttachedProviderDrivesEngine) {
    engine_->attach();

    LocationTransition transition;
    transition.siteId = "office";
    transition.type = TransitionType::Enter;
    transition.timestamp = T("08:00:00");
    transition.accuracy = 10.0;
    provider_->emitTransition(transition);

    EXPECT_TRUE(engine_->getActiveSession("office"));

    // Errors stay inside the callback
    transition.siteId = "warehouse";
    EXPECT_NO_THROW(provider_->emitTransition(transition));
}

TEST_F(TrackingEngineTest, EventBusReceivesTimelineChanges) {
    std::map<ports::ChangeKind, int> counts;
    for (auto kind : {ports::ChangeKind::SessionOpened, ports::ChangeKind::SessionPendingExit,
                      ports::ChangeKind::SessionCompleted, ports::ChangeKind::TransitionIgnored}) {
        eventBus_->subscribe(kind, [&counts](const ports::TrackingChange& change) {
            counts[change.kind]++;
        });
    }

    enter("08:00:00", 10.0);
    enter("08:00:02", 10.0);
    exit("16:00:00");
    provider_->pushFix(fix("16:01:00", kFarAway, 20.0));
    tickAt("16:01:00");
    eventBus_->processEvents();

    EXPECT_EQ(counts[ports::ChangeKind::SessionOpened], 1);
    EXPECT_EQ(counts[ports::ChangeKind::TransitionIgnored], 1);
    EXPECT_EQ(counts[ports::ChangeKind::SessionPendingExit], 1);
    EXPECT_EQ(counts[ports::ChangeKind::SessionCompleted], 1);
}

TEST_F(TrackingEngineTest, TimelineInvariantsHoldAcrossMixedTraffic) {
    enter("08:00:00", 10.0);
    enter("08:00:03", 10.0);
    exit("10:00:00");
    enter("10:00:40", 10.0);
    exit("12:00:00", 150.0);
    exit("12:30:00");
    provider_->pushFix(fix("12:31:00", kFarAway, 80.0));
    tickAt("12:31:00");
    enter("12:40:00", 20.0);
    exit("13:00:00", 10.0, kFarAway);
    enter("13:00:04", 10.0);
    clock_->setCurrentTime(T("13:10:00"));
    engine_->clockIn("office");
    clock_->setCurrentTime(T("14:00:00"));
    engine_->clockOut("office");

    std::map<std::string, int> openPerSite;
    for (const auto& session : store_->allSessions()) {
        EXPECT_TRUE(satisfiesInvariants(session)) << session.id;
        if (session.isOpen()) {
            openPerSite[session.siteId]++;
        }
        if (session.durationMinutes) {
            EXPECT_EQ(*session.durationMinutes,
                      domain::SessionStateMachine::durationMinutes(session.clockIn, *session.clockOut));
        }
    }
    for (const auto& [site, open] : openPerSite) {
        EXPECT_LE(open, 1) << site;
    }

    std::optional<Timestamp> previous;
    for (const auto& event : store_->allEvents()) {
        if (!event.admitted()) {
            continue;
        }
        if (previous) {
            EXPECT_GE(event.timestamp - *previous, config_.cooldown());
        }
        previous = event.timestamp;
    }
}
