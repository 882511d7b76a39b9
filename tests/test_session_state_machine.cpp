#include <gtest/gtest.h>
#include "../core/adapters/InMemoryTrackingStore.hpp"
#include "../core/domain/SessionStateMachine.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <stdexcept>

using namespace worktrack;
using namespace worktrack::domain;

namespace {

Timestamp T(const std::string& hhmmss) {
    return *parseIso8601("2025-01-20T" + hhmmss + "Z");
}

} // namespace

class SessionStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::InMemoryTrackingStore>();
        clock_ = std::make_shared<sim::SimulatedClock>(T("08:00:00"));
        machine_ = std::make_unique<SessionStateMachine>(store_, clock_, std::make_shared<StandardRng>(11u),
                                                         config_);
    }

    LocationTransition exitWith(std::optional<double> accuracy) {
        LocationTransition transition;
        transition.siteId = "office";
        transition.type = TransitionType::Exit;
        transition.timestamp = T("12:00:00");
        transition.accuracy = accuracy;
        return transition;
    }

    TrackingSession active(std::optional<double> checkinAccuracy = 20.0) {
        TrackingSession session;
        session.id = "s-1";
        session.siteId = "office";
        session.clockIn = T("08:00:00");
        session.checkinAccuracy = checkinAccuracy;
        return session;
    }

    static Confidence high(Placement placement) {
        return Confidence{ConfidenceTier::High, placement};
    }

    TrackingConfig config_;
    std::shared_ptr<adapters::InMemoryTrackingStore> store_;
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<SessionStateMachine> machine_;
};

TEST_F(SessionStateMachineTest, DurationRoundsToNearestMinute) {
    EXPECT_EQ(SessionStateMachine::durationMinutes(T("08:00:00"), T("08:00:29")), 0);
    EXPECT_EQ(SessionStateMachine::durationMinutes(T("08:00:00"), T("08:00:30")), 1);
    EXPECT_EQ(SessionStateMachine::durationMinutes(T("08:00:00"), T("16:01:00")), 481);
    EXPECT_EQ(SessionStateMachine::durationMinutes(T("08:00:00"), T("07:00:00")), 0);
}

TEST_F(SessionStateMachineTest, ExitGuardsApplyInOrder) {
    auto session = active(20.0);

    EXPECT_EQ(machine_->decideExit(std::nullopt, exitWith(10.0), high(Placement::ConfidentlyOutside)).reason,
              IgnoreReason::NoSession);
    EXPECT_EQ(machine_->decideExit(session, exitWith(120.0), high(Placement::ConfidentlyOutside)).reason,
              IgnoreReason::PoorAccuracy);
    EXPECT_EQ(machine_->decideExit(session, exitWith(61.0), high(Placement::ConfidentlyOutside)).reason,
              IgnoreReason::SignalDegradation);
    EXPECT_EQ(machine_->decideExit(session, exitWith(60.0), Confidence{}).decision,
              Decision::BeginPendingExit);

    session.state = SessionState::PendingExit;
    session.pendingExitAt = T("11:00:00");
    EXPECT_EQ(machine_->decideExit(session, exitWith(10.0), high(Placement::ConfidentlyOutside)).reason,
              IgnoreReason::Duplicate);
}

TEST_F(SessionStateMachineTest, HighConfidenceCommitsUnlessInside) {
    auto session = active();

    EXPECT_EQ(machine_->decideExit(session, exitWith(10.0), high(Placement::ConfidentlyOutside)).decision,
              Decision::CommitImmediate);
    EXPECT_EQ(machine_->decideExit(session, exitWith(10.0), high(Placement::Uncertain)).decision,
              Decision::CommitImmediate);
    EXPECT_EQ(machine_->decideExit(session, exitWith(10.0), high(Placement::ConfidentlyInside)).decision,
              Decision::BeginPendingExit);
}

TEST_F(SessionStateMachineTest, DegradationNeedsCheckinAccuracy) {
    auto manual = active(std::nullopt);
    EXPECT_EQ(machine_->decideExit(manual, exitWith(90.0), Confidence{}).decision, Decision::BeginPendingExit);
}

TEST_F(SessionStateMachineTest, EnterDecisions) {
    LocationTransition enter;
    enter.siteId = "office";
    enter.type = TransitionType::Enter;
    enter.timestamp = T("12:05:00");

    EXPECT_EQ(machine_->decideEnter(std::nullopt, enter).decision, Decision::Open);
    EXPECT_EQ(machine_->decideEnter(active(), enter).reason, IgnoreReason::Duplicate);

    auto pending = active();
    pending.state = SessionState::PendingExit;
    pending.pendingExitAt = T("12:00:00");
    EXPECT_EQ(machine_->decideEnter(pending, enter).decision, Decision::Resume);

    enter.timestamp = T("12:05:01");
    EXPECT_EQ(machine_->decideEnter(pending, enter).decision, Decision::ExpireAndOpen);
}

TEST_F(SessionStateMachineTest, LifecycleThroughStore) {
    auto session = machine_->open("office", T("08:00:00"), TrackingMethod::Auto, 15.0);
    EXPECT_EQ(session.state, SessionState::Active);
    EXPECT_EQ(store_->getActiveOrPendingSession("office")->id, session.id);

    clock_->setCurrentTime(T("12:00:00"));
    auto pending = machine_->beginPendingExit(session, T("12:00:00"));
    EXPECT_EQ(pending.pendingExitAt, T("12:00:00"));
    EXPECT_THROW(machine_->beginPendingExit(pending, T("12:01:00")), std::logic_error);

    auto resumed = machine_->resume(pending);
    EXPECT_EQ(resumed.state, SessionState::Active);
    EXPECT_THROW(machine_->resume(resumed), std::logic_error);

    auto done = machine_->complete(resumed, T("07:00:00"), std::nullopt, ExitResolution::Manual);
    EXPECT_EQ(done.clockOut, T("08:00:00"));
    EXPECT_EQ(done.durationMinutes, 0);
    EXPECT_TRUE(done.belowMinimum);
    EXPECT_THROW(machine_->complete(done, T("13:00:00"), std::nullopt, ExitResolution::Manual),
                 std::logic_error);
}
