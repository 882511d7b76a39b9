#include "SessionStateMachine.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace worktrack::domain {

std::string decisionToString(Decision decision) {
    switch (decision) {
        case Decision::Open: return "open";
        case Decision::Resume: return "resume";
        case Decision::ExpireAndOpen: return "expire_and_open";
        case Decision::BeginPendingExit: return "begin_pending_exit";
        case Decision::CommitImmediate: return "commit_immediate";
        case Decision::Ignore: return "ignore";
    }
    return "ignore";
}

SessionStateMachine::SessionStateMachine(std::shared_ptr<ports::ITrackingStore> store,
                                         std::shared_ptr<IClock> clock,
                                         std::shared_ptr<IRng> rng,
                                         const TrackingConfig& config)
    : store_(std::move(store))
    , clock_(std::move(clock))
    , rng_(std::move(rng))
    , config_(config) {
}

TransitionDecision SessionStateMachine::decideEnter(const std::optional<TrackingSession>& current,
                                                    const LocationTransition& transition) const {
    if (!current) {
        return {Decision::Open, IgnoreReason::None};
    }

    if (current->state == SessionState::Active) {
        return {Decision::Ignore, IgnoreReason::Duplicate};
    }

    // Pending exit: the verification window decides between a return and a new visit
    auto elapsed = transition.timestamp - *current->pendingExitAt;
    if (elapsed > config_.lastVerificationOffset()) {
        return {Decision::ExpireAndOpen, IgnoreReason::None};
    }
    return {Decision::Resume, IgnoreReason::None};
}

TransitionDecision SessionStateMachine::decideExit(const std::optional<TrackingSession>& current,
                                                   const LocationTransition& transition,
                                                   const Confidence& confidence) const {
    if (!current) {
        return {Decision::Ignore, IgnoreReason::NoSession};
    }

    if (transition.accuracy && *transition.accuracy > config_.poorAccuracyMeters) {
        return {Decision::Ignore, IgnoreReason::PoorAccuracy};
    }

    if (transition.accuracy && current->checkinAccuracy && *current->checkinAccuracy > 0.0 &&
        *transition.accuracy > *current->checkinAccuracy * config_.degradationFactor) {
        return {Decision::Ignore, IgnoreReason::SignalDegradation};
    }

    if (current->state == SessionState::PendingExit) {
        return {Decision::Ignore, IgnoreReason::Duplicate};
    }

    if (confidence.isHigh() && confidence.placement != Placement::ConfidentlyInside) {
        return {Decision::CommitImmediate, IgnoreReason::None};
    }
    return {Decision::BeginPendingExit, IgnoreReason::None};
}

TrackingSession SessionStateMachine::planOpen(const std::string& siteId, Timestamp clockIn,
                                              TrackingMethod method, std::optional<double> checkinAccuracy) const {
    const auto now = clock_->now();

    TrackingSession session;
    session.id = rng_->uuid();
    session.siteId = siteId;
    session.clockIn = clockIn;
    session.trackingMethod = method;
    session.state = SessionState::Active;
    session.checkinAccuracy = checkinAccuracy;
    session.createdAt = now;
    session.updatedAt = now;
    return session;
}

SessionPatch SessionStateMachine::planPendingExit(const TrackingSession& session, Timestamp exitAt) const {
    if (session.state != SessionState::Active) {
        throw std::logic_error("pending exit requires an active session, got " +
                               sessionStateToString(session.state));
    }

    SessionPatch patch;
    patch.state = SessionState::PendingExit;
    patch.pendingExitAt = exitAt;
    patch.updatedAt = clock_->now();
    return patch;
}

SessionPatch SessionStateMachine::planResume(const TrackingSession& session) const {
    if (session.state != SessionState::PendingExit) {
        throw std::logic_error("resume requires a pending exit, got " +
                               sessionStateToString(session.state));
    }

    SessionPatch patch;
    patch.state = SessionState::Active;
    patch.clearPendingExit = true;
    patch.updatedAt = clock_->now();
    return patch;
}

SessionPatch SessionStateMachine::planCompletion(const TrackingSession& session, Timestamp clockOut,
                                                 std::optional<double> exitAccuracy,
                                                 ExitResolution resolution) const {
    if (session.state == SessionState::Completed) {
        throw std::logic_error("session " + session.id + " is already completed");
    }

    if (clockOut < session.clockIn) {
        clockOut = session.clockIn;
    }

    const auto duration = durationMinutes(session.clockIn, clockOut);

    SessionPatch patch;
    patch.state = SessionState::Completed;
    patch.clockOut = clockOut;
    patch.clearPendingExit = true;
    patch.exitAccuracy = exitAccuracy;
    patch.durationMinutes = duration;
    patch.exitResolution = resolution;
    patch.belowMinimum = duration < config_.minimumSessionMinutes;
    patch.updatedAt = clock_->now();
    return patch;
}

ports::CommittedTransition SessionStateMachine::commit(const ports::TransitionCommit& commit) {
    std::vector<std::optional<TrackingSession>> before;
    for (const auto& update : commit.updates) {
        before.push_back(store_->getSession(update.first));
    }

    auto committed = store_->commitTransition(commit);

    for (std::size_t i = 0; i < committed.updated.size(); ++i) {
        logApplied(before[i], committed.updated[i]);
    }
    if (committed.created) {
        logApplied(std::nullopt, *committed.created);
    }
    return committed;
}

TrackingSession SessionStateMachine::open(const std::string& siteId, Timestamp clockIn,
                                          TrackingMethod method, std::optional<double> checkinAccuracy) {
    auto stored = store_->createSession(planOpen(siteId, clockIn, method, checkinAccuracy));
    logApplied(std::nullopt, stored);
    return stored;
}

TrackingSession SessionStateMachine::beginPendingExit(const TrackingSession& session, Timestamp exitAt) {
    auto stored = store_->updateSession(session.id, planPendingExit(session, exitAt));
    logApplied(session, stored);
    return stored;
}

TrackingSession SessionStateMachine::resume(const TrackingSession& session) {
    auto stored = store_->updateSession(session.id, planResume(session));
    logApplied(session, stored);
    return stored;
}

TrackingSession SessionStateMachine::complete(const TrackingSession& session, Timestamp clockOut,
                                              std::optional<double> exitAccuracy,
                                              ExitResolution resolution) {
    auto stored = store_->updateSession(session.id, planCompletion(session, clockOut, exitAccuracy, resolution));
    logApplied(session, stored);
    return stored;
}

void SessionStateMachine::logApplied(const std::optional<TrackingSession>& before,
                                     const TrackingSession& after) const {
    std::cout << "[StateMachine] " << (before ? sessionStateToString(before->state) : std::string("none"))
              << " -> " << sessionStateToString(after.state) << ": session " << after.id;

    switch (after.state) {
        case SessionState::Active:
            if (before) {
                std::cout << " resumed";
            } else {
                std::cout << " at " << after.siteId << " (" << trackingMethodToString(after.trackingMethod)
                          << ", clock-in " << formatIso8601(after.clockIn) << ")";
            }
            break;
        case SessionState::PendingExit:
            std::cout << " (exit at " << formatIso8601(*after.pendingExitAt) << ")";
            break;
        case SessionState::Completed:
            std::cout << " (" << exitResolutionToString(after.exitResolution) << ", "
                      << after.durationMinutes.value_or(0) << " min"
                      << (after.belowMinimum ? ", below minimum" : "") << ")";
            break;
    }
    std::cout << std::endl;
}

std::int64_t SessionStateMachine::durationMinutes(Timestamp clockIn, Timestamp clockOut) {
    if (clockOut <= clockIn) {
        return 0;
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(clockOut - clockIn).count();
    return static_cast<std::int64_t>(std::llround(static_cast<double>(millis) / 60000.0));
}

} // namespace worktrack::domain
