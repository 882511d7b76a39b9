/**
 * @file SessionStateMachine.hpp
 * @brief Lifecycle rules for tracking sessions
 *
 * decideEnter()/decideExit() are pure guard evaluations over the current
 * session and an admitted transition. The plan*() helpers build the record
 * or patch for one lifecycle step without writing it. The mutators apply a
 * single step through the tracking store, and commit() applies the steps of
 * a transition together with its event record. Both return only after the
 * store acknowledged the write.
 */

#pragma once

#include "ConfidenceEvaluator.hpp"
#include "../IClock.hpp"
#include "../IRng.hpp"
#include "../TrackingConfig.hpp"
#include "../Types.hpp"
#include "../ports/ITrackingStore.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace worktrack::domain {

enum class Decision {
    Open,               ///< none -> active
    Resume,             ///< pending_exit -> active
    ExpireAndOpen,      ///< pending_exit -> completed (by default), then a new session
    BeginPendingExit,   ///< active -> pending_exit
    CommitImmediate,    ///< active -> completed
    Ignore
};

struct TransitionDecision {
    Decision decision = Decision::Ignore;
    IgnoreReason reason = IgnoreReason::None;
};

std::string decisionToString(Decision decision);

class SessionStateMachine {
public:
    SessionStateMachine(std::shared_ptr<ports::ITrackingStore> store,
                        std::shared_ptr<IClock> clock,
                        std::shared_ptr<IRng> rng,
                        const TrackingConfig& config);

    TransitionDecision decideEnter(const std::optional<TrackingSession>& current,
                                   const LocationTransition& transition) const;

    TransitionDecision decideExit(const std::optional<TrackingSession>& current,
                                  const LocationTransition& transition,
                                  const Confidence& confidence) const;

    TrackingSession planOpen(const std::string& siteId, Timestamp clockIn,
                             TrackingMethod method, std::optional<double> checkinAccuracy) const;

    /// @throws std::logic_error if the session is not active
    SessionPatch planPendingExit(const TrackingSession& session, Timestamp exitAt) const;

    /// @throws std::logic_error if the session is not pending exit
    SessionPatch planResume(const TrackingSession& session) const;

    /**
     * @brief Patch that closes an open session
     * @param clockOut Clamped to clockIn when earlier
     * @throws std::logic_error if the session is already completed
     */
    SessionPatch planCompletion(const TrackingSession& session, Timestamp clockOut,
                                std::optional<double> exitAccuracy, ExitResolution resolution) const;

    ports::CommittedTransition commit(const ports::TransitionCommit& commit);

    TrackingSession open(const std::string& siteId, Timestamp clockIn,
                         TrackingMethod method, std::optional<double> checkinAccuracy);

    TrackingSession beginPendingExit(const TrackingSession& session, Timestamp exitAt);

    TrackingSession resume(const TrackingSession& session);

    TrackingSession complete(const TrackingSession& session, Timestamp clockOut,
                             std::optional<double> exitAccuracy, ExitResolution resolution);

    /// round((clockOut - clockIn) / 1 min), never negative
    static std::int64_t durationMinutes(Timestamp clockIn, Timestamp clockOut);

private:
    void logApplied(const std::optional<TrackingSession>& before, const TrackingSession& after) const;

    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IRng> rng_;
    TrackingConfig config_;
};

} // namespace worktrack::domain
