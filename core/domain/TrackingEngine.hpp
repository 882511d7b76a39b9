/**
 * @file TrackingEngine.hpp
 * @brief Single event-processing pipeline for automatic work tracking
 *
 * Wires the location capability, debouncer, session state machine and exit
 * verification scheduler together behind one mutex. Every entry point
 * (transition callback, timer tick, user command, query) is serialized, so
 * platform callbacks may arrive on any thread.
 *
 * Write-then-acknowledge: the debouncer and the verification schedules are
 * updated only after the store accepted the corresponding write. A
 * PersistenceError therefore leaves both durable and cached state as they
 * were, and the caller may retry the same input.
 */

#pragma once

#include "ConfidenceEvaluator.hpp"
#include "EventDebouncer.hpp"
#include "ExitVerificationScheduler.hpp"
#include "SessionStateMachine.hpp"
#include "../IClock.hpp"
#include "../IRng.hpp"
#include "../TrackingConfig.hpp"
#include "../Types.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/ILocationProvider.hpp"
#include "../ports/INotificationDispatcher.hpp"
#include "../ports/ITrackingStore.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace worktrack::domain {

enum class SessionAction {
    None,
    Opened,
    PendingExit,
    Resumed,
    Completed,
    CompletedAndOpened
};

std::string sessionActionToString(SessionAction action);

/// What happened to one transition
struct TransitionOutcome {
    TransitionEvent event;
    SessionAction action = SessionAction::None;
    std::optional<TrackingSession> session;        ///< session after the transition
    std::optional<TrackingSession> closedSession;  ///< set for CompletedAndOpened

    bool accepted() const { return !event.ignored; }
};

struct RecoveryReport {
    std::size_t rescheduled = 0;
    std::size_t resolved = 0;
};

class TrackingEngine {
public:
    TrackingEngine(std::shared_ptr<ports::ITrackingStore> store,
                   std::shared_ptr<ports::ILocationProvider> locationProvider,
                   std::shared_ptr<ports::INotificationDispatcher> notifications,
                   std::shared_ptr<IClock> clock,
                   std::shared_ptr<IRng> rng,
                   const TrackingConfig& config = TrackingConfig{},
                   std::shared_ptr<ports::IEventBus> eventBus = nullptr);

    TrackingEngine(const TrackingEngine&) = delete;
    TrackingEngine& operator=(const TrackingEngine&) = delete;

    /// Route the location provider's transition callback into this engine
    void attach();

    /**
     * @brief Process one transition notification
     * @throws InvalidTransition if the site is unknown
     * @throws PersistenceError if the store rejected a write
     */
    TransitionOutcome handleTransition(const LocationTransition& transition);

    /**
     * @brief Start a manual session at the current time
     * @throws ManualCommandConflict if the site is unknown or already has an open session
     */
    TrackingSession clockIn(const std::string& siteId);

    /**
     * @brief Close the open session of a site at the current time
     * @throws ManualCommandConflict if the site has no open session
     */
    TrackingSession clockOut(const std::string& siteId);

    /// Drive due verification checks; returns sessions resolved by this tick
    std::vector<TrackingSession> tick();

    /**
     * @brief Rebuild verification state after a cold start
     *
     * Pending exits still inside the verification window get a schedule
     * again; older ones are closed by default at pendingExitAt plus the last
     * check offset.
     */
    RecoveryReport recover();

    /// Sessions overlapping [from, to), short sessions excluded
    std::vector<TrackingSession> getSessionsOverlapping(Timestamp from, Timestamp to) const;

    std::optional<TrackingSession> getActiveSession(const std::string& siteId) const;

    std::vector<TrackingSession> getHistory(const std::string& siteId, std::size_t limit) const;

    bool isVerificationPending(const std::string& sessionId) const;
    std::optional<Timestamp> nextVerificationAt(const std::string& sessionId) const;

    const TrackingConfig& config() const { return config_; }

private:
    TransitionOutcome handleEnter(const Site& site, const LocationTransition& transition,
                                  const std::optional<TrackingSession>& current,
                                  TransitionEvent& event);
    TransitionOutcome handleExit(const Site& site, const LocationTransition& transition,
                                 const std::optional<TrackingSession>& current,
                                 TransitionEvent& event);

    TransitionEvent makeEvent(const LocationTransition& transition) const;
    TransitionOutcome recordIgnored(TransitionEvent& event, IgnoreReason reason);

    void announceOpened(const TrackingSession& session);
    void announceCompleted(const TrackingSession& session);
    void publish(ports::ChangeKind kind, const TrackingSession& session, const std::string& detail);
    std::string siteName(const std::string& siteId) const;

    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<ports::ILocationProvider> locationProvider_;
    std::shared_ptr<ports::INotificationDispatcher> notifications_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IRng> rng_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    TrackingConfig config_;

    ConfidenceEvaluator evaluator_;
    EventDebouncer debouncer_;
    ExitVerificationScheduler scheduler_;
    SessionStateMachine stateMachine_;

    mutable std::mutex mutex_;
};

} // namespace worktrack::domain
