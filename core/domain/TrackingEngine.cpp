#include "TrackingEngine.hpp"
#include "../Errors.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace worktrack::domain {

namespace {

std::string formatDuration(std::int64_t minutes) {
    std::ostringstream ss;
    if (minutes >= 60) {
        ss << (minutes / 60) << "h " << (minutes % 60) << "m";
    } else {
        ss << minutes << "m";
    }
    return ss.str();
}

} // namespace

std::string sessionActionToString(SessionAction action) {
    switch (action) {
        case SessionAction::None: return "none";
        case SessionAction::Opened: return "opened";
        case SessionAction::PendingExit: return "pending_exit";
        case SessionAction::Resumed: return "resumed";
        case SessionAction::Completed: return "completed";
        case SessionAction::CompletedAndOpened: return "completed_and_opened";
    }
    return "none";
}

TrackingEngine::TrackingEngine(std::shared_ptr<ports::ITrackingStore> store,
                               std::shared_ptr<ports::ILocationProvider> locationProvider,
                               std::shared_ptr<ports::INotificationDispatcher> notifications,
                               std::shared_ptr<IClock> clock,
                               std::shared_ptr<IRng> rng,
                               const TrackingConfig& config,
                               std::shared_ptr<ports::IEventBus> eventBus)
    : store_(std::move(store))
    , locationProvider_(std::move(locationProvider))
    , notifications_(std::move(notifications))
    , clock_(std::move(clock))
    , rng_(std::move(rng))
    , eventBus_(std::move(eventBus))
    , config_(config)
    , evaluator_(config_)
    , debouncer_(store_, config_)
    , scheduler_(locationProvider_, config_)
    , stateMachine_(store_, clock_, rng_, config_) {
    std::string reason;
    if (!config_.validate(reason)) {
        throw std::invalid_argument("Invalid tracking configuration: " + reason);
    }
}

void TrackingEngine::attach() {
    locationProvider_->setTransitionCallback([this](const LocationTransition& transition) {
        try {
            handleTransition(transition);
        } catch (const std::exception& e) {
            std::cerr << "[Engine] Transition for " << transition.siteId
                      << " not applied: " << e.what() << std::endl;
        }
    });
}

TransitionOutcome TrackingEngine::handleTransition(const LocationTransition& transition) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto site = store_->getSite(transition.siteId);
    if (!site) {
        throw InvalidTransition("unknown site '" + transition.siteId + "'");
    }

    std::cout << "[Engine] " << transitionTypeToString(transition.type) << " at " << site->name
              << " (" << formatIso8601(transition.timestamp) << ", accuracy "
              << (transition.accuracy ? std::to_string(*transition.accuracy) + "m" : std::string("n/a"))
              << ")" << std::endl;

    TransitionEvent event = makeEvent(transition);

    if (!debouncer_.admits(transition.siteId, transition.timestamp)) {
        return recordIgnored(event, IgnoreReason::Debounced);
    }

    auto current = store_->getActiveOrPendingSession(transition.siteId);

    TransitionOutcome outcome = transition.type == TransitionType::Enter
        ? handleEnter(*site, transition, current, event)
        : handleExit(*site, transition, current, event);

    debouncer_.recordAdmitted(transition.siteId, transition.timestamp);
    return outcome;
}

TransitionOutcome TrackingEngine::handleEnter(const Site& site, const LocationTransition& transition,
                                              const std::optional<TrackingSession>& current,
                                              TransitionEvent& event) {
    auto decision = stateMachine_.decideEnter(current, transition);

    ports::TransitionCommit commit;
    commit.event = event;

    TransitionOutcome outcome;
    switch (decision.decision) {
        case Decision::Open:
            commit.created = stateMachine_.planOpen(site.id, transition.timestamp,
                                                    TrackingMethod::Auto, transition.accuracy);
            outcome.action = SessionAction::Opened;
            break;
        case Decision::Resume:
            commit.updates.emplace_back(current->id, stateMachine_.planResume(*current));
            outcome.action = SessionAction::Resumed;
            break;
        case Decision::ExpireAndOpen: {
            auto clockOut = *current->pendingExitAt + config_.lastVerificationOffset();
            commit.updates.emplace_back(current->id,
                                        stateMachine_.planCompletion(*current, clockOut, std::nullopt,
                                                                     ExitResolution::ExitByDefault));
            commit.created = stateMachine_.planOpen(site.id, transition.timestamp,
                                                    TrackingMethod::Auto, transition.accuracy);
            outcome.action = SessionAction::CompletedAndOpened;
            break;
        }
        default:
            return recordIgnored(event, decision.reason);
    }

    auto committed = stateMachine_.commit(commit);
    outcome.event = committed.event;

    if (outcome.action == SessionAction::Resumed) {
        outcome.session = committed.updated.front();
        scheduler_.cancel(current->id);
        publish(ports::ChangeKind::SessionResumed, *outcome.session, "re-entered before exit was confirmed");
        return outcome;
    }

    if (outcome.action == SessionAction::CompletedAndOpened) {
        outcome.closedSession = committed.updated.front();
        scheduler_.cancel(current->id);
        announceCompleted(*outcome.closedSession);
    }
    outcome.session = committed.created;
    announceOpened(*outcome.session);
    return outcome;
}

TransitionOutcome TrackingEngine::handleExit(const Site& site, const LocationTransition& transition,
                                             const std::optional<TrackingSession>& current,
                                             TransitionEvent& event) {
    auto confidence = evaluator_.evaluateTransition(transition, site);
    auto decision = stateMachine_.decideExit(current, transition, confidence);

    ports::TransitionCommit commit;
    commit.event = event;

    TransitionOutcome outcome;
    switch (decision.decision) {
        case Decision::CommitImmediate:
            commit.updates.emplace_back(current->id,
                                        stateMachine_.planCompletion(*current, transition.timestamp,
                                                                     transition.accuracy,
                                                                     ExitResolution::Immediate));
            outcome.action = SessionAction::Completed;
            break;
        case Decision::BeginPendingExit:
            commit.updates.emplace_back(current->id,
                                        stateMachine_.planPendingExit(*current, transition.timestamp));
            outcome.action = SessionAction::PendingExit;
            break;
        default:
            return recordIgnored(event, decision.reason);
    }

    auto committed = stateMachine_.commit(commit);
    outcome.event = committed.event;
    outcome.session = committed.updated.front();

    if (outcome.action == SessionAction::Completed) {
        announceCompleted(*outcome.session);
    } else {
        scheduler_.schedule(*outcome.session, site, transition.accuracy);
        publish(ports::ChangeKind::SessionPendingExit, *outcome.session,
                "exit " + confidenceTierToString(confidence.tier) + " confidence, verifying");
    }
    return outcome;
}

TrackingSession TrackingEngine::clockIn(const std::string& siteId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto site = store_->getSite(siteId);
    if (!site) {
        throw ManualCommandConflict("unknown site '" + siteId + "'");
    }

    if (auto current = store_->getActiveOrPendingSession(siteId)) {
        throw ManualCommandConflict("site '" + site->name + "' already has an " +
                                    sessionStateToString(current->state) + " session");
    }

    auto session = stateMachine_.open(siteId, clock_->now(), TrackingMethod::Manual, std::nullopt);
    announceOpened(session);
    return session;
}

TrackingSession TrackingEngine::clockOut(const std::string& siteId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto current = store_->getActiveOrPendingSession(siteId);
    if (!current) {
        throw ManualCommandConflict("no open session at site '" + siteId + "'");
    }

    auto session = stateMachine_.complete(*current, clock_->now(), std::nullopt, ExitResolution::Manual);
    scheduler_.cancel(current->id);
    announceCompleted(session);
    return session;
}

std::vector<TrackingSession> TrackingEngine::tick() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrackingSession> resolved;
    for (const auto& result : scheduler_.tick(clock_->now())) {
        auto session = store_->getSession(result.sessionId);
        if (!session || session->state != SessionState::PendingExit) {
            // Resolved through another path already
            scheduler_.cancel(result.sessionId);
            continue;
        }

        if (result.verdict == VerificationVerdict::Commit) {
            auto completed = stateMachine_.complete(*session, result.clockOut,
                                                    result.exitAccuracy, result.resolution);
            scheduler_.cancel(result.sessionId);
            announceCompleted(completed);
            resolved.push_back(std::move(completed));
        } else {
            auto resumed = stateMachine_.resume(*session);
            scheduler_.cancel(result.sessionId);
            publish(ports::ChangeKind::SessionResumed, resumed, "verification placed device inside site");
            resolved.push_back(std::move(resumed));
        }
    }
    return resolved;
}

RecoveryReport TrackingEngine::recover() {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = clock_->now();
    RecoveryReport report;

    for (const auto& session : store_->pendingExitSessions()) {
        if (scheduler_.isScheduled(session.id)) {
            continue;
        }

        auto site = store_->getSite(session.siteId);
        const auto pendingSince = *session.pendingExitAt;
        const bool stale = now - pendingSince > config_.maxVerificationWindow();

        if (site && !stale) {
            scheduler_.schedule(session, *site, std::nullopt);
            ++report.rescheduled;
            continue;
        }

        auto clockOut = std::min(now, pendingSince + config_.lastVerificationOffset());
        std::cout << "[Engine] Resolving stale pending exit of session " << session.id
                  << (site ? "" : " (site removed)") << std::endl;
        auto completed = stateMachine_.complete(session, clockOut, std::nullopt,
                                                ExitResolution::ExitByDefault);
        announceCompleted(completed);
        ++report.resolved;
    }

    std::cout << "[Engine] Recovery: " << report.rescheduled << " verification(s) rescheduled, "
              << report.resolved << " stale pending exit(s) resolved" << std::endl;
    return report;
}

std::vector<TrackingSession> TrackingEngine::getSessionsOverlapping(Timestamp from, Timestamp to) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto sessions = store_->sessionsOverlapping(from, to);
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [](const TrackingSession& s) { return s.belowMinimum; }),
                   sessions.end());
    return sessions;
}

std::optional<TrackingSession> TrackingEngine::getActiveSession(const std::string& siteId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_->getActiveOrPendingSession(siteId);
}

std::vector<TrackingSession> TrackingEngine::getHistory(const std::string& siteId, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_->queryHistory(siteId, limit);
}

bool TrackingEngine::isVerificationPending(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduler_.isScheduled(sessionId);
}

std::optional<Timestamp> TrackingEngine::nextVerificationAt(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduler_.nextCheckAt(sessionId);
}

TransitionEvent TrackingEngine::makeEvent(const LocationTransition& transition) const {
    TransitionEvent event;
    event.id = rng_->uuid();
    event.siteId = transition.siteId;
    event.type = transition.type;
    event.timestamp = transition.timestamp;
    if (transition.position) {
        event.latitude = transition.position->latitude;
        event.longitude = transition.position->longitude;
    }
    event.accuracy = transition.accuracy;
    return event;
}

TransitionOutcome TrackingEngine::recordIgnored(TransitionEvent& event, IgnoreReason reason) {
    event.ignored = true;
    event.ignoreReason = reason;

    TransitionOutcome outcome;
    outcome.event = store_->appendEvent(event);

    std::cout << "[Engine] Ignored " << transitionTypeToString(event.type) << " for "
              << event.siteId << ": " << ignoreReasonToString(reason) << std::endl;

    if (eventBus_) {
        ports::TrackingChange change;
        change.kind = ports::ChangeKind::TransitionIgnored;
        change.siteId = event.siteId;
        change.at = event.timestamp;
        change.detail = ignoreReasonToString(reason);
        eventBus_->publish(change);
    }
    return outcome;
}

void TrackingEngine::announceOpened(const TrackingSession& session) {
    const auto name = siteName(session.siteId);
    if (notifications_) {
        try {
            notifications_->notify(ports::NotificationKind::ClockedIn, session.siteId,
                                   "Clocked in at " + name);
        } catch (const std::exception& e) {
            std::cerr << "[Notify] clocked_in for " << session.siteId << " failed: " << e.what() << std::endl;
        }
    }
    publish(ports::ChangeKind::SessionOpened, session, trackingMethodToString(session.trackingMethod));
}

void TrackingEngine::announceCompleted(const TrackingSession& session) {
    const auto name = siteName(session.siteId);
    const auto minutes = session.durationMinutes.value_or(0);

    std::string summary = "Clocked out of " + name + " after " + formatDuration(minutes);
    if (session.belowMinimum) {
        summary += " (short session, not counted)";
    }

    if (notifications_) {
        try {
            notifications_->notify(ports::NotificationKind::ClockedOut, session.siteId, summary);
        } catch (const std::exception& e) {
            std::cerr << "[Notify] clocked_out for " << session.siteId << " failed: " << e.what() << std::endl;
        }
    }
    publish(ports::ChangeKind::SessionCompleted, session, exitResolutionToString(session.exitResolution));
}

void TrackingEngine::publish(ports::ChangeKind kind, const TrackingSession& session, const std::string& detail) {
    if (!eventBus_) {
        return;
    }
    ports::TrackingChange change;
    change.kind = kind;
    change.siteId = session.siteId;
    change.sessionId = session.id;
    change.at = session.updatedAt;
    change.detail = detail;
    eventBus_->publish(change);
}

std::string TrackingEngine::siteName(const std::string& siteId) const {
    auto site = store_->getSite(siteId);
    return site ? site->name : siteId;
}

} // namespace worktrack::domain
