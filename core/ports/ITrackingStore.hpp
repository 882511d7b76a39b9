/**
 * @file ITrackingStore.hpp
 * @brief Persistence contract consumed by the tracking core
 *
 * Every write either completes durably or throws PersistenceError with the
 * prior state left intact. Callers treat a transition as applied only after
 * the corresponding write returned.
 */

#pragma once

#include "../Types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace worktrack::ports {

/**
 * @brief Session writes caused by one admitted transition, plus its event
 *
 * Updates run first, in order, then the optional insert, then the event
 * append. The store applies all of it or none of it.
 */
struct TransitionCommit {
    std::vector<std::pair<std::string, SessionPatch>> updates;
    std::optional<TrackingSession> created;
    TransitionEvent event;
};

struct CommittedTransition {
    std::vector<TrackingSession> updated;
    std::optional<TrackingSession> created;
    TransitionEvent event;
};

class ITrackingStore {
public:
    virtual ~ITrackingStore() = default;

    // Sessions
    virtual std::optional<TrackingSession> getActiveOrPendingSession(const std::string& siteId) const = 0;
    virtual std::optional<TrackingSession> getSession(const std::string& sessionId) const = 0;

    /**
     * @brief Insert a new session
     * @throws PersistenceError if the site already has an open session
     */
    virtual TrackingSession createSession(const TrackingSession& session) = 0;

    /**
     * @brief Apply a partial update
     * @return The stored session after the update
     * @throws PersistenceError if the session is unknown or the result breaks
     *         the session invariants
     */
    virtual TrackingSession updateSession(const std::string& sessionId, const SessionPatch& patch) = 0;

    /// Newest first, at most limit entries (0 means unlimited)
    virtual std::vector<TrackingSession> queryHistory(const std::string& siteId, std::size_t limit) const = 0;

    virtual std::vector<TrackingSession> pendingExitSessions() const = 0;

    /// Sessions with clockIn < to and (open or clockOut > from), ordered by clockIn
    virtual std::vector<TrackingSession> sessionsOverlapping(Timestamp from, Timestamp to) const = 0;

    // Transition events
    virtual TransitionEvent appendEvent(const TransitionEvent& event) = 0;

    /**
     * @brief Apply a transition's session writes and its event as one unit
     * @throws PersistenceError with nothing applied if any step is rejected
     */
    virtual CommittedTransition commitTransition(const TransitionCommit& commit) = 0;

    /// Most recently appended event for the site that was not debounced
    virtual std::optional<TransitionEvent> lastAdmittedEvent(const std::string& siteId) const = 0;

    /// Newest first, at most limit entries (0 means unlimited)
    virtual std::vector<TransitionEvent> eventsForSite(const std::string& siteId, std::size_t limit) const = 0;

    // Sites
    virtual void upsertSite(const Site& site) = 0;
    virtual std::optional<Site> getSite(const std::string& siteId) const = 0;
    virtual std::vector<Site> listSites() const = 0;
    virtual void deleteSite(const std::string& siteId) = 0;
};

} // namespace worktrack::ports
