#pragma once

#include "../ports/ITrackingStore.hpp"
#include <map>
#include <mutex>
#include <vector>

namespace worktrack::adapters {

/**
 * @brief Volatile ITrackingStore
 *
 * Reference semantics for the store contract. Also used as the working set
 * of JsonFileTrackingStore and as a test double: setFailWrites() makes every
 * mutating call throw PersistenceError without touching state, and
 * setFailEventWrites() rejects only the event log part of a write.
 */
class InMemoryTrackingStore : public ports::ITrackingStore {
public:
    struct Snapshot {
        std::map<std::string, Site> sites;
        std::map<std::string, TrackingSession> sessions;
        std::vector<TransitionEvent> events;
    };

    InMemoryTrackingStore() = default;
    ~InMemoryTrackingStore() override = default;

    std::optional<TrackingSession> getActiveOrPendingSession(const std::string& siteId) const override;
    std::optional<TrackingSession> getSession(const std::string& sessionId) const override;
    TrackingSession createSession(const TrackingSession& session) override;
    TrackingSession updateSession(const std::string& sessionId, const SessionPatch& patch) override;
    std::vector<TrackingSession> queryHistory(const std::string& siteId, std::size_t limit) const override;
    std::vector<TrackingSession> pendingExitSessions() const override;
    std::vector<TrackingSession> sessionsOverlapping(Timestamp from, Timestamp to) const override;

    TransitionEvent appendEvent(const TransitionEvent& event) override;
    ports::CommittedTransition commitTransition(const ports::TransitionCommit& commit) override;
    std::optional<TransitionEvent> lastAdmittedEvent(const std::string& siteId) const override;
    std::vector<TransitionEvent> eventsForSite(const std::string& siteId, std::size_t limit) const override;

    void upsertSite(const Site& site) override;
    std::optional<Site> getSite(const std::string& siteId) const override;
    std::vector<Site> listSites() const override;
    void deleteSite(const std::string& siteId) override;

    Snapshot snapshot() const;
    void restore(Snapshot snapshot);

    /// Events in append order
    std::vector<TransitionEvent> allEvents() const;
    std::vector<TrackingSession> allSessions() const;

    void setFailWrites(bool fail);
    bool failWrites() const;
    void setFailEventWrites(bool fail);

private:
    using SessionMap = std::map<std::string, TrackingSession>;

    void checkWritable() const;
    void checkEventWritable() const;
    static TrackingSession insertSession(SessionMap& sessions, const TrackingSession& session);
    static TrackingSession patchSession(SessionMap& sessions, const std::string& sessionId,
                                        const SessionPatch& patch);

    std::map<std::string, Site> sites_;
    SessionMap sessions_;
    std::vector<TransitionEvent> events_;
    bool failWrites_ = false;
    bool failEventWrites_ = false;
    mutable std::mutex mutex_;
};

} // namespace worktrack::adapters
