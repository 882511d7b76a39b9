#include "InMemoryTrackingStore.hpp"
#include "../Errors.hpp"
#include <algorithm>

namespace worktrack::adapters {

namespace {

bool newerFirst(const TrackingSession& a, const TrackingSession& b) {
    return a.clockIn > b.clockIn;
}

} // namespace

std::optional<TrackingSession> InMemoryTrackingStore::getActiveOrPendingSession(const std::string& siteId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, session] : sessions_) {
        if (session.siteId == siteId && session.isOpen()) {
            return session;
        }
    }
    return std::nullopt;
}

std::optional<TrackingSession> InMemoryTrackingStore::getSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TrackingSession InMemoryTrackingStore::createSession(const TrackingSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    return insertSession(sessions_, session);
}

TrackingSession InMemoryTrackingStore::updateSession(const std::string& sessionId, const SessionPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    return patchSession(sessions_, sessionId, patch);
}

TrackingSession InMemoryTrackingStore::insertSession(SessionMap& sessions, const TrackingSession& session) {
    if (session.id.empty()) {
        throw PersistenceError("session id must not be empty");
    }
    if (sessions.count(session.id) > 0) {
        throw PersistenceError("session " + session.id + " already exists");
    }
    if (!satisfiesInvariants(session)) {
        throw PersistenceError("session " + session.id + " violates session invariants");
    }
    if (session.isOpen()) {
        for (const auto& [id, existing] : sessions) {
            if (existing.siteId == session.siteId && existing.isOpen()) {
                throw PersistenceError("site " + session.siteId + " already has open session " + id);
            }
        }
    }

    sessions[session.id] = session;
    return session;
}

TrackingSession InMemoryTrackingStore::patchSession(SessionMap& sessions, const std::string& sessionId,
                                                    const SessionPatch& patch) {
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        throw PersistenceError("unknown session " + sessionId);
    }

    TrackingSession updated = it->second;
    applyPatch(updated, patch);
    if (!satisfiesInvariants(updated)) {
        throw PersistenceError("update would break invariants of session " + sessionId);
    }

    it->second = updated;
    return updated;
}

std::vector<TrackingSession> InMemoryTrackingStore::queryHistory(const std::string& siteId, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrackingSession> result;
    for (const auto& [id, session] : sessions_) {
        if (session.siteId == siteId) {
            result.push_back(session);
        }
    }
    std::sort(result.begin(), result.end(), newerFirst);
    if (limit > 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::vector<TrackingSession> InMemoryTrackingStore::pendingExitSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrackingSession> result;
    for (const auto& [id, session] : sessions_) {
        if (session.state == SessionState::PendingExit) {
            result.push_back(session);
        }
    }
    return result;
}

std::vector<TrackingSession> InMemoryTrackingStore::sessionsOverlapping(Timestamp from, Timestamp to) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TrackingSession> result;
    for (const auto& [id, session] : sessions_) {
        if (session.clockIn < to && (!session.clockOut || *session.clockOut > from)) {
            result.push_back(session);
        }
    }
    std::sort(result.begin(), result.end(), [](const TrackingSession& a, const TrackingSession& b) {
        return a.clockIn < b.clockIn;
    });
    return result;
}

TransitionEvent InMemoryTrackingStore::appendEvent(const TransitionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    checkEventWritable();

    events_.push_back(event);
    return event;
}

ports::CommittedTransition InMemoryTrackingStore::commitTransition(const ports::TransitionCommit& commit) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();

    // Stage on a copy so a rejected step leaves the live map untouched
    SessionMap staged = sessions_;
    ports::CommittedTransition result;
    for (const auto& [sessionId, patch] : commit.updates) {
        result.updated.push_back(patchSession(staged, sessionId, patch));
    }
    if (commit.created) {
        result.created = insertSession(staged, *commit.created);
    }
    checkEventWritable();

    sessions_ = std::move(staged);
    events_.push_back(commit.event);
    result.event = commit.event;
    return result;
}

std::optional<TransitionEvent> InMemoryTrackingStore::lastAdmittedEvent(const std::string& siteId) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->siteId == siteId && it->admitted()) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<TransitionEvent> InMemoryTrackingStore::eventsForSite(const std::string& siteId, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TransitionEvent> result;
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->siteId != siteId) {
            continue;
        }
        result.push_back(*it);
        if (limit > 0 && result.size() == limit) {
            break;
        }
    }
    return result;
}

void InMemoryTrackingStore::upsertSite(const Site& site) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    sites_[site.id] = site;
}

std::optional<Site> InMemoryTrackingStore::getSite(const std::string& siteId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sites_.find(siteId);
    if (it == sites_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Site> InMemoryTrackingStore::listSites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Site> result;
    result.reserve(sites_.size());
    for (const auto& [id, site] : sites_) {
        result.push_back(site);
    }
    return result;
}

void InMemoryTrackingStore::deleteSite(const std::string& siteId) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    sites_.erase(siteId);
}

InMemoryTrackingStore::Snapshot InMemoryTrackingStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{sites_, sessions_, events_};
}

void InMemoryTrackingStore::restore(Snapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    sites_ = std::move(snapshot.sites);
    sessions_ = std::move(snapshot.sessions);
    events_ = std::move(snapshot.events);
}

std::vector<TransitionEvent> InMemoryTrackingStore::allEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<TrackingSession> InMemoryTrackingStore::allSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TrackingSession> result;
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

void InMemoryTrackingStore::setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = fail;
}

bool InMemoryTrackingStore::failWrites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failWrites_;
}

void InMemoryTrackingStore::setFailEventWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failEventWrites_ = fail;
}

void InMemoryTrackingStore::checkWritable() const {
    if (failWrites_) {
        throw PersistenceError("store is not accepting writes");
    }
}

void InMemoryTrackingStore::checkEventWritable() const {
    if (failEventWrites_) {
        throw PersistenceError("event log is not accepting writes");
    }
}

} // namespace worktrack::adapters
