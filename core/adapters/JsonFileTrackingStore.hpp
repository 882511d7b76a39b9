/**
 * @file JsonFileTrackingStore.hpp
 * @brief Durable ITrackingStore backed by a single JSON document
 *
 * The whole store is rewritten on every mutation: the document is written to
 * "<path>.tmp" and renamed over the previous file, so a crash leaves either
 * the old or the new document. When the write fails the in-memory view is
 * rolled back and PersistenceError is thrown.
 *
 * With an AuditSigner attached, every appended event carries an HMAC digest
 * chained to the previous event; verifyAuditChain() detects edits to the
 * event log made outside this class.
 */

#pragma once

#include "InMemoryTrackingStore.hpp"
#include "../../crypto/AuditSigner.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace worktrack::adapters {

struct AuditReport {
    bool intact = true;
    std::size_t verified = 0;
    std::optional<std::string> firstBrokenEventId;
};

class JsonFileTrackingStore : public ports::ITrackingStore {
public:
    static constexpr int kFormatVersion = 1;

    /// @throws PersistenceError if an existing file cannot be read or parsed
    explicit JsonFileTrackingStore(std::string path, std::shared_ptr<AuditSigner> signer = nullptr);
    ~JsonFileTrackingStore() override = default;

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

    /// Check every event digest against the chain; requires a signer
    AuditReport verifyAuditChain() const;

    const std::string& path() const { return path_; }

private:
    template <typename Fn>
    auto mutate(Fn&& fn) -> decltype(fn());

    void load();
    void persist() const;
    TransitionEvent signEvent(const TransitionEvent& event) const;

    std::string path_;
    std::shared_ptr<AuditSigner> signer_;
    InMemoryTrackingStore state_;
    std::string lastDigest_;
    std::mutex writeMutex_;
};

} // namespace worktrack::adapters
