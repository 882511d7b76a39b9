#include "JsonFileTrackingStore.hpp"
#include "../Errors.hpp"
#include "../JsonCodec.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace worktrack::adapters {

namespace fs = std::filesystem;

JsonFileTrackingStore::JsonFileTrackingStore(std::string path, std::shared_ptr<AuditSigner> signer)
    : path_(std::move(path))
    , signer_(std::move(signer)) {
    load();
}

template <typename Fn>
auto JsonFileTrackingStore::mutate(Fn&& fn) -> decltype(fn()) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    auto before = state_.snapshot();
    auto digestBefore = lastDigest_;

    // Validation failures inside fn leave state untouched
    auto result = fn();

    try {
        persist();
    } catch (const std::exception& e) {
        state_.restore(std::move(before));
        lastDigest_ = std::move(digestBefore);
        std::cerr << "[Store] Write to " << path_ << " failed, rolled back: " << e.what() << std::endl;
        throw PersistenceError(std::string("cannot write ") + path_ + ": " + e.what());
    }
    return result;
}

void JsonFileTrackingStore::load() {
    if (!fs::exists(path_)) {
        std::cout << "[Store] " << path_ << " does not exist yet, starting empty" << std::endl;
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw PersistenceError("cannot open " + path_);
    }

    try {
        nlohmann::json doc = nlohmann::json::parse(file);

        int version = doc.value("version", 0);
        if (version != kFormatVersion) {
            throw std::runtime_error("unsupported format version " + std::to_string(version));
        }

        InMemoryTrackingStore::Snapshot snapshot;
        for (const auto& item : doc.at("sites")) {
            auto site = JsonCodec::jsonToSite(item);
            snapshot.sites[site.id] = site;
        }
        for (const auto& item : doc.at("sessions")) {
            auto session = JsonCodec::jsonToSession(item);
            if (!satisfiesInvariants(session)) {
                throw std::runtime_error("session " + session.id + " violates session invariants");
            }
            snapshot.sessions[session.id] = session;
        }
        for (const auto& item : doc.at("events")) {
            snapshot.events.push_back(JsonCodec::jsonToEvent(item));
        }

        if (!snapshot.events.empty()) {
            lastDigest_ = snapshot.events.back().digest;
        }

        std::cout << "[Store] Loaded " << snapshot.sites.size() << " site(s), "
                  << snapshot.sessions.size() << " session(s), "
                  << snapshot.events.size() << " event(s) from " << path_ << std::endl;

        state_.restore(std::move(snapshot));
    } catch (const std::exception& e) {
        throw PersistenceError("corrupt store file " + path_ + ": " + e.what());
    }
}

void JsonFileTrackingStore::persist() const {
    nlohmann::json doc;
    doc["version"] = kFormatVersion;

    doc["sites"] = nlohmann::json::array();
    for (const auto& site : state_.listSites()) {
        doc["sites"].push_back(JsonCodec::siteToJson(site));
    }

    doc["sessions"] = nlohmann::json::array();
    for (const auto& session : state_.allSessions()) {
        doc["sessions"].push_back(JsonCodec::sessionToJson(session));
    }

    doc["events"] = nlohmann::json::array();
    for (const auto& event : state_.allEvents()) {
        doc["events"].push_back(JsonCodec::eventToJson(event));
    }

    const std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot open " + tmpPath + " for writing");
        }
        out << doc.dump(2);
        out.flush();
        if (!out.good()) {
            throw std::runtime_error("short write to " + tmpPath);
        }
    }

    fs::rename(tmpPath, path_);
}

std::optional<TrackingSession> JsonFileTrackingStore::getActiveOrPendingSession(const std::string& siteId) const {
    return state_.getActiveOrPendingSession(siteId);
}

std::optional<TrackingSession> JsonFileTrackingStore::getSession(const std::string& sessionId) const {
    return state_.getSession(sessionId);
}

TrackingSession JsonFileTrackingStore::createSession(const TrackingSession& session) {
    return mutate([&] { return state_.createSession(session); });
}

TrackingSession JsonFileTrackingStore::updateSession(const std::string& sessionId, const SessionPatch& patch) {
    return mutate([&] { return state_.updateSession(sessionId, patch); });
}

std::vector<TrackingSession> JsonFileTrackingStore::queryHistory(const std::string& siteId, std::size_t limit) const {
    return state_.queryHistory(siteId, limit);
}

std::vector<TrackingSession> JsonFileTrackingStore::pendingExitSessions() const {
    return state_.pendingExitSessions();
}

std::vector<TrackingSession> JsonFileTrackingStore::sessionsOverlapping(Timestamp from, Timestamp to) const {
    return state_.sessionsOverlapping(from, to);
}

TransitionEvent JsonFileTrackingStore::appendEvent(const TransitionEvent& event) {
    return mutate([&] {
        auto stored = state_.appendEvent(signEvent(event));
        if (signer_) {
            lastDigest_ = stored.digest;
        }
        return stored;
    });
}

ports::CommittedTransition JsonFileTrackingStore::commitTransition(const ports::TransitionCommit& commit) {
    return mutate([&] {
        ports::TransitionCommit signedCommit = commit;
        signedCommit.event = signEvent(commit.event);
        auto committed = state_.commitTransition(signedCommit);
        if (signer_) {
            lastDigest_ = committed.event.digest;
        }
        return committed;
    });
}

TransitionEvent JsonFileTrackingStore::signEvent(const TransitionEvent& event) const {
    TransitionEvent signedEvent = event;
    if (signer_) {
        try {
            signedEvent.digest = signer_->sign(lastDigest_, JsonCodec::eventSigningPayload(signedEvent));
        } catch (const std::runtime_error& e) {
            throw PersistenceError("cannot sign event " + event.id + ": " + e.what());
        }
    }
    return signedEvent;
}

std::optional<TransitionEvent> JsonFileTrackingStore::lastAdmittedEvent(const std::string& siteId) const {
    return state_.lastAdmittedEvent(siteId);
}

std::vector<TransitionEvent> JsonFileTrackingStore::eventsForSite(const std::string& siteId, std::size_t limit) const {
    return state_.eventsForSite(siteId, limit);
}

void JsonFileTrackingStore::upsertSite(const Site& site) {
    mutate([&] {
        state_.upsertSite(site);
        return true;
    });
}

std::optional<Site> JsonFileTrackingStore::getSite(const std::string& siteId) const {
    return state_.getSite(siteId);
}

std::vector<Site> JsonFileTrackingStore::listSites() const {
    return state_.listSites();
}

void JsonFileTrackingStore::deleteSite(const std::string& siteId) {
    mutate([&] {
        state_.deleteSite(siteId);
        return true;
    });
}

AuditReport JsonFileTrackingStore::verifyAuditChain() const {
    if (!signer_) {
        throw std::logic_error("audit verification requires a signing key");
    }

    AuditReport report;
    std::string previous;
    for (const auto& event : state_.allEvents()) {
        if (!signer_->verify(previous, JsonCodec::eventSigningPayload(event), event.digest)) {
            report.intact = false;
            report.firstBrokenEventId = event.id;
            std::cerr << "[Store] Audit chain broken at event " << event.id << std::endl;
            return report;
        }
        previous = event.digest;
        ++report.verified;
    }
    return report;
}

} // namespace worktrack::adapters
