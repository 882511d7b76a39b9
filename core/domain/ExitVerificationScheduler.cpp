#include "ExitVerificationScheduler.hpp"
#include "../Geo.hpp"
#include "../IClock.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace worktrack::domain {

ExitVerificationScheduler::ExitVerificationScheduler(
    std::shared_ptr<ports::ILocationProvider> locationProvider,
    const TrackingConfig& config)
    : locationProvider_(std::move(locationProvider))
    , evaluator_(config)
    , offsetsMinutes_(config.verificationOffsetsMinutes) {
}

void ExitVerificationScheduler::schedule(const TrackingSession& session, const Site& site,
                                         std::optional<double> exitEventAccuracy) {
    if (!session.pendingExitAt) {
        std::cerr << "[ExitVerification] Session " << session.id
                  << " has no pending exit, not scheduling" << std::endl;
        return;
    }

    VerificationSchedule schedule;
    schedule.sessionId = session.id;
    schedule.site = site;
    schedule.pendingExitAt = *session.pendingExitAt;
    schedule.exitEventAccuracy = exitEventAccuracy;

    schedules_[session.id] = std::move(schedule);

    std::cout << "[ExitVerification] Scheduled " << offsetsMinutes_.size()
              << " checks for session " << session.id << " at " << site.name << std::endl;
}

std::vector<VerificationResult> ExitVerificationScheduler::tick(Timestamp now) {
    std::vector<VerificationResult> results;

    for (auto& [sessionId, schedule] : schedules_) {
        if (!schedule.verdict) {
            schedule.verdict = runCheck(schedule, now);
        }
        if (schedule.verdict) {
            results.push_back(*schedule.verdict);
        }
    }

    return results;
}

std::optional<VerificationResult> ExitVerificationScheduler::runCheck(VerificationSchedule& schedule,
                                                                      Timestamp now) {
    auto checkTime = [&](std::size_t index) {
        return schedule.pendingExitAt + std::chrono::minutes(offsetsMinutes_[index]);
    };

    std::size_t due = schedule.nextCheck;
    while (due < offsetsMinutes_.size() && checkTime(due) <= now) {
        ++due;
    }
    if (due == schedule.nextCheck) {
        return std::nullopt;
    }

    if (due - schedule.nextCheck > 1) {
        std::cout << "[ExitVerification] Collapsing " << (due - schedule.nextCheck)
                  << " overdue checks for session " << schedule.sessionId << std::endl;
    }

    const std::size_t checkIndex = due - 1;
    const Timestamp scheduledAt = checkTime(checkIndex);
    schedule.nextCheck = due;

    VerificationResult result;
    result.sessionId = schedule.sessionId;
    result.siteId = schedule.site.id;

    auto fix = samplePosition(schedule.sessionId);
    if (fix && fix->timestamp < schedule.pendingExitAt) {
        std::cout << "[ExitVerification] Check " << (checkIndex + 1) << "/" << offsetsMinutes_.size()
                  << " for session " << schedule.sessionId << " inconclusive: fix from "
                  << formatIso8601(fix->timestamp) << " predates the exit" << std::endl;
        fix.reset();
    } else if (!fix) {
        std::cout << "[ExitVerification] Check " << (checkIndex + 1) << "/" << offsetsMinutes_.size()
                  << " for session " << schedule.sessionId << " inconclusive: no position" << std::endl;
    }

    if (fix) {
        schedule.lastSample = fix;
        auto confidence = evaluator_.evaluateFix(*fix, schedule.site);

        std::cout << "[ExitVerification] Check " << (checkIndex + 1) << "/" << offsetsMinutes_.size()
                  << " for session " << schedule.sessionId
                  << ": accuracy " << fix->accuracy << "m, distance "
                  << Geo::distanceToSiteMeters(*fix, schedule.site) << "m, "
                  << confidenceTierToString(confidence.tier) << "/"
                  << placementToString(confidence.placement) << std::endl;

        if (confidence.isHigh() && confidence.placement == Placement::ConfidentlyOutside) {
            result.verdict = VerificationVerdict::Commit;
            result.resolution = ExitResolution::Verified;
            result.clockOut = std::min(fix->timestamp, scheduledAt);
            result.exitAccuracy = fix->accuracy;
            return result;
        }

        if (confidence.isHigh() && confidence.placement == Placement::ConfidentlyInside) {
            result.verdict = VerificationVerdict::Cancel;
            return result;
        }
    }

    if (schedule.nextCheck < offsetsMinutes_.size()) {
        return std::nullopt;
    }

    result.verdict = VerificationVerdict::Commit;
    result.resolution = ExitResolution::ExitByDefault;
    result.clockOut = scheduledAt;
    result.exitAccuracy = schedule.lastSample
        ? std::optional<double>(schedule.lastSample->accuracy)
        : schedule.exitEventAccuracy;

    std::cout << "[ExitVerification] Schedule exhausted for session " << schedule.sessionId
              << ", exit by default at " << formatIso8601(scheduledAt) << std::endl;
    return result;
}

std::optional<PositionFix> ExitVerificationScheduler::samplePosition(const std::string& sessionId) {
    try {
        return locationProvider_->fetchCurrentPosition();
    } catch (const std::exception& e) {
        std::cerr << "[ExitVerification] Position fetch failed for session " << sessionId
                  << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool ExitVerificationScheduler::cancel(const std::string& sessionId) {
    return schedules_.erase(sessionId) > 0;
}

bool ExitVerificationScheduler::isScheduled(const std::string& sessionId) const {
    return schedules_.count(sessionId) > 0;
}

std::optional<Timestamp> ExitVerificationScheduler::nextCheckAt(const std::string& sessionId) const {
    auto it = schedules_.find(sessionId);
    if (it == schedules_.end() || it->second.nextCheck >= offsetsMinutes_.size()) {
        return std::nullopt;
    }
    return it->second.pendingExitAt + std::chrono::minutes(offsetsMinutes_[it->second.nextCheck]);
}

} // namespace worktrack::domain
