/**
 * @file ExitVerificationScheduler.hpp
 * @brief Timed position re-checks after an exit transition
 *
 * A schedule is plain data derived from a pending-exit session: the exit
 * time, the site geometry and the index of the next check. Nothing runs on
 * its own; the host drives tick() from whatever timer it has, and a tick
 * that arrives late collapses all overdue checks into one position fetch.
 * Because every field can be rebuilt from the persisted session, a process
 * restart loses nothing but the last sample.
 */

#pragma once

#include "ConfidenceEvaluator.hpp"
#include "../TrackingConfig.hpp"
#include "../Types.hpp"
#include "../ports/ILocationProvider.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace worktrack::domain {

enum class VerificationVerdict {
    Commit,
    Cancel
};

/// Resolution reached for one pending exit
struct VerificationResult {
    std::string sessionId;
    std::string siteId;
    VerificationVerdict verdict = VerificationVerdict::Commit;
    ExitResolution resolution = ExitResolution::None;
    Timestamp clockOut{};
    std::optional<double> exitAccuracy;
};

struct VerificationSchedule {
    std::string sessionId;
    Site site;
    Timestamp pendingExitAt{};
    std::optional<double> exitEventAccuracy;
    std::size_t nextCheck = 0;
    std::optional<PositionFix> lastSample;
    std::optional<VerificationResult> verdict;  ///< reached but not yet applied
};

class ExitVerificationScheduler {
public:
    ExitVerificationScheduler(std::shared_ptr<ports::ILocationProvider> locationProvider,
                              const TrackingConfig& config);

    /**
     * @brief Start verifying a session that entered pending_exit
     * @note Replaces an existing schedule for the same session
     */
    void schedule(const TrackingSession& session, const Site& site,
                  std::optional<double> exitEventAccuracy);

    /**
     * @brief Run every check that is due at now
     * @return Verdicts reached. A verdict is returned again on every later
     *         tick until cancel() drops its schedule
     */
    std::vector<VerificationResult> tick(Timestamp now);

    /// Drop a schedule; safe to call repeatedly or for unknown sessions
    bool cancel(const std::string& sessionId);

    bool isScheduled(const std::string& sessionId) const;
    std::optional<Timestamp> nextCheckAt(const std::string& sessionId) const;
    std::size_t activeCount() const { return schedules_.size(); }

private:
    std::optional<VerificationResult> runCheck(VerificationSchedule& schedule, Timestamp now);
    std::optional<PositionFix> samplePosition(const std::string& sessionId);

    std::shared_ptr<ports::ILocationProvider> locationProvider_;
    ConfidenceEvaluator evaluator_;
    std::vector<int> offsetsMinutes_;
    std::map<std::string, VerificationSchedule> schedules_;
};

} // namespace worktrack::domain
