/**
 * @file Types.hpp
 * @brief Core value types for work-session tracking
 *
 * Defines sites, tracking sessions, transition events and the enums that
 * describe their lifecycle. All timestamps are wall-clock time points so
 * they can be persisted and compared across process restarts.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace worktrack {

using Timestamp = std::chrono::system_clock::time_point;

enum class TransitionType {
    Enter,
    Exit
};

enum class SessionState {
    Active,
    PendingExit,
    Completed
};

enum class TrackingMethod {
    Auto,
    Manual
};

/// How a completed session obtained its clock-out time
enum class ExitResolution {
    None,
    Immediate,      ///< exit event itself was high confidence
    Verified,       ///< a verification sample confirmed the exit
    ExitByDefault,  ///< verification budget exhausted without confirmation
    Manual          ///< user clock-out
};

enum class IgnoreReason {
    None,
    PoorAccuracy,
    SignalDegradation,
    NoSession,
    Debounced,
    Duplicate
};

/**
 * @brief Named circular work location
 *
 * Radius is bounded by TrackingConfig::minRadiusMeters and
 * TrackingConfig::maxRadiusMeters; SiteRegistry enforces the bounds.
 */
struct Site {
    std::string id;
    std::string name;
    double latitude = 0.0;
    double longitude = 0.0;
    double radiusMeters = 200.0;
    bool active = true;
    Timestamp createdAt{};
    Timestamp updatedAt{};
};

/**
 * @brief One contiguous stretch of work at a site
 *
 * Invariants:
 * - clockOut is set iff state == Completed
 * - pendingExitAt is set iff state == PendingExit
 * - durationMinutes is set iff state == Completed and is never negative
 */
struct TrackingSession {
    std::string id;
    std::string siteId;
    Timestamp clockIn{};
    std::optional<Timestamp> clockOut;
    TrackingMethod trackingMethod = TrackingMethod::Auto;
    SessionState state = SessionState::Active;
    std::optional<Timestamp> pendingExitAt;
    std::optional<double> checkinAccuracy;
    std::optional<double> exitAccuracy;
    std::optional<std::int64_t> durationMinutes;
    ExitResolution exitResolution = ExitResolution::None;
    bool belowMinimum = false;
    Timestamp createdAt{};
    Timestamp updatedAt{};

    bool isOpen() const {
        return state == SessionState::Active || state == SessionState::PendingExit;
    }
};

/**
 * @brief Partial update applied by ITrackingStore::updateSession
 *
 * Unset fields keep their stored value. clearClockOut and clearPendingExit
 * reset the corresponding optional.
 */
struct SessionPatch {
    std::optional<SessionState> state;
    std::optional<Timestamp> clockOut;
    bool clearClockOut = false;
    std::optional<Timestamp> pendingExitAt;
    bool clearPendingExit = false;
    std::optional<double> exitAccuracy;
    std::optional<std::int64_t> durationMinutes;
    std::optional<ExitResolution> exitResolution;
    std::optional<bool> belowMinimum;
    Timestamp updatedAt{};
};

struct Coordinates {
    double latitude = 0.0;
    double longitude = 0.0;
};

/// Validated transition notification from the location capability
struct LocationTransition {
    std::string siteId;
    TransitionType type = TransitionType::Enter;
    Timestamp timestamp{};
    std::optional<Coordinates> position;
    std::optional<double> accuracy;
};

/// Write-once audit record of every transition the engine received
struct TransitionEvent {
    std::string id;
    std::string siteId;
    TransitionType type = TransitionType::Enter;
    Timestamp timestamp{};
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> accuracy;
    bool ignored = false;
    IgnoreReason ignoreReason = IgnoreReason::None;
    std::string digest;

    /// Debounced events do not count as admitted for cooldown purposes
    bool admitted() const { return ignoreReason != IgnoreReason::Debounced; }
};

/// Result of an active position fetch
struct PositionFix {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracy = 0.0;
    Timestamp timestamp{};
};

std::string transitionTypeToString(TransitionType type);
std::optional<TransitionType> stringToTransitionType(const std::string& str);

std::string sessionStateToString(SessionState state);
std::optional<SessionState> stringToSessionState(const std::string& str);

std::string trackingMethodToString(TrackingMethod method);
std::optional<TrackingMethod> stringToTrackingMethod(const std::string& str);

std::string exitResolutionToString(ExitResolution resolution);
std::optional<ExitResolution> stringToExitResolution(const std::string& str);

std::string ignoreReasonToString(IgnoreReason reason);
std::optional<IgnoreReason> stringToIgnoreReason(const std::string& str);

/// Applies a patch in place; does not check invariants
void applyPatch(TrackingSession& session, const SessionPatch& patch);

/// True when the clockOut/pendingExitAt/duration invariants hold
bool satisfiesInvariants(const TrackingSession& session);

} // namespace worktrack
