#include "Types.hpp"

namespace worktrack {

std::string transitionTypeToString(TransitionType type) {
    switch (type) {
        case TransitionType::Enter: return "enter";
        case TransitionType::Exit: return "exit";
    }
    return "enter";
}

std::optional<TransitionType> stringToTransitionType(const std::string& str) {
    if (str == "enter") return TransitionType::Enter;
    if (str == "exit") return TransitionType::Exit;
    return std::nullopt;
}

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Active: return "active";
        case SessionState::PendingExit: return "pending_exit";
        case SessionState::Completed: return "completed";
    }
    return "active";
}

std::optional<SessionState> stringToSessionState(const std::string& str) {
    if (str == "active") return SessionState::Active;
    if (str == "pending_exit") return SessionState::PendingExit;
    if (str == "completed") return SessionState::Completed;
    return std::nullopt;
}

std::string trackingMethodToString(TrackingMethod method) {
    return method == TrackingMethod::Manual ? "manual" : "auto";
}

std::optional<TrackingMethod> stringToTrackingMethod(const std::string& str) {
    if (str == "auto") return TrackingMethod::Auto;
    if (str == "manual") return TrackingMethod::Manual;
    return std::nullopt;
}

std::string exitResolutionToString(ExitResolution resolution) {
    switch (resolution) {
        case ExitResolution::None: return "none";
        case ExitResolution::Immediate: return "immediate";
        case ExitResolution::Verified: return "verified";
        case ExitResolution::ExitByDefault: return "exit_by_default";
        case ExitResolution::Manual: return "manual";
    }
    return "none";
}

std::optional<ExitResolution> stringToExitResolution(const std::string& str) {
    if (str == "none") return ExitResolution::None;
    if (str == "immediate") return ExitResolution::Immediate;
    if (str == "verified") return ExitResolution::Verified;
    if (str == "exit_by_default") return ExitResolution::ExitByDefault;
    if (str == "manual") return ExitResolution::Manual;
    return std::nullopt;
}

std::string ignoreReasonToString(IgnoreReason reason) {
    switch (reason) {
        case IgnoreReason::None: return "none";
        case IgnoreReason::PoorAccuracy: return "poor_accuracy";
        case IgnoreReason::SignalDegradation: return "signal_degradation";
        case IgnoreReason::NoSession: return "no_session";
        case IgnoreReason::Debounced: return "debounced";
        case IgnoreReason::Duplicate: return "duplicate";
    }
    return "none";
}

std::optional<IgnoreReason> stringToIgnoreReason(const std::string& str) {
    if (str == "none") return IgnoreReason::None;
    if (str == "poor_accuracy") return IgnoreReason::PoorAccuracy;
    if (str == "signal_degradation") return IgnoreReason::SignalDegradation;
    if (str == "no_session") return IgnoreReason::NoSession;
    if (str == "debounced") return IgnoreReason::Debounced;
    if (str == "duplicate") return IgnoreReason::Duplicate;
    return std::nullopt;
}

void applyPatch(TrackingSession& session, const SessionPatch& patch) {
    if (patch.state) session.state = *patch.state;

    if (patch.clearClockOut) {
        session.clockOut.reset();
    } else if (patch.clockOut) {
        session.clockOut = patch.clockOut;
    }

    if (patch.clearPendingExit) {
        session.pendingExitAt.reset();
    } else if (patch.pendingExitAt) {
        session.pendingExitAt = patch.pendingExitAt;
    }

    if (patch.exitAccuracy) session.exitAccuracy = patch.exitAccuracy;
    if (patch.durationMinutes) session.durationMinutes = patch.durationMinutes;
    if (patch.exitResolution) session.exitResolution = *patch.exitResolution;
    if (patch.belowMinimum) session.belowMinimum = *patch.belowMinimum;

    session.updatedAt = patch.updatedAt;
}

bool satisfiesInvariants(const TrackingSession& session) {
    const bool completed = session.state == SessionState::Completed;
    const bool pending = session.state == SessionState::PendingExit;

    if (session.clockOut.has_value() != completed) return false;
    if (session.pendingExitAt.has_value() != pending) return false;
    if (session.durationMinutes.has_value() != completed) return false;
    if (session.durationMinutes && *session.durationMinutes < 0) return false;
    if (session.clockOut && *session.clockOut < session.clockIn) return false;
    return true;
}

} // namespace worktrack
