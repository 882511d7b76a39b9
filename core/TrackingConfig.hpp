/**
 * @file TrackingConfig.hpp
 * @brief Tunable parameters of the tracking pipeline
 *
 * Defaults match the production tuning. The verification offsets and the
 * exit distance margin are expected to change as field data comes in, so
 * they are plain configuration rather than constants.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace worktrack {

struct TrackingConfig {
    int cooldownSeconds = 10;                       ///< debounce window per site
    double highConfidenceAccuracyMeters = 50.0;     ///< strictly below is high confidence
    std::vector<int> verificationOffsetsMinutes = {1, 3, 5};
    int minimumSessionMinutes = 5;                  ///< shorter sessions are flagged, not deleted
    double poorAccuracyMeters = 100.0;              ///< exits worse than this are ignored
    double degradationFactor = 3.0;                 ///< exit vs check-in accuracy ratio limit
    double exitMarginMeters = 0.0;                  ///< extra distance required to confirm exit
    int staleGraceMinutes = 5;                      ///< restart grace after the last check

    double minRadiusMeters = 100.0;
    double maxRadiusMeters = 1000.0;
    double defaultRadiusMeters = 200.0;

    std::chrono::seconds cooldown() const {
        return std::chrono::seconds(cooldownSeconds);
    }

    std::chrono::minutes verificationOffset(std::size_t index) const {
        return std::chrono::minutes(verificationOffsetsMinutes.at(index));
    }

    /// Delay of the final verification check after the exit event
    std::chrono::minutes lastVerificationOffset() const {
        return std::chrono::minutes(verificationOffsetsMinutes.empty()
            ? 0 : verificationOffsetsMinutes.back());
    }

    /// Age after which a pending exit is resolved without sampling
    std::chrono::minutes maxVerificationWindow() const {
        return lastVerificationOffset() + std::chrono::minutes(staleGraceMinutes);
    }

    /**
     * @brief Check internal consistency
     * @param reason Receives a description of the first problem found
     * @return true if the configuration is usable
     */
    bool validate(std::string& reason) const {
        if (cooldownSeconds < 0) {
            reason = "cooldown_seconds must not be negative";
            return false;
        }
        if (verificationOffsetsMinutes.empty()) {
            reason = "verification_offsets_minutes must not be empty";
            return false;
        }
        int previous = 0;
        for (int offset : verificationOffsetsMinutes) {
            if (offset <= previous) {
                reason = "verification_offsets_minutes must be positive and strictly increasing";
                return false;
            }
            previous = offset;
        }
        if (highConfidenceAccuracyMeters <= 0.0 || poorAccuracyMeters <= 0.0) {
            reason = "accuracy thresholds must be positive";
            return false;
        }
        if (degradationFactor < 1.0) {
            reason = "degradation_factor must be at least 1";
            return false;
        }
        if (exitMarginMeters < 0.0 || minimumSessionMinutes < 0 || staleGraceMinutes < 0) {
            reason = "margins and durations must not be negative";
            return false;
        }
        if (minRadiusMeters <= 0.0 || minRadiusMeters > maxRadiusMeters ||
            defaultRadiusMeters < minRadiusMeters || defaultRadiusMeters > maxRadiusMeters) {
            reason = "radius bounds are inconsistent";
            return false;
        }
        return true;
    }
};

} // namespace worktrack
