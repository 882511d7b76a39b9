#pragma once

#include "../TrackingConfig.hpp"
#include "../Types.hpp"
#include <optional>
#include <string>

namespace worktrack::domain {

enum class ConfidenceTier {
    High,
    Low,
    Unknown
};

enum class Placement {
    ConfidentlyInside,
    ConfidentlyOutside,
    Uncertain
};

struct Confidence {
    ConfidenceTier tier = ConfidenceTier::Unknown;
    Placement placement = Placement::Uncertain;

    bool isHigh() const { return tier == ConfidenceTier::High; }
};

std::string confidenceTierToString(ConfidenceTier tier);
std::string placementToString(Placement placement);

/**
 * @brief Grades a location reading against a site
 *
 * Stateless. The tier depends on accuracy alone; the placement additionally
 * needs the distance to the site center. A reading without accuracy is
 * never confidently placed.
 */
class ConfidenceEvaluator {
public:
    explicit ConfidenceEvaluator(const TrackingConfig& config);

    ConfidenceTier tier(std::optional<double> accuracyMeters) const;

    Confidence evaluate(std::optional<double> accuracyMeters,
                        std::optional<double> distanceMeters,
                        double radiusMeters) const;

    Confidence evaluateFix(const PositionFix& fix, const Site& site) const;

    Confidence evaluateTransition(const LocationTransition& transition, const Site& site) const;

private:
    double highConfidenceAccuracyMeters_;
    double exitMarginMeters_;
};

} // namespace worktrack::domain
