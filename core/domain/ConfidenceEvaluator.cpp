#include "ConfidenceEvaluator.hpp"
#include "../Geo.hpp"
#include <cmath>

namespace worktrack::domain {

std::string confidenceTierToString(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::High: return "high";
        case ConfidenceTier::Low: return "low";
        case ConfidenceTier::Unknown: return "unknown";
    }
    return "unknown";
}

std::string placementToString(Placement placement) {
    switch (placement) {
        case Placement::ConfidentlyInside: return "inside";
        case Placement::ConfidentlyOutside: return "outside";
        case Placement::Uncertain: return "uncertain";
    }
    return "uncertain";
}

ConfidenceEvaluator::ConfidenceEvaluator(const TrackingConfig& config)
    : highConfidenceAccuracyMeters_(config.highConfidenceAccuracyMeters)
    , exitMarginMeters_(config.exitMarginMeters) {
}

ConfidenceTier ConfidenceEvaluator::tier(std::optional<double> accuracyMeters) const {
    if (!accuracyMeters || !std::isfinite(*accuracyMeters) || *accuracyMeters < 0.0) {
        return ConfidenceTier::Unknown;
    }
    return *accuracyMeters < highConfidenceAccuracyMeters_ ? ConfidenceTier::High : ConfidenceTier::Low;
}

Confidence ConfidenceEvaluator::evaluate(std::optional<double> accuracyMeters,
                                         std::optional<double> distanceMeters,
                                         double radiusMeters) const {
    Confidence result;
    result.tier = tier(accuracyMeters);

    if (result.tier == ConfidenceTier::Unknown || !distanceMeters) {
        return result;
    }

    const double accuracy = *accuracyMeters;
    const double distance = *distanceMeters;

    if (distance - accuracy > radiusMeters + exitMarginMeters_) {
        result.placement = Placement::ConfidentlyOutside;
    } else if (distance + accuracy < radiusMeters) {
        result.placement = Placement::ConfidentlyInside;
    }
    return result;
}

Confidence ConfidenceEvaluator::evaluateFix(const PositionFix& fix, const Site& site) const {
    return evaluate(fix.accuracy, Geo::distanceToSiteMeters(fix, site), site.radiusMeters);
}

Confidence ConfidenceEvaluator::evaluateTransition(const LocationTransition& transition,
                                                   const Site& site) const {
    std::optional<double> distance;
    if (transition.position) {
        distance = Geo::distanceToSiteMeters(*transition.position, site);
    }
    return evaluate(transition.accuracy, distance, site.radiusMeters);
}

} // namespace worktrack::domain
