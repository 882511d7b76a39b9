#include "Geo.hpp"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace worktrack {

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);
    
    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);
    
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceToSiteMeters(const Coordinates& point, const Site& site) {
    return distanceMeters(point.latitude, point.longitude, site.latitude, site.longitude);
}

double Geo::distanceToSiteMeters(const PositionFix& fix, const Site& site) {
    return distanceMeters(fix.latitude, fix.longitude, site.latitude, site.longitude);
}

bool Geo::isInsideSite(const Coordinates& point, const Site& site) {
    return distanceToSiteMeters(point, site) <= site.radiusMeters;
}

bool Geo::isValidLatitude(double latitude) {
    return std::isfinite(latitude) && latitude >= -90.0 && latitude <= 90.0;
}

bool Geo::isValidLongitude(double longitude) {
    return std::isfinite(longitude) && longitude >= -180.0 && longitude <= 180.0;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

} // namespace worktrack
