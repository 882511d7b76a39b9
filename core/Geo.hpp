#pragma once

#include "Types.hpp"

namespace worktrack {

class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    
    static double distanceToSiteMeters(const Coordinates& point, const Site& site);
    static double distanceToSiteMeters(const PositionFix& fix, const Site& site);
    
    static bool isInsideSite(const Coordinates& point, const Site& site);
    
    static bool isValidLatitude(double latitude);
    static bool isValidLongitude(double longitude);
    
private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static double toRadians(double degrees);
};

} // namespace worktrack
