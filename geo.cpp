#include "geo.hpp"
#include <cmath>

static double to_radians(double degrees) {
    static const double PI = std::acos(-1.0);
    return degrees * (PI / 180.0);
}

bool is_valid_coordinate(double latitude, double longitude) {
    if (!std::isfinite(latitude) || !std::isfinite(longitude)) return false;
    if (latitude < -90.0 || latitude > 90.0) return false;
    if (longitude < -180.0 || longitude > 180.0) return false;
    // (0, 0) is what a failed geocode leaves behind
    if (latitude == 0.0 && longitude == 0.0) return false;
    return true;
}

double haversine_km(double lat1, double lng1, double lat2, double lng2) {
    double phi1 = to_radians(lat1);
    double phi2 = to_radians(lat2);
    double delta_lat = to_radians(lat2 - lat1);
    double delta_lng = to_radians(lng2 - lng1);

    double a = std::sin(delta_lat / 2) * std::sin(delta_lat / 2) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(delta_lng / 2) * std::sin(delta_lng / 2);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

    return EARTH_RADIUS_KM * c;
}

double calculate_distance(const Stop& from, const Stop& to) {
    if (!from.has_coordinates() || !to.has_coordinates()) {
        return INVALID_COORDINATE_PENALTY_KM;
    }
    return haversine_km(*from.latitude, *from.longitude, *to.latitude, *to.longitude);
}

double calculate_distance_to_origin(const Stop& stop, const Origin& origin) {
    if (!stop.has_coordinates() || !is_valid_coordinate(origin.latitude, origin.longitude)) {
        return INVALID_COORDINATE_PENALTY_KM;
    }
    return haversine_km(origin.latitude, origin.longitude, *stop.latitude, *stop.longitude);
}
