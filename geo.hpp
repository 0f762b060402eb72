#ifndef GEO_HPP
#define GEO_HPP

#include "delivery.hpp"

const double EARTH_RADIUS_KM = 6371.0;
// Applied to route totals only, never to single legs.
const double ROAD_DISTANCE_FACTOR = 1.2;
const double INVALID_COORDINATE_PENALTY_KM = 1000.0;

bool is_valid_coordinate(double latitude, double longitude);

/**
 * @brief Great-circle distance in km between two points (haversine).
 */
double haversine_km(double lat1, double lng1, double lat2, double lng2);

// Both return INVALID_COORDINATE_PENALTY_KM when a coordinate is missing.
double calculate_distance(const Stop& from, const Stop& to);
double calculate_distance_to_origin(const Stop& stop, const Origin& origin);

#endif // GEO_HPP
