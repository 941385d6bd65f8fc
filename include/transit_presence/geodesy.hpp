// === Geodesy =================================================================
//
// Great-circle helpers shared by the displacement filter, the publisher's
// debounce, and proximity discovery.

#pragma once

#include "transit_presence/types.hpp"

namespace transit_presence {

/** @brief Mean Earth radius used for all geodesic calculations. */
inline constexpr double k_earth_radius_m{6'371'000.0};

/**
 * @brief Determine the great-circle (haversine) distance separating two coordinates.
 */
double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Compute the coordinate reached by travelling @p distance_m along @p bearing_deg.
 */
GeodeticCoordinate offset_coordinate(const GeodeticCoordinate& origin, double bearing_deg, double distance_m);

}  // namespace transit_presence
