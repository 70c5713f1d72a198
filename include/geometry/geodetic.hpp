#ifndef TRACKALIGN_GEOMETRY_GEODETIC_HPP_
#define TRACKALIGN_GEOMETRY_GEODETIC_HPP_

#include <vector>

#include <Eigen/Core>

#include <tracks/data.hpp>

namespace trackalign {

// Mean Earth radius, in meters.
constexpr double kEarthRadiusM = 6371000.0;

struct GeoPoint {
  double latitude_deg, longitude_deg, altitude_m;
};

// (East, North, Up) offsets in meters from a local origin.
typedef Eigen::Vector3d EnuPoint;

// Local tangent plane (equirectangular) approximation:
//   E = R * dlon * cos(origin_lat)
//   N = R * dlat
//   U = alt - origin_alt
// Accurate to well below GNSS noise for distances up to tens of kilometers,
// which covers a single drone flight. NaN inputs produce NaN outputs.
EnuPoint GeodeticToEnu(const GeoPoint &origin, const GeoPoint &point);

std::vector<EnuPoint>
ProjectToEnu(const GeoPoint &origin,
             const std::vector<TimestampedPosition> &positions);

// First sample with all three coordinates non-NaN. Returns false if there is
// no such sample.
bool FirstValidPosition(const std::vector<TimestampedPosition> &positions,
                        GeoPoint *result);

} // namespace trackalign

#endif // TRACKALIGN_GEOMETRY_GEODETIC_HPP_
