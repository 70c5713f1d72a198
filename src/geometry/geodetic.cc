#include <geometry/geodetic.hpp>

#include <cmath>

#include <glog/logging.h>

namespace trackalign {

namespace {
double DegreesToRadians(double degrees) { return degrees * M_PI / 180.0; }
} // namespace

EnuPoint GeodeticToEnu(const GeoPoint &origin, const GeoPoint &point) {
  const double origin_lat_rad = DegreesToRadians(origin.latitude_deg);
  const double dlat_rad =
      DegreesToRadians(point.latitude_deg - origin.latitude_deg);
  const double dlon_rad =
      DegreesToRadians(point.longitude_deg - origin.longitude_deg);
  return EnuPoint(kEarthRadiusM * dlon_rad * cos(origin_lat_rad),
                  kEarthRadiusM * dlat_rad,
                  point.altitude_m - origin.altitude_m);
}

std::vector<EnuPoint>
ProjectToEnu(const GeoPoint &origin,
             const std::vector<TimestampedPosition> &positions) {
  std::vector<EnuPoint> result;
  result.reserve(positions.size());
  for (const TimestampedPosition &position : positions) {
    result.push_back(GeodeticToEnu(
        origin,
        {position.latitude_deg, position.longitude_deg, position.altitude_m}));
  }
  return result;
}

bool FirstValidPosition(const std::vector<TimestampedPosition> &positions,
                        GeoPoint *result) {
  CHECK_NOTNULL(result);
  for (const TimestampedPosition &position : positions) {
    if (!std::isnan(position.latitude_deg) &&
        !std::isnan(position.longitude_deg) &&
        !std::isnan(position.altitude_m)) {
      *result = {position.latitude_deg, position.longitude_deg,
                 position.altitude_m};
      return true;
    }
  }
  return false;
}

} // namespace trackalign
