#include "geo/geo.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace walkplan {

namespace {

double ToRadians(double degrees) { return degrees * std::numbers::pi / 180.0; }

}  // namespace

double HaversineKm(Coordinates a, Coordinates b) {
  double phi1 = ToRadians(a.lat);
  double phi2 = ToRadians(b.lat);
  double dphi = ToRadians(b.lat - a.lat);
  double dlambda = ToRadians(b.lon - a.lon);
  double h = std::sin(dphi / 2) * std::sin(dphi / 2) +
             std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2) *
                 std::sin(dlambda / 2);
  // Rounding can push h a hair past 1 for antipodal points.
  h = std::min(1.0, std::max(0.0, h));
  return 2 * kEarthRadiusKm * std::atan2(std::sqrt(h), std::sqrt(1 - h));
}

double WalkMinutes(double distance_km, double speed_kmh) {
  if (distance_km <= 0 || speed_kmh <= 0) {
    return 0.0;
  }
  return distance_km / speed_kmh * 60.0;
}

bool IsValidCoordinates(Coordinates c) {
  return std::isfinite(c.lat) && std::isfinite(c.lon) && c.lat >= -90.0 &&
         c.lat <= 90.0 && c.lon >= -180.0 && c.lon <= 180.0;
}

}  // namespace walkplan
