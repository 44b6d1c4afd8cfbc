#pragma once

#include <ostream>

namespace walkplan {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kWalkSpeedKmh = 4.5;

struct Coordinates {
  double lat;
  double lon;

  bool operator==(const Coordinates& other) const {
    return lat == other.lat && lon == other.lon;
  }
};

// Great-circle distance in kilometers.
double HaversineKm(Coordinates a, Coordinates b);

// Walking time for a distance at a constant speed. Zero for non-positive
// distances.
double WalkMinutes(double distance_km, double speed_kmh = kWalkSpeedKmh);

bool IsValidCoordinates(Coordinates c);

inline std::ostream& operator<<(std::ostream& os, const Coordinates& value) {
  return os << "(" << value.lat << ", " << value.lon << ")";
}

}  // namespace walkplan
