#pragma once

#include <vector>

#include "geo/geo.h"

namespace walkplan {

struct BruteForceOrder {
  std::vector<int> order;
  double length_km;
};

// Shortest open path from `start` through every point, by enumerating all
// permutations. Only usable for a handful of points.
BruteForceOrder BruteForceShortestOrder(
    Coordinates start, const std::vector<Coordinates>& points
);

}  // namespace walkplan
