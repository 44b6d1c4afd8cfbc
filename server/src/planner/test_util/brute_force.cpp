#include "planner/test_util/brute_force.h"

#include <algorithm>
#include <limits>
#include <numeric>

#include "planner/sequencer.h"

namespace walkplan {

BruteForceOrder BruteForceShortestOrder(
    Coordinates start, const std::vector<Coordinates>& points
) {
  std::vector<int> perm(points.size());
  std::iota(perm.begin(), perm.end(), 0);

  BruteForceOrder best{perm, std::numeric_limits<double>::infinity()};
  do {
    double length = PathLengthKm(start, points, perm);
    if (length < best.length_km) {
      best = BruteForceOrder{perm, length};
    }
  } while (std::next_permutation(perm.begin(), perm.end()));
  return best;
}

}  // namespace walkplan
