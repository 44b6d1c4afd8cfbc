#pragma once

#include <vector>

#include "geo/geo.h"

namespace walkplan {

struct SequencerOptions {
  // Inputs up to this size are solved exactly.
  int dp_threshold = 7;
  int two_opt_max_iterations = 100;
};

// Indices into a point list, in visit order.
using VisitOrder = std::vector<int>;

// Length of the open path start -> points[order[0]] -> ... in kilometers.
double PathLengthKm(
    Coordinates start, const std::vector<Coordinates>& points, const VisitOrder& order
);

// Exact shortest open path by dynamic programming over subsets. The start
// is a fixed virtual node outside the bitmask. O(2^n * n^2).
VisitOrder SolveExactOrder(Coordinates start, const std::vector<Coordinates>& points);

// Greedy: always walk to the closest unvisited point. Ties go to the lower
// index.
VisitOrder NearestNeighborOrder(Coordinates start, const std::vector<Coordinates>& points);

// 2-opt with first improvement: reverses order[i..j] whenever that shortens
// the path, restarting the scan after each accepted move, for at most
// `max_iterations` moves. Never lengthens the path.
VisitOrder ImproveTwoOpt(
    Coordinates start,
    const std::vector<Coordinates>& points,
    VisitOrder order,
    int max_iterations
);

// Iteration cap for 2-opt, scaled down for larger inputs.
int TwoOptIterationCap(size_t point_count, int max_iterations);

// Visit order minimizing haversine path length: exact up to
// options.dp_threshold points, nearest neighbor plus 2-opt above.
VisitOrder OptimizeVisitOrder(
    Coordinates start,
    const std::vector<Coordinates>& points,
    const SequencerOptions& options = {}
);

}  // namespace walkplan
