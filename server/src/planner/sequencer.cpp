#include "planner/sequencer.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace walkplan {

namespace {

// Larger exact instances would need gigabytes of DP state.
constexpr int kMaxExactPoints = 16;
constexpr double kImprovementEpsilon = 1e-9;

// Node 0 is the start, node k + 1 is points[k].
class DistanceMatrix {
 public:
  DistanceMatrix(Coordinates start, const std::vector<Coordinates>& points)
      : size_(points.size() + 1), values_(size_ * size_, 0.0) {
    std::vector<Coordinates> nodes;
    nodes.reserve(size_);
    nodes.push_back(start);
    nodes.insert(nodes.end(), points.begin(), points.end());
    for (size_t a = 0; a < size_; ++a) {
      for (size_t b = a + 1; b < size_; ++b) {
        double d = HaversineKm(nodes[a], nodes[b]);
        values_[a * size_ + b] = d;
        values_[b * size_ + a] = d;
      }
    }
  }

  double Between(int a, int b) const { return values_[a * size_ + b]; }

  // Distance between two points by their indices in the point list.
  double Points(int i, int j) const { return Between(i + 1, j + 1); }

  double FromStart(int i) const { return Between(0, i + 1); }

 private:
  size_t size_;
  std::vector<double> values_;
};

double OrderLength(const DistanceMatrix& dist, const VisitOrder& order) {
  if (order.empty()) {
    return 0.0;
  }
  double total = dist.FromStart(order[0]);
  for (size_t k = 1; k < order.size(); ++k) {
    total += dist.Points(order[k - 1], order[k]);
  }
  return total;
}

}  // namespace

double PathLengthKm(
    Coordinates start, const std::vector<Coordinates>& points, const VisitOrder& order
) {
  double total = 0.0;
  Coordinates cursor = start;
  for (int index : order) {
    total += HaversineKm(cursor, points[index]);
    cursor = points[index];
  }
  return total;
}

VisitOrder SolveExactOrder(Coordinates start, const std::vector<Coordinates>& points) {
  int n = static_cast<int>(points.size());
  if (n == 0) {
    return {};
  }
  if (n > kMaxExactPoints) {
    throw std::runtime_error(
        "SolveExactOrder supports at most " + std::to_string(kMaxExactPoints) + " points"
    );
  }
  DistanceMatrix dist(start, points);
  const double kInf = std::numeric_limits<double>::infinity();
  size_t states = size_t{1} << n;

  // cost[mask * n + last]: shortest path from start visiting `mask`, ending
  // at `last`.
  std::vector<double> cost(states * n, kInf);
  std::vector<int> parent(states * n, -1);
  for (int i = 0; i < n; ++i) {
    cost[(size_t{1} << i) * n + i] = dist.FromStart(i);
  }
  for (size_t mask = 1; mask < states; ++mask) {
    for (int last = 0; last < n; ++last) {
      if (!(mask & (size_t{1} << last))) {
        continue;
      }
      double current = cost[mask * n + last];
      if (current == kInf) {
        continue;
      }
      for (int next = 0; next < n; ++next) {
        if (mask & (size_t{1} << next)) {
          continue;
        }
        size_t next_mask = mask | (size_t{1} << next);
        double candidate = current + dist.Points(last, next);
        if (candidate < cost[next_mask * n + next]) {
          cost[next_mask * n + next] = candidate;
          parent[next_mask * n + next] = last;
        }
      }
    }
  }

  size_t full = states - 1;
  int best_last = 0;
  for (int last = 1; last < n; ++last) {
    if (cost[full * n + last] < cost[full * n + best_last]) {
      best_last = last;
    }
  }

  VisitOrder order;
  order.reserve(n);
  size_t mask = full;
  int node = best_last;
  while (node != -1) {
    order.push_back(node);
    int prev = parent[mask * n + node];
    mask &= ~(size_t{1} << node);
    node = prev;
  }
  std::reverse(order.begin(), order.end());
  return order;
}

VisitOrder NearestNeighborOrder(Coordinates start, const std::vector<Coordinates>& points) {
  DistanceMatrix dist(start, points);
  int n = static_cast<int>(points.size());
  std::vector<bool> visited(n, false);
  VisitOrder order;
  order.reserve(n);
  int current = -1;  // -1 is the start
  for (int step = 0; step < n; ++step) {
    int best = -1;
    double best_distance = std::numeric_limits<double>::infinity();
    for (int candidate = 0; candidate < n; ++candidate) {
      if (visited[candidate]) {
        continue;
      }
      double d = current < 0 ? dist.FromStart(candidate)
                             : dist.Points(current, candidate);
      if (d < best_distance) {
        best_distance = d;
        best = candidate;
      }
    }
    visited[best] = true;
    order.push_back(best);
    current = best;
  }
  return order;
}

VisitOrder ImproveTwoOpt(
    Coordinates start,
    const std::vector<Coordinates>& points,
    VisitOrder order,
    int max_iterations
) {
  int n = static_cast<int>(order.size());
  if (n < 3) {
    return order;
  }
  DistanceMatrix dist(start, points);
  // Matrix node of the point at position `pos`, with -1 being the start.
  auto node = [&order](int pos) { return pos < 0 ? 0 : order[pos] + 1; };

  for (int iteration = 0; iteration < max_iterations; ++iteration) {
    bool improved = false;
    for (int i = 0; i < n - 1 && !improved; ++i) {
      for (int j = i + 1; j < n && !improved; ++j) {
        // Reversing order[i..j] swaps the edges (i-1, i) and (j, j+1) for
        // (i-1, j) and (i, j+1). The path is open, so j == n-1 has no
        // trailing edge.
        double before = dist.Between(node(i - 1), node(i));
        double after = dist.Between(node(i - 1), node(j));
        if (j + 1 < n) {
          before += dist.Between(node(j), node(j + 1));
          after += dist.Between(node(i), node(j + 1));
        }
        if (after + kImprovementEpsilon < before) {
          std::reverse(order.begin() + i, order.begin() + j + 1);
          improved = true;
        }
      }
    }
    if (!improved) {
      break;
    }
  }
  return order;
}

int TwoOptIterationCap(size_t point_count, int max_iterations) {
  if (point_count <= 15) {
    return std::max(10, max_iterations);
  }
  return std::max(5, max_iterations / 2);
}

VisitOrder OptimizeVisitOrder(
    Coordinates start,
    const std::vector<Coordinates>& points,
    const SequencerOptions& options
) {
  if (points.size() <= 1) {
    return points.empty() ? VisitOrder{} : VisitOrder{0};
  }
  int threshold = std::min(options.dp_threshold, kMaxExactPoints);
  if (static_cast<int>(points.size()) <= threshold) {
    return SolveExactOrder(start, points);
  }
  VisitOrder seed = NearestNeighborOrder(start, points);
  return ImproveTwoOpt(
      start,
      points,
      std::move(seed),
      TwoOptIterationCap(points.size(), options.two_opt_max_iterations)
  );
}

}  // namespace walkplan
