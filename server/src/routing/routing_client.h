#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "geo/geo.h"
#include "routing/leg.h"

namespace walkplan {

// A remote walking-directions service. Implementations throw on failure;
// callers decide whether to retry or fall back.
class RoutingClient {
 public:
  virtual ~RoutingClient() = default;

  virtual std::string Name() const = 0;

  // Legs for consecutive pairs of `points` (points.size() - 1 of them).
  virtual std::vector<Leg> Route(
      const std::vector<Coordinates>& points, std::chrono::milliseconds timeout
  ) = 0;
};

}  // namespace walkplan
