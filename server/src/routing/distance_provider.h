#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "config/planner_config.h"
#include "geo/geo.h"
#include "log.h"
#include "routing/leg.h"
#include "routing/routing_client.h"
#include "util/deadline.h"
#include "util/retry.h"
#include "util/ttl_cache.h"

namespace walkplan {

// Gives the walking leg between two points. Implementations must be safe to
// call from several threads at once.
class DistanceProvider {
 public:
  virtual ~DistanceProvider() = default;

  // Never throws: remote failures are absorbed by a fallback.
  virtual Leg ComputeLeg(Coordinates from, Coordinates to, const Deadline& deadline) = 0;
};

// Straight-line estimate: haversine distance, constant walking speed and a
// two-point geometry.
Leg EstimateLeg(Coordinates from, Coordinates to, double walk_speed_kmh = kWalkSpeedKmh);

class HaversineDistanceProvider : public DistanceProvider {
 public:
  explicit HaversineDistanceProvider(double walk_speed_kmh = kWalkSpeedKmh)
      : walk_speed_kmh_(walk_speed_kmh) {}

  Leg ComputeLeg(Coordinates from, Coordinates to, const Deadline& deadline) override;

 private:
  double walk_speed_kmh_;
};

// Tries each routing client in order, each with bounded retries, and ends
// with the haversine estimate. Routed legs are cached.
class FallbackDistanceProvider : public DistanceProvider {
 public:
  FallbackDistanceProvider(
      std::vector<RoutingClient*> clients,
      const RoutingConfig& config,
      TextLogger log = NullLogger(),
      Sleeper sleep = ThreadSleeper()
  );

  Leg ComputeLeg(Coordinates from, Coordinates to, const Deadline& deadline) override;

  // Number of legs that had to be estimated because every client failed.
  int fallback_count() const { return fallback_count_.load(); }

 private:
  std::vector<RoutingClient*> clients_;
  RoutingConfig config_;
  RetryPolicy retry_policy_;
  TextLogger log_;
  Sleeper sleep_;
  TtlCache<std::string, Leg> cache_;
  std::atomic<int> fallback_count_{0};
};

// Cache key: both endpoints rounded to 6 decimals.
std::string LegCacheKey(Coordinates from, Coordinates to);

}  // namespace walkplan
