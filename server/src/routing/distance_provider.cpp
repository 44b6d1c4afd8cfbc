#include "routing/distance_provider.h"

#include <algorithm>
#include <format>

namespace walkplan {

Leg EstimateLeg(Coordinates from, Coordinates to, double walk_speed_kmh) {
  double distance_km = HaversineKm(from, to);
  return Leg{
      .distance_km = distance_km,
      .duration_minutes = WalkMinutes(distance_km, walk_speed_kmh),
      .geometry = {from, to},
      .maneuvers = {},
      .source = LegSource::kEstimated,
  };
}

Leg HaversineDistanceProvider::ComputeLeg(
    Coordinates from, Coordinates to, const Deadline& /*deadline*/
) {
  return EstimateLeg(from, to, walk_speed_kmh_);
}

std::string LegCacheKey(Coordinates from, Coordinates to) {
  return std::format(
      "{:.6f},{:.6f}|{:.6f},{:.6f}", from.lat, from.lon, to.lat, to.lon
  );
}

FallbackDistanceProvider::FallbackDistanceProvider(
    std::vector<RoutingClient*> clients,
    const RoutingConfig& config,
    TextLogger log,
    Sleeper sleep
)
    : clients_(std::move(clients)),
      config_(config),
      retry_policy_{
          .max_attempts = config.max_attempts,
          .initial_backoff = std::chrono::milliseconds{config.initial_backoff_ms},
          .backoff_multiplier = config.backoff_multiplier,
      },
      log_(std::move(log)),
      sleep_(std::move(sleep)),
      cache_(
          std::chrono::seconds{config.cache_ttl_seconds},
          static_cast<size_t>(std::max(0, config.cache_capacity))
      ) {}

Leg FallbackDistanceProvider::ComputeLeg(
    Coordinates from, Coordinates to, const Deadline& deadline
) {
  if (from == to) {
    return EstimateLeg(from, to, config_.walk_speed_kmh);
  }
  std::string key = LegCacheKey(from, to);
  if (std::optional<Leg> cached = cache_.Get(key)) {
    return *cached;
  }

  std::chrono::milliseconds per_call{config_.timeout_ms};
  for (RoutingClient* client : clients_) {
    auto result = RetryWithBackoff(
        [&] {
          std::vector<Leg> legs =
              client->Route({from, to}, deadline.Remaining(per_call));
          return legs.at(0);
        },
        retry_policy_,
        deadline,
        sleep_
    );
    if (result.ok()) {
      cache_.Put(key, *result.value);
      return *result.value;
    }
    log_(std::format(
        "{} unavailable after {} attempt(s): {}",
        client->Name(),
        result.attempts,
        result.last_error
    ));
  }

  ++fallback_count_;
  // Estimates are cheap and not cached, so a later request can still get a
  // routed leg.
  return EstimateLeg(from, to, config_.walk_speed_kmh);
}

}  // namespace walkplan
