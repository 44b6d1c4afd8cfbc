#include "planner/prefilter.h"

#include <algorithm>
#include <utility>

namespace walkplan {

std::vector<const Poi*> PrefilterCandidates(
    const std::vector<Poi>& pois,
    Coordinates origin,
    double search_radius_km,
    const PrefilterOptions& options
) {
  std::vector<const Poi*> result;
  if (pois.size() <= options.max_candidates) {
    result.reserve(pois.size());
    for (const Poi& poi : pois) {
      result.push_back(&poi);
    }
    return result;
  }

  double near_limit = search_radius_km * options.near_radius_factor;
  std::vector<std::pair<double, const Poi*>> near;
  std::vector<std::pair<double, const Poi*>> far;
  for (const Poi& poi : pois) {
    double d = HaversineKm(origin, poi.location);
    (d <= near_limit ? near : far).emplace_back(d, &poi);
  }
  auto by_distance = [](const auto& a, const auto& b) { return a.first < b.first; };
  std::stable_sort(near.begin(), near.end(), by_distance);
  std::stable_sort(far.begin(), far.end(), by_distance);

  result.reserve(options.max_candidates);
  for (const auto& bucket : {&near, &far}) {
    for (const auto& [d, poi] : *bucket) {
      if (result.size() >= options.max_candidates) {
        return result;
      }
      result.push_back(poi);
    }
  }
  return result;
}

}  // namespace walkplan
