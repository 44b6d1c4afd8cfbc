#pragma once

#include <vector>

#include "catalog/poi.h"
#include "geo/geo.h"

namespace walkplan {

struct PrefilterOptions {
  size_t max_candidates = 60;
  // POIs within factor * search radius are "near".
  double near_radius_factor = 1.25;
};

// Bounds the working set before scoring. Returns every POI, in input order,
// when there are at most max_candidates of them. Otherwise takes near POIs
// nearest first and backfills with far ones, also nearest first. The
// returned pointers refer into `pois`.
std::vector<const Poi*> PrefilterCandidates(
    const std::vector<Poi>& pois,
    Coordinates origin,
    double search_radius_km,
    const PrefilterOptions& options
);

}  // namespace walkplan
