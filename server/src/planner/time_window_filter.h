#pragma once

#include <string>
#include <vector>

#include "catalog/poi.h"
#include "config/planner_config.h"
#include "planner/scoring.h"
#include "schedule/opening_hours.h"
#include "util/date.h"

namespace walkplan {

// Lower-cased name, category and tags joined by spaces, for keyword checks.
std::string PoiKeywordText(const Poi& poi);

// True when the POI should not be offered at a walk starting at `start`:
// cafés and bars before the morning cutoff, secluded parks and alleys from
// the night start.
bool ExcludedAtStart(const Poi& poi, LocalTime start, const PlannerConfig& config);

// Drops candidates excluded at `start`, keeping the unfiltered list if that
// would drop all of them, then moves candidates that would be closed beyond
// the max wait at their projected arrival behind the rest. Relative ranking
// is preserved within each group.
std::vector<CandidateScore> ApplyTimeWindowFilter(
    std::vector<CandidateScore> ranked,
    LocalTime start,
    const OpeningHoursResolver& resolver,
    const PlannerConfig& config
);

}  // namespace walkplan
