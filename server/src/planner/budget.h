#pragma once

#include <cstddef>
#include <vector>

#include "catalog/poi.h"
#include "config/planner_config.h"
#include "geo/geo.h"

namespace walkplan {

// A POI chosen for the route with its planned visit length.
struct SelectedStop {
  const Poi* poi;
  double visit_minutes;
};

struct BudgetOptions {
  // Minutes available for walking and visits after reservations.
  double available_minutes;
  // hours * 60. Only the first stop may use time beyond available_minutes.
  double raw_budget_minutes;
  int target_visit_count;
  double min_visit_minutes;
  double padding_minutes;
  double overflow_factor = 1.08;
  double fill_ratio = 0.98;
  double walk_speed_kmh = kWalkSpeedKmh;
};

struct BudgetFit {
  std::vector<SelectedStop> selected;
  std::vector<SelectedStop> skipped;
  double total_minutes = 0.0;
};

// max(1, round(hours * target per hour)).
int TargetVisitCount(double hours, const IntensityProfile& profile);

// How many top-ranked candidates go to the sequencer.
size_t CandidateLimit(
    double hours, const IntensityProfile& profile, size_t available, size_t max_selected
);

// max(15, hours * 60 - reserved break minutes - safety buffer).
double EffectiveBudgetMinutes(
    double hours, double reserved_break_minutes, const IntensityProfile& profile
);

// Walk + visit + padding minutes of visiting `stops` in order from `start`,
// with haversine walking estimates.
double SequenceMinutes(
    Coordinates start,
    const std::vector<SelectedStop>& stops,
    double padding_minutes,
    double walk_speed_kmh = kWalkSpeedKmh
);

// Walks `ordered` and keeps the stops that fit in the budget, shortening a
// visit down to the minimum when that makes it fit. While fewer than the
// target count are selected, a stop may overflow the budget up to
// overflow_factor. Skipped stops are retried while the route is below
// fill_ratio of the budget. The first stop is always kept if it fits in the
// raw budget; otherwise throws RouteInfeasible. Stops keep the given order.
BudgetFit FitToBudget(
    Coordinates start, const std::vector<SelectedStop>& ordered, const BudgetOptions& options
);

// Drops stops from the end while the route exceeds
// available_minutes * overflow_factor, never going below one stop. The
// dropped stops are appended to `fit.skipped`.
void DropTailOverBudget(Coordinates start, BudgetFit& fit, const BudgetOptions& options);

}  // namespace walkplan
