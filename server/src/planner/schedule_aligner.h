#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "catalog/poi.h"
#include "config/planner_config.h"
#include "log.h"
#include "planner/budget.h"
#include "planner/itinerary.h"
#include "routing/distance_provider.h"
#include "routing/leg.h"
#include "schedule/opening_hours.h"
#include "util/date.h"
#include "util/deadline.h"

namespace walkplan {

// The timeline being built for one request.
struct TimelineState {
  LocalTime start_time;
  // Leave time of the last stop; never moves backwards.
  LocalTime cursor;
  Coordinates position;
  // Leave time of the last break, or the start time.
  LocalTime last_break;
  std::vector<PlannedStop> stops;
  std::optional<Leg> approach_leg;
  std::vector<Leg> legs;

  // Adds `stop`, reached over `leg` from the current position. Assigns the
  // stop's order and distance and moves the cursor to its leave time.
  void Append(PlannedStop stop, Leg leg);
};

// Runs after every scheduled stop. Returns true when it appended stops of
// its own, so the next leg has to start from the new position.
using AfterStopHook = std::function<bool(TimelineState&, const Deadline&)>;

// Legs origin -> stop 0 -> stop 1 -> ..., computed concurrently.
std::vector<Leg> PrefetchLegs(
    DistanceProvider& distances,
    Coordinates origin,
    const std::vector<SelectedStop>& ordered,
    const Deadline& deadline
);

class ScheduleAligner {
 public:
  ScheduleAligner(
      const OpeningHoursResolver& resolver,
      DistanceProvider& distances,
      const IntensityProfile& profile,
      TextLogger log = NullLogger()
  );

  // Walks `ordered` from `origin` starting at `start`, waiting for openings,
  // cutting visits short at closing time and padding between stops.
  TimelineState Align(
      Coordinates origin,
      LocalTime start,
      const std::vector<SelectedStop>& ordered,
      const Deadline& deadline,
      const AfterStopHook& after_stop = nullptr
  ) const;

  // One visit to `poi` for someone arriving at `arrival`. Order and
  // distance are left for TimelineState::Append.
  PlannedStop ScheduleVisit(const Poi& poi, double visit_minutes, LocalTime arrival) const;

 private:
  const OpeningHoursResolver& resolver_;
  DistanceProvider& distances_;
  IntensityProfile profile_;
  TextLogger log_;
};

}  // namespace walkplan
