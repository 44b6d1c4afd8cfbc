#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/planner_config.h"
#include "log.h"
#include "planner/schedule_aligner.h"
#include "routing/distance_provider.h"
#include "schedule/opening_hours.h"
#include "services/break_finder.h"
#include "util/date.h"
#include "util/deadline.h"

namespace walkplan {

inline constexpr std::string_view kBreakCategory = "coffee_break";

struct BreakPreferences {
  bool enabled = true;
  // Requested minutes between breaks. Can only make breaks rarer than the
  // intensity's own interval.
  std::optional<int> interval_minutes;
  double search_radius_km = 0.5;
  // Preferred cuisine or drink, matched against category and tags.
  std::optional<std::string> cuisine;
};

// Intensity baseline, raised to the user's interval (at least 30) when one
// was given.
int RecommendedBreakInterval(
    const IntensityProfile& profile, const std::optional<BreakPreferences>& preferences
);

// Length of one break for the given interval.
double BreakStayMinutes(const IntensityProfile& profile, int interval_minutes);

// Minutes to set aside for breaks in a walk of `total_minutes`, before the
// route is fitted to its budget. 0 when breaks are off.
double EstimateBreakMinutes(
    double total_minutes,
    const IntensityProfile& profile,
    const std::optional<BreakPreferences>& preferences
);

// Adds a café stop to the timeline once enough time has passed since the
// last break. Intended as the ScheduleAligner's after-stop hook.
class BreakInserter {
 public:
  BreakInserter(
      BreakCandidateFinder* finder,
      DistanceProvider& distances,
      const OpeningHoursResolver& resolver,
      const IntensityProfile& profile,
      BreakPreferences preferences,
      LocalTime budget_end,
      TextLogger log = NullLogger()
  );

  // Returns true when a break was appended. Lookup failures are logged and
  // skipped, to be retried after the next stop.
  bool MaybeInsert(TimelineState& state, const Deadline& deadline);

  AfterStopHook AsHook() {
    return [this](TimelineState& state, const Deadline& deadline) {
      return MaybeInsert(state, deadline);
    };
  }

  int interval_minutes() const { return interval_minutes_; }
  int inserted_count() const { return inserted_count_; }

 private:
  // First candidate that is not on the route yet and is open on arrival,
  // preferring the requested cuisine.
  std::optional<Poi> ChooseCafe(
      const std::vector<Poi>& candidates, const TimelineState& state
  ) const;

  BreakCandidateFinder* finder_;
  DistanceProvider& distances_;
  const OpeningHoursResolver& resolver_;
  IntensityProfile profile_;
  BreakPreferences preferences_;
  int interval_minutes_;
  double stay_minutes_;
  double radius_km_;
  LocalTime budget_end_;
  TextLogger log_;
  int inserted_count_ = 0;
};

}  // namespace walkplan
