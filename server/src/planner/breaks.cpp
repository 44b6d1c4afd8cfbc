#include "planner/breaks.h"

#include <algorithm>
#include <cmath>
#include <format>

#include "util/strings.h"

namespace walkplan {

int RecommendedBreakInterval(
    const IntensityProfile& profile, const std::optional<BreakPreferences>& preferences
) {
  int baseline = profile.break_interval_minutes;
  if (!preferences || !preferences->enabled || !preferences->interval_minutes) {
    return baseline;
  }
  return std::max(baseline, std::max(30, *preferences->interval_minutes));
}

double BreakStayMinutes(const IntensityProfile& profile, int interval_minutes) {
  return EffectiveVisitMinutes(profile, std::max(15, std::min(30, interval_minutes / 3)));
}

double EstimateBreakMinutes(
    double total_minutes,
    const IntensityProfile& profile,
    const std::optional<BreakPreferences>& preferences
) {
  if (!preferences || !preferences->enabled || total_minutes <= 0) {
    return 0.0;
  }
  double interval = RecommendedBreakInterval(profile, preferences);
  if (total_minutes < interval * 0.75) {
    return 0.0;
  }
  int breaks = static_cast<int>(total_minutes / interval);
  if (total_minutes - breaks * interval >= interval * 0.6) {
    ++breaks;
  }
  breaks = std::max(1, breaks);
  breaks = std::min(breaks, static_cast<int>(total_minutes / 105) + 1);
  double base_stay = std::max(18.0, std::min(35.0, interval / 3.2));
  return breaks * EffectiveVisitMinutes(profile, std::round(base_stay));
}

BreakInserter::BreakInserter(
    BreakCandidateFinder* finder,
    DistanceProvider& distances,
    const OpeningHoursResolver& resolver,
    const IntensityProfile& profile,
    BreakPreferences preferences,
    LocalTime budget_end,
    TextLogger log
)
    : finder_(finder),
      distances_(distances),
      resolver_(resolver),
      profile_(profile),
      preferences_(std::move(preferences)),
      interval_minutes_(RecommendedBreakInterval(profile, preferences_)),
      stay_minutes_(BreakStayMinutes(profile, interval_minutes_)),
      radius_km_(std::clamp(preferences_.search_radius_km, 0.1, 2.0)),
      budget_end_(budget_end),
      log_(std::move(log)) {}

std::optional<Poi> BreakInserter::ChooseCafe(
    const std::vector<Poi>& candidates, const TimelineState& state
) const {
  std::vector<const Poi*> usable;
  for (const Poi& cafe : candidates) {
    bool visited = std::any_of(
        state.stops.begin(),
        state.stops.end(),
        [&cafe](const PlannedStop& stop) { return stop.poi_id == cafe.id; }
    );
    if (visited) {
      continue;
    }
    double walk = WalkMinutes(HaversineKm(state.position, cafe.location));
    OpeningStatus status = resolver_.Evaluate(cafe, state.cursor.PlusMinutes(walk));
    if (!status.is_open || status.wait_minutes > 0) {
      continue;
    }
    usable.push_back(&cafe);
  }
  if (usable.empty()) {
    return std::nullopt;
  }
  if (preferences_.cuisine) {
    std::string wanted = ToLowerAscii(*preferences_.cuisine);
    for (const Poi* cafe : usable) {
      bool matches = ToLowerAscii(cafe->category).find(wanted) != std::string::npos ||
                     std::any_of(cafe->tags.begin(), cafe->tags.end(), [&](const std::string& tag) {
                       return ToLowerAscii(tag).find(wanted) != std::string::npos;
                     });
      if (matches) {
        return *cafe;
      }
    }
  }
  return *usable.front();
}

bool BreakInserter::MaybeInsert(TimelineState& state, const Deadline& deadline) {
  if (finder_ == nullptr || !preferences_.enabled) {
    return false;
  }
  double elapsed = state.cursor.MinutesSince(state.last_break);
  if (elapsed < interval_minutes_) {
    return false;
  }

  std::vector<Poi> candidates;
  try {
    candidates = finder_->FindNear(state.position, radius_km_, deadline);
  } catch (const std::exception& e) {
    log_(std::format("break lookup failed, skipping: {}", e.what()));
    return false;
  }
  std::optional<Poi> cafe = ChooseCafe(candidates, state);
  if (!cafe) {
    log_(std::format(
        "no open café within {:.1f} km of {} after {:.0f} min without a break",
        radius_km_,
        state.stops.empty() ? std::string("the start") : state.stops.back().name,
        elapsed
    ));
    return false;
  }

  Leg leg = distances_.ComputeLeg(state.position, cafe->location, deadline);
  LocalTime arrival = state.cursor.PlusMinutes(leg.duration_minutes);
  LocalTime leave = arrival.PlusMinutes(stay_minutes_ + profile_.transition_padding_minutes);
  if (leave > budget_end_) {
    log_(std::format(
        "skipping break at '{}': it would end at {}, after the walk's end {}",
        cafe->name,
        leave.ClockString(),
        budget_end_.ClockString()
    ));
    return false;
  }

  PlannedStop stop{
      .order = 0,
      .poi_id = cafe->id,
      .name = cafe->name,
      .location = cafe->location,
      .category = std::string(kBreakCategory),
      .address = cafe->address,
      .arrival_time = arrival,
      .leave_time = leave,
      .wait_minutes = 0.0,
      .visit_minutes = stay_minutes_,
      .is_open = true,
      .opening_label = resolver_.Evaluate(*cafe, arrival).label,
      .availability_note = std::nullopt,
      .is_break = true,
  };
  state.Append(std::move(stop), std::move(leg));
  state.last_break = leave;
  ++inserted_count_;
  log_(std::format(
      "break #{} at '{}' {}-{}",
      inserted_count_,
      cafe->name,
      arrival.ClockString(),
      leave.ClockString()
  ));
  return true;
}

}  // namespace walkplan
