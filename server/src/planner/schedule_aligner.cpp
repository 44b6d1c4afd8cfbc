#include "planner/schedule_aligner.h"

#include <format>
#include <future>

namespace walkplan {

void TimelineState::Append(PlannedStop stop, Leg leg) {
  stop.order = static_cast<int>(stops.size()) + 1;
  stop.distance_from_previous_km = leg.distance_km;
  if (stops.empty()) {
    approach_leg = std::move(leg);
  } else {
    legs.push_back(std::move(leg));
  }
  cursor = Later(cursor, stop.leave_time);
  position = stop.location;
  stops.push_back(std::move(stop));
}

std::vector<Leg> PrefetchLegs(
    DistanceProvider& distances,
    Coordinates origin,
    const std::vector<SelectedStop>& ordered,
    const Deadline& deadline
) {
  std::vector<std::future<Leg>> pending;
  pending.reserve(ordered.size());
  Coordinates from = origin;
  for (const SelectedStop& stop : ordered) {
    Coordinates to = stop.poi->location;
    pending.push_back(std::async(std::launch::async, [&distances, &deadline, from, to]() {
      return distances.ComputeLeg(from, to, deadline);
    }));
    from = to;
  }
  std::vector<Leg> legs;
  legs.reserve(pending.size());
  for (auto& leg : pending) {
    legs.push_back(leg.get());
  }
  return legs;
}

ScheduleAligner::ScheduleAligner(
    const OpeningHoursResolver& resolver,
    DistanceProvider& distances,
    const IntensityProfile& profile,
    TextLogger log
)
    : resolver_(resolver),
      distances_(distances),
      profile_(profile),
      log_(std::move(log)) {}

PlannedStop ScheduleAligner::ScheduleVisit(
    const Poi& poi, double visit_minutes, LocalTime arrival
) const {
  OpeningStatus status = resolver_.Evaluate(poi, arrival);

  LocalTime visit_start = arrival;
  std::optional<std::string> note;
  if (status.is_open && status.wait_minutes > 0 && status.opens_at) {
    visit_start = *status.opens_at;
    note = "waiting for opening until " + visit_start.ClockString();
  }
  LocalTime visit_end = visit_start.PlusMinutes(visit_minutes);
  if (status.is_open && status.closes_at && *status.closes_at < visit_end) {
    visit_end = *status.closes_at;
    note = "closes at " + visit_end.ClockString() + ", plan faster";
  }
  if (!status.is_open) {
    if (status.closed_all_day) {
      note = "closed on this day";
    } else if (status.opens_at) {
      note = "closed on arrival, opens at " + status.opens_at->ClockString();
    } else {
      note = "closed on arrival";
    }
  }

  return PlannedStop{
      .order = 0,
      .poi_id = poi.id,
      .name = poi.name,
      .location = poi.location,
      .category = poi.category,
      .address = poi.address,
      .arrival_time = visit_start,
      .leave_time = visit_end.PlusMinutes(profile_.transition_padding_minutes),
      .wait_minutes = visit_start.MinutesSince(arrival),
      .visit_minutes = visit_end.MinutesSince(visit_start),
      .is_open = status.is_open,
      .opening_label = status.label,
      .availability_note = note,
  };
}

TimelineState ScheduleAligner::Align(
    Coordinates origin,
    LocalTime start,
    const std::vector<SelectedStop>& ordered,
    const Deadline& deadline,
    const AfterStopHook& after_stop
) const {
  TimelineState state{
      .start_time = start,
      .cursor = start,
      .position = origin,
      .last_break = start,
  };
  std::vector<Leg> prefetched = PrefetchLegs(distances_, origin, ordered, deadline);

  bool moved_elsewhere = false;
  for (size_t i = 0; i < ordered.size(); ++i) {
    const Poi& poi = *ordered[i].poi;
    Leg leg = moved_elsewhere ? distances_.ComputeLeg(state.position, poi.location, deadline)
                              : prefetched[i];
    LocalTime arrival = state.cursor.PlusMinutes(leg.duration_minutes);
    PlannedStop stop = ScheduleVisit(poi, ordered[i].visit_minutes, arrival);
    if (!stop.is_open) {
      log_(std::format(
          "'{}' is closed at {} ({})", poi.name, arrival.ClockString(), stop.opening_label
      ));
    }
    state.Append(std::move(stop), std::move(leg));
    moved_elsewhere = after_stop && after_stop(state, deadline);
  }
  return state;
}

}  // namespace walkplan
