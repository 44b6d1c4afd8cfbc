#include "schedule/start_time.h"

#include <format>

#include "util/strings.h"

namespace walkplan {

namespace {

LocalTime AtHour(LocalTime day, int hour) {
  return day.StartOfDay().PlusMinutes(hour * 60.0);
}

}  // namespace

bool FitsReasonableWindow(
    LocalTime start, double duration_hours, const ReasonableHours& hours
) {
  if (start.Hour() < hours.start_hour) {
    return false;
  }
  LocalTime end = start.PlusMinutes(duration_hours * 60.0);
  LocalTime latest = AtHour(start, hours.end_hour).PlusMinutes(hours.grace_minutes);
  return end <= latest;
}

LocalTime SuggestReasonableStart(
    LocalTime current, double duration_hours, const ReasonableHours& hours
) {
  if (current.Hour() < hours.start_hour) {
    return AtHour(current, hours.start_hour);
  }
  if (FitsReasonableWindow(current, duration_hours, hours)) {
    return current;
  }
  return AtHour(current.PlusMinutes(kMinutesPerDay), hours.start_hour);
}

StartTimePlan DetermineStartTime(
    std::optional<std::string_view> requested,
    LocalTime now,
    double duration_hours,
    const ReasonableHours& hours
) {
  StartTimePlan plan{.start_time = now, .warnings = {}};

  if (requested && !TrimWhitespace(*requested).empty()) {
    std::string_view text = TrimWhitespace(*requested);
    std::optional<LocalTime> start = LocalTime::Parse(text);
    if (!start) {
      if (std::optional<TimeOfDay> clock = TimeOfDay::Parse(text);
          clock && clock->minutes < kMinutesPerDay) {
        start = now.StartOfDay().PlusMinutes(clock->minutes);
        if (*start < now) {
          start = start->PlusMinutes(kMinutesPerDay);
          plan.warnings.push_back(std::format(
              "requested start {} has already passed today, moving it to {}",
              text,
              start->ToString()
          ));
        }
      }
    }
    if (start) {
      plan.start_time = *start;
      if (!FitsReasonableWindow(*start, duration_hours, hours)) {
        plan.warnings.push_back(std::format(
            "requested start is outside comfortable city hours, consider starting at {}",
            SuggestReasonableStart(*start, duration_hours, hours).ClockString()
        ));
      }
      return plan;
    }
    plan.warnings.push_back(
        "could not parse the requested start time, choosing the nearest comfortable window"
    );
  }

  if (now.Hour() < hours.end_hour && FitsReasonableWindow(now, duration_hours, hours)) {
    plan.start_time = now;
    return plan;
  }

  LocalTime suggested = SuggestReasonableStart(now, duration_hours, hours);
  if (now.Hour() < hours.start_hour) {
    plan.warnings.push_back(std::format(
        "the city is still waking up, the walk will start at {}", suggested.ClockString()
    ));
  } else if (now.Hour() >= hours.end_hour) {
    plan.warnings.push_back(std::format(
        "it is late for a walk, planning the start for {}", suggested.ToString()
    ));
  } else {
    plan.warnings.push_back(std::format(
        "the walk takes longer than what is left of today, better start at {}",
        suggested.ToString()
    ));
  }
  plan.start_time = suggested;
  return plan;
}

}  // namespace walkplan
