#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/date.h"

namespace walkplan {

// Hours of the day in which the city is pleasant for a walk. A walk may end
// up to `grace_minutes` after end_hour.
struct ReasonableHours {
  int start_hour = 9;
  int end_hour = 22;
  int grace_minutes = 30;
};

struct StartTimePlan {
  LocalTime start_time;
  std::vector<std::string> warnings;
};

// Whether a walk of `duration_hours` starting at `start` stays inside the
// reasonable hours of its day.
bool FitsReasonableWindow(
    LocalTime start, double duration_hours, const ReasonableHours& hours = {}
);

// `current` if the walk fits from there, the same day's start hour if it is
// too early, otherwise the next day's start hour.
LocalTime SuggestReasonableStart(
    LocalTime current, double duration_hours, const ReasonableHours& hours = {}
);

// Resolves a requested start ("HH:MM" today, or a full local time) against
// `now`. A clock time already past today moves to tomorrow. Without a usable
// request the walk starts now, or at the next reasonable time. Every
// adjustment or concern is reported as a warning.
StartTimePlan DetermineStartTime(
    std::optional<std::string_view> requested,
    LocalTime now,
    double duration_hours,
    const ReasonableHours& hours = {}
);

}  // namespace walkplan
