#pragma once

#include <bitset>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "catalog/poi.h"
#include "config/planner_config.h"
#include "log.h"
#include "util/date.h"

namespace walkplan {

// Raised for opening-hours text that does not follow the weekly grammar.
class InvalidScheduleExpression : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One daily opening range applied on a set of weekdays. Bit 0 is Monday.
// When `close <= open` the range ends on the following day.
struct OpeningHoursWindow {
  std::bitset<7> weekdays;
  TimeOfDay open;
  TimeOfDay close;
  bool wraps;

  bool operator==(const OpeningHoursWindow& other) const {
    return weekdays == other.weekdays && open == other.open &&
           close == other.close && wraps == other.wraps;
  }
};

// Parses expressions like "Mo-Fr 10:00-18:00; Sa,Su 11:00-16:00", "24/7",
// "daily 09:00-21:00" or "Su off". Throws InvalidScheduleExpression.
std::vector<OpeningHoursWindow> ParseWeeklyExpression(std::string_view expression);

enum class ScheduleSource { kExpression, kExplicitFields, kCategory, kDefault };

struct WeeklySchedule {
  std::vector<OpeningHoursWindow> windows;
  ScheduleSource source;

  // Exact data from the catalog rather than a category guess.
  bool IsPrecise() const {
    return source == ScheduleSource::kExpression ||
           source == ScheduleSource::kExplicitFields;
  }
};

struct OpeningStatus {
  // Open at the instant, or opening within the max wait.
  bool is_open;
  // Minutes until opening. 0 when already open; for a closed place, the
  // time until the next opening within the coming week (0 if none).
  double wait_minutes;
  std::optional<LocalTime> opens_at;
  // End of the (merged) window the visit would start in.
  std::optional<LocalTime> closes_at;
  // No window starts on the instant's day.
  bool closed_all_day;
  bool precise;
  // Hours of the instant's day, e.g. "10:00–18:00 (exact)".
  std::string label;
};

class OpeningHoursResolver {
 public:
  OpeningHoursResolver(const PlannerConfig& config, TextLogger log = NullLogger());

  // Expression, then explicit fields, then category table, then default.
  // A malformed expression is skipped and logged once per POI for the
  // lifetime of the resolver.
  WeeklySchedule ScheduleFor(const Poi& poi) const;

  OpeningStatus Evaluate(const Poi& poi, LocalTime at) const;

  OpeningStatus Evaluate(
      const WeeklySchedule& schedule, LocalTime at, int max_wait_minutes
  ) const;

  int max_wait_minutes() const { return config_.max_wait_minutes; }

 private:
  const PlannerConfig& config_;
  TextLogger log_;
  mutable std::mutex reported_mutex_;
  mutable std::set<std::pair<int, std::string>> reported_;
};

// "10:00–18:00, 19:00–23:00", "open 24 hours" or "closed", for one weekday.
std::string DayLabel(const std::vector<OpeningHoursWindow>& windows, int weekday);

}  // namespace walkplan
