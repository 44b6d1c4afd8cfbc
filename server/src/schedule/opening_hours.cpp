#include "schedule/opening_hours.h"

#include <algorithm>
#include <array>
#include <format>
#include <map>
#include <utility>

#include "util/strings.h"

namespace walkplan {

namespace {

constexpr int64_t kSecondsPerDay = 24 * 3600;
const std::bitset<7> kEveryDay{0x7F};

struct DayName {
  std::string_view name;
  int weekday;
};

// Lower-case forms only; ToLowerAscii leaves Cyrillic alone, so both cases
// of the Russian abbreviations are listed.
constexpr std::array<DayName, 21> kDayNames{{
    {"mo", 0}, {"tu", 1}, {"we", 2}, {"th", 3}, {"fr", 4}, {"sa", 5}, {"su", 6},
    {"пн", 0}, {"вт", 1}, {"ср", 2}, {"чт", 3}, {"пт", 4}, {"сб", 5}, {"вс", 6},
    {"Пн", 0}, {"Вт", 1}, {"Ср", 2}, {"Чт", 3}, {"Пт", 4}, {"Сб", 5}, {"Вс", 6},
}};

std::string ReplaceAll(std::string text, std::string_view from, std::string_view to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

int ParseDay(std::string_view token, std::string_view rule) {
  std::string key = ToLowerAscii(TrimWhitespace(token));
  for (const DayName& day : kDayNames) {
    if (key == day.name) {
      return day.weekday;
    }
  }
  throw InvalidScheduleExpression(
      std::format("unknown day '{}' in rule '{}'", token, rule)
  );
}

std::bitset<7> ParseDays(std::string_view text, std::string_view rule) {
  std::string days = ToLowerAscii(TrimWhitespace(text));
  if (!days.empty() && days.back() == ':') {
    days.pop_back();
  }
  if (days.empty() || days == "daily" || days == "every day" ||
      days == "everyday" || days == "ежедневно" || days == "Ежедневно") {
    return kEveryDay;
  }
  std::bitset<7> mask;
  for (const std::string& item : SplitAndTrim(days, ',')) {
    size_t dash = item.find('-');
    if (dash == std::string::npos) {
      mask.set(ParseDay(item, rule));
      continue;
    }
    int first = ParseDay(std::string_view(item).substr(0, dash), rule);
    int last = ParseDay(std::string_view(item).substr(dash + 1), rule);
    // Ranges may wrap over the week end, e.g. "Fr-Mo".
    for (int d = first;; d = (d + 1) % 7) {
      mask.set(d);
      if (d == last) {
        break;
      }
    }
  }
  return mask;
}

std::pair<TimeOfDay, TimeOfDay> ParseRange(std::string_view text, std::string_view rule) {
  std::vector<std::string> parts = SplitAndTrim(text, '-');
  std::optional<TimeOfDay> open;
  std::optional<TimeOfDay> close;
  if (parts.size() == 2) {
    open = TimeOfDay::Parse(parts[0]);
    close = TimeOfDay::Parse(parts[1]);
  }
  if (!open || !close || open->minutes >= kMinutesPerDay) {
    throw InvalidScheduleExpression(
        std::format("bad time range '{}' in rule '{}'", text, rule)
    );
  }
  return {*open, *close};
}

bool IsClosedKeyword(std::string_view word) {
  std::string key = ToLowerAscii(word);
  return key == "off" || key == "closed" || key == "выходной";
}

struct Interval {
  LocalTime open;
  LocalTime close;
};

// Absolute intervals from the day before `at` through a week after it,
// merged where they touch or overlap.
std::vector<Interval> IntervalsAround(
    const std::vector<OpeningHoursWindow>& windows, LocalTime at
) {
  LocalTime day0 = at.StartOfDay();
  int weekday = at.Weekday();
  std::vector<Interval> intervals;
  for (int offset = -1; offset <= 7; ++offset) {
    int d = ((weekday + offset) % 7 + 7) % 7;
    LocalTime day_start{day0.seconds + offset * kSecondsPerDay};
    for (const OpeningHoursWindow& w : windows) {
      if (!w.weekdays.test(d)) {
        continue;
      }
      int close_minutes = w.close.minutes + (w.wraps ? kMinutesPerDay : 0);
      intervals.push_back(Interval{
          LocalTime{day_start.seconds + w.open.minutes * 60},
          LocalTime{day_start.seconds + close_minutes * 60}
      });
    }
  }
  std::sort(intervals.begin(), intervals.end(), [](const Interval& a, const Interval& b) {
    return a.open < b.open;
  });
  std::vector<Interval> merged;
  for (const Interval& interval : intervals) {
    if (!merged.empty() && interval.open <= merged.back().close) {
      merged.back().close = Later(merged.back().close, interval.close);
    } else {
      merged.push_back(interval);
    }
  }
  return merged;
}

}  // namespace

std::vector<OpeningHoursWindow> ParseWeeklyExpression(std::string_view expression) {
  // Typographic dashes are common in scraped data.
  std::string normalized =
      ReplaceAll(ReplaceAll(std::string(expression), "–", "-"), "—", "-");
  if (TrimWhitespace(normalized).empty()) {
    throw InvalidScheduleExpression("empty opening hours expression");
  }

  // Later rules replace earlier ones for the days they name.
  std::array<std::optional<std::vector<std::pair<TimeOfDay, TimeOfDay>>>, 7> per_day;
  for (const std::string& rule : SplitAndTrim(normalized, ';')) {
    if (ToLowerAscii(rule) == "24/7") {
      for (auto& day : per_day) {
        day = std::vector<std::pair<TimeOfDay, TimeOfDay>>{
            {TimeOfDay{0}, TimeOfDay{kMinutesPerDay}}
        };
      }
      continue;
    }

    std::vector<std::pair<TimeOfDay, TimeOfDay>> ranges;
    std::bitset<7> days;
    size_t last_space = rule.find_last_of(' ');
    if (IsClosedKeyword(rule) ||
        (last_space != std::string::npos &&
         IsClosedKeyword(std::string_view(rule).substr(last_space + 1)))) {
      std::string_view day_part =
          last_space == std::string::npos ? std::string_view{}
                                          : std::string_view(rule).substr(0, last_space);
      days = ParseDays(day_part, rule);
    } else {
      size_t first_digit = rule.find_first_of("0123456789");
      if (first_digit == std::string::npos) {
        throw InvalidScheduleExpression(
            std::format("rule '{}' has no time range", rule)
        );
      }
      days = ParseDays(std::string_view(rule).substr(0, first_digit), rule);
      for (const std::string& range :
           SplitAndTrim(std::string_view(rule).substr(first_digit), ',')) {
        ranges.push_back(ParseRange(range, rule));
      }
    }
    for (int d = 0; d < 7; ++d) {
      if (days.test(d)) {
        per_day[d] = ranges;
      }
    }
  }

  // Group identical ranges across days into one window each.
  std::map<std::pair<int, int>, std::bitset<7>> grouped;
  for (int d = 0; d < 7; ++d) {
    if (!per_day[d]) {
      continue;
    }
    for (const auto& [open, close] : *per_day[d]) {
      grouped[{open.minutes, close.minutes}].set(d);
    }
  }
  std::vector<OpeningHoursWindow> windows;
  for (const auto& [range, mask] : grouped) {
    TimeOfDay open{range.first};
    TimeOfDay close{range.second};
    windows.push_back(OpeningHoursWindow{
        .weekdays = mask,
        .open = open,
        .close = close,
        .wraps = close.minutes <= open.minutes,
    });
  }
  return windows;
}

std::string DayLabel(const std::vector<OpeningHoursWindow>& windows, int weekday) {
  std::vector<const OpeningHoursWindow*> today;
  for (const OpeningHoursWindow& w : windows) {
    if (w.weekdays.test(weekday)) {
      today.push_back(&w);
    }
  }
  if (today.empty()) {
    return "closed";
  }
  std::sort(today.begin(), today.end(), [](const auto* a, const auto* b) {
    return a->open < b->open;
  });
  std::string label;
  bool wraps = false;
  for (const OpeningHoursWindow* w : today) {
    if (w->open.minutes == 0 && w->close.minutes == kMinutesPerDay) {
      return "open 24 hours";
    }
    if (!label.empty()) {
      label += ", ";
    }
    label += w->open.ToString() + "–" + w->close.ToString();
    wraps = wraps || w->wraps;
  }
  if (wraps) {
    label += " (+1 day)";
  }
  return label;
}

OpeningHoursResolver::OpeningHoursResolver(const PlannerConfig& config, TextLogger log)
    : config_(config), log_(std::move(log)) {}

WeeklySchedule OpeningHoursResolver::ScheduleFor(const Poi& poi) const {
  if (poi.opening_hours) {
    try {
      return WeeklySchedule{
          ParseWeeklyExpression(*poi.opening_hours), ScheduleSource::kExpression
      };
    } catch (const InvalidScheduleExpression& e) {
      std::lock_guard<std::mutex> lock(reported_mutex_);
      if (reported_.emplace(poi.id.v, *poi.opening_hours).second) {
        log_(std::format(
            "data quality: POI {} '{}' has unusable opening hours \"{}\" ({}), "
            "using fallback hours",
            poi.id.v,
            poi.name,
            *poi.opening_hours,
            e.what()
        ));
      }
    }
  }

  auto category_it = config_.typical_hours.find(poi.category);
  const DailyWindow& typical = category_it != config_.typical_hours.end()
                                   ? category_it->second
                                   : config_.default_hours;
  auto make = [](TimeOfDay open, TimeOfDay close, ScheduleSource source) {
    return WeeklySchedule{
        {OpeningHoursWindow{
            .weekdays = kEveryDay,
            .open = open,
            .close = close,
            .wraps = close.minutes <= open.minutes,
        }},
        source
    };
  };

  if (poi.open_time || poi.close_time) {
    return make(
        poi.open_time.value_or(typical.open),
        poi.close_time.value_or(typical.close),
        ScheduleSource::kExplicitFields
    );
  }
  return make(
      typical.open,
      typical.close,
      category_it != config_.typical_hours.end() ? ScheduleSource::kCategory
                                                 : ScheduleSource::kDefault
  );
}

OpeningStatus OpeningHoursResolver::Evaluate(const Poi& poi, LocalTime at) const {
  return Evaluate(ScheduleFor(poi), at, config_.max_wait_minutes);
}

OpeningStatus OpeningHoursResolver::Evaluate(
    const WeeklySchedule& schedule, LocalTime at, int max_wait_minutes
) const {
  OpeningStatus status{
      .is_open = false,
      .wait_minutes = 0.0,
      .opens_at = std::nullopt,
      .closes_at = std::nullopt,
      .closed_all_day = true,
      .precise = schedule.IsPrecise(),
      .label = DayLabel(schedule.windows, at.Weekday()) +
               (schedule.IsPrecise() ? " (exact)" : " (approx.)"),
  };
  for (const OpeningHoursWindow& w : schedule.windows) {
    if (w.weekdays.test(at.Weekday())) {
      status.closed_all_day = false;
    }
  }

  std::vector<Interval> intervals = IntervalsAround(schedule.windows, at);
  for (const Interval& interval : intervals) {
    if (interval.open <= at && at < interval.close) {
      status.is_open = true;
      status.closes_at = interval.close;
      // Open via yesterday's late window counts as an open day.
      status.closed_all_day = false;
      return status;
    }
    if (interval.open > at) {
      status.wait_minutes = interval.open.MinutesSince(at);
      status.opens_at = interval.open;
      if (status.wait_minutes <= max_wait_minutes) {
        status.is_open = true;
        status.closes_at = interval.close;
      }
      return status;
    }
  }
  return status;
}

}  // namespace walkplan
