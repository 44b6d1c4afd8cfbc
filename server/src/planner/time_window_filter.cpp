#include "planner/time_window_filter.h"

#include <algorithm>

#include "util/strings.h"

namespace walkplan {

std::string PoiKeywordText(const Poi& poi) {
  std::string text = ToLowerAscii(poi.name) + " " + ToLowerAscii(poi.category);
  for (const std::string& tag : poi.tags) {
    text += " " + ToLowerAscii(tag);
  }
  return text;
}

bool ExcludedAtStart(const Poi& poi, LocalTime start, const PlannerConfig& config) {
  int hour = start.Hour();
  if (hour < config.morning_cutoff_hour &&
      ContainsAny(PoiKeywordText(poi), config.morning_excluded_keywords)) {
    return true;
  }
  if (hour >= config.night_start_hour &&
      ContainsAny(PoiKeywordText(poi), config.night_excluded_keywords)) {
    return true;
  }
  return false;
}

std::vector<CandidateScore> ApplyTimeWindowFilter(
    std::vector<CandidateScore> ranked,
    LocalTime start,
    const OpeningHoursResolver& resolver,
    const PlannerConfig& config
) {
  std::vector<CandidateScore> kept;
  kept.reserve(ranked.size());
  for (const CandidateScore& candidate : ranked) {
    if (!ExcludedAtStart(*candidate.poi, start, config)) {
      kept.push_back(candidate);
    }
  }
  if (kept.empty()) {
    kept = std::move(ranked);
  }

  std::stable_partition(kept.begin(), kept.end(), [&resolver](const CandidateScore& c) {
    return resolver.Evaluate(*c.poi, c.projected_arrival).is_open;
  });
  return kept;
}

}  // namespace walkplan
