#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/poi.h"
#include "config/planner_config.h"
#include "geo/geo.h"
#include "services/weather.h"
#include "util/date.h"

namespace walkplan {

// Everything about a request that influences how a POI is ranked.
struct ScoringContext {
  LocalTime start_time;
  Coordinates origin;
  IntensityProfile profile;
  std::optional<SocialMode> social_mode;
  std::optional<WeatherSnapshot> weather;
  // Empty when no interest text was given or the embedding service failed.
  std::vector<float> query_embedding;
  const ScoringTables& tables;
};

struct CandidateScore {
  const Poi* poi;
  double embedding;
  double contextual;
  double popularity;
  double base;
  double diversity_penalty;
  double final_score;
  double distance_km;
  // Rough arrival used only for ranking, not for the final schedule.
  LocalTime projected_arrival;
};

// "early_morning", "morning", "lunch", "day", "evening", "night" or
// "default" for an hour of the day.
std::string_view TimePhaseFor(int hour);

double TimePhaseAlignment(
    const ScoringTables& tables,
    std::string_view phase,
    const std::string& category,
    const std::set<std::string>& tags
);

// 0.75 without a weather snapshot. Favors indoor categories in rain, fog
// and cold, outdoor ones in warm weather.
double WeatherAlignment(
    const ScoringTables& tables,
    const std::string& category,
    const std::set<std::string>& tags,
    const std::optional<WeatherSnapshot>& weather
);

double SocialAlignment(
    const ScoringTables& tables,
    const std::string& category,
    const std::set<std::string>& tags,
    std::optional<SocialMode> mode
);

// Steps down from 1.0 to 0.4 as the distance grows relative to the search
// radius.
double AccessibilityAlignment(double distance_km, double search_radius_km);

// Weighted blend of the four alignments, 0-100.
double ContextualScore(
    const ScoringContext& context, const Poi& poi, LocalTime arrival, double distance_km
);

// 0-30 from the rating, 18 when the rating is missing.
double PopularityScore(double rating);

// Cosine similarity scaled to 0-100, 55 when either embedding is missing.
double EmbeddingScore(
    const std::vector<float>& query, const std::vector<float>& poi_embedding
);

// 30 when `category` equals the last entry of `recent`, 15 when it appears
// elsewhere in it, else 0.
double DiversityPenalty(const std::string& category, const std::vector<std::string>& recent);

// Scores every candidate and returns them best first, ordered by
// (final_score, embedding) descending.
std::vector<CandidateScore> ScoreCandidates(
    const std::vector<const Poi*>& candidates, const ScoringContext& context
);

}  // namespace walkplan
