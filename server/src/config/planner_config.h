#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <toml++/toml.hpp>
#include <unordered_map>
#include <vector>

#include "util/date.h"

namespace walkplan {

enum class Intensity { kRelaxed, kMedium, kIntense };

enum class SocialMode { kSolo, kFriends, kCouple, kFamily };

// Accepts "relaxed"/"low", "medium", "intense"/"high". Anything else is
// medium.
Intensity ParseIntensity(std::string_view name);
std::string_view IntensityName(Intensity intensity);

std::optional<SocialMode> ParseSocialMode(std::string_view name);
std::string_view SocialModeName(SocialMode mode);

// Pacing parameters of one intensity level.
struct IntensityProfile {
  double target_per_hour;
  int default_visit_minutes;
  int min_visit_minutes;
  int max_visit_minutes;
  int transition_padding_minutes;
  int safety_buffer_minutes;
  double search_radius_km;
  double candidate_multiplier;
  int break_interval_minutes;
};

// Visit duration bounded by the profile: the default when `base` is missing
// or non-positive, otherwise `base` clamped to [min, max], rounded.
double EffectiveVisitMinutes(
    const IntensityProfile& profile, std::optional<double> base
);

// Category preference weights with a fallback for unknown categories.
struct CategoryWeights {
  std::unordered_map<std::string, double> by_category;
  double fallback = 0.75;

  // Weight for `category`, or for the first tag that has one, or the
  // fallback.
  double Lookup(const std::string& category, const std::set<std::string>& tags) const;
};

struct ScoringTables {
  // Keyed by time phase name ("early_morning", ..., "default").
  std::unordered_map<std::string, CategoryWeights> time_phase;
  // Keyed by SocialModeName().
  std::unordered_map<std::string, CategoryWeights> social;
  std::set<std::string> indoor_categories;
  std::set<std::string> outdoor_categories;
};

struct DailyWindow {
  TimeOfDay open;
  TimeOfDay close;
};

struct RoutingConfig {
  // Base URL of an OSRM server, e.g. "http://localhost:5000". Unset means
  // haversine estimates only.
  std::optional<std::string> osrm_base_url;
  std::string osrm_profile = "foot";
  int timeout_ms = 4000;
  int max_attempts = 3;
  int initial_backoff_ms = 200;
  double backoff_multiplier = 2.0;
  int cache_ttl_seconds = 3600;
  int cache_capacity = 4096;
  double walk_speed_kmh = 4.5;
};

// Retries for the optional services (geocoder, weather, embeddings,
// explanations). A call that still fails after these falls back.
struct ServicesConfig {
  int max_attempts = 2;
  int initial_backoff_ms = 200;
  double backoff_multiplier = 2.0;
};

struct PlannerConfig {
  std::map<Intensity, IntensityProfile> intensities;
  ScoringTables scoring;

  // Typical opening hours by category, used when a POI has no schedule.
  std::unordered_map<std::string, DailyWindow> typical_hours;
  DailyWindow default_hours{TimeOfDay{9 * 60}, TimeOfDay{21 * 60}};

  size_t max_candidates = 60;
  double near_radius_factor = 1.25;
  int max_selected_candidates = 80;

  int dp_threshold = 7;
  int two_opt_max_iterations = 100;

  int max_wait_minutes = 45;
  int max_consecutive_category = 2;
  double budget_overflow_factor = 1.08;
  double budget_fill_ratio = 0.98;

  double break_search_radius_km = 0.5;
  std::vector<std::string> break_categories;

  // Keywords matched against name, category and tags.
  std::vector<std::string> morning_excluded_keywords;
  std::vector<std::string> night_excluded_keywords;
  int morning_cutoff_hour = 9;
  int night_start_hour = 21;

  RoutingConfig routing;
  ServicesConfig services;

  const IntensityProfile& Profile(Intensity intensity) const;
};

PlannerConfig DefaultPlannerConfig();

// Overlays the keys present in `table` on top of DefaultPlannerConfig().
PlannerConfig PlannerConfigFromToml(const toml::table& table);

// Parse a TOML config file into a PlannerConfig.
PlannerConfig PlannerConfigLoad(const std::string& config_path);

}  // namespace walkplan
