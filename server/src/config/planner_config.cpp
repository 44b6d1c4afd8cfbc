#include "config/planner_config.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "util/strings.h"

namespace walkplan {

namespace {

CategoryWeights Weights(
    std::initializer_list<std::pair<const std::string, double>> entries,
    double fallback
) {
  return CategoryWeights{.by_category = entries, .fallback = fallback};
}

DailyWindow Window(int open_hour, int open_minute, int close_hour, int close_minute) {
  return DailyWindow{
      TimeOfDay{open_hour * 60 + open_minute}, TimeOfDay{close_hour * 60 + close_minute}
  };
}

DailyWindow ParseDailyWindow(std::string_view text, std::string_view key) {
  std::vector<std::string> parts = SplitAndTrim(text, '-');
  std::optional<TimeOfDay> open;
  std::optional<TimeOfDay> close;
  if (parts.size() == 2) {
    open = TimeOfDay::Parse(parts[0]);
    close = TimeOfDay::Parse(parts[1]);
  }
  if (!open || !close) {
    throw std::runtime_error(
        "typical_hours." + std::string(key) + " must look like \"HH:MM-HH:MM\""
    );
  }
  return DailyWindow{*open, *close};
}

std::vector<std::string> StringArray(const toml::node_view<const toml::node>& node) {
  std::vector<std::string> result;
  if (const toml::array* arr = node.as_array()) {
    for (const auto& elem : *arr) {
      if (auto val = elem.value<std::string>()) {
        result.push_back(*val);
      }
    }
  }
  return result;
}

template <typename T>
void Overlay(const toml::node_view<const toml::node>& node, T& target) {
  if (auto val = node.value<T>()) {
    target = *val;
  }
}

void OverlayWeights(const toml::table* table, std::unordered_map<std::string, CategoryWeights>& target) {
  if (!table) {
    return;
  }
  for (auto&& [group, node] : *table) {
    const toml::table* entries = node.as_table();
    if (!entries) {
      continue;
    }
    CategoryWeights& weights = target[std::string(group.str())];
    for (auto&& [category, value] : *entries) {
      std::optional<double> weight = value.value<double>();
      if (!weight) {
        throw std::runtime_error(
            "Weight for '" + std::string(category.str()) + "' must be a number"
        );
      }
      if (category.str() == "default") {
        weights.fallback = *weight;
      } else {
        weights.by_category[std::string(category.str())] = *weight;
      }
    }
  }
}

}  // namespace

Intensity ParseIntensity(std::string_view name) {
  std::string key = ToLowerAscii(TrimWhitespace(name));
  if (key == "relaxed" || key == "low") {
    return Intensity::kRelaxed;
  }
  if (key == "intense" || key == "high") {
    return Intensity::kIntense;
  }
  return Intensity::kMedium;
}

std::string_view IntensityName(Intensity intensity) {
  switch (intensity) {
    case Intensity::kRelaxed:
      return "relaxed";
    case Intensity::kMedium:
      return "medium";
    case Intensity::kIntense:
      return "intense";
  }
  return "medium";
}

std::optional<SocialMode> ParseSocialMode(std::string_view name) {
  std::string key = ToLowerAscii(TrimWhitespace(name));
  if (key == "solo") return SocialMode::kSolo;
  if (key == "friends") return SocialMode::kFriends;
  if (key == "couple") return SocialMode::kCouple;
  if (key == "family") return SocialMode::kFamily;
  return std::nullopt;
}

std::string_view SocialModeName(SocialMode mode) {
  switch (mode) {
    case SocialMode::kSolo:
      return "solo";
    case SocialMode::kFriends:
      return "friends";
    case SocialMode::kCouple:
      return "couple";
    case SocialMode::kFamily:
      return "family";
  }
  return "solo";
}

double EffectiveVisitMinutes(
    const IntensityProfile& profile, std::optional<double> base
) {
  double value = (!base || *base <= 0) ? profile.default_visit_minutes : *base;
  value = std::clamp(
      value,
      static_cast<double>(profile.min_visit_minutes),
      static_cast<double>(profile.max_visit_minutes)
  );
  return std::round(value);
}

double CategoryWeights::Lookup(
    const std::string& category, const std::set<std::string>& tags
) const {
  if (auto it = by_category.find(category); it != by_category.end()) {
    return it->second;
  }
  for (const std::string& tag : tags) {
    if (auto it = by_category.find(tag); it != by_category.end()) {
      return it->second;
    }
  }
  return fallback;
}

const IntensityProfile& PlannerConfig::Profile(Intensity intensity) const {
  auto it = intensities.find(intensity);
  if (it == intensities.end()) {
    throw std::runtime_error(
        "No profile configured for intensity " + std::string(IntensityName(intensity))
    );
  }
  return it->second;
}

PlannerConfig DefaultPlannerConfig() {
  PlannerConfig config;

  config.intensities = {
      {Intensity::kRelaxed,
       IntensityProfile{
           .target_per_hour = 1.3,
           .default_visit_minutes = 55,
           .min_visit_minutes = 40,
           .max_visit_minutes = 90,
           .transition_padding_minutes = 8,
           .safety_buffer_minutes = 20,
           .search_radius_km = 5.0,
           .candidate_multiplier = 1.5,
           .break_interval_minutes = 90,
       }},
      {Intensity::kMedium,
       IntensityProfile{
           .target_per_hour = 2.0,
           .default_visit_minutes = 42,
           .min_visit_minutes = 30,
           .max_visit_minutes = 70,
           .transition_padding_minutes = 6,
           .safety_buffer_minutes = 15,
           .search_radius_km = 7.5,
           .candidate_multiplier = 2.0,
           .break_interval_minutes = 90,
       }},
      {Intensity::kIntense,
       IntensityProfile{
           .target_per_hour = 2.8,
           .default_visit_minutes = 30,
           .min_visit_minutes = 20,
           .max_visit_minutes = 55,
           .transition_padding_minutes = 4,
           .safety_buffer_minutes = 10,
           .search_radius_km = 10.0,
           .candidate_multiplier = 2.5,
           .break_interval_minutes = 100,
       }},
  };

  ScoringTables& scoring = config.scoring;
  scoring.time_phase = {
      {"early_morning",
       Weights({{"park", 1.0}, {"embankment", 0.95}, {"viewpoint", 0.92}, {"memorial", 0.82}}, 0.75)},
      {"morning",
       Weights({{"museum", 0.95}, {"art_object", 0.88}, {"architecture", 0.86}, {"memorial", 0.84}}, 0.78)},
      {"lunch",
       Weights({{"cafe", 1.0}, {"restaurant", 0.95}, {"market", 0.92}, {"embankment", 0.8}}, 0.74)},
      {"day",
       Weights({{"museum", 0.9}, {"art_object", 0.88}, {"memorial", 0.86}, {"architecture", 0.85}, {"park", 0.82}}, 0.78)},
      {"evening",
       Weights({{"architecture", 0.95}, {"art_object", 0.94}, {"viewpoint", 0.92}, {"embankment", 0.9}, {"memorial", 0.88}}, 0.8)},
      {"night",
       Weights({{"art_object", 0.9}, {"memorial", 0.88}, {"monument", 0.88}, {"embankment", 0.85}, {"park", 0.52}}, 0.72)},
      {"default", Weights({}, 0.75)},
  };
  scoring.social = {
      {"solo",
       Weights({{"museum", 0.95}, {"memorial", 0.9}, {"park", 0.82}, {"art_object", 0.8}}, 0.76)},
      {"friends",
       Weights({{"art_object", 0.96}, {"mosaic", 0.94}, {"decorative_art", 0.92}, {"market", 0.86}}, 0.74)},
      {"couple",
       Weights({{"embankment", 0.95}, {"viewpoint", 0.94}, {"cafe", 0.9}, {"architecture", 0.88}}, 0.78)},
      {"family",
       Weights({{"museum", 0.9}, {"park", 0.9}, {"memorial", 0.85}}, 0.8)},
  };
  scoring.indoor_categories = {
      "museum", "gallery", "church", "religious_site", "cafe", "restaurant"
  };
  scoring.outdoor_categories = {
      "park", "embankment", "viewpoint", "mosaic", "art_object",
      "decorative_art", "monument", "memorial"
  };

  config.typical_hours = {
      {"museum", Window(10, 0, 19, 0)},
      {"art_object", Window(9, 0, 21, 0)},
      {"architecture", Window(9, 0, 22, 0)},
      {"religious_site", Window(8, 0, 20, 0)},
      {"viewpoint", Window(9, 0, 22, 0)},
      {"sculpture", Window(9, 0, 22, 0)},
      {"park", Window(0, 0, 24, 0)},
      {"memorial", Window(0, 0, 24, 0)},
      {"monument", Window(0, 0, 24, 0)},
      {"embankment", Window(0, 0, 24, 0)},
      {"cafe", Window(8, 0, 23, 0)},
      {"bar", Window(12, 0, 2, 0)},
  };

  config.break_categories = {"cafe", "coffee"};
  config.morning_excluded_keywords = {
      "coffee", "cafe", "bar", "brunch", "кофе", "кафе", "бар"
  };
  config.night_excluded_keywords = {
      "park", "alley", "trail", "courtyard", "сквер", "тропа", "двор", "аллея", "парк"
  };
  return config;
}

PlannerConfig PlannerConfigFromToml(const toml::table& table) {
  PlannerConfig config = DefaultPlannerConfig();

  int64_t max_candidates = static_cast<int64_t>(config.max_candidates);
  Overlay(table["max_candidates"], max_candidates);
  if (max_candidates < 1) {
    throw std::runtime_error("max_candidates must be positive");
  }
  config.max_candidates = static_cast<size_t>(max_candidates);
  Overlay(table["near_radius_factor"], config.near_radius_factor);
  Overlay(table["max_selected_candidates"], config.max_selected_candidates);
  Overlay(table["max_wait_minutes"], config.max_wait_minutes);
  Overlay(table["max_consecutive_category"], config.max_consecutive_category);
  Overlay(table["budget_overflow_factor"], config.budget_overflow_factor);
  Overlay(table["budget_fill_ratio"], config.budget_fill_ratio);

  Overlay(table["sequencer"]["dp_threshold"], config.dp_threshold);
  Overlay(table["sequencer"]["two_opt_max_iterations"], config.two_opt_max_iterations);

  Overlay(table["breaks"]["search_radius_km"], config.break_search_radius_km);
  if (table["breaks"]["categories"].as_array()) {
    config.break_categories = StringArray(table["breaks"]["categories"]);
  }

  if (table["time_window"]["morning_excluded_keywords"].as_array()) {
    config.morning_excluded_keywords =
        StringArray(table["time_window"]["morning_excluded_keywords"]);
  }
  if (table["time_window"]["night_excluded_keywords"].as_array()) {
    config.night_excluded_keywords =
        StringArray(table["time_window"]["night_excluded_keywords"]);
  }
  Overlay(table["time_window"]["morning_cutoff_hour"], config.morning_cutoff_hour);
  Overlay(table["time_window"]["night_start_hour"], config.night_start_hour);

  if (const toml::table* intensities = table["intensity"].as_table()) {
    for (auto&& [name, node] : *intensities) {
      Intensity intensity = ParseIntensity(name.str());
      if (IntensityName(intensity) != name.str()) {
        throw std::runtime_error(
            "Unknown intensity in config: " + std::string(name.str())
        );
      }
      IntensityProfile& profile = config.intensities.at(intensity);
      auto view = toml::node_view<const toml::node>{&node};
      Overlay(view["target_per_hour"], profile.target_per_hour);
      Overlay(view["default_visit_minutes"], profile.default_visit_minutes);
      Overlay(view["min_visit_minutes"], profile.min_visit_minutes);
      Overlay(view["max_visit_minutes"], profile.max_visit_minutes);
      Overlay(view["transition_padding_minutes"], profile.transition_padding_minutes);
      Overlay(view["safety_buffer_minutes"], profile.safety_buffer_minutes);
      Overlay(view["search_radius_km"], profile.search_radius_km);
      Overlay(view["candidate_multiplier"], profile.candidate_multiplier);
      Overlay(view["break_interval_minutes"], profile.break_interval_minutes);
      if (profile.min_visit_minutes > profile.max_visit_minutes) {
        throw std::runtime_error(
            "min_visit_minutes exceeds max_visit_minutes for " +
            std::string(name.str())
        );
      }
    }
  }

  OverlayWeights(table["scoring"]["time_phase"].as_table(), config.scoring.time_phase);
  OverlayWeights(table["scoring"]["social"].as_table(), config.scoring.social);

  if (const toml::table* hours = table["typical_hours"].as_table()) {
    for (auto&& [category, node] : *hours) {
      std::optional<std::string> text = node.value<std::string>();
      if (!text) {
        throw std::runtime_error(
            "typical_hours." + std::string(category.str()) + " must be a string"
        );
      }
      DailyWindow window = ParseDailyWindow(*text, category.str());
      if (category.str() == "default") {
        config.default_hours = window;
      } else {
        config.typical_hours[std::string(category.str())] = window;
      }
    }
  }

  RoutingConfig& routing = config.routing;
  if (auto url = table["routing"]["osrm_base_url"].value<std::string>()) {
    routing.osrm_base_url = *url;
  }
  Overlay(table["routing"]["osrm_profile"], routing.osrm_profile);
  Overlay(table["routing"]["timeout_ms"], routing.timeout_ms);
  Overlay(table["routing"]["max_attempts"], routing.max_attempts);
  Overlay(table["routing"]["initial_backoff_ms"], routing.initial_backoff_ms);
  Overlay(table["routing"]["backoff_multiplier"], routing.backoff_multiplier);
  Overlay(table["routing"]["cache_ttl_seconds"], routing.cache_ttl_seconds);
  Overlay(table["routing"]["cache_capacity"], routing.cache_capacity);
  Overlay(table["routing"]["walk_speed_kmh"], routing.walk_speed_kmh);
  if (routing.walk_speed_kmh <= 0) {
    throw std::runtime_error("routing.walk_speed_kmh must be positive");
  }

  ServicesConfig& services = config.services;
  Overlay(table["services"]["max_attempts"], services.max_attempts);
  Overlay(table["services"]["initial_backoff_ms"], services.initial_backoff_ms);
  Overlay(table["services"]["backoff_multiplier"], services.backoff_multiplier);
  if (services.max_attempts < 1) {
    throw std::runtime_error("services.max_attempts must be at least 1");
  }

  return config;
}

PlannerConfig PlannerConfigLoad(const std::string& config_path) {
  toml::table table;
  try {
    table = toml::parse_file(config_path);
  } catch (const toml::parse_error& err) {
    throw std::runtime_error(
        "Failed to parse planner config file '" + config_path +
        "': " + std::string(err.what())
    );
  }
  try {
    return PlannerConfigFromToml(table);
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Invalid planner config file '" + config_path + "': " + e.what()
    );
  }
}

}  // namespace walkplan
