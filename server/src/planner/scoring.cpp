#include "planner/scoring.h"

#include <algorithm>

#include "services/embedding.h"

namespace walkplan {

namespace {

constexpr size_t kDiversityHistory = 3;
constexpr double kDiversityWeight = 0.15;

struct PhaseRange {
  std::string_view name;
  int start_hour;
  int end_hour;
};

constexpr PhaseRange kTimePhases[] = {
    {"early_morning", 6, 9},
    {"morning", 9, 12},
    {"lunch", 12, 14},
    {"day", 14, 17},
    {"evening", 17, 19},
    {"night", 19, 22},
};

bool AnyTagContains(const std::set<std::string>& tags, const std::vector<std::string>& needles) {
  return std::any_of(tags.begin(), tags.end(), [&needles](const std::string& tag) {
    return std::any_of(needles.begin(), needles.end(), [&tag](const std::string& needle) {
      return tag.find(needle) != std::string::npos;
    });
  });
}

// Tag fragments that make a place a better fit for a social mode.
struct SocialHint {
  SocialMode mode;
  std::vector<std::string> fragments;
  double bonus;
};

const std::vector<SocialHint>& SocialHints() {
  static const std::vector<SocialHint> kHints = {
      {SocialMode::kFriends, {"инст", "instagram", "photo"}, 0.05},
      {SocialMode::kFamily, {"дет", "kids", "family"}, 0.04},
      {SocialMode::kCouple, {"панорама", "вид", "panorama", "view"}, 0.05},
      {SocialMode::kSolo, {"тихий", "спокой", "quiet", "calm"}, 0.04},
  };
  return kHints;
}

double Clamp(double value, double lo, double hi) { return std::clamp(value, lo, hi); }

}  // namespace

std::string_view TimePhaseFor(int hour) {
  for (const PhaseRange& phase : kTimePhases) {
    if (phase.start_hour <= hour && hour < phase.end_hour) {
      return phase.name;
    }
  }
  return "default";
}

double TimePhaseAlignment(
    const ScoringTables& tables,
    std::string_view phase,
    const std::string& category,
    const std::set<std::string>& tags
) {
  auto it = tables.time_phase.find(std::string(phase));
  if (it == tables.time_phase.end()) {
    it = tables.time_phase.find("default");
  }
  if (it == tables.time_phase.end()) {
    return 0.75;
  }
  return it->second.Lookup(category, tags);
}

double WeatherAlignment(
    const ScoringTables& tables,
    const std::string& category,
    const std::set<std::string>& tags,
    const std::optional<WeatherSnapshot>& weather
) {
  if (!weather) {
    return 0.75;
  }
  bool indoor = tables.indoor_categories.contains(category);
  bool outdoor = tables.outdoor_categories.contains(category);
  double bias = indoor ? 0.92 : (outdoor ? 0.65 : 0.75);

  if (IsFoggy(*weather)) {
    bias += indoor ? 0.05 : -0.08;
  }
  if (IsPrecipitation(*weather)) {
    bias += indoor ? 0.06 : -0.12;
  }
  if (weather->temperature_c && *weather->temperature_c <= 2.0) {
    bias += indoor ? 0.04 : -0.06;
  }
  if (weather->temperature_c && *weather->temperature_c >= 24.0) {
    bias += indoor ? -0.04 : 0.05;
  }
  if (AnyTagContains(tags, {"крыт", "indoor"})) {
    bias += 0.05;
  }
  if (AnyTagContains(tags, {"outdoor", "street"})) {
    bias -= 0.04;
  }
  return Clamp(bias, 0.45, 1.05);
}

double SocialAlignment(
    const ScoringTables& tables,
    const std::string& category,
    const std::set<std::string>& tags,
    std::optional<SocialMode> mode
) {
  if (!mode) {
    return 0.75;
  }
  auto it = tables.social.find(std::string(SocialModeName(*mode)));
  if (it == tables.social.end()) {
    return 0.75;
  }
  // Social preferences are keyed by category only.
  double base = it->second.Lookup(category, {});
  for (const SocialHint& hint : SocialHints()) {
    if (hint.mode == *mode && AnyTagContains(tags, hint.fragments)) {
      base += hint.bonus;
    }
  }
  return Clamp(base, 0.5, 1.0);
}

double AccessibilityAlignment(double distance_km, double search_radius_km) {
  if (distance_km <= search_radius_km * 0.35) return 1.0;
  if (distance_km <= search_radius_km * 0.65) return 0.85;
  if (distance_km <= search_radius_km * 0.9) return 0.7;
  if (distance_km <= search_radius_km * 1.15) return 0.55;
  return 0.4;
}

double ContextualScore(
    const ScoringContext& context, const Poi& poi, LocalTime arrival, double distance_km
) {
  double time_phase = Clamp(
      TimePhaseAlignment(context.tables, TimePhaseFor(arrival.Hour()), poi.category, poi.tags),
      0.0,
      1.1
  );
  double weather = Clamp(
      WeatherAlignment(context.tables, poi.category, poi.tags, context.weather), 0.0, 1.1
  );
  double social = Clamp(
      SocialAlignment(context.tables, poi.category, poi.tags, context.social_mode), 0.0, 1.1
  );
  double access = Clamp(
      AccessibilityAlignment(distance_km, context.profile.search_radius_km), 0.0, 1.1
  );
  double blended = 0.40 * time_phase + 0.25 * weather + 0.20 * social + 0.15 * access;
  return Clamp(blended * 100.0, 0.0, 100.0);
}

double PopularityScore(double rating) {
  if (rating <= 0) {
    return 18.0;
  }
  return Clamp(rating / 5.0, 0.0, 1.0) * 30.0;
}

double EmbeddingScore(
    const std::vector<float>& query, const std::vector<float>& poi_embedding
) {
  std::optional<double> similarity = CosineSimilarity(query, poi_embedding);
  if (!similarity) {
    return 55.0;
  }
  return Clamp(*similarity * 100.0, 0.0, 100.0);
}

double DiversityPenalty(const std::string& category, const std::vector<std::string>& recent) {
  if (category.empty() || recent.empty()) {
    return 0.0;
  }
  if (recent.back() == category) {
    return 30.0;
  }
  if (std::find(recent.begin(), recent.end(), category) != recent.end()) {
    return 15.0;
  }
  return 0.0;
}

std::vector<CandidateScore> ScoreCandidates(
    const std::vector<const Poi*>& candidates, const ScoringContext& context
) {
  double slot_minutes = std::max(
      30.0,
      static_cast<double>(
          context.profile.default_visit_minutes + context.profile.transition_padding_minutes
      )
  );

  std::vector<CandidateScore> scored;
  scored.reserve(candidates.size());
  for (size_t index = 0; index < candidates.size(); ++index) {
    const Poi& poi = *candidates[index];
    LocalTime arrival = context.start_time.PlusMinutes(index * slot_minutes);
    double distance_km = HaversineKm(context.origin, poi.location);
    double embedding = EmbeddingScore(context.query_embedding, poi.embedding);
    double contextual = ContextualScore(context, poi, arrival, distance_km);
    double popularity = PopularityScore(poi.rating);
    scored.push_back(CandidateScore{
        .poi = &poi,
        .embedding = embedding,
        .contextual = contextual,
        .popularity = popularity,
        .base = 0.4 * embedding + 0.3 * contextual + 0.15 * popularity,
        .diversity_penalty = 0.0,
        .final_score = 0.0,
        .distance_km = distance_km,
        .projected_arrival = arrival,
    });
  }

  // The penalty depends on what ranked above, so it is applied in base
  // order before the final sort.
  std::stable_sort(
      scored.begin(),
      scored.end(),
      [](const CandidateScore& a, const CandidateScore& b) {
        if (a.base != b.base) return a.base > b.base;
        return a.embedding > b.embedding;
      }
  );
  std::vector<std::string> recent;
  for (CandidateScore& candidate : scored) {
    candidate.diversity_penalty = DiversityPenalty(candidate.poi->category, recent);
    candidate.final_score =
        std::max(0.0, candidate.base - kDiversityWeight * candidate.diversity_penalty);
    recent.push_back(candidate.poi->category);
    if (recent.size() > kDiversityHistory) {
      recent.erase(recent.begin());
    }
  }
  std::stable_sort(
      scored.begin(),
      scored.end(),
      [](const CandidateScore& a, const CandidateScore& b) {
        if (a.final_score != b.final_score) return a.final_score > b.final_score;
        return a.embedding > b.embedding;
      }
  );
  return scored;
}

}  // namespace walkplan
