#include "planner/assembler.h"

#include <algorithm>
#include <cmath>
#include <format>

#include "errors.h"
#include "planner/breaks.h"
#include "planner/budget.h"
#include "planner/diversity.h"
#include "planner/prefilter.h"
#include "planner/schedule_aligner.h"
#include "planner/scoring.h"
#include "planner/sequencer.h"
#include "planner/time_window_filter.h"
#include "schedule/opening_hours.h"
#include "schedule/start_time.h"

namespace walkplan {

namespace {

constexpr int kLateFinishHour = 22;

std::string JoinCategories(const std::vector<std::string>& categories) {
  std::string out;
  for (const std::string& category : categories) {
    if (!out.empty()) out += ", ";
    out += category;
  }
  return out;
}

}  // namespace

ItineraryAssembler::ItineraryAssembler(
    const PlannerConfig& config, PlannerServices services, TextLogger log, Sleeper sleep
)
    : config_(config),
      services_(services),
      log_(std::move(log)),
      retry_policy_{
          .max_attempts = config.services.max_attempts,
          .initial_backoff = std::chrono::milliseconds{config.services.initial_backoff_ms},
          .backoff_multiplier = config.services.backoff_multiplier,
      },
      sleep_(std::move(sleep)) {}

ItineraryAssembler::ResolvedStart ItineraryAssembler::ResolveStart(
    const PlanRequest& request, const Deadline& deadline
) const {
  if (request.start_location) {
    if (!IsValidCoordinates(*request.start_location)) {
      throw InvalidRequest("start_location is out of range");
    }
    return ResolvedStart{
        .location = *request.start_location,
        .label = request.start_address.value_or("the starting point"),
    };
  }
  const std::string& address = *request.start_address;
  if (services_.geocoder == nullptr) {
    throw StartLocationUnresolved("no geocoder configured to resolve '" + address + "'");
  }
  auto result = RetryWithBackoff(
      [&] { return services_.geocoder->Resolve(address, deadline); },
      retry_policy_,
      deadline,
      sleep_
  );
  if (!result.ok()) {
    throw StartLocationUnresolved(std::format(
        "could not resolve '{}' after {} attempt(s): {}",
        address,
        result.attempts,
        result.last_error
    ));
  }
  const std::optional<GeocodeResult>& found = *result.value;
  if (!found || !services_.geocoder->Validate(found->location)) {
    throw StartLocationUnresolved("could not resolve '" + address + "'");
  }
  log_(std::format("Resolved '{}' to {}", address, found->label));
  return ResolvedStart{.location = found->location, .label = found->label};
}

std::optional<WeatherSnapshot> ItineraryAssembler::LoadWeather(
    Coordinates at, const Deadline& deadline
) const {
  if (services_.weather == nullptr) {
    return std::nullopt;
  }
  auto result = RetryWithBackoff(
      [&] { return services_.weather->Snapshot(at, deadline); },
      retry_policy_,
      deadline,
      sleep_
  );
  if (!result.ok()) {
    log_(std::format(
        "Weather skipped after {} attempt(s): {}", result.attempts, result.last_error
    ));
  }
  return result.value;
}

std::vector<float> ItineraryAssembler::EmbedInterests(
    const std::string& interests, const Deadline& deadline
) const {
  if (services_.embeddings == nullptr || interests.empty()) {
    return {};
  }
  auto result = RetryWithBackoff(
      [&] { return services_.embeddings->Embed(interests, deadline); },
      retry_policy_,
      deadline,
      sleep_
  );
  if (!result.ok()) {
    log_(std::format(
        "Interest embedding skipped after {} attempt(s): {}",
        result.attempts,
        result.last_error
    ));
    return {};
  }
  return std::move(*result.value);
}

Itinerary ItineraryAssembler::Plan(
    const PlanRequest& request, LocalTime now, const Deadline& deadline
) const {
  ValidatePlanRequest(request);
  Intensity intensity = ParseIntensity(request.intensity);
  const IntensityProfile& profile = config_.Profile(intensity);
  std::optional<SocialMode> social_mode;
  if (request.social_mode) {
    social_mode = ParseSocialMode(*request.social_mode);
  }

  ResolvedStart start = ResolveStart(request, deadline);
  StartTimePlan start_plan = DetermineStartTime(
      request.start_time ? std::optional<std::string_view>(*request.start_time) : std::nullopt,
      now,
      request.hours
  );

  std::vector<Poi> pois = services_.catalog.Query(request.categories);
  if (pois.empty()) {
    throw NoCandidatesFound(
        request.categories.empty()
            ? std::string("the catalog is empty")
            : "no places in categories: " + JoinCategories(request.categories)
    );
  }
  log_(std::format("{} catalog candidates", pois.size()));

  // Per request, so each unusable opening-hours text is reported once.
  OpeningHoursResolver resolver(config_, log_);
  std::optional<WeatherSnapshot> weather = LoadWeather(start.location, deadline);
  ScoringContext scoring_context{
      .start_time = start_plan.start_time,
      .origin = start.location,
      .profile = profile,
      .social_mode = social_mode,
      .weather = weather,
      .query_embedding = EmbedInterests(request.interests, deadline),
      .tables = config_.scoring,
  };

  std::vector<const Poi*> prefiltered = PrefilterCandidates(
      pois,
      start.location,
      profile.search_radius_km,
      PrefilterOptions{
          .max_candidates = config_.max_candidates,
          .near_radius_factor = config_.near_radius_factor,
      }
  );
  std::vector<CandidateScore> ranked = ApplyTimeWindowFilter(
      ScoreCandidates(prefiltered, scoring_context), start_plan.start_time, resolver, config_
  );
  if (ranked.empty()) {
    throw NoCandidatesFound("no candidates left after filtering");
  }
  size_t limit = CandidateLimit(
      request.hours,
      profile,
      ranked.size(),
      static_cast<size_t>(config_.max_selected_candidates)
  );
  ranked.resize(std::min(ranked.size(), limit));

  std::vector<Coordinates> points;
  points.reserve(ranked.size());
  for (const CandidateScore& candidate : ranked) {
    points.push_back(candidate.poi->location);
  }
  VisitOrder order = OptimizeVisitOrder(
      start.location,
      points,
      SequencerOptions{
          .dp_threshold = config_.dp_threshold,
          .two_opt_max_iterations = config_.two_opt_max_iterations,
      }
  );
  std::vector<SelectedStop> ordered;
  ordered.reserve(order.size());
  for (int idx : order) {
    const Poi* poi = ranked[idx].poi;
    ordered.push_back(SelectedStop{
        .poi = poi,
        .visit_minutes = EffectiveVisitMinutes(
            profile,
            poi->avg_visit_minutes > 0 ? std::optional<double>(poi->avg_visit_minutes)
                                       : std::nullopt
        ),
    });
  }

  double raw_budget = request.hours * 60.0;
  std::optional<BreakPreferences> breaks;
  if (services_.break_finder != nullptr && request.breaks && request.breaks->enabled) {
    breaks = request.breaks;
  }
  double reserved_break_minutes = EstimateBreakMinutes(raw_budget, profile, breaks);
  BudgetOptions budget{
      .available_minutes =
          EffectiveBudgetMinutes(request.hours, reserved_break_minutes, profile),
      .raw_budget_minutes = raw_budget,
      .target_visit_count = TargetVisitCount(request.hours, profile),
      .min_visit_minutes = static_cast<double>(profile.min_visit_minutes),
      .padding_minutes = static_cast<double>(profile.transition_padding_minutes),
      .overflow_factor = config_.budget_overflow_factor,
      .fill_ratio = config_.budget_fill_ratio,
      .walk_speed_kmh = config_.routing.walk_speed_kmh,
  };
  BudgetFit fit = FitToBudget(start.location, ordered, budget);
  int swaps = EnforceCategoryDiversity(
      fit.selected,
      config_.max_consecutive_category,
      [](const SelectedStop& stop) -> const std::string& { return stop.poi->category; }
  );
  DropTailOverBudget(start.location, fit, budget);
  log_(std::format(
      "Selected {} of {} stops ({} skipped, {} diversity swaps, {:.0f} of {:.0f} min)",
      fit.selected.size(),
      ordered.size(),
      fit.skipped.size(),
      swaps,
      fit.total_minutes,
      budget.available_minutes
  ));

  ScheduleAligner aligner(resolver, services_.distances, profile, log_);
  std::optional<BreakInserter> inserter;
  AfterStopHook hook;
  if (breaks) {
    inserter.emplace(
        services_.break_finder,
        services_.distances,
        resolver,
        profile,
        *breaks,
        start_plan.start_time.PlusMinutes(raw_budget),
        log_
    );
    hook = inserter->AsHook();
  }
  TimelineState timeline =
      aligner.Align(start.location, start_plan.start_time, fit.selected, deadline, hook);

  Itinerary itinerary{
      .start_time = start_plan.start_time,
      .start_location = start.location,
      .start_label = start.label,
      .intensity = std::string(IntensityName(intensity)),
      .stops = std::move(timeline.stops),
      .approach_leg = std::move(timeline.approach_leg),
      .legs = std::move(timeline.legs),
  };
  if (itinerary.approach_leg) {
    itinerary.total_distance_km += itinerary.approach_leg->distance_km;
  }
  for (const Leg& leg : itinerary.legs) {
    itinerary.total_distance_km += leg.distance_km;
  }
  LocalTime finish =
      itinerary.stops.empty() ? itinerary.start_time : itinerary.stops.back().leave_time;
  itinerary.total_minutes =
      static_cast<int>(std::lround(finish.MinutesSince(itinerary.start_time)));

  // Warnings.
  int requested_minutes = static_cast<int>(std::lround(raw_budget));
  if (itinerary.total_minutes > requested_minutes) {
    itinerary.warnings.push_back(std::format(
        "route runs longer than requested: {} min instead of {} min",
        itinerary.total_minutes,
        requested_minutes
    ));
  }
  for (const PlannedStop& stop : itinerary.stops) {
    if (!stop.is_open) {
      itinerary.warnings.push_back(std::format(
          "{} may be closed at {}: {}",
          stop.name,
          stop.arrival_time.ClockString(),
          stop.availability_note.value_or(stop.opening_label)
      ));
    }
  }
  if (finish.StartOfDay() != itinerary.start_time.StartOfDay() ||
      finish.Hour() >= kLateFinishHour) {
    itinerary.warnings.push_back(
        std::format("the walk ends late, at {}", finish.ClockString())
    );
  }
  for (std::string& warning : start_plan.warnings) {
    itinerary.warnings.push_back(std::move(warning));
  }

  // Notes.
  itinerary.notes.push_back("Starting from " + start.label);
  itinerary.notes.push_back(std::format(
      "{} min kept as a safety buffer", profile.safety_buffer_minutes
  ));
  double visit_minutes = 0.0;
  for (const PlannedStop& stop : itinerary.stops) {
    if (!stop.is_break) visit_minutes += stop.visit_minutes;
  }
  itinerary.notes.push_back(
      std::format("{:.0f} min spent at places", visit_minutes)
  );
  if (inserter && inserter->inserted_count() > 0) {
    itinerary.notes.push_back(std::format(
        "{} coffee break(s), about every {} min",
        inserter->inserted_count(),
        inserter->interval_minutes()
    ));
  }
  if (weather) {
    if (std::optional<std::string> advice = WeatherAdvice(*weather)) {
      itinerary.notes.push_back(*advice);
    }
  }
  bool any_estimated =
      (itinerary.approach_leg && itinerary.approach_leg->source == LegSource::kEstimated) ||
      std::any_of(itinerary.legs.begin(), itinerary.legs.end(), [](const Leg& leg) {
        return leg.source == LegSource::kEstimated;
      });
  if (any_estimated) {
    itinerary.notes.push_back("some walking times are straight-line estimates");
  }

  RouteExplanation explanation = ExplainRoute(
      services_.explanations,
      ExplanationRequest{
          .stops = itinerary.stops,
          .interests = request.interests,
          .social_mode = social_mode ? std::string(SocialModeName(*social_mode)) : "",
          .intensity = itinerary.intensity,
      },
      deadline,
      log_,
      retry_policy_,
      sleep_
  );
  itinerary.summary = std::move(explanation.summary);
  for (size_t i = 0; i < itinerary.stops.size() && i < explanation.why.size(); ++i) {
    if (!explanation.why[i].empty()) {
      itinerary.stops[i].why = std::move(explanation.why[i]);
    }
  }
  for (std::string& note : explanation.notes) {
    itinerary.notes.push_back(std::move(note));
  }
  return itinerary;
}

}  // namespace walkplan
