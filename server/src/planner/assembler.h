#pragma once

#include <optional>
#include <string>
#include <vector>

#include "catalog/catalog.h"
#include "config/planner_config.h"
#include "log.h"
#include "planner/itinerary.h"
#include "planner/request.h"
#include "routing/distance_provider.h"
#include "services/break_finder.h"
#include "services/embedding.h"
#include "services/explanation.h"
#include "services/geocoder.h"
#include "services/weather.h"
#include "util/date.h"
#include "util/deadline.h"
#include "util/retry.h"

namespace walkplan {

// Collaborators of the planner, built once per process. Only the catalog
// and the distance provider are required.
struct PlannerServices {
  const PoiCatalog& catalog;
  DistanceProvider& distances;
  BreakCandidateFinder* break_finder = nullptr;
  WeatherService* weather = nullptr;
  EmbeddingService* embeddings = nullptr;
  Geocoder* geocoder = nullptr;
  ExplanationService* explanations = nullptr;
};

// Runs the whole pipeline for one request: candidates, ranking, ordering,
// budget, timeline, breaks and texts. Calls to the optional services are
// retried per config.services and then fall back. Safe to share between
// threads as long as the services are.
class ItineraryAssembler {
 public:
  ItineraryAssembler(
      const PlannerConfig& config,
      PlannerServices services,
      TextLogger log = NullLogger(),
      Sleeper sleep = ThreadSleeper()
  );

  // Returns a complete, possibly degraded itinerary. Throws InvalidRequest,
  // StartLocationUnresolved, NoCandidatesFound or RouteInfeasible.
  Itinerary Plan(const PlanRequest& request, LocalTime now, const Deadline& deadline) const;

 private:
  struct ResolvedStart {
    Coordinates location;
    std::string label;
  };

  ResolvedStart ResolveStart(const PlanRequest& request, const Deadline& deadline) const;
  std::optional<WeatherSnapshot> LoadWeather(Coordinates at, const Deadline& deadline) const;
  std::vector<float> EmbedInterests(const std::string& interests, const Deadline& deadline) const;

  const PlannerConfig& config_;
  PlannerServices services_;
  TextLogger log_;
  RetryPolicy retry_policy_;
  Sleeper sleep_;
};

}  // namespace walkplan
