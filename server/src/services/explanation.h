#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "log.h"
#include "planner/itinerary.h"
#include "util/deadline.h"
#include "util/retry.h"

namespace walkplan {

struct ExplanationRequest {
  const std::vector<PlannedStop>& stops;
  std::string interests;
  std::string social_mode;
  std::string intensity;
};

struct RouteExplanation {
  std::string summary;
  // One entry per stop, in stop order. Empty strings mean "no text".
  std::vector<std::string> why;
  std::vector<std::string> notes;
};

// Writes the human-facing texts of a route (typically a language model).
// The output is free text that should contain a JSON object
// {"summary": ..., "stops": [{"poi_id": ..., "why": ...}], "notes": [...]}.
class ExplanationService {
 public:
  virtual ~ExplanationService() = default;

  virtual std::string Explain(const ExplanationRequest& request, const Deadline& deadline) = 0;
};

// One way of digging a JSON object out of model output.
struct ExplanationParser {
  std::string name;
  std::function<std::optional<nlohmann::json>(std::string_view)> parse;
};

// Whole text as JSON, then a ```json fenced block, then the first balanced
// {...} span.
std::vector<ExplanationParser> DefaultExplanationParsers();

// Runs `parsers` in order and converts the first usable object. Nullopt when
// none of them yields a summary.
std::optional<RouteExplanation> ParseExplanation(
    std::string_view text,
    const std::vector<PlannedStop>& stops,
    const std::vector<ExplanationParser>& parsers = DefaultExplanationParsers()
);

// Text built from names and categories alone.
RouteExplanation TemplatedExplanation(const std::vector<PlannedStop>& stops);

// Asks `service` (if any), retrying per `retry`, and falls back to
// TemplatedExplanation() when it keeps failing or its output cannot be
// parsed. Never throws.
RouteExplanation ExplainRoute(
    ExplanationService* service,
    const ExplanationRequest& request,
    const Deadline& deadline,
    const TextLogger& log,
    const RetryPolicy& retry = RetryPolicy{},
    const Sleeper& sleep = ThreadSleeper()
);

}  // namespace walkplan
