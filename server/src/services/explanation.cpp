#include "services/explanation.h"

#include <format>
#include <unordered_map>

namespace walkplan {

namespace {

std::optional<nlohmann::json> ParseObject(std::string_view text) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  return j;
}

std::optional<nlohmann::json> ParseFencedBlock(std::string_view text) {
  size_t fence = text.find("```");
  if (fence == std::string_view::npos) {
    return std::nullopt;
  }
  size_t body = text.find('\n', fence);
  if (body == std::string_view::npos) {
    return std::nullopt;
  }
  size_t end = text.find("```", body);
  if (end == std::string_view::npos) {
    return std::nullopt;
  }
  return ParseObject(text.substr(body + 1, end - body - 1));
}

std::optional<nlohmann::json> ParseFirstBalancedObject(std::string_view text) {
  size_t begin = text.find('{');
  while (begin != std::string_view::npos) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (size_t i = begin; i < text.size(); ++i) {
      char c = text[i];
      if (in_string) {
        if (escaped) {
          escaped = false;
        } else if (c == '\\') {
          escaped = true;
        } else if (c == '"') {
          in_string = false;
        }
        continue;
      }
      if (c == '"') {
        in_string = true;
      } else if (c == '{') {
        ++depth;
      } else if (c == '}' && --depth == 0) {
        if (auto j = ParseObject(text.substr(begin, i - begin + 1))) {
          return j;
        }
        break;
      }
    }
    begin = text.find('{', begin + 1);
  }
  return std::nullopt;
}

std::string CategoryReason(const std::string& category) {
  static const std::unordered_map<std::string, std::string> kReasons = {
      {"museum", "A museum worth stepping into for the city's history."},
      {"gallery", "A gallery with works worth a slow look."},
      {"park", "A green spot to slow down between sights."},
      {"embankment", "A riverside stretch with open views."},
      {"viewpoint", "One of the best views along the way."},
      {"architecture", "A landmark building that defines the street."},
      {"memorial", "A memorial that tells part of the city's story."},
      {"monument", "A monument the city is known for."},
      {"art_object", "Street art that makes a good photo stop."},
      {"mosaic", "A mosaic worth finding."},
      {"religious_site", "A historic church with a quiet interior."},
      {"cafe", "A place to rest and warm up."},
      {"coffee_break", "A short coffee break to recharge."},
  };
  auto it = kReasons.find(category);
  return it != kReasons.end() ? it->second : "A notable stop on the way.";
}

}  // namespace

std::vector<ExplanationParser> DefaultExplanationParsers() {
  return {
      {"raw", ParseObject},
      {"fenced", ParseFencedBlock},
      {"balanced", ParseFirstBalancedObject},
  };
}

std::optional<RouteExplanation> ParseExplanation(
    std::string_view text,
    const std::vector<PlannedStop>& stops,
    const std::vector<ExplanationParser>& parsers
) {
  for (const ExplanationParser& parser : parsers) {
    std::optional<nlohmann::json> j = parser.parse(text);
    if (!j) {
      continue;
    }
    auto summary = j->find("summary");
    if (summary == j->end() || !summary->is_string()) {
      continue;
    }
    RouteExplanation explanation;
    explanation.summary = summary->get<std::string>();
    explanation.why.assign(stops.size(), "");
    if (auto per_stop = j->find("stops"); per_stop != j->end() && per_stop->is_array()) {
      for (size_t i = 0; i < per_stop->size(); ++i) {
        const nlohmann::json& entry = (*per_stop)[i];
        if (entry.is_string() && i < stops.size()) {
          explanation.why[i] = entry.get<std::string>();
          continue;
        }
        if (!entry.is_object() || !entry.contains("why") || !entry["why"].is_string()) {
          continue;
        }
        std::string why = entry["why"].get<std::string>();
        if (entry.contains("poi_id") && entry["poi_id"].is_number_integer()) {
          int poi_id = entry["poi_id"].get<int>();
          for (size_t s = 0; s < stops.size(); ++s) {
            if (stops[s].poi_id.v == poi_id) {
              explanation.why[s] = why;
            }
          }
        } else if (i < stops.size()) {
          explanation.why[i] = why;
        }
      }
    }
    if (auto notes = j->find("notes"); notes != j->end() && notes->is_array()) {
      for (const nlohmann::json& note : *notes) {
        if (note.is_string()) {
          explanation.notes.push_back(note.get<std::string>());
        }
      }
    }
    return explanation;
  }
  return std::nullopt;
}

RouteExplanation TemplatedExplanation(const std::vector<PlannedStop>& stops) {
  RouteExplanation explanation;
  std::vector<std::string> names;
  for (const PlannedStop& stop : stops) {
    explanation.why.push_back(CategoryReason(stop.category));
    if (!stop.is_break) {
      names.push_back(stop.name);
    }
  }
  if (names.empty()) {
    explanation.summary = "A short walk.";
    return explanation;
  }
  std::string joined = names[0];
  for (size_t i = 1; i < names.size(); ++i) {
    joined += (i + 1 == names.size() ? " and " : ", ") + names[i];
  }
  explanation.summary = "A walk through: " + joined + ".";
  return explanation;
}

RouteExplanation ExplainRoute(
    ExplanationService* service,
    const ExplanationRequest& request,
    const Deadline& deadline,
    const TextLogger& log,
    const RetryPolicy& retry,
    const Sleeper& sleep
) {
  if (service == nullptr || deadline.Expired()) {
    return TemplatedExplanation(request.stops);
  }
  auto text = RetryWithBackoff(
      [&] { return service->Explain(request, deadline); }, retry, deadline, sleep
  );
  if (!text.ok()) {
    log(std::format(
        "explanation service failed after {} attempt(s), using templated text: {}",
        text.attempts,
        text.last_error
    ));
    return TemplatedExplanation(request.stops);
  }
  if (std::optional<RouteExplanation> parsed = ParseExplanation(*text.value, request.stops)) {
    // Stops the service skipped still get a line.
    RouteExplanation fallback = TemplatedExplanation(request.stops);
    for (size_t i = 0; i < parsed->why.size(); ++i) {
      if (parsed->why[i].empty()) {
        parsed->why[i] = fallback.why[i];
      }
    }
    return *parsed;
  }
  log("explanation output could not be parsed, using templated text");
  return TemplatedExplanation(request.stops);
}

}  // namespace walkplan
