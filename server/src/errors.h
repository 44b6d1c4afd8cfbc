#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace walkplan {

enum class PlanningErrorKind {
  kNoCandidates,
  kInfeasible,
  kUnresolvedStart,
};

// User-facing planning failures. These are final: retrying the same request
// gives the same answer.
class PlanningError : public std::runtime_error {
 public:
  PlanningError(PlanningErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  PlanningErrorKind kind() const { return kind_; }

 private:
  PlanningErrorKind kind_;
};

// Nothing in the catalog survived the category, distance and time filters.
class NoCandidatesFound : public PlanningError {
 public:
  explicit NoCandidatesFound(const std::string& message)
      : PlanningError(PlanningErrorKind::kNoCandidates, message) {}
};

// Not even one stop fits in the requested time.
class RouteInfeasible : public PlanningError {
 public:
  explicit RouteInfeasible(const std::string& message)
      : PlanningError(PlanningErrorKind::kInfeasible, message) {}
};

// Only an address was given and it could not be geocoded.
class StartLocationUnresolved : public PlanningError {
 public:
  explicit StartLocationUnresolved(const std::string& message)
      : PlanningError(PlanningErrorKind::kUnresolvedStart, message) {}
};

// A collaborator (routing, geocoding, weather, explanations) failed. Callers
// recover with a fallback unless the service is mandatory for the request.
class ExternalServiceUnavailable : public std::runtime_error {
 public:
  ExternalServiceUnavailable(std::string_view service, const std::string& detail)
      : std::runtime_error(std::string(service) + " unavailable: " + detail),
        service_(service) {}

  const std::string& service() const { return service_; }

 private:
  std::string service_;
};

inline std::string_view PlanningErrorKindName(PlanningErrorKind kind) {
  switch (kind) {
    case PlanningErrorKind::kNoCandidates:
      return "no_candidates";
    case PlanningErrorKind::kInfeasible:
      return "route_infeasible";
    case PlanningErrorKind::kUnresolvedStart:
      return "start_unresolved";
  }
  return "planning_error";
}

}  // namespace walkplan
