#include "planner/budget.h"

#include <algorithm>
#include <cmath>
#include <format>

#include "errors.h"

namespace walkplan {

namespace {

// Tracks the route being built by FitToBudget.
class BudgetWalker {
 public:
  BudgetWalker(Coordinates start, const BudgetOptions& options, BudgetFit& fit)
      : options_(options), fit_(fit), position_(start) {}

  bool TryAdd(SelectedStop stop, bool allow_overflow) {
    double travel = WalkMinutes(
        HaversineKm(position_, stop.poi->location), options_.walk_speed_kmh
    );
    double remaining = std::max(0.0, options_.available_minutes - fit_.total_minutes);
    double incremental = travel + stop.visit_minutes + options_.padding_minutes;
    if (incremental <= remaining) {
      Accept(stop, incremental);
      return true;
    }

    double room_for_visit = remaining - travel - options_.padding_minutes;
    if (room_for_visit >= options_.min_visit_minutes) {
      stop.visit_minutes = std::round(std::min(stop.visit_minutes, room_for_visit));
      incremental = travel + stop.visit_minutes + options_.padding_minutes;
      if (incremental <= remaining) {
        Accept(stop, incremental);
        return true;
      }
    }

    if (allow_overflow &&
        fit_.total_minutes + incremental <=
            options_.available_minutes * options_.overflow_factor) {
      Accept(stop, incremental);
      return true;
    }
    return false;
  }

  // The first stop only has to fit in the raw budget, visit trimmed to the
  // minimum if needed.
  bool ForceFirst(SelectedStop stop) {
    double travel = WalkMinutes(
        HaversineKm(position_, stop.poi->location), options_.walk_speed_kmh
    );
    double room_for_visit = options_.raw_budget_minutes - travel - options_.padding_minutes;
    if (room_for_visit < options_.min_visit_minutes) {
      return false;
    }
    stop.visit_minutes = std::round(std::min(stop.visit_minutes, room_for_visit));
    Accept(stop, travel + stop.visit_minutes + options_.padding_minutes);
    return true;
  }

 private:
  void Accept(const SelectedStop& stop, double incremental) {
    fit_.selected.push_back(stop);
    fit_.total_minutes += incremental;
    position_ = stop.poi->location;
  }

  const BudgetOptions& options_;
  BudgetFit& fit_;
  Coordinates position_;
};

}  // namespace

int TargetVisitCount(double hours, const IntensityProfile& profile) {
  return std::max(1, static_cast<int>(std::lround(hours * profile.target_per_hour)));
}

size_t CandidateLimit(
    double hours, const IntensityProfile& profile, size_t available, size_t max_selected
) {
  size_t base = static_cast<size_t>(
      std::max(6L, std::lround(hours * profile.candidate_multiplier))
  );
  size_t buffer = std::max<size_t>(4, static_cast<size_t>(base * 0.4));
  return std::min({available, base + buffer, max_selected});
}

double EffectiveBudgetMinutes(
    double hours, double reserved_break_minutes, const IntensityProfile& profile
) {
  return std::max(
      15.0, hours * 60.0 - reserved_break_minutes - profile.safety_buffer_minutes
  );
}

double SequenceMinutes(
    Coordinates start,
    const std::vector<SelectedStop>& stops,
    double padding_minutes,
    double walk_speed_kmh
) {
  double total = 0.0;
  Coordinates position = start;
  for (const SelectedStop& stop : stops) {
    total += WalkMinutes(HaversineKm(position, stop.poi->location), walk_speed_kmh) +
             stop.visit_minutes + padding_minutes;
    position = stop.poi->location;
  }
  return total;
}

BudgetFit FitToBudget(
    Coordinates start, const std::vector<SelectedStop>& ordered, const BudgetOptions& options
) {
  BudgetFit fit;
  if (ordered.empty()) {
    return fit;
  }
  BudgetWalker walker(start, options, fit);
  auto under_target = [&]() {
    return static_cast<int>(fit.selected.size()) < options.target_visit_count;
  };

  for (const SelectedStop& stop : ordered) {
    bool allow_overflow = fit.selected.empty() || under_target();
    if (!walker.TryAdd(stop, allow_overflow)) {
      fit.skipped.push_back(stop);
    }
  }

  if (fit.selected.empty()) {
    if (!walker.ForceFirst(ordered.front())) {
      throw RouteInfeasible(std::format(
          "No stop fits in {:.0f} minutes: the nearest candidate '{}' needs "
          "more time than that",
          options.raw_budget_minutes,
          ordered.front().poi->name
      ));
    }
    fit.skipped.erase(fit.skipped.begin());
  }

  bool added = true;
  while (!fit.skipped.empty() && added &&
         fit.total_minutes < options.available_minutes * options.fill_ratio) {
    added = false;
    for (auto it = fit.skipped.begin(); it != fit.skipped.end(); ++it) {
      if (walker.TryAdd(*it, under_target())) {
        fit.skipped.erase(it);
        added = true;
        break;
      }
    }
  }
  return fit;
}

void DropTailOverBudget(Coordinates start, BudgetFit& fit, const BudgetOptions& options) {
  double limit = options.available_minutes * options.overflow_factor;
  fit.total_minutes = SequenceMinutes(
      start, fit.selected, options.padding_minutes, options.walk_speed_kmh
  );
  while (fit.selected.size() > 1 && fit.total_minutes > limit) {
    fit.skipped.insert(fit.skipped.begin(), fit.selected.back());
    fit.selected.pop_back();
    fit.total_minutes = SequenceMinutes(
        start, fit.selected, options.padding_minutes, options.walk_speed_kmh
    );
  }
}

}  // namespace walkplan
