#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "catalog/catalog.h"
#include "config/planner_config.h"
#include "errors.h"
#include "export/gpx.h"
#include "log.h"
#include "planner/assembler.h"
#include "planner/request.h"
#include "routing/distance_provider.h"
#include "routing/osrm_client.h"
#include "services/break_finder.h"
#include "services/weather.h"

using namespace walkplan;

namespace {

PlanRequest LoadRequestFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open request file: " + path);
  }
  try {
    return nlohmann::json::parse(file).get<PlanRequest>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(
        "Failed to parse request file '" + path + "': " + std::string(e.what())
    );
  }
}

void PrintItinerary(const Itinerary& itinerary) {
  std::cout << "Start " << itinerary.start_time.ToString() << " from "
            << itinerary.start_label << "\n";
  for (const PlannedStop& stop : itinerary.stops) {
    std::cout << "  " << stop.order << ". " << stop.arrival_time.ClockString() << "-"
              << stop.leave_time.ClockString() << "  " << stop.name << " ["
              << stop.category << "]";
    if (stop.availability_note) {
      std::cout << "  (" << *stop.availability_note << ")";
    }
    std::cout << "\n";
  }
  std::cout << "Total: " << itinerary.total_minutes << " min, "
            << itinerary.total_distance_km << " km\n";
  for (const std::string& warning : itinerary.warnings) {
    std::cout << "Warning: " << warning << "\n";
  }
  std::cout << itinerary.summary << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"Plan a walking route through a POI catalog"};

  std::string catalog_path;
  std::string config_path;
  std::string request_path;
  std::string gpx_path;
  std::string json_path;
  std::vector<double> start;
  std::string address;
  double hours = 3.0;
  std::string intensity = "medium";
  std::string social_mode;
  std::string interests;
  std::vector<std::string> categories;
  std::string start_time;
  std::string now_text;
  bool breaks = false;
  bool verbose = false;

  app.add_option("catalog", catalog_path, "POI catalog (.csv or .json)")
      ->required()
      ->check(CLI::ExistingFile);
  app.add_option("--config", config_path, "Planner TOML config file")
      ->check(CLI::ExistingFile);
  app.add_option("--request", request_path, "JSON request file; overrides the flags below")
      ->check(CLI::ExistingFile);
  app.add_option("--start", start, "Start coordinates: lat lon")->expected(2);
  app.add_option("--address", address, "Start address label");
  app.add_option("--hours", hours, "Walk length in hours")->default_val(3.0);
  app.add_option("--intensity", intensity, "relaxed, medium or intense")
      ->default_val("medium");
  app.add_option("--social", social_mode, "solo, friends, couple or family");
  app.add_option("--interests", interests, "Free text interests");
  app.add_option("--category", categories, "Restrict to these categories");
  app.add_option("--start-time", start_time, "HH:MM or YYYY-MM-DDTHH:MM");
  app.add_option("--now", now_text, "Pretend the current time is YYYY-MM-DDTHH:MM");
  app.add_flag("--breaks", breaks, "Insert coffee breaks from the catalog's cafés");
  app.add_option("--gpx", gpx_path, "Write the route as GPX to this file");
  app.add_option("--json", json_path, "Write the itinerary JSON to this file");
  app.add_flag("-v,--verbose", verbose, "Log planning steps");

  CLI11_PARSE(app, argc, argv);

  PlannerConfig config =
      config_path.empty() ? DefaultPlannerConfig() : PlannerConfigLoad(config_path);
  TextLogger log = verbose ? OstreamLogger(std::cerr) : NullLogger();

  PlanRequest request;
  if (!request_path.empty()) {
    request = LoadRequestFile(request_path);
  } else {
    if (start.size() == 2) {
      request.start_location = Coordinates{start[0], start[1]};
    }
    if (!address.empty()) request.start_address = address;
    request.hours = hours;
    request.intensity = intensity;
    if (!social_mode.empty()) request.social_mode = social_mode;
    request.interests = interests;
    request.categories = categories;
    if (!start_time.empty()) request.start_time = start_time;
    if (breaks) request.breaks = BreakPreferences{};
  }

  LocalTime now = LocalTime::Now();
  if (!now_text.empty()) {
    std::optional<LocalTime> parsed = LocalTime::Parse(now_text);
    if (!parsed) {
      std::cerr << "Error: --now must look like 2025-06-02T10:00" << std::endl;
      return 1;
    }
    now = *parsed;
  }

  InMemoryPoiCatalog catalog(PoiCatalogLoad(catalog_path));
  std::cout << "Loaded " << catalog.All().size() << " POIs from " << catalog_path
            << std::endl;

  std::unique_ptr<OsrmRoutingClient> osrm;
  std::vector<RoutingClient*> clients;
  if (config.routing.osrm_base_url) {
    osrm = std::make_unique<OsrmRoutingClient>(
        *config.routing.osrm_base_url, config.routing.osrm_profile
    );
    clients.push_back(osrm.get());
  }
  FallbackDistanceProvider distances(
      clients, config.routing, ComponentLogger(log, "routing")
  );
  CatalogBreakFinder break_finder(catalog, config.break_categories);

  PlannerServices services{
      .catalog = catalog,
      .distances = distances,
      .break_finder = &break_finder,
  };
  ItineraryAssembler assembler(config, services, ComponentLogger(log, "planner"));

  Itinerary itinerary;
  try {
    itinerary = assembler.Plan(request, now, Deadline::After(std::chrono::seconds(30)));
  } catch (const PlanningError& e) {
    std::cerr << "Cannot plan (" << PlanningErrorKindName(e.kind()) << "): " << e.what()
              << std::endl;
    return 2;
  } catch (const InvalidRequest& e) {
    std::cerr << "Invalid request: " << e.what() << std::endl;
    return 1;
  }

  PrintItinerary(itinerary);

  if (!json_path.empty()) {
    std::ofstream out(json_path);
    out << nlohmann::json(itinerary).dump(2) << std::endl;
    std::cout << "Wrote " << json_path << std::endl;
  }
  if (!gpx_path.empty()) {
    std::ofstream out(gpx_path);
    WriteGpx(itinerary, out);
    std::cout << "Wrote " << gpx_path << std::endl;
  }
  return 0;
}
