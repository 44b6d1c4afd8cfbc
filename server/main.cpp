#include <CLI/CLI.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "catalog/catalog.h"
#include "config/planner_config.h"
#include "crow.h"
#include "errors.h"
#include "planner/assembler.h"
#include "planner/request.h"
#include "routing/distance_provider.h"
#include "routing/osrm_client.h"
#include "services/break_finder.h"

using namespace walkplan;

namespace {

crow::response JsonResponse(int code, const nlohmann::json& body) {
  crow::response res(code, body.dump());
  res.add_header("Content-Type", "application/json");
  return res;
}

crow::response ErrorResponse(int code, std::string_view kind, const std::string& message) {
  return JsonResponse(code, nlohmann::json{{"error", kind}, {"message", message}});
}

int StatusFor(PlanningErrorKind kind) {
  switch (kind) {
    case PlanningErrorKind::kNoCandidates:
      return 404;
    case PlanningErrorKind::kInfeasible:
    case PlanningErrorKind::kUnresolvedStart:
      return 422;
  }
  return 422;
}

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app_options{"Walking route planning server"};

  std::string catalog_path;
  std::string config_path;
  int port = 18080;
  int deadline_ms = 20000;

  app_options.add_option("catalog", catalog_path, "POI catalog (.csv or .json)")
      ->required()
      ->check(CLI::ExistingFile);
  app_options.add_option("--config", config_path, "Planner TOML config file")
      ->check(CLI::ExistingFile);
  app_options.add_option("--port", port, "Port to listen on")->default_val(18080);
  app_options.add_option("--deadline-ms", deadline_ms, "Planning deadline per request")
      ->default_val(20000);

  CLI11_PARSE(app_options, argc, argv);

  PlannerConfig config;
  std::unique_ptr<InMemoryPoiCatalog> catalog;
  try {
    config = config_path.empty() ? DefaultPlannerConfig() : PlannerConfigLoad(config_path);
    catalog = std::make_unique<InMemoryPoiCatalog>(PoiCatalogLoad(catalog_path));
    std::cout << "Loaded " << catalog->All().size() << " POIs from " << catalog_path
              << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error loading planner data: " << e.what() << std::endl;
    return 1;
  }

  TextLogger log = OstreamLogger(std::cout);
  std::unique_ptr<OsrmRoutingClient> osrm;
  std::vector<RoutingClient*> clients;
  if (config.routing.osrm_base_url) {
    osrm = std::make_unique<OsrmRoutingClient>(
        *config.routing.osrm_base_url, config.routing.osrm_profile
    );
    clients.push_back(osrm.get());
  }
  FallbackDistanceProvider distances(clients, config.routing, ComponentLogger(log, "routing"));
  CatalogBreakFinder break_finder(*catalog, config.break_categories);
  ItineraryAssembler assembler(
      config,
      PlannerServices{
          .catalog = *catalog,
          .distances = distances,
          .break_finder = &break_finder,
      },
      ComponentLogger(log, "planner")
  );

  crow::SimpleApp app;

  CROW_ROUTE(app, "/health")([]() { return "ok"; });

  CROW_ROUTE(app, "/pois")([&catalog](const crow::request& req) {
    std::vector<std::string> categories;
    if (const char* category = req.url_params.get("category")) {
      categories.push_back(category);
    }
    nlohmann::json j = catalog->Query(categories);
    return JsonResponse(200, j);
  });

  CROW_ROUTE(app, "/plan")
      .methods(crow::HTTPMethod::POST)([&assembler, deadline_ms](const crow::request& req) {
        PlanRequest request;
        try {
          request = nlohmann::json::parse(req.body).get<PlanRequest>();
        } catch (const nlohmann::json::exception& e) {
          return ErrorResponse(400, "invalid_request", e.what());
        }
        try {
          Itinerary itinerary = assembler.Plan(
              request,
              LocalTime::Now(),
              Deadline::After(std::chrono::milliseconds(deadline_ms))
          );
          return JsonResponse(200, itinerary);
        } catch (const InvalidRequest& e) {
          return ErrorResponse(400, "invalid_request", e.what());
        } catch (const PlanningError& e) {
          return ErrorResponse(StatusFor(e.kind()), PlanningErrorKindName(e.kind()), e.what());
        }
      });

  app.port(static_cast<uint16_t>(port)).multithreaded().run();
}
