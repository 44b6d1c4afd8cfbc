#include "routing/osrm_client.h"

#include <format>
#include <httplib.h>
#include <stdexcept>

#include "errors.h"
#include "util/retry.h"

namespace walkplan {

namespace {

Coordinates LonLat(const nlohmann::json& pair) {
  if (!pair.is_array() || pair.size() < 2) {
    throw std::runtime_error("OSRM coordinate is not a [lon, lat] pair");
  }
  return Coordinates{pair[1].get<double>(), pair[0].get<double>()};
}

Leg ParseLeg(const nlohmann::json& leg_json) {
  Leg leg{
      .distance_km = leg_json.at("distance").get<double>() / 1000.0,
      .duration_minutes = leg_json.at("duration").get<double>() / 60.0,
      .geometry = {},
      .maneuvers = {},
      .source = LegSource::kRouted,
  };
  auto steps = leg_json.find("steps");
  if (steps == leg_json.end()) {
    return leg;
  }
  for (const nlohmann::json& step : *steps) {
    if (auto geometry = step.find("geometry"); geometry != step.end()) {
      for (const nlohmann::json& pair : geometry->at("coordinates")) {
        Coordinates point = LonLat(pair);
        // Steps share their boundary points.
        if (leg.geometry.empty() || !(leg.geometry.back() == point)) {
          leg.geometry.push_back(point);
        }
      }
    }
    const nlohmann::json& maneuver = step.at("maneuver");
    leg.maneuvers.push_back(Maneuver{
        .type = maneuver.value("type", std::string{}),
        .modifier = maneuver.value("modifier", std::string{}),
        .street_name = step.value("name", std::string{}),
        .distance_m = step.value("distance", 0.0),
        .duration_s = step.value("duration", 0.0),
        .location = LonLat(maneuver.at("location")),
    });
  }
  return leg;
}

}  // namespace

OsrmRoutingClient::OsrmRoutingClient(std::string base_url, std::string profile)
    : base_url_(std::move(base_url)), profile_(std::move(profile)) {}

std::string OsrmRoutePath(
    const std::string& profile, const std::vector<Coordinates>& points
) {
  std::string path = "/route/v1/" + profile + "/";
  for (size_t i = 0; i < points.size(); ++i) {
    if (i > 0) {
      path += ";";
    }
    path += std::format("{:.6f},{:.6f}", points[i].lon, points[i].lat);
  }
  path += "?steps=true&geometries=geojson&overview=false";
  return path;
}

std::vector<Leg> ParseOsrmRouteResponse(
    const nlohmann::json& response, size_t expected_legs
) {
  std::string code = response.value("code", std::string{});
  if (code != "Ok") {
    std::string message = response.value("message", std::string{});
    std::string text = std::format("OSRM answered '{}': {}", code, message);
    if (code == "NoRoute" || code == "NoSegment" || code == "InvalidQuery") {
      throw PermanentFailure(text);
    }
    throw std::runtime_error(text);
  }
  const nlohmann::json& routes = response.at("routes");
  if (!routes.is_array() || routes.empty()) {
    throw PermanentFailure("OSRM response has no routes");
  }
  const nlohmann::json& legs_json = routes[0].at("legs");
  if (legs_json.size() != expected_legs) {
    throw PermanentFailure(std::format(
        "OSRM returned {} legs, expected {}", legs_json.size(), expected_legs
    ));
  }
  std::vector<Leg> legs;
  legs.reserve(expected_legs);
  for (const nlohmann::json& leg_json : legs_json) {
    legs.push_back(ParseLeg(leg_json));
  }
  return legs;
}

std::vector<Leg> OsrmRoutingClient::Route(
    const std::vector<Coordinates>& points, std::chrono::milliseconds timeout
) {
  if (points.size() < 2) {
    return {};
  }
  httplib::Client client(base_url_);
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  httplib::Headers headers = {{"User-Agent", "walkplan/1.0"}};

  auto res = client.Get(OsrmRoutePath(profile_, points), headers);
  if (!res) {
    throw ExternalServiceUnavailable(
        Name(), "request to " + base_url_ + " failed: " + httplib::to_string(res.error())
    );
  }
  if (res->status >= 500) {
    throw ExternalServiceUnavailable(Name(), std::format("server error {}", res->status));
  }
  nlohmann::json body;
  try {
    body = nlohmann::json::parse(res->body);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::string("OSRM returned invalid JSON: ") + e.what());
  }
  return ParseOsrmRouteResponse(body, points.size() - 1);
}

}  // namespace walkplan
