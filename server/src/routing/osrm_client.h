#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "routing/routing_client.h"

namespace walkplan {

// Walking directions from an OSRM server's /route/v1 endpoint.
class OsrmRoutingClient : public RoutingClient {
 public:
  explicit OsrmRoutingClient(std::string base_url, std::string profile = "foot");

  std::string Name() const override { return "osrm"; }

  std::vector<Leg> Route(
      const std::vector<Coordinates>& points, std::chrono::milliseconds timeout
  ) override;

 private:
  std::string base_url_;
  std::string profile_;
};

// "/route/v1/foot/44.002,56.3287;44.0042,56.3269?steps=true&..."
std::string OsrmRoutePath(
    const std::string& profile, const std::vector<Coordinates>& points
);

// Converts an OSRM route response into legs. Throws PermanentFailure for
// answers that retrying cannot change ("NoRoute", wrong leg count) and
// std::runtime_error for anything else malformed.
std::vector<Leg> ParseOsrmRouteResponse(
    const nlohmann::json& response, size_t expected_legs
);

}  // namespace walkplan
