#include "service_impl.hpp"
#include "errors.hpp"
#include "pathfinder.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace {
bool validCoordinate(double lat, double lon) {
  return std::isfinite(lat) && std::isfinite(lon) && lat >= -90.0 &&
         lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

void fillOption(const Graph &graph, const PathResult &path,
                greenrouting::RouteOption *option) {
  option->set_type(path.type);
  option->set_found(true);
  for (NodeID id : path.nodes)
    option->add_node_ids(graph.GetNode(id)->osm_id);
  for (const auto &c : path.geometry) {
    auto *loc = option->add_coordinates();
    loc->set_latitude(c.lat);
    loc->set_longitude(c.lon);
  }
  option->set_distance_meters(path.totalLength);
  option->set_mean_ndvi(path.meanNdvi);
  option->set_mean_aqi(path.meanAqi);
  option->set_green_cost(path.totalGreenCost);
  option->set_num_segments(static_cast<int>(path.edges.size()));
}
} // namespace

Status GreenRoutingServiceImpl::GetRoutes(ServerContext *context,
                                          const RouteRequest *request,
                                          RouteResponse *reply) {
  double sLat = request->origin().latitude();
  double sLon = request->origin().longitude();
  double dLat = request->destination().latitude();
  double dLon = request->destination().longitude();

  std::cout << "Received request: From (" << sLat << ", " << sLon << ") to ("
            << dLat << ", " << dLon << ")" << std::endl;

  if (!validCoordinate(sLat, sLon) || !validCoordinate(dLat, dLon)) {
    return Status(grpc::StatusCode::INVALID_ARGUMENT,
                  "Origin and destination must be valid WGS84 coordinates.");
  }

  CostConfig cost = costConfig_;
  if (request->weights().use_custom_weights()) {
    cost.greenWeight = request->weights().green_weight();
    cost.aqiWeight = request->weights().aqi_weight();
  }

  *reply->mutable_query() = *request;
  reply->mutable_shortest()->set_type("shortest");
  reply->mutable_greenest()->set_type("greenest");

  SnappedRoutes snapped;
  try {
    snapped = Pathfinder::FindRoutesNear(graph_, sLat, sLon, dLat, dLon, cost);
  } catch (const NoPathError &e) {
    std::cerr << "[Server] " << e.what() << std::endl;
    return Status(grpc::StatusCode::NOT_FOUND, e.what());
  } catch (const std::invalid_argument &e) {
    return Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  }

  const RoutePair &routes = snapped.routes;
  fillOption(graph_, routes.shortest, reply->mutable_shortest());
  fillOption(graph_, routes.greenest, reply->mutable_greenest());
  reply->set_origin_snap_meters(snapped.originSnapMeters);
  reply->set_destination_snap_meters(snapped.destinationSnapMeters);

  auto *cmp = reply->mutable_comparison();
  cmp->set_extra_distance_meters(routes.greenest.totalLength -
                                 routes.shortest.totalLength);
  cmp->set_ndvi_gain(routes.greenest.meanNdvi - routes.shortest.meanNdvi);
  cmp->set_aqi_reduction(routes.shortest.meanAqi - routes.greenest.meanAqi);
  cmp->set_same_route(routes.shortest.edges == routes.greenest.edges);

  return Status::OK;
}
