#ifndef PATHFINDER_HPP
#define PATHFINDER_HPP

#include "cost_model.hpp"
#include "graph.hpp"
#include <functional>
#include <string>
#include <vector>

// Edge weight used by the search. Must be non-negative.
using WeightFn = std::function<Weight(const Edge &)>;

struct SnappedRoutes {
  RoutePair routes;
  NodeID origin = -1;
  NodeID destination = -1;
  double originSnapMeters = 0.0;
  double destinationSnapMeters = 0.0;
};

class Pathfinder {
public:
  // Dijkstra from start to end under `weight`. Frontier ties resolve to the
  // lower node id. Aggregates are filled using `costModel`. Throws
  // NoPathError when end is unreachable or either node id is invalid.
  static PathResult FindPath(const Graph &graph, NodeID start, NodeID end,
                             const WeightFn &weight,
                             const CostModel &costModel,
                             const std::string &typeLabel);

  // Shortest (length) and greenest (green cost) over the same graph.
  static RoutePair FindRoutes(const Graph &graph, NodeID origin,
                              NodeID destination,
                              const CostConfig &costConfig = CostConfig());

  // Snaps both coordinates to the nearest graph node first.
  static SnappedRoutes FindRoutesNear(const Graph &graph, double sLat,
                                      double sLon, double dLat, double dLon,
                                      const CostConfig &costConfig =
                                          CostConfig());

  // Sum/mean of the traversed edges' attributes.
  static void FillAggregates(const Graph &graph, const CostModel &costModel,
                             PathResult &result);
};

#endif // PATHFINDER_HPP
