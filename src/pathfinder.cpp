#include "pathfinder.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <queue>
#include <sstream>
#include <utility>
#include <vector>

// --- Dijkstra Search State ---
struct State {
  Weight g_score;
  NodeID u;

  bool operator>(const State &other) const {
    if (g_score != other.g_score)
      return g_score > other.g_score;
    return u > other.u;
  }
};

struct PathInfo {
  Weight g_score = INF;
  NodeID parent = -1;
  EdgeID via = -1;
  bool settled = false;
};

namespace {
std::string describeNode(const Graph &graph, const std::string &role,
                         NodeID id) {
  const Node *node = graph.GetNode(id);
  if (!node)
    return role + " node " + std::to_string(id) + " (not in graph)";
  return role + " node " + std::to_string(id) + " (osm " +
         std::to_string(node->osm_id) + ")";
}

std::vector<std::string> unreachableEndpoints(const Graph &graph,
                                              NodeID start, NodeID end,
                                              bool searched) {
  std::vector<std::string> out;
  if (!graph.GetNode(start))
    out.push_back(describeNode(graph, "origin", start));
  if (!graph.GetNode(end))
    out.push_back(describeNode(graph, "destination", end));
  if (!out.empty() || !searched)
    return out;

  if (graph.GetNode(start)->outgoing.empty())
    out.push_back(describeNode(graph, "origin", start) +
                  " has no outgoing road segments");
  out.push_back(describeNode(graph, "destination", end));
  return out;
}
} // namespace

PathResult Pathfinder::FindPath(const Graph &graph, NodeID start, NodeID end,
                                const WeightFn &weight,
                                const CostModel &costModel,
                                const std::string &typeLabel) {
  if (!graph.GetNode(start) || !graph.GetNode(end))
    throw NoPathError(start, end,
                      unreachableEndpoints(graph, start, end, false));

  const auto &nodes = graph.GetNodes();
  const auto &edges = graph.GetEdges();

  std::vector<PathInfo> info(nodes.size());
  std::priority_queue<State, std::vector<State>, std::greater<State>> pq;

  info[start].g_score = 0;
  pq.push({0, start});

  while (!pq.empty()) {
    State top = pq.top();
    pq.pop();

    if (info[top.u].settled)
      continue;
    info[top.u].settled = true;
    if (top.u == end)
      break;

    for (EdgeID eid : nodes[top.u].outgoing) {
      const Edge &edge = edges[eid];
      double newG = top.g_score + weight(edge);

      if (newG < info[edge.to].g_score) {
        info[edge.to].g_score = newG;
        info[edge.to].parent = top.u;
        info[edge.to].via = eid;
        pq.push({newG, edge.to});
      }
    }
  }

  if (info[end].g_score == INF)
    throw NoPathError(start, end, unreachableEndpoints(graph, start, end, true));

  PathResult result;
  result.type = typeLabel;

  // --- Reconstruct ---
  NodeID curr = end;
  while (curr != -1) {
    result.nodes.push_back(curr);
    if (info[curr].via != -1)
      result.edges.push_back(info[curr].via);
    curr = info[curr].parent;
  }
  std::reverse(result.nodes.begin(), result.nodes.end());
  std::reverse(result.edges.begin(), result.edges.end());

  FillAggregates(graph, costModel, result);
  return result;
}

void Pathfinder::FillAggregates(const Graph &graph, const CostModel &costModel,
                                PathResult &result) {
  result.totalLength = 0.0;
  result.meanNdvi = 0.0;
  result.meanAqi = 0.0;
  result.totalGreenCost = 0.0;
  result.geometry.clear();

  if (result.edges.empty()) {
    if (!result.nodes.empty()) {
      const Node *n = graph.GetNode(result.nodes.front());
      if (n)
        result.geometry.push_back({n->lat, n->lon});
    }
    return;
  }

  double ndviSum = 0.0, aqiSum = 0.0;
  for (EdgeID eid : result.edges) {
    const Edge *edge = graph.GetEdge(eid);
    if (!edge)
      continue;
    result.totalLength += edge->attrs.length;
    result.totalGreenCost += costModel.greenCost(edge->attrs);
    ndviSum += edge->attrs.ndvi;
    aqiSum += edge->attrs.aqi;

    // Consecutive segments share an endpoint
    size_t skip = result.geometry.empty() ? 0 : 1;
    result.geometry.insert(result.geometry.end(),
                           edge->geometry.begin() + skip,
                           edge->geometry.end());
  }
  result.meanNdvi = ndviSum / result.edges.size();
  result.meanAqi = aqiSum / result.edges.size();
}

RoutePair Pathfinder::FindRoutes(const Graph &graph, NodeID origin,
                                 NodeID destination,
                                 const CostConfig &costConfig) {
  CostModel model(costConfig);

  WeightFn byLength = [&model](const Edge &e) {
    return model.distanceWeight(e.attrs);
  };
  WeightFn byGreenCost = [&model](const Edge &e) {
    return model.greenCost(e.attrs);
  };

  RoutePair pair;
  pair.shortest =
      FindPath(graph, origin, destination, byLength, model, "shortest");
  pair.greenest =
      FindPath(graph, origin, destination, byGreenCost, model, "greenest");

  std::ostringstream summary;
  summary << std::fixed << std::setprecision(0)
          << "[Router] shortest: " << pair.shortest.totalLength << " m, "
          << pair.shortest.edges.size() << " segments | greenest: "
          << pair.greenest.totalLength << " m, "
          << pair.greenest.edges.size() << " segments";
  std::cout << summary.str() << std::endl;
  return pair;
}

SnappedRoutes Pathfinder::FindRoutesNear(const Graph &graph, double sLat,
                                         double sLon, double dLat, double dLon,
                                         const CostConfig &costConfig) {
  NodeID start = graph.findNearestNode(sLat, sLon);
  NodeID end = graph.findNearestNode(dLat, dLon);
  if (start == -1 || end == -1)
    throw NoPathError(start, end,
                      unreachableEndpoints(graph, start, end, false));

  const auto &nodes = graph.GetNodes();
  SnappedRoutes out;
  out.origin = start;
  out.destination = end;
  out.originSnapMeters =
      haversine(sLat, sLon, nodes[start].lat, nodes[start].lon);
  out.destinationSnapMeters =
      haversine(dLat, dLon, nodes[end].lat, nodes[end].lon);

  std::cout << "[Router] Nearest origin node: " << nodes[start].osm_id << " ("
            << out.originSnapMeters << "m away)" << std::endl;
  std::cout << "[Router] Nearest destination node: " << nodes[end].osm_id
            << " (" << out.destinationSnapMeters << "m away)" << std::endl;

  out.routes = FindRoutes(graph, start, end, costConfig);
  return out;
}
