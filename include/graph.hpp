#ifndef GRAPH_HPP
#define GRAPH_HPP

#include "types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

std::string stripOuterQuotes(const std::string &s);
std::vector<std::string> parseCSVLine(const std::string &rawLine);

// Road network: intersections plus directed road segments. A two-way road is
// two directed edges with reversed geometry.
class Graph {
public:
  NodeID addNode(long long osmId, double lat, double lon);

  // Throws std::out_of_range unless both endpoints exist. An empty geometry
  // becomes the straight segment between the endpoints. length <= 0 means
  // "unknown" and is left for the enricher.
  EdgeID addEdge(NodeID from, NodeID to, const Polyline &geometry = {},
                 double length = 0.0, int key = 0);

  // Adds from->to and to->from (reversed geometry).
  void addRoad(NodeID from, NodeID to, const Polyline &geometry = {},
               double length = 0.0, int key = 0);

  NodeID findNearestNode(double lat, double lon) const;

  const Node *GetNode(NodeID id) const;
  const Edge *GetEdge(EdgeID id) const;

  const std::vector<Node> &GetNodes() const;
  const std::vector<Edge> &GetEdges() const;

  void setAttributes(EdgeID id, const EdgeAttributes &attrs);

  NodeID getNodeId(long long osmId) const;

  bool empty() const { return nodes_.empty() || edges_.empty(); }
  bool isEnriched() const;

  // --- CSV I/O ---
  // nodes: osmid,lat,lon
  // raw edges: u,v,key,oneway,length,geometry
  // enriched edges: u,v,key,length,ndvi,aqi,geometry (one row per direction)
  static Graph LoadRaw(const std::string &nodesPath,
                       const std::string &edgesPath);
  static Graph LoadEnriched(const std::string &nodesPath,
                            const std::string &edgesPath);
  void SaveEnriched(const std::string &edgesPath) const;

private:
  std::vector<Node> nodes_;
  std::vector<Edge> edges_;
  std::unordered_map<long long, NodeID> osm_id_map_;

  void loadNodes(const std::string &filename);
  void loadRawEdges(const std::string &filename);
  void loadEnrichedEdges(const std::string &filename);
};

#endif
