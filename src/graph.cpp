#include "graph.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

// --- CSV Parsing Implementation ---

std::string stripOuterQuotes(const std::string &s) {
  std::string result = s;
  // Trim whitespace/CR/LF
  while (!result.empty() && (result.back() == '\r' || result.back() == '\n' ||
                             result.back() == ' ' || result.back() == '\t'))
    result.pop_back();
  while (!result.empty() && (result.front() == ' ' || result.front() == '\t'))
    result.erase(result.begin());

  // Strip one layer of outer quotes if the entire line is wrapped
  if (result.size() >= 2 && result.front() == '"' && result.back() == '"' &&
      result.find(',') != std::string::npos &&
      result.find("\",") == std::string::npos) {
    result = result.substr(1, result.size() - 2);
  }
  return result;
}

std::vector<std::string> parseCSVLine(const std::string &rawLine) {
  std::string line = stripOuterQuotes(rawLine);
  std::vector<std::string> cols;
  std::string field;
  bool inQuotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"'; // escaped quote
        ++i;
      } else {
        inQuotes = !inQuotes;
      }
    } else if (c == ',' && !inQuotes) {
      cols.push_back(field);
      field.clear();
    } else {
      field += c;
    }
  }
  cols.push_back(field);
  return cols;
}

namespace {
bool parseDouble(const std::string &text, double &out) {
  if (text.empty())
    return false;
  try {
    size_t used = 0;
    out = std::stod(text, &used);
    return used > 0 && std::isfinite(out);
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool parseLong(const std::string &text, long long &out) {
  if (text.empty())
    return false;
  try {
    out = std::stoll(text);
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool isTruthy(const std::string &value) {
  std::string v = value;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return v == "1" || v == "true" || v == "yes";
}

std::ifstream openOrThrow(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open())
    throw GraphLoadError("Cannot open graph file: " + filename);
  return file;
}
} // namespace

// --- Graph Method Implementations ---

NodeID Graph::addNode(long long osmId, double lat, double lon) {
  auto it = osm_id_map_.find(osmId);
  if (it != osm_id_map_.end())
    return it->second;

  Node node;
  node.id = (NodeID)nodes_.size();
  node.osm_id = osmId;
  node.lat = lat;
  node.lon = lon;
  osm_id_map_[osmId] = node.id;
  nodes_.push_back(node);
  return node.id;
}

EdgeID Graph::addEdge(NodeID from, NodeID to, const Polyline &geometry,
                      double length, int key) {
  if (!GetNode(from) || !GetNode(to))
    throw std::out_of_range("Edge endpoint does not exist: " +
                            std::to_string(from) + " -> " +
                            std::to_string(to));

  Edge edge;
  edge.id = (EdgeID)edges_.size();
  edge.from = from;
  edge.to = to;
  edge.key = key;
  edge.geometry = geometry;
  if (edge.geometry.size() < 2) {
    edge.geometry = {{nodes_[from].lat, nodes_[from].lon},
                     {nodes_[to].lat, nodes_[to].lon}};
  }
  if (length > 0.0)
    edge.attrs.length = length;

  nodes_[from].outgoing.push_back(edge.id);
  edges_.push_back(edge);
  return edge.id;
}

void Graph::addRoad(NodeID from, NodeID to, const Polyline &geometry,
                    double length, int key) {
  addEdge(from, to, geometry, length, key);
  addEdge(to, from, reversed(geometry), length, key);
}

NodeID Graph::findNearestNode(double lat, double lon) const {
  NodeID bestNode = -1;
  double minDist = INF;
  for (const auto &node : nodes_) {
    double dist = haversine(lat, lon, node.lat, node.lon);
    if (dist < minDist) {
      minDist = dist;
      bestNode = node.id;
    }
  }
  return bestNode;
}

const Node *Graph::GetNode(NodeID id) const {
  if (id < 0 || id >= (int)nodes_.size())
    return nullptr;
  return &nodes_[id];
}

const Edge *Graph::GetEdge(EdgeID id) const {
  if (id < 0 || id >= (int)edges_.size())
    return nullptr;
  return &edges_[id];
}

const std::vector<Node> &Graph::GetNodes() const { return nodes_; }

const std::vector<Edge> &Graph::GetEdges() const { return edges_; }

void Graph::setAttributes(EdgeID id, const EdgeAttributes &attrs) {
  if (id < 0 || id >= (int)edges_.size())
    throw std::out_of_range("No such edge: " + std::to_string(id));
  edges_[id].attrs = attrs;
}

NodeID Graph::getNodeId(long long osmId) const {
  auto it = osm_id_map_.find(osmId);
  if (it != osm_id_map_.end())
    return it->second;
  return -1;
}

bool Graph::isEnriched() const {
  if (edges_.empty())
    return false;
  for (const auto &edge : edges_) {
    if (!edge.attrs.enriched)
      return false;
  }
  return true;
}

// --- CSV Loading ---

Graph Graph::LoadRaw(const std::string &nodesPath,
                     const std::string &edgesPath) {
  std::cout << "[Graph] Loading road network from " << nodesPath << " and "
            << edgesPath << "..." << std::endl;
  Graph graph;
  graph.loadNodes(nodesPath);
  graph.loadRawEdges(edgesPath);
  std::cout << "[Graph] Loaded " << graph.nodes_.size() << " nodes | "
            << graph.edges_.size() << " edges." << std::endl;
  return graph;
}

Graph Graph::LoadEnriched(const std::string &nodesPath,
                          const std::string &edgesPath) {
  std::cout << "[Graph] Loading enriched graph from " << edgesPath << "..."
            << std::endl;
  Graph graph;
  graph.loadNodes(nodesPath);
  graph.loadEnrichedEdges(edgesPath);
  std::cout << "[Graph] Loaded " << graph.nodes_.size() << " nodes | "
            << graph.edges_.size() << " enriched edges." << std::endl;
  return graph;
}

void Graph::loadNodes(const std::string &filename) {
  std::ifstream file = openOrThrow(filename);
  std::string line;
  std::getline(file, line); // Header

  int skipped = 0;
  while (std::getline(file, line)) {
    if (stripOuterQuotes(line).empty())
      continue;
    auto cols = parseCSVLine(line);
    long long osmId = 0;
    double lat = 0.0, lon = 0.0;
    if (cols.size() < 3 || !parseLong(cols[0], osmId) ||
        !parseDouble(cols[1], lat) || !parseDouble(cols[2], lon)) {
      skipped++;
      continue;
    }
    addNode(osmId, lat, lon);
  }
  if (skipped > 0)
    std::cerr << "[Graph] Skipped " << skipped << " malformed node rows in "
              << filename << std::endl;
}

void Graph::loadRawEdges(const std::string &filename) {
  std::ifstream file = openOrThrow(filename);
  std::string line;
  std::getline(file, line); // Header

  int skipped = 0;
  while (std::getline(file, line)) {
    if (stripOuterQuotes(line).empty())
      continue;
    auto cols = parseCSVLine(line);
    long long u = 0, v = 0, key = 0;
    if (cols.size() < 2 || !parseLong(cols[0], u) || !parseLong(cols[1], v)) {
      skipped++;
      continue;
    }
    NodeID from = getNodeId(u);
    NodeID to = getNodeId(v);
    if (from == -1 || to == -1) {
      skipped++;
      continue;
    }
    if (cols.size() > 2)
      parseLong(cols[2], key);
    bool oneway = cols.size() > 3 && isTruthy(cols[3]);
    double length = 0.0;
    if (cols.size() > 4 && !parseDouble(cols[4], length))
      length = 0.0;
    Polyline geometry;
    if (cols.size() > 5)
      geometry = parseGeometry(cols[5]);

    if (oneway)
      addEdge(from, to, geometry, length, (int)key);
    else
      addRoad(from, to, geometry, length, (int)key);
  }
  if (skipped > 0)
    std::cerr << "[Graph] Skipped " << skipped << " edge rows in " << filename
              << " (malformed or unknown endpoint)" << std::endl;
}

void Graph::loadEnrichedEdges(const std::string &filename) {
  std::ifstream file = openOrThrow(filename);
  std::string line;
  std::getline(file, line); // Header

  int skipped = 0;
  int sanitized = 0;
  while (std::getline(file, line)) {
    if (stripOuterQuotes(line).empty())
      continue;
    auto cols = parseCSVLine(line);
    long long u = 0, v = 0, key = 0;
    if (cols.size() < 2 || !parseLong(cols[0], u) || !parseLong(cols[1], v)) {
      skipped++;
      continue;
    }
    NodeID from = getNodeId(u);
    NodeID to = getNodeId(v);
    if (from == -1 || to == -1) {
      skipped++;
      continue;
    }
    if (cols.size() > 2)
      parseLong(cols[2], key);

    // Missing attributes fall back to the same defaults the enricher uses
    EdgeAttributes attrs;
    bool clean = true;
    if (cols.size() <= 3 || !parseDouble(cols[3], attrs.length) ||
        attrs.length <= 0.0) {
      attrs.length = SANITIZE_LENGTH;
      clean = false;
    }
    if (cols.size() <= 4 || !parseDouble(cols[4], attrs.ndvi)) {
      attrs.ndvi = FALLBACK_NDVI;
      clean = false;
    }
    if (cols.size() <= 5 || !parseDouble(cols[5], attrs.aqi) ||
        attrs.aqi < 0.0) {
      attrs.aqi = DEFAULT_AQI;
      clean = false;
    }
    attrs.ndvi = clampNdvi(attrs.ndvi);
    attrs.enriched = true;
    if (!clean)
      sanitized++;

    Polyline geometry;
    if (cols.size() > 6)
      geometry = parseGeometry(cols[6]);

    EdgeID id = addEdge(from, to, geometry, attrs.length, (int)key);
    edges_[id].attrs = attrs;
  }
  if (skipped > 0)
    std::cerr << "[Graph] Skipped " << skipped << " edge rows in " << filename
              << std::endl;
  if (sanitized > 0)
    std::cout << "[Graph] Sanitized attributes on " << sanitized << " edges."
              << std::endl;
}

void Graph::SaveEnriched(const std::string &edgesPath) const {
  std::ofstream out(edgesPath);
  if (!out.is_open())
    throw GraphLoadError("Cannot write enriched graph: " + edgesPath);

  out << "u,v,key,length,ndvi,aqi,geometry\n";
  out << std::setprecision(17);
  for (const auto &edge : edges_) {
    out << nodes_[edge.from].osm_id << ',' << nodes_[edge.to].osm_id << ','
        << edge.key << ',' << edge.attrs.length << ',' << edge.attrs.ndvi
        << ',' << edge.attrs.aqi << ",\"" << formatGeometry(edge.geometry)
        << "\"\n";
  }
  std::cout << "[Graph] Saved " << edges_.size() << " enriched edges to "
            << edgesPath << std::endl;
}
