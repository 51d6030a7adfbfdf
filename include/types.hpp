#ifndef TYPES_HPP
#define TYPES_HPP

#include <cmath>
#include <limits>
#include <string>
#include <vector>

// --- Core Type Aliases ---
using NodeID = int;
using EdgeID = int;
using Weight = double;

// --- Constants ---
const double INF = std::numeric_limits<double>::max();
const double R_EARTH = 6371000.0;
const double PI = 3.14159265358979323846;

// Enrichment Fallbacks
const double FALLBACK_NDVI = 0.0;  // raster miss / no data
const double DEFAULT_AQI = 50.0;   // no station data
const double SANITIZE_LENGTH = 1.0; // missing length in a persisted graph
const double MIN_EDGE_LENGTH = 0.01; // zero-length segments (m)
const int DEFAULT_NDVI_SAMPLES = 7;
const int MIN_NDVI_SAMPLES = 2;

// Cost Model Defaults
const double DEFAULT_GREEN_WEIGHT = 0.7;
const double DEFAULT_AQI_WEIGHT = 0.3;
const double DEFAULT_AQI_SCALE = 100.0;

// Two stations closer than this (m) to each other's distance are a tie
const double STATION_TIE_EPSILON = 1e-6;

// --- Haversine Distance (meters) ---
inline double toRadians(double degree) { return degree * PI / 180.0; }

inline double haversine(double lat1, double lon1, double lat2, double lon2) {
  double dLat = toRadians(lat2 - lat1);
  double dLon = toRadians(lon2 - lon1);
  lat1 = toRadians(lat1);
  lat2 = toRadians(lat2);
  double a =
      std::sin(dLat / 2) * std::sin(dLat / 2) +
      std::sin(dLon / 2) * std::sin(dLon / 2) * std::cos(lat1) * std::cos(lat2);
  double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return R_EARTH * c;
}

inline double clampNdvi(double ndvi) {
  if (ndvi < -1.0)
    return -1.0;
  if (ndvi > 1.0)
    return 1.0;
  return ndvi;
}

// --- Geometry ---
struct Coordinate {
  double lat;
  double lon;
};

using Polyline = std::vector<Coordinate>;

// Length of a polyline in meters.
inline double polylineLength(const Polyline &line) {
  double total = 0.0;
  for (size_t i = 1; i < line.size(); ++i)
    total += haversine(line[i - 1].lat, line[i - 1].lon, line[i].lat,
                       line[i].lon);
  return total;
}

// --- Graph Structures ---
struct EdgeAttributes {
  double length = 0.0; // meters, 0 until known
  double ndvi = FALLBACK_NDVI;
  double aqi = DEFAULT_AQI;
  bool enriched = false;
};

struct Edge {
  EdgeID id;
  NodeID from;
  NodeID to;
  int key;          // parallel-edge index between the same endpoints
  Polyline geometry; // from -> to, endpoints included
  EdgeAttributes attrs;
};

struct Node {
  NodeID id;
  long long osm_id;
  double lat;
  double lon;
  std::vector<EdgeID> outgoing;
};

// --- Output Structures ---
struct PathResult {
  std::string type; // "shortest", "greenest"
  std::vector<NodeID> nodes;
  std::vector<EdgeID> edges;
  Polyline geometry;

  double totalLength = 0.0; // meters
  double meanNdvi = 0.0;
  double meanAqi = 0.0;
  double totalGreenCost = 0.0;
};

struct RoutePair {
  PathResult shortest;
  PathResult greenest;
};

#endif // TYPES_HPP
