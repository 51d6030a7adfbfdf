#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "cost_model.hpp"
#include "enricher.hpp"
#include <string>

struct ServiceConfig {
  std::string serverAddress = "0.0.0.0:50052";
  std::string nodesPath = "data/processed/nodes.csv";
  std::string edgesPath = "data/processed/edges.csv";
  std::string ndviRasterPath = "data/raw/ndvi.asc";
  std::string stationsPath = "data/raw/aqi_stations.csv";
  std::string enrichedEdgesPath = "data/processed/edges_env.csv";

  EnrichConfig enrich;
  CostConfig cost;

  // Overrides defaults from GREEN_ROUTING_ADDRESS, GRAPH_NODES_PATH,
  // GRAPH_EDGES_PATH, NDVI_RASTER_PATH, AQI_STATIONS_PATH,
  // ENRICHED_EDGES_PATH, NDVI_SAMPLES, NDVI_SAMPLING, DEFAULT_AQI,
  // GREEN_WEIGHT, AQI_WEIGHT, NDVI_TRANSFORM. Throws std::invalid_argument
  // on a malformed numeric value.
  static ServiceConfig FromEnvironment();
};

#endif // CONFIG_HPP
