#include "config.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace {
void readString(const char *name, std::string &target) {
  if (const char *env_p = std::getenv(name))
    target = env_p;
}

void readDouble(const char *name, double &target) {
  const char *env_p = std::getenv(name);
  if (!env_p)
    return;
  try {
    target = std::stod(env_p);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string(name) + " is not a number: " +
                                env_p);
  }
}

void readInt(const char *name, int &target) {
  const char *env_p = std::getenv(name);
  if (!env_p)
    return;
  try {
    target = std::stoi(env_p);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string(name) + " is not an integer: " +
                                env_p);
  }
}
} // namespace

ServiceConfig ServiceConfig::FromEnvironment() {
  ServiceConfig config;
  readString("GREEN_ROUTING_ADDRESS", config.serverAddress);
  readString("GRAPH_NODES_PATH", config.nodesPath);
  readString("GRAPH_EDGES_PATH", config.edgesPath);
  readString("NDVI_RASTER_PATH", config.ndviRasterPath);
  readString("AQI_STATIONS_PATH", config.stationsPath);
  readString("ENRICHED_EDGES_PATH", config.enrichedEdgesPath);

  readInt("NDVI_SAMPLES", config.enrich.ndviSamples);
  if (config.enrich.ndviSamples < MIN_NDVI_SAMPLES)
    config.enrich.ndviSamples = MIN_NDVI_SAMPLES;
  readDouble("DEFAULT_AQI", config.enrich.defaultAqi);
  if (!std::isfinite(config.enrich.defaultAqi) ||
      config.enrich.defaultAqi < 0.0)
    throw std::invalid_argument("DEFAULT_AQI must be a finite value >= 0");

  std::string sampling;
  readString("NDVI_SAMPLING", sampling);
  if (sampling == "midpoint")
    config.enrich.sampling = NdviSampling::kMidpoint;
  else if (!sampling.empty() && sampling != "line")
    throw std::invalid_argument("NDVI_SAMPLING must be 'line' or 'midpoint'");

  readDouble("GREEN_WEIGHT", config.cost.greenWeight);
  readDouble("AQI_WEIGHT", config.cost.aqiWeight);
  std::string transform;
  readString("NDVI_TRANSFORM", transform);
  if (!transform.empty())
    config.cost.ndviTransform = ndviTransformFromString(transform);

  // Rejects non-finite or negative weights before the server starts
  CostModel validated(config.cost);

  return config;
}
