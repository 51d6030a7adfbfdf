#include "graph_builder.hpp"
#include "enricher.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>

Graph BuildEnvironmentalGraph(const ServiceConfig &config) {
  std::cout << "=== Environmental Graph Builder ===" << std::endl;

  Graph raw = Graph::LoadRaw(config.nodesPath, config.edgesPath);
  if (raw.empty())
    throw EnrichmentError("Road network at " + config.edgesPath +
                          " has no usable edges");

  Graph enriched;
  {
    NdviRaster raster = NdviRaster::LoadAsciiGrid(config.ndviRasterPath);
    StationSet stations = StationSet::LoadCSV(config.stationsPath);
    enriched = Enricher::Enrich(raw, raster, stations, config.enrich);
  }

  enriched.SaveEnriched(config.enrichedEdgesPath);
  return enriched;
}

Graph LoadOrBuildEnvironmentalGraph(const ServiceConfig &config) {
  std::ifstream cached(config.enrichedEdgesPath);
  if (cached.good()) {
    cached.close();
    std::cout << "[Graph] Found existing " << config.enrichedEdgesPath
              << ", reusing." << std::endl;
    Graph graph = Graph::LoadEnriched(config.nodesPath,
                                      config.enrichedEdgesPath);
    if (!graph.empty())
      return graph;
    std::cerr << "[Graph] Cached graph is empty, rebuilding." << std::endl;
  }
  return BuildEnvironmentalGraph(config);
}
