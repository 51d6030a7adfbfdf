#include <iostream>
#include <stdexcept>

#include "config.hpp"
#include "errors.hpp"
#include "graph_builder.hpp"

// Offline step: enrich the exported road network with NDVI and AQI and write
// the enriched edge table the server loads at start-up.
int main(int argc, char **argv) {
  try {
    ServiceConfig config = ServiceConfig::FromEnvironment();
    Graph graph = BuildEnvironmentalGraph(config);

    std::cout << "\n=== DONE ===" << std::endl;
    std::cout << graph.GetEdges().size() << " enriched edges written to "
              << config.enrichedEdgesPath << std::endl;
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  } catch (const EnrichmentError &e) {
    std::cerr << "Enrichment failed: " << e.what() << std::endl;
    return 1;
  } catch (const GraphLoadError &e) {
    std::cerr << "Graph I/O failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
