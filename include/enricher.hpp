#ifndef ENRICHER_HPP
#define ENRICHER_HPP

#include "graph.hpp"
#include "raster.hpp"
#include "stations.hpp"

enum class NdviSampling {
  kLineMean, // mean over points along the full geometry
  kMidpoint  // single pixel under the geometric midpoint
};

struct EnrichConfig {
  NdviSampling sampling = NdviSampling::kLineMean;
  int ndviSamples = DEFAULT_NDVI_SAMPLES;
  double fallbackNdvi = FALLBACK_NDVI;
  double defaultAqi = DEFAULT_AQI;
};

struct EnrichmentReport {
  int edgesEnriched = 0;
  int lengthsComputed = 0;
  int ndviFallbacks = 0;
  int aqiFallbacks = 0;
};

class Enricher {
public:
  // Returns a copy of `raw` with length/ndvi/aqi set on every edge. Throws
  // EnrichmentError if the graph has no nodes or no edges. Per-edge lookup
  // failures get the configured fallback and are counted in `report`.
  static Graph Enrich(const Graph &raw, const NdviRaster &raster,
                      const StationSet &stations,
                      const EnrichConfig &config = EnrichConfig(),
                      EnrichmentReport *report = nullptr);

  // Attributes for one edge; depends only on the edge's geometry and the
  // two inputs.
  static EdgeAttributes EnrichEdge(const Edge &edge, const NdviRaster &raster,
                                   const StationSet &stations,
                                   const EnrichConfig &config,
                                   EnrichmentReport &report);
};

#endif // ENRICHER_HPP
