#ifndef GRAPH_BUILDER_HPP
#define GRAPH_BUILDER_HPP

#include "config.hpp"
#include "graph.hpp"

// Loads the raw network, raster and stations named in `config`, enriches the
// network and writes it to config.enrichedEdgesPath. The raster and stations
// are released before returning. Throws EnrichmentError or GraphLoadError.
Graph BuildEnvironmentalGraph(const ServiceConfig &config);

// Reuses the persisted enriched graph when it exists, otherwise builds it.
Graph LoadOrBuildEnvironmentalGraph(const ServiceConfig &config);

#endif // GRAPH_BUILDER_HPP
