#include "enricher.hpp"
#include "errors.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

EdgeAttributes Enricher::EnrichEdge(const Edge &edge, const NdviRaster &raster,
                                    const StationSet &stations,
                                    const EnrichConfig &config,
                                    EnrichmentReport &report) {
  EdgeAttributes attrs = edge.attrs;

  if (attrs.length <= 0.0) {
    attrs.length = std::max(polylineLength(edge.geometry), MIN_EDGE_LENGTH);
    report.lengthsComputed++;
  }

  const Coordinate mid = midpoint(edge.geometry);

  // --- NDVI ---
  try {
    if (config.sampling == NdviSampling::kLineMean)
      attrs.ndvi = raster.sampleLine(edge.geometry, config.ndviSamples);
    else
      attrs.ndvi = raster.sampleAt(mid.lat, mid.lon);
  } catch (const OutOfBoundsError &) {
    attrs.ndvi = config.fallbackNdvi;
    report.ndviFallbacks++;
  }
  attrs.ndvi = clampNdvi(attrs.ndvi);

  // --- AQI ---
  try {
    attrs.aqi = stations.nearestAqi(mid.lat, mid.lon);
  } catch (const NoStationDataError &) {
    attrs.aqi = config.defaultAqi;
    report.aqiFallbacks++;
  }
  if (attrs.aqi < 0.0)
    attrs.aqi = 0.0;

  attrs.enriched = true;
  report.edgesEnriched++;
  return attrs;
}

Graph Enricher::Enrich(const Graph &raw, const NdviRaster &raster,
                       const StationSet &stations, const EnrichConfig &config,
                       EnrichmentReport *report) {
  if (raw.GetNodes().empty())
    throw EnrichmentError("Cannot enrich an empty road graph (no nodes)");
  if (raw.GetEdges().empty())
    throw EnrichmentError("Cannot enrich an empty road graph (no edges)");
  if (!std::isfinite(config.defaultAqi) || config.defaultAqi < 0.0)
    throw EnrichmentError("Default AQI must be finite and non-negative");
  if (!std::isfinite(config.fallbackNdvi))
    throw EnrichmentError("Fallback NDVI must be finite");

  std::cout << "[Enricher] Sampling NDVI and AQI for "
            << raw.GetEdges().size() << " road segments..." << std::endl;
  if (stations.empty())
    std::cerr << "[Enricher] No AQI stations; using default AQI "
              << config.defaultAqi << " for every segment." << std::endl;

  Graph enriched = raw;
  EnrichmentReport local;
  for (const auto &edge : raw.GetEdges()) {
    enriched.setAttributes(
        edge.id, EnrichEdge(edge, raster, stations, config, local));
  }

  std::cout << "[Enricher] Enriched " << local.edgesEnriched << " edges ("
            << local.lengthsComputed << " lengths computed, "
            << local.ndviFallbacks << " NDVI fallbacks, "
            << local.aqiFallbacks << " AQI fallbacks)." << std::endl;

  if (report)
    *report = local;
  return enriched;
}
