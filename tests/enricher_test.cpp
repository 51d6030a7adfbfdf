#include "enricher.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <vector>

namespace {
// Small raw network near Bengaluru, no attributes set.
Graph makeRawGrid() {
  Graph g;
  NodeID a = g.addNode(1, 12.970, 77.590);
  NodeID b = g.addNode(2, 12.970, 77.600);
  NodeID c = g.addNode(3, 12.980, 77.600);
  NodeID d = g.addNode(4, 12.980, 77.590);
  g.addRoad(a, b);
  g.addRoad(b, c, {{12.970, 77.600}, {12.975, 77.605}, {12.980, 77.600}});
  g.addRoad(c, d);
  g.addEdge(d, a, {}, 1200.0); // one-way with a known length
  return g;
}

StationSet makeStations() {
  return StationSet({{101, 12.969, 77.589, 60.0, ""},
                     {102, 12.981, 77.601, 140.0, ""}});
}
} // namespace

TEST(EnricherTest, EveryEdgeGetsInRangeAttributes) {
  Graph raw = makeRawGrid();
  EnrichmentReport report;
  Graph g = Enricher::Enrich(raw, makeUniformRaster(0.45f), makeStations(),
                             EnrichConfig(), &report);

  ASSERT_EQ(g.GetEdges().size(), raw.GetEdges().size());
  for (const auto &e : g.GetEdges()) {
    EXPECT_TRUE(e.attrs.enriched);
    EXPECT_GT(e.attrs.length, 0.0);
    EXPECT_GE(e.attrs.ndvi, -1.0);
    EXPECT_LE(e.attrs.ndvi, 1.0);
    EXPECT_GE(e.attrs.aqi, 0.0);
    EXPECT_NEAR(e.attrs.ndvi, 0.45, 1e-6);
  }
  EXPECT_TRUE(g.isEnriched());
  EXPECT_FALSE(raw.isEnriched());
  EXPECT_EQ(report.edgesEnriched, (int)raw.GetEdges().size());
  EXPECT_EQ(report.ndviFallbacks, 0);
  EXPECT_EQ(report.aqiFallbacks, 0);
}

TEST(EnricherTest, LengthComputedFromGeometryOnlyWhenMissing) {
  Graph g = Enricher::Enrich(makeRawGrid(), makeUniformRaster(0.3f),
                             makeStations());
  // a-b: straight 0.01 deg of longitude at 12.97N
  EXPECT_NEAR(g.GetEdge(0)->attrs.length, haversine(12.97, 77.59, 12.97, 77.60),
              1e-6);
  // b-c follows its bent geometry, longer than the chord
  EXPECT_GT(g.GetEdge(2)->attrs.length, haversine(12.97, 77.60, 12.98, 77.60));
  // d-a keeps the supplied length
  EXPECT_DOUBLE_EQ(g.GetEdge(6)->attrs.length, 1200.0);
}

TEST(EnricherTest, AqiComesFromNearestStationToMidpoint) {
  Graph g = Enricher::Enrich(makeRawGrid(), makeUniformRaster(0.3f),
                             makeStations());
  EXPECT_DOUBLE_EQ(g.GetEdge(0)->attrs.aqi, 60.0);  // a-b, south
  EXPECT_DOUBLE_EQ(g.GetEdge(4)->attrs.aqi, 140.0); // c-d, north
}

TEST(EnricherTest, EnrichmentIsIdempotent) {
  Graph raw = makeRawGrid();
  NdviRaster raster = makeUniformRaster(0.61f);
  StationSet stations = makeStations();

  Graph first = Enricher::Enrich(raw, raster, stations);
  Graph second = Enricher::Enrich(raw, raster, stations);
  Graph again = Enricher::Enrich(first, raster, stations);

  for (size_t i = 0; i < raw.GetEdges().size(); ++i) {
    const EdgeAttributes &a = first.GetEdges()[i].attrs;
    const EdgeAttributes &b = second.GetEdges()[i].attrs;
    const EdgeAttributes &c = again.GetEdges()[i].attrs;
    EXPECT_EQ(a.length, b.length);
    EXPECT_EQ(a.ndvi, b.ndvi);
    EXPECT_EQ(a.aqi, b.aqi);
    EXPECT_EQ(a.length, c.length);
    EXPECT_EQ(a.ndvi, c.ndvi);
    EXPECT_EQ(a.aqi, c.aqi);
  }
}

TEST(EnricherTest, EmptyStationSetUsesDefaultAqiEverywhere) {
  Graph raw = makeRawGrid();
  EnrichConfig config;
  config.defaultAqi = 55.0;
  EnrichmentReport report;
  Graph g = Enricher::Enrich(raw, makeUniformRaster(0.2f), StationSet(),
                             config, &report);

  EXPECT_TRUE(g.isEnriched());
  for (const auto &e : g.GetEdges())
    EXPECT_DOUBLE_EQ(e.attrs.aqi, 55.0);
  EXPECT_EQ(report.aqiFallbacks, (int)raw.GetEdges().size());
}

TEST(EnricherTest, NonFiniteOrNegativeDefaultAqiIsRejected) {
  Graph raw = makeRawGrid();
  for (double bad : {std::numeric_limits<double>::quiet_NaN(),
                     std::numeric_limits<double>::infinity(), -1.0}) {
    EnrichConfig config;
    config.defaultAqi = bad;
    EXPECT_THROW(
        Enricher::Enrich(raw, makeUniformRaster(0.2f), StationSet(), config),
        EnrichmentError)
        << bad;
  }
}

TEST(EnricherTest, EdgesOffTheRasterGetFallbackNdvi) {
  Graph raw;
  NodeID a = raw.addNode(1, 40.0, 10.0);
  NodeID b = raw.addNode(2, 40.01, 10.0);
  raw.addRoad(a, b);

  EnrichConfig config;
  config.fallbackNdvi = -0.1;
  EnrichmentReport report;
  Graph g = Enricher::Enrich(raw, makeUniformRaster(0.9f), makeStations(),
                             config, &report);
  for (const auto &e : g.GetEdges())
    EXPECT_DOUBLE_EQ(e.attrs.ndvi, -0.1);
  EXPECT_EQ(report.ndviFallbacks, 2);
}

TEST(EnricherTest, RasterValuesAreClampedToNdviRange) {
  Graph g = Enricher::Enrich(makeRawGrid(), makeUniformRaster(3.5f),
                             makeStations());
  for (const auto &e : g.GetEdges())
    EXPECT_DOUBLE_EQ(e.attrs.ndvi, 1.0);
}

TEST(EnricherTest, LineMeanAndMidpointSamplingDiffer) {
  // West cell 0.2, east cell 0.8, boundary at lon 78.0
  NdviRaster raster(2, 1, 77.0, 12.0, 1.0, {0.2f, 0.8f});
  Graph raw;
  NodeID a = raw.addNode(1, 12.5, 77.1);
  NodeID b = raw.addNode(2, 12.5, 78.3);
  raw.addEdge(a, b);

  EnrichConfig line;
  line.ndviSamples = 7; // 77.1, 77.3, ..., 78.3: five west, two east
  Graph byLine = Enricher::Enrich(raw, raster, makeStations(), line);
  EXPECT_NEAR(byLine.GetEdge(0)->attrs.ndvi, (5 * 0.2 + 2 * 0.8) / 7.0, 1e-6);

  EnrichConfig mid;
  mid.sampling = NdviSampling::kMidpoint; // lon 77.7
  Graph byMid = Enricher::Enrich(raw, raster, makeStations(), mid);
  EXPECT_NEAR(byMid.GetEdge(0)->attrs.ndvi, 0.2, 1e-6);
}

TEST(EnricherTest, EmptyGraphIsFatal) {
  Graph empty;
  EXPECT_THROW(Enricher::Enrich(empty, makeUniformRaster(0.1f), makeStations()),
               EnrichmentError);

  Graph nodesOnly;
  nodesOnly.addNode(1, 12.97, 77.59);
  EXPECT_THROW(
      Enricher::Enrich(nodesOnly, makeUniformRaster(0.1f), makeStations()),
      EnrichmentError);
}
