#include "errors.hpp"
#include "graph.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(CsvTest, HandlesQuotedFieldsAndWrappedRows) {
  auto cols = parseCSVLine("1,2,\"77.5 12.9;77.6 12.95\"\r");
  ASSERT_EQ(cols.size(), 3u);
  EXPECT_EQ(cols[2], "77.5 12.9;77.6 12.95");

  auto wrapped = parseCSVLine("\"10,12.5,77.5\"");
  ASSERT_EQ(wrapped.size(), 3u);
  EXPECT_EQ(wrapped[0], "10");

  auto escaped = parseCSVLine("a,\"say \"\"hi\"\"\",c");
  ASSERT_EQ(escaped.size(), 3u);
  EXPECT_EQ(escaped[1], "say \"hi\"");
}

TEST(GraphTest, EdgesRequireExistingEndpoints) {
  Graph g;
  NodeID a = g.addNode(100, 12.97, 77.59);
  EXPECT_THROW(g.addEdge(a, 5), std::out_of_range);
  EXPECT_THROW(g.addEdge(-1, a), std::out_of_range);
  EXPECT_TRUE(g.GetEdges().empty());
}

TEST(GraphTest, AddNodeIsKeyedByOsmId) {
  Graph g;
  NodeID a = g.addNode(100, 12.97, 77.59);
  NodeID again = g.addNode(100, 0.0, 0.0);
  EXPECT_EQ(a, again);
  EXPECT_EQ(g.GetNodes().size(), 1u);
  EXPECT_EQ(g.getNodeId(100), a);
  EXPECT_EQ(g.getNodeId(999), -1);
}

TEST(GraphTest, RoadAddsBothDirectionsWithReversedGeometry) {
  Graph g;
  NodeID a = g.addNode(1, 12.0, 77.0);
  NodeID b = g.addNode(2, 12.0, 77.01);
  g.addRoad(a, b, {{12.0, 77.0}, {12.001, 77.005}, {12.0, 77.01}});

  ASSERT_EQ(g.GetEdges().size(), 2u);
  const Edge *fwd = g.GetEdge(0);
  const Edge *back = g.GetEdge(1);
  EXPECT_EQ(fwd->from, a);
  EXPECT_EQ(back->from, b);
  EXPECT_DOUBLE_EQ(back->geometry.front().lon, 77.01);
  EXPECT_DOUBLE_EQ(back->geometry[1].lat, 12.001);
  EXPECT_EQ(g.GetNode(a)->outgoing.size(), 1u);
  EXPECT_EQ(g.GetNode(b)->outgoing.size(), 1u);
}

TEST(GraphTest, MissingGeometryBecomesStraightSegment) {
  Graph g;
  NodeID a = g.addNode(1, 12.0, 77.0);
  NodeID b = g.addNode(2, 12.1, 77.0);
  EdgeID e = g.addEdge(a, b);
  ASSERT_EQ(g.GetEdge(e)->geometry.size(), 2u);
  EXPECT_DOUBLE_EQ(g.GetEdge(e)->geometry.back().lat, 12.1);
  EXPECT_DOUBLE_EQ(g.GetEdge(e)->attrs.length, 0.0);
  EXPECT_FALSE(g.isEnriched());
}

TEST(GraphTest, FindNearestNode) {
  Graph g;
  EXPECT_EQ(g.findNearestNode(12.0, 77.0), -1);
  g.addNode(1, 12.0, 77.0);
  NodeID b = g.addNode(2, 12.5, 77.5);
  EXPECT_EQ(g.findNearestNode(12.4, 77.4), b);
}

TEST(GraphTest, LoadRawParsesOnewayLengthAndGeometry) {
  std::string nodes = writeTempFile("raw_nodes.csv", "osmid,lat,lon\n"
                                                     "10,12.97,77.59\n"
                                                     "11,12.98,77.59\n"
                                                     "12,12.98,77.60\n"
                                                     "bad,row\n");
  std::string edges = writeTempFile(
      "raw_edges.csv", "u,v,key,oneway,length,geometry\n"
                       "10,11,0,False,1112.5,\"77.59 12.97;77.59 12.98\"\n"
                       "11,12,0,True,,\n"
                       "12,99,0,True,10,\n");

  Graph g = Graph::LoadRaw(nodes, edges);
  EXPECT_EQ(g.GetNodes().size(), 3u);
  // two-way road -> 2, one-way -> 1, unknown endpoint skipped
  ASSERT_EQ(g.GetEdges().size(), 3u);
  EXPECT_DOUBLE_EQ(g.GetEdge(0)->attrs.length, 1112.5);
  EXPECT_EQ(g.GetNodes()[g.GetEdge(1)->to].osm_id, 10);
  EXPECT_EQ(g.GetNodes()[g.GetEdge(2)->from].osm_id, 11);
  EXPECT_EQ(g.GetNodes()[g.GetEdge(2)->to].osm_id, 12);
  EXPECT_DOUBLE_EQ(g.GetEdge(2)->attrs.length, 0.0);
  EXPECT_EQ(g.GetEdge(2)->geometry.size(), 2u);
}

TEST(GraphTest, OnewayFlagIsCaseInsensitive) {
  std::string nodes = writeTempFile("flag_nodes.csv", "osmid,lat,lon\n"
                                                      "20,12.97,77.59\n"
                                                      "21,12.98,77.59\n"
                                                      "22,12.98,77.60\n");
  std::string edges = writeTempFile(
      "flag_edges.csv", "u,v,key,oneway,length,geometry\n"
                        "20,21,0,TRUE,10,\n"
                        "21,22,0,\xC3\xBCber,10,\n");

  Graph g = Graph::LoadRaw(nodes, edges);
  // one-way -> 1, unrecognised flag is two-way -> 2
  ASSERT_EQ(g.GetEdges().size(), 3u);
  EXPECT_EQ(g.GetNodes()[g.GetEdge(0)->from].osm_id, 20);
  EXPECT_EQ(g.GetNodes()[g.GetEdge(1)->from].osm_id, 21);
  EXPECT_EQ(g.GetNodes()[g.GetEdge(2)->from].osm_id, 22);
}

TEST(GraphTest, LoadRawMissingFileThrows) {
  EXPECT_THROW(Graph::LoadRaw("/nonexistent/nodes.csv", "/nonexistent/e.csv"),
               GraphLoadError);
}

TEST(GraphTest, EnrichedGraphRoundTripsAttributes) {
  Graph g;
  NodeID a = g.addNode(1, 12.97, 77.59);
  NodeID b = g.addNode(2, 12.98, 77.59);
  g.addEdge(a, b, {{12.97, 77.59}, {12.975, 77.591}, {12.98, 77.59}});
  g.setAttributes(0, attrs(1113.123456789, 0.123456789012345, 87.654321));

  std::string nodes = writeTempFile("rt_nodes.csv", "osmid,lat,lon\n"
                                                    "1,12.97,77.59\n"
                                                    "2,12.98,77.59\n");
  std::string edges = ::testing::TempDir() + "rt_edges_env.csv";
  g.SaveEnriched(edges);

  Graph loaded = Graph::LoadEnriched(nodes, edges);
  ASSERT_EQ(loaded.GetEdges().size(), 1u);
  const Edge *e = loaded.GetEdge(0);
  EXPECT_EQ(e->attrs.length, 1113.123456789);
  EXPECT_EQ(e->attrs.ndvi, 0.123456789012345);
  EXPECT_EQ(e->attrs.aqi, 87.654321);
  EXPECT_EQ(e->geometry.size(), 3u);
  EXPECT_TRUE(loaded.isEnriched());
}

TEST(GraphTest, LoadEnrichedSanitizesMissingAttributes) {
  std::string nodes = writeTempFile("san_nodes.csv", "osmid,lat,lon\n"
                                                     "1,12.97,77.59\n"
                                                     "2,12.98,77.59\n");
  std::string edges =
      writeTempFile("san_edges.csv", "u,v,key,length,ndvi,aqi,geometry\n"
                                     "1,2,0,,,,\n"
                                     "2,1,0,250,1.7,-3,\n");
  Graph g = Graph::LoadEnriched(nodes, edges);
  ASSERT_EQ(g.GetEdges().size(), 2u);

  const EdgeAttributes &first = g.GetEdge(0)->attrs;
  EXPECT_DOUBLE_EQ(first.length, SANITIZE_LENGTH);
  EXPECT_DOUBLE_EQ(first.ndvi, FALLBACK_NDVI);
  EXPECT_DOUBLE_EQ(first.aqi, DEFAULT_AQI);

  const EdgeAttributes &second = g.GetEdge(1)->attrs;
  EXPECT_DOUBLE_EQ(second.length, 250.0);
  EXPECT_DOUBLE_EQ(second.ndvi, 1.0);
  EXPECT_DOUBLE_EQ(second.aqi, DEFAULT_AQI);
  EXPECT_TRUE(g.isEnriched());
}
