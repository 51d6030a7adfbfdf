#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "graph_builder.hpp"
#include "service_impl.hpp"
#include <grpcpp/grpcpp.h>

using grpc::Server;
using grpc::ServerBuilder;

void RunServer(const ServiceConfig &config) {
  Graph graph;
  try {
    graph = LoadOrBuildEnvironmentalGraph(config);
  } catch (const EnrichmentError &e) {
    std::cerr << "Failed to build environmental graph: " << e.what()
              << std::endl;
    std::exit(1);
  } catch (const GraphLoadError &e) {
    std::cerr << "Failed to load road network: " << e.what() << std::endl;
    std::cerr << "Set GRAPH_NODES_PATH / GRAPH_EDGES_PATH to the exported "
                 "network CSV files."
              << std::endl;
    std::exit(1);
  }

  GreenRoutingServiceImpl service(graph, config.cost);

  ServerBuilder builder;
  builder.AddListeningPort(config.serverAddress,
                           grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "Failed to listen on " << config.serverAddress << std::endl;
    std::exit(1);
  }
  std::cout << "Server listening on " << config.serverAddress << std::endl;
  std::cout << "Graph loaded with " << graph.GetNodes().size() << " nodes, "
            << graph.GetEdges().size() << " edges." << std::endl;

  server->Wait();
}

int main(int argc, char **argv) {
  ServiceConfig config;
  try {
    config = ServiceConfig::FromEnvironment();
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }
  RunServer(config);
  return 0;
}
