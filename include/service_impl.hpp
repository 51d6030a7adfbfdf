#ifndef SERVICE_IMPL_HPP
#define SERVICE_IMPL_HPP

#include "cost_model.hpp"
#include "graph.hpp"
#include "green_routing.grpc.pb.h"
#include <grpcpp/grpcpp.h>

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using greenrouting::GreenRouting;
using greenrouting::RouteRequest;
using greenrouting::RouteResponse;

class GreenRoutingServiceImpl final : public GreenRouting::Service {
public:
  GreenRoutingServiceImpl(const Graph &graph, const CostConfig &costConfig)
      : graph_(graph), costConfig_(costConfig) {}
  Status GetRoutes(ServerContext *context, const RouteRequest *request,
                   RouteResponse *reply) override;

private:
  const Graph &graph_;
  CostConfig costConfig_;
};

#endif // SERVICE_IMPL_HPP
