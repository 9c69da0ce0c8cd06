#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace rackwise::store {
class CoordinationStore;
}
namespace rackwise::service {
class TopologyService;
}
namespace rackwise::upstream {
class UpstreamCheckWorker;
}

namespace rackwise::factory {

/*
  Application

  Owns the long-lived objects of the daemon. upstream_worker is null when
  upstream checking is disabled; it is not started yet.
*/
struct Application {
  std::shared_ptr<rackwise::store::CoordinationStore>      store;
  std::shared_ptr<rackwise::service::TopologyService>      topology_service;
  std::shared_ptr<rackwise::upstream::UpstreamCheckWorker> upstream_worker;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows concrete store and load
  balancer types.
*/
Application Build(const rackwise::runtime::config::RuntimeConfig& config);

} // namespace rackwise::factory
