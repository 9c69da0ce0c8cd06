#include "factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/catalog/store_catalog.hpp"
#include "internal/core/placement_engine.hpp"
#include "internal/grpc/topology_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/topology_service.hpp"
#include "internal/store/store_factory.hpp"
#include "internal/topology/node_manager.hpp"
#include "internal/topology/rack_manager.hpp"
#include "internal/upstream/grpc_load_balancer_client.hpp"
#include "internal/upstream/upstream_check_worker.hpp"
#include "internal/upstream/upstream_reconciler.hpp"

namespace rackwise::factory {

namespace {

std::shared_ptr<upstream::UpstreamReconciler> BuildReconciler(const rackwise::runtime::config::RuntimeConfig& config,
                                                              const std::shared_ptr<store::CoordinationStore>& store) {
  const auto& check = config.upstream_check();
  if (!check.enabled()) {
    return nullptr;
  }
  if (check.load_balancer_endpoint().empty()) {
    throw std::invalid_argument("upstream_check.load_balancer_endpoint is required when upstream_check.enabled is set");
  }

  auto channel   = ::grpc::CreateChannel(check.load_balancer_endpoint(), ::grpc::InsecureChannelCredentials());
  auto lb_client = std::make_shared<upstream::GrpcLoadBalancerClient>(std::move(channel));
  auto catalog   = std::make_shared<catalog::StoreCatalog>(store, config.coordination().catalog_root());
  return std::make_shared<upstream::UpstreamReconciler>(std::move(catalog), std::move(lb_client));
}

} // namespace

Application Build(const rackwise::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Coordination store and topology
  // ------------------------------------------------------------------
  app.store = store::StoreFactory::Build(config.coordination());

  auto nodes = std::make_shared<topology::NodeManager>(app.store, config.coordination().nodes_root());
  auto racks = std::make_shared<topology::RackManager>(app.store, config.coordination().racks_root());

  core::TopologyOptions options;
  options.rack_id_attribute_key = config.topology().rack_id_attribute_key();
  options.default_rack_id       = config.topology().default_rack_id();
  auto placement                = std::make_shared<core::PlacementEngine>(nodes, racks, options);

  // ------------------------------------------------------------------
  // Upstream reconciliation
  // ------------------------------------------------------------------
  auto reconciler = BuildReconciler(config, app.store);
  if (reconciler) {
    app.upstream_worker = std::make_shared<upstream::UpstreamCheckWorker>(
        reconciler, std::chrono::milliseconds(config.upstream_check().interval_ms()));
  } else {
    RACKWISE_LOG_INFO("upstream check disabled");
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.placement  = placement;
  ctx.nodes      = nodes;
  ctx.racks      = racks;
  ctx.reconciler = reconciler;

  app.topology_service = std::make_shared<service::TopologyService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TopologyServer>(app.topology_service));

  return app;
}

} // namespace rackwise::factory
