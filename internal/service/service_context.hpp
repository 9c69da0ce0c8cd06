#pragma once

#include <memory>

namespace rackwise::core {
class PlacementEngine;
}
namespace rackwise::topology {
class NodeManager;
class RackManager;
} // namespace rackwise::topology
namespace rackwise::upstream {
class UpstreamReconciler;
}

namespace rackwise::service {

/*
  Dependency container shared by the services.
  reconciler is null when upstream checking is disabled.
*/
struct ServiceContext {
  std::shared_ptr<rackwise::core::PlacementEngine>        placement;
  std::shared_ptr<rackwise::topology::NodeManager>        nodes;
  std::shared_ptr<rackwise::topology::RackManager>        racks;
  std::shared_ptr<rackwise::upstream::UpstreamReconciler> reconciler;
};

} // namespace rackwise::service
