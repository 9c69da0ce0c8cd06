#include "internal/topology/node_manager.hpp"

#include <utility>

namespace rackwise::topology {

template class MachineManager<model::Node>;

NodeManager::NodeManager(std::shared_ptr<store::CoordinationStore> store, std::string root)
    : MachineManager<model::Node>(std::move(store), std::move(root)) {}

std::vector<model::Node> NodeManager::GetActiveNodesInRack(const std::string& rack_id) const {
  std::vector<model::Node> nodes;
  for (auto& node : GetActiveObjects()) {
    if (node.rack_id == rack_id) {
      nodes.push_back(std::move(node));
    }
  }
  return nodes;
}

} // namespace rackwise::topology
