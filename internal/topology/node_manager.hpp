#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/model/machine.hpp"
#include "internal/topology/machine_manager.hpp"

namespace rackwise::topology {

extern template class MachineManager<model::Node>;

class NodeManager : public MachineManager<model::Node> {
 public:
  NodeManager(std::shared_ptr<store::CoordinationStore> store, std::string root);

  // Active nodes whose recorded rack is rack_id.
  std::vector<model::Node> GetActiveNodesInRack(const std::string& rack_id) const;
};

} // namespace rackwise::topology
