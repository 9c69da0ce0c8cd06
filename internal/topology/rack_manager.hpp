#pragma once

#include <memory>
#include <string>

#include "internal/model/machine.hpp"
#include "internal/topology/machine_manager.hpp"

namespace rackwise::topology {

extern template class MachineManager<model::Rack>;

class RackManager : public MachineManager<model::Rack> {
 public:
  RackManager(std::shared_ptr<store::CoordinationStore> store, std::string root);
};

} // namespace rackwise::topology
