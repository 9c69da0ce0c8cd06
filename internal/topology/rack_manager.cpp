#include "internal/topology/rack_manager.hpp"

#include <utility>

namespace rackwise::topology {

template class MachineManager<model::Rack>;

RackManager::RackManager(std::shared_ptr<store::CoordinationStore> store, std::string root)
    : MachineManager<model::Rack>(std::move(store), std::move(root)) {}

} // namespace rackwise::topology
