#include "internal/model/machine.hpp"

namespace rackwise::model {

std::string_view ToString(MachineState state) {
  switch (state) {
    case MachineState::kActive:
      return "ACTIVE";
    case MachineState::kDecommissioning:
      return "DECOMMISSIONING";
    case MachineState::kDecommissioned:
      return "DECOMMISSIONED";
    case MachineState::kDead:
      return "DEAD";
  }
  return "UNKNOWN";
}

} // namespace rackwise::model
