#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rackwise::model {

enum class MachineState : std::uint8_t {
  kActive          = 0,
  kDecommissioning = 1,
  kDecommissioned  = 2,
  kDead            = 3,
};

constexpr bool IsDecommissionState(MachineState state) {
  return state == MachineState::kDecommissioning || state == MachineState::kDecommissioned;
}

std::string_view ToString(MachineState state);

/*
  A worker node as tracked by the topology store.

  host is the first label of the hostname; rack_id names the rack the
  node reported through its offer attributes.
*/
struct Node {
  std::string  id;
  std::string  host;
  std::string  rack_id;
  MachineState state = MachineState::kActive;

  bool operator==(const Node&) const = default;
};

// Racks carry nothing beyond membership and state.
struct Rack {
  std::string  id;
  MachineState state = MachineState::kActive;

  bool operator==(const Rack&) const = default;
};

// Transitions produce a new value; stored entities are never mutated in place.
template <typename Machine>
Machine WithState(Machine machine, MachineState state) {
  machine.state = state;
  return machine;
}

} // namespace rackwise::model
