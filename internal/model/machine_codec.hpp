#pragma once

#include <string>
#include <string_view>

#include "internal/model/machine.hpp"
#include "rackwise/v1.hpp"

namespace rackwise::model {

/*
  Byte form of stored machines.

  Entities are written as protobuf JSON (NodeRecord / RackRecord). Markers
  created without payload decode from the path id and the state implied by
  the bucket they were read from.
*/

rackwise::v1::MachineState ToProto(MachineState state);
MachineState               FromProto(rackwise::v1::MachineState state);

std::string EncodeNode(const Node& node);
Node        DecodeNode(std::string_view id, const std::string& bytes, MachineState bucket_state);

std::string EncodeRack(const Rack& rack);
Rack        DecodeRack(std::string_view id, const std::string& bytes, MachineState bucket_state);

rackwise::v1::MachineRecord ToMachineRecord(const Node& node);
rackwise::v1::MachineRecord ToMachineRecord(const Rack& rack);

} // namespace rackwise::model
