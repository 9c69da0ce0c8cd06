#include "internal/model/machine_codec.hpp"

#include "internal/util/proto_json.hpp"

namespace rackwise::model {

using namespace rackwise::v1;

using util::FromJson;
using util::ToJson;

rackwise::v1::MachineState ToProto(MachineState state) {
  switch (state) {
    case MachineState::kActive:
      return MACHINE_STATE_ACTIVE;
    case MachineState::kDecommissioning:
      return MACHINE_STATE_DECOMMISSIONING;
    case MachineState::kDecommissioned:
      return MACHINE_STATE_DECOMMISSIONED;
    case MachineState::kDead:
      return MACHINE_STATE_DEAD;
  }
  return MACHINE_STATE_UNSPECIFIED;
}

MachineState FromProto(rackwise::v1::MachineState state) {
  switch (state) {
    case MACHINE_STATE_DECOMMISSIONING:
      return MachineState::kDecommissioning;
    case MACHINE_STATE_DECOMMISSIONED:
      return MachineState::kDecommissioned;
    case MACHINE_STATE_DEAD:
      return MachineState::kDead;
    case MACHINE_STATE_ACTIVE:
    default:
      return MachineState::kActive;
  }
}

std::string EncodeNode(const Node& node) {
  NodeRecord record;
  record.set_id(node.id);
  record.set_host(node.host);
  record.set_rack_id(node.rack_id);
  record.set_state(ToProto(node.state));
  return ToJson(record);
}

Node DecodeNode(std::string_view id, const std::string& bytes, MachineState bucket_state) {
  Node node;
  node.id    = std::string(id);
  node.state = bucket_state;
  if (bytes.empty()) {
    return node;
  }

  const auto record = FromJson<NodeRecord>(bytes);
  if (!record.id().empty()) node.id = record.id();
  node.host    = record.host();
  node.rack_id = record.rack_id();
  if (record.state() != MACHINE_STATE_UNSPECIFIED) node.state = FromProto(record.state());
  return node;
}

std::string EncodeRack(const Rack& rack) {
  RackRecord record;
  record.set_id(rack.id);
  record.set_state(ToProto(rack.state));
  return ToJson(record);
}

Rack DecodeRack(std::string_view id, const std::string& bytes, MachineState bucket_state) {
  Rack rack;
  rack.id    = std::string(id);
  rack.state = bucket_state;
  if (bytes.empty()) {
    return rack;
  }

  const auto record = FromJson<RackRecord>(bytes);
  if (!record.id().empty()) rack.id = record.id();
  if (record.state() != MACHINE_STATE_UNSPECIFIED) rack.state = FromProto(record.state());
  return rack;
}

MachineRecord ToMachineRecord(const Node& node) {
  MachineRecord record;
  record.set_kind(MACHINE_KIND_NODE);
  record.set_id(node.id);
  record.set_state(ToProto(node.state));
  record.set_host(node.host);
  record.set_rack_id(node.rack_id);
  return record;
}

MachineRecord ToMachineRecord(const Rack& rack) {
  MachineRecord record;
  record.set_kind(MACHINE_KIND_RACK);
  record.set_id(rack.id);
  record.set_state(ToProto(rack.state));
  return record;
}

} // namespace rackwise::model
