#pragma once

#include <string>
#include <string_view>

#include "internal/model/machine.hpp"
#include "internal/model/machine_codec.hpp"

namespace rackwise::topology {

/*
  Capabilities MachineManager needs from an entity type:
  identity, a kind label for logs, and byte (de)serialization.
*/
template <typename Machine>
struct MachineTraits;

template <>
struct MachineTraits<model::Node> {
  static constexpr const char* kKind = "node";

  static const std::string& Id(const model::Node& node) {
    return node.id;
  }

  static std::string Encode(const model::Node& node) {
    return model::EncodeNode(node);
  }

  static model::Node Decode(std::string_view id, const std::string& bytes, model::MachineState bucket_state) {
    return model::DecodeNode(id, bytes, bucket_state);
  }
};

template <>
struct MachineTraits<model::Rack> {
  static constexpr const char* kKind = "rack";

  static const std::string& Id(const model::Rack& rack) {
    return rack.id;
  }

  static std::string Encode(const model::Rack& rack) {
    return model::EncodeRack(rack);
  }

  static model::Rack Decode(std::string_view id, const std::string& bytes, model::MachineState bucket_state) {
    return model::DecodeRack(id, bytes, bucket_state);
  }
};

} // namespace rackwise::topology
