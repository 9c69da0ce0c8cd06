#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/map.h>

#include "internal/model/machine.hpp"
#include "internal/topology/node_manager.hpp"
#include "internal/topology/rack_manager.hpp"
#include "rackwise/v1.hpp"

namespace rackwise::core {

enum class RackCheckState {
  kAlreadyOnNode,
  kNodeSaturated, // reserved, no check produces it
  kRackSaturated,
  kRackOk,
  kNotRackSensitive,
  kNodeDecommissioning,
  kRackDecommissioning,
};

bool             IsAcceptable(RackCheckState state);
std::string_view ToString(RackCheckState state);

enum class DiscoveryResult {
  kNewRack,
  kActive,
  kNodeDecommissioning,
  kRackDecommissioning,
};

std::string_view ToString(DiscoveryResult result);

enum class NodeLossResult {
  kIgnored,
  kNodeDead,
  kNodeAndRackDead,
};

std::string_view ToString(NodeLossResult result);

struct ResyncSummary {
  std::size_t racks_cleared = 0;
  std::size_t nodes_cleared = 0;
  std::size_t new_racks     = 0;
  std::size_t active_nodes  = 0;
  // Roster entries whose node or rack id is not a usable path segment.
  std::size_t skipped = 0;
};

struct OfferEvaluation {
  // Empty when the node was already active.
  std::optional<DiscoveryResult> discovery;
  RackCheckState                 verdict = RackCheckState::kNotRackSensitive;
};

struct TopologyOptions {
  std::string rack_id_attribute_key = "rackid";
  std::string default_rack_id       = "DEFAULT";
};

/*
  Rack-aware placement and topology discovery.

  Holds no topology of its own: every decision reads the node and rack
  managers, which in turn read the coordination store. Within one process the
  mutating calls (CheckOffer, LoadRacksFromMaster, NodeLost) are serialized so
  a machine never lands in two buckets; across processes interleaved
  discoveries converge because every write is an idempotent save keyed by id.
*/
class PlacementEngine {
 public:
  PlacementEngine(std::shared_ptr<topology::NodeManager> nodes, std::shared_ptr<topology::RackManager> racks,
                  TopologyOptions options = {});

  // Placement verdict for one pending task against one offer.
  RackCheckState CheckRack(const rackwise::v1::Offer& offer, const rackwise::v1::PendingTaskRequest& task_request,
                           const std::vector<rackwise::v1::TaskId>& active_tasks) const;

  // Registers the offering node (and its rack) if it is not active yet.
  std::optional<DiscoveryResult> CheckOffer(const rackwise::v1::Offer& offer);

  // CheckOffer followed by CheckRack on the registered topology.
  OfferEvaluation EvaluateOffer(const rackwise::v1::Offer& offer, const rackwise::v1::PendingTaskRequest& task_request,
                                const std::vector<rackwise::v1::TaskId>& active_tasks);

  // Drops all active nodes and racks and rebuilds them from the roster.
  // Entries with an unusable node or rack id are skipped before anything is
  // cleared.
  ResyncSummary LoadRacksFromMaster(const rackwise::v1::Roster& roster);

  NodeLossResult NodeLost(const std::string& node_id);

  // Sanitized rack id from offer or roster attributes.
  std::string RackIdOf(const google::protobuf::Map<std::string, std::string>& attributes) const;

 private:
  model::MachineState InitialState(const std::string& node_id) const;
  DiscoveryResult     RegisterNode(const model::Node& node, std::string_view source);
  model::Node         NodeFrom(const std::string& id, const std::string& hostname, const std::string& rack_id) const;

  std::shared_ptr<topology::NodeManager> nodes_;
  std::shared_ptr<topology::RackManager> racks_;
  TopologyOptions                        options_;
  std::mutex                             topology_mutex_;
};

} // namespace rackwise::core
