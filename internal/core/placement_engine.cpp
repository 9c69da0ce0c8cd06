#include "placement_engine.hpp"

#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/api/paths.hpp"
#include "internal/util/names.hpp"

namespace rackwise::core {

using namespace rackwise::v1;

namespace {

using observability::IntField;
using observability::SizeField;
using observability::StringField;

constexpr std::string_view kFromOffer  = "offer";
constexpr std::string_view kFromRoster = "roster";

struct LocalRosterEntry {
  std::string id;
  std::string hostname;
  std::string rack_id;
};

// Reason the id cannot be a store path segment, empty when it can.
std::optional<std::string> SegmentProblem(const std::string& id) {
  try {
    store::ValidateSegment(id);
  } catch (const std::invalid_argument& e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

} // namespace

bool IsAcceptable(RackCheckState state) {
  return state == RackCheckState::kRackOk || state == RackCheckState::kNotRackSensitive;
}

std::string_view ToString(RackCheckState state) {
  switch (state) {
    case RackCheckState::kAlreadyOnNode:
      return "ALREADY_ON_NODE";
    case RackCheckState::kNodeSaturated:
      return "NODE_SATURATED";
    case RackCheckState::kRackSaturated:
      return "RACK_SATURATED";
    case RackCheckState::kRackOk:
      return "RACK_OK";
    case RackCheckState::kNotRackSensitive:
      return "NOT_RACK_SENSITIVE";
    case RackCheckState::kNodeDecommissioning:
      return "NODE_DECOMMISSIONING";
    case RackCheckState::kRackDecommissioning:
      return "RACK_DECOMMISSIONING";
  }
  return "UNKNOWN";
}

std::string_view ToString(DiscoveryResult result) {
  switch (result) {
    case DiscoveryResult::kNewRack:
      return "NEW_RACK";
    case DiscoveryResult::kActive:
      return "ACTIVE";
    case DiscoveryResult::kNodeDecommissioning:
      return "NODE_DECOMMISSIONING";
    case DiscoveryResult::kRackDecommissioning:
      return "RACK_DECOMMISSIONING";
  }
  return "UNKNOWN";
}

std::string_view ToString(NodeLossResult result) {
  switch (result) {
    case NodeLossResult::kIgnored:
      return "IGNORED";
    case NodeLossResult::kNodeDead:
      return "NODE_DEAD";
    case NodeLossResult::kNodeAndRackDead:
      return "NODE_AND_RACK_DEAD";
  }
  return "UNKNOWN";
}

PlacementEngine::PlacementEngine(std::shared_ptr<topology::NodeManager> nodes, std::shared_ptr<topology::RackManager> racks,
                                 TopologyOptions options)
    : nodes_(std::move(nodes)), racks_(std::move(racks)), options_(std::move(options)) {
  if (!nodes_ || !racks_) {
    throw std::invalid_argument("PlacementEngine: node and rack managers are required");
  }
}

std::string PlacementEngine::RackIdOf(const google::protobuf::Map<std::string, std::string>& attributes) const {
  const auto it = attributes.find(options_.rack_id_attribute_key);
  if (it == attributes.end()) {
    return util::SafeId(options_.default_rack_id);
  }
  return util::SafeId(it->second);
}

RackCheckState PlacementEngine::CheckRack(const Offer& offer, const PendingTaskRequest& task_request,
                                          const std::vector<TaskId>& active_tasks) const {
  const auto node_id = util::SafeId(offer.node_id());
  const auto host    = util::HostFromHostname(offer.hostname());
  const auto rack_id = RackIdOf(offer.attributes());

  if (nodes_->IsDecommissioning(node_id)) {
    return RackCheckState::kNodeDecommissioning;
  }
  if (racks_->IsDecommissioning(rack_id)) {
    return RackCheckState::kRackDecommissioning;
  }

  const auto& request = task_request.request();
  if (!request.rack_sensitive()) {
    return RackCheckState::kNotRackSensitive;
  }

  std::unordered_map<std::string, int> rack_usage;
  for (const auto& task : active_tasks) {
    if (task.host() == host) {
      RACKWISE_LOG_DEBUG("task already on node", {StringField("pending_task_id", task_request.pending_task_id()),
                                                   StringField("host", host), StringField("task_id", task.id())});
      return RackCheckState::kAlreadyOnNode;
    }
    ++rack_usage[task.rack_id()];
  }

  const auto num_racks   = racks_->NumActive();
  const auto usage       = rack_usage.find(rack_id);
  const int  num_on_rack = usage == rack_usage.end() ? 0 : usage->second;

  // With no active rack the share is unbounded for a positive instance count
  // and undefined for zero, which never accepts.
  bool rack_ok = request.instances() > 0;
  if (num_racks > 0) {
    const double num_per_rack = static_cast<double>(request.instances()) / static_cast<double>(num_racks);
    rack_ok                   = static_cast<double>(num_on_rack) < num_per_rack;
  }

  RACKWISE_LOG_DEBUG("rack check", {StringField("pending_task_id", task_request.pending_task_id()), StringField("rack_id", rack_id),
                                     SizeField("num_racks", num_racks), IntField("num_on_rack", num_on_rack),
                                     IntField("instances", request.instances())});

  return rack_ok ? RackCheckState::kRackOk : RackCheckState::kRackSaturated;
}

model::MachineState PlacementEngine::InitialState(const std::string& node_id) const {
  if (!nodes_->IsDecommissioning(node_id)) {
    return model::MachineState::kActive;
  }
  // Keeps DECOMMISSIONING vs DECOMMISSIONED as stored.
  const auto decommissioning = nodes_->GetDecommissioningObject(node_id);
  return decommissioning ? decommissioning->state : model::MachineState::kActive;
}

model::Node PlacementEngine::NodeFrom(const std::string& id, const std::string& hostname, const std::string& rack_id) const {
  const auto node_id = util::SafeId(id);
  return model::Node{node_id, util::HostFromHostname(hostname), rack_id, InitialState(node_id)};
}

DiscoveryResult PlacementEngine::RegisterNode(const model::Node& node, std::string_view source) {
  if (model::IsDecommissionState(node.state)) {
    return DiscoveryResult::kNodeDecommissioning;
  }

  if (nodes_->IsDead(node.id)) {
    nodes_->RemoveDead(node.id);
  }

  nodes_->Save(node);

  if (racks_->IsDecommissioning(node.rack_id)) {
    return DiscoveryResult::kRackDecommissioning;
  }

  if (racks_->IsDead(node.rack_id)) {
    racks_->RemoveDead(node.rack_id);
  }

  if (racks_->IsActive(node.rack_id)) {
    RACKWISE_LOG_INFO("discovered new node in existing rack",
                      {StringField("source", source), StringField("node_id", node.id), StringField("host", node.host),
                       StringField("rack_id", node.rack_id)});
    return DiscoveryResult::kActive;
  }

  racks_->AddToActive(node.rack_id);
  RACKWISE_LOG_INFO("discovered new rack", {StringField("source", source), StringField("node_id", node.id),
                                            StringField("host", node.host), StringField("rack_id", node.rack_id)});
  return DiscoveryResult::kNewRack;
}

std::optional<DiscoveryResult> PlacementEngine::CheckOffer(const Offer& offer) {
  const auto                  node_id = util::SafeId(offer.node_id());
  std::lock_guard<std::mutex> lock(topology_mutex_);
  if (nodes_->IsActive(node_id)) {
    return std::nullopt;
  }
  return RegisterNode(NodeFrom(offer.node_id(), offer.hostname(), RackIdOf(offer.attributes())), kFromOffer);
}

OfferEvaluation PlacementEngine::EvaluateOffer(const Offer& offer, const PendingTaskRequest& task_request,
                                               const std::vector<TaskId>& active_tasks) {
  OfferEvaluation evaluation;
  evaluation.discovery = CheckOffer(offer);
  evaluation.verdict   = CheckRack(offer, task_request, active_tasks);
  return evaluation;
}

ResyncSummary PlacementEngine::LoadRacksFromMaster(const Roster& roster) {
  ResyncSummary summary;

  std::vector<LocalRosterEntry> entries;
  entries.reserve(static_cast<std::size_t>(roster.nodes_size()));
  for (const auto& node : roster.nodes()) {
    LocalRosterEntry entry{util::SafeId(node.id()), node.hostname(), RackIdOf(node.attributes())};
    auto        problem = SegmentProblem(entry.id);
    if (!problem) {
      problem = SegmentProblem(entry.rack_id);
    }
    if (problem) {
      RACKWISE_LOG_WARN("skipping roster entry", {StringField("node_id", node.id()), StringField("rack_id", entry.rack_id),
                                                  StringField("reason", *problem)});
      ++summary.skipped;
      continue;
    }
    entries.push_back(std::move(entry));
  }

  std::lock_guard<std::mutex> lock(topology_mutex_);
  summary.racks_cleared = racks_->ClearActive();
  summary.nodes_cleared = nodes_->ClearActive();

  for (const auto& entry : entries) {
    const auto result = RegisterNode(NodeFrom(entry.id, entry.hostname, entry.rack_id), kFromRoster);
    switch (result) {
      case DiscoveryResult::kNewRack:
        ++summary.new_racks;
        ++summary.active_nodes;
        break;
      case DiscoveryResult::kActive:
        ++summary.active_nodes;
        break;
      default:
        break;
    }
  }

  RACKWISE_LOG_INFO("loaded topology from master",
                    {SizeField("racks_cleared", summary.racks_cleared),
                     SizeField("nodes_cleared", summary.nodes_cleared),
                     SizeField("new_racks", summary.new_racks),
                     SizeField("active_nodes", summary.active_nodes),
                     SizeField("skipped", summary.skipped)});
  return summary;
}

NodeLossResult PlacementEngine::NodeLost(const std::string& raw_node_id) {
  const auto                  node_id = util::SafeId(raw_node_id);
  std::lock_guard<std::mutex> lock(topology_mutex_);

  if (nodes_->IsDead(node_id) || nodes_->IsDecommissioning(node_id)) {
    return NodeLossResult::kIgnored;
  }

  const auto lost = nodes_->GetActiveObject(node_id);
  if (!lost) {
    RACKWISE_LOG_WARN("lost a node that was not active", {StringField("node_id", node_id)});
    return NodeLossResult::kIgnored;
  }

  nodes_->MarkAsDead(node_id);

  const auto remaining = nodes_->GetActiveNodesInRack(lost->rack_id);
  RACKWISE_LOG_INFO("node lost", {StringField("node_id", node_id), StringField("rack_id", lost->rack_id),
                                  SizeField("nodes_left_in_rack", remaining.size())});

  // A decommissioning rack keeps its one bucket.
  if (!remaining.empty() || !racks_->IsActive(lost->rack_id)) {
    return NodeLossResult::kNodeDead;
  }

  racks_->MarkAsDead(lost->rack_id);
  return NodeLossResult::kNodeAndRackDead;
}

} // namespace rackwise::core
