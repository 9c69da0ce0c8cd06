#include "topology_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <vector>

#include "internal/core/placement_engine.hpp"
#include "internal/model/machine_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/topology/node_manager.hpp"
#include "internal/topology/rack_manager.hpp"
#include "internal/upstream/upstream_reconciler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace rackwise::service {

using namespace rackwise::v1;

namespace {

using observability::DoubleField;
using observability::StringField;

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      RACKWISE_LOG_DEBUG("RPC finished", {StringField("route", route), DoubleField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      RACKWISE_LOG_DEBUG("RPC finished", {StringField("route", route), DoubleField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    RACKWISE_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), DoubleField("latency_ms", elapsed_ms())});
    throw;
  }
}

DiscoveryResult ToProto(const std::optional<core::DiscoveryResult>& result) {
  if (!result) {
    return DISCOVERY_RESULT_ALREADY_ACTIVE;
  }
  switch (*result) {
    case core::DiscoveryResult::kNewRack:
      return DISCOVERY_RESULT_NEW_RACK;
    case core::DiscoveryResult::kActive:
      return DISCOVERY_RESULT_ACTIVE;
    case core::DiscoveryResult::kNodeDecommissioning:
      return DISCOVERY_RESULT_NODE_DECOMMISSIONING;
    case core::DiscoveryResult::kRackDecommissioning:
      return DISCOVERY_RESULT_RACK_DECOMMISSIONING;
  }
  return DISCOVERY_RESULT_UNSPECIFIED;
}

RackCheckResult ToProto(core::RackCheckState state) {
  switch (state) {
    case core::RackCheckState::kAlreadyOnNode:
      return RACK_CHECK_RESULT_ALREADY_ON_NODE;
    case core::RackCheckState::kNodeSaturated:
      return RACK_CHECK_RESULT_NODE_SATURATED;
    case core::RackCheckState::kRackSaturated:
      return RACK_CHECK_RESULT_RACK_SATURATED;
    case core::RackCheckState::kRackOk:
      return RACK_CHECK_RESULT_RACK_OK;
    case core::RackCheckState::kNotRackSensitive:
      return RACK_CHECK_RESULT_NOT_RACK_SENSITIVE;
    case core::RackCheckState::kNodeDecommissioning:
      return RACK_CHECK_RESULT_NODE_DECOMMISSIONING;
    case core::RackCheckState::kRackDecommissioning:
      return RACK_CHECK_RESULT_RACK_DECOMMISSIONING;
  }
  return RACK_CHECK_RESULT_UNSPECIFIED;
}

NodeLossResult ToProto(core::NodeLossResult result) {
  switch (result) {
    case core::NodeLossResult::kIgnored:
      return NODE_LOSS_RESULT_IGNORED;
    case core::NodeLossResult::kNodeDead:
      return NODE_LOSS_RESULT_NODE_DEAD;
    case core::NodeLossResult::kNodeAndRackDead:
      return NODE_LOSS_RESULT_NODE_AND_RACK_DEAD;
  }
  return NODE_LOSS_RESULT_UNSPECIFIED;
}

std::string RequireId(const MachineRequest& req) {
  if (req.id().empty()) {
    throw std::invalid_argument("machine id is required");
  }
  return util::SafeId(req.id());
}

void RequireKind(MachineKind kind) {
  if (kind != MACHINE_KIND_NODE && kind != MACHINE_KIND_RACK) {
    throw std::invalid_argument("machine kind must be NODE or RACK");
  }
}

template <typename Machine>
void AppendRecords(const std::vector<Machine>& machines, ListMachinesResponse* resp) {
  for (const auto& machine : machines) {
    *resp->add_machines() = model::ToMachineRecord(machine);
  }
}

template <typename Manager>
void AppendBucket(const Manager& manager, MachineBucket bucket, ListMachinesResponse* resp) {
  if (bucket == MACHINE_BUCKET_UNSPECIFIED || bucket == MACHINE_BUCKET_ACTIVE) {
    AppendRecords(manager.GetActiveObjects(), resp);
  }
  if (bucket == MACHINE_BUCKET_UNSPECIFIED || bucket == MACHINE_BUCKET_DECOMMISSIONING) {
    AppendRecords(manager.GetDecommissioningObjects(), resp);
  }
  if (bucket == MACHINE_BUCKET_UNSPECIFIED || bucket == MACHINE_BUCKET_DEAD) {
    AppendRecords(manager.GetDeadObjects(), resp);
  }
}

template <typename Manager>
bool MarkDecommissionedIn(Manager& manager, const std::string& id) {
  const auto machine = manager.GetDecommissioningObject(id);
  if (!machine) {
    throw util::NotFound("machine " + id + " is not decommissioning");
  }
  if (machine->state == model::MachineState::kDecommissioned) {
    return false;
  }
  manager.MarkAsDecommissioned(*machine);
  return true;
}

} // namespace

TopologyService::TopologyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.placement || !ctx_.nodes || !ctx_.racks) {
    throw std::invalid_argument("TopologyService: placement engine and machine managers are required");
  }
}

EvaluateOfferResponse TopologyService::EvaluateOffer(const EvaluateOfferRequest& req) {
  return ObserveRpc("TopologyService.EvaluateOffer", [&] {
    if (req.offer().node_id().empty()) {
      throw std::invalid_argument("offer node_id is required");
    }
    const std::vector<TaskId> active_tasks(req.active_tasks().begin(), req.active_tasks().end());
    const auto                evaluation = ctx_.placement->EvaluateOffer(req.offer(), req.task_request(), active_tasks);

    EvaluateOfferResponse resp;
    resp.set_discovery(ToProto(evaluation.discovery));
    resp.set_verdict(ToProto(evaluation.verdict));
    resp.set_acceptable(core::IsAcceptable(evaluation.verdict));
    return resp;
  });
}

CheckOfferResponse TopologyService::CheckOffer(const CheckOfferRequest& req) {
  return ObserveRpc("TopologyService.CheckOffer", [&] {
    if (req.offer().node_id().empty()) {
      throw std::invalid_argument("offer node_id is required");
    }
    CheckOfferResponse resp;
    resp.set_discovery(ToProto(ctx_.placement->CheckOffer(req.offer())));
    return resp;
  });
}

NodeLostResponse TopologyService::NodeLost(const NodeLostRequest& req) {
  return ObserveRpc("TopologyService.NodeLost", [&] {
    if (req.node_id().empty()) {
      throw std::invalid_argument("node_id is required");
    }
    NodeLostResponse resp;
    resp.set_result(ToProto(ctx_.placement->NodeLost(req.node_id())));
    return resp;
  });
}

LoadRosterResponse TopologyService::LoadRoster(const LoadRosterRequest& req) {
  return ObserveRpc("TopologyService.LoadRoster", [&] {
    const auto summary = ctx_.placement->LoadRacksFromMaster(req.roster());

    LoadRosterResponse resp;
    resp.set_racks_cleared(summary.racks_cleared);
    resp.set_nodes_cleared(summary.nodes_cleared);
    resp.set_new_racks(summary.new_racks);
    resp.set_active_nodes(summary.active_nodes);
    resp.set_skipped(summary.skipped);
    return resp;
  });
}

ListMachinesResponse TopologyService::ListMachines(const ListMachinesRequest& req) {
  return ObserveRpc("TopologyService.ListMachines", [&] {
    ListMachinesResponse resp;
    if (req.kind() == MACHINE_KIND_UNSPECIFIED || req.kind() == MACHINE_KIND_RACK) {
      AppendBucket(*ctx_.racks, req.bucket(), &resp);
    }
    if (req.kind() == MACHINE_KIND_UNSPECIFIED || req.kind() == MACHINE_KIND_NODE) {
      AppendBucket(*ctx_.nodes, req.bucket(), &resp);
    }
    return resp;
  });
}

MachineResponse TopologyService::Decommission(const MachineRequest& req) {
  return ObserveRpc("TopologyService.Decommission", [&] {
    RequireKind(req.kind());
    const auto id = RequireId(req);
    if (req.kind() == MACHINE_KIND_NODE) {
      ctx_.nodes->Decommission(id);
    } else {
      ctx_.racks->Decommission(id);
    }
    MachineResponse resp;
    resp.set_changed(true);
    return resp;
  });
}

MachineResponse TopologyService::MarkDecommissioned(const MachineRequest& req) {
  return ObserveRpc("TopologyService.MarkDecommissioned", [&] {
    RequireKind(req.kind());
    const auto id = RequireId(req);

    MachineResponse resp;
    resp.set_changed(req.kind() == MACHINE_KIND_NODE ? MarkDecommissionedIn(*ctx_.nodes, id) : MarkDecommissionedIn(*ctx_.racks, id));
    return resp;
  });
}

MachineResponse TopologyService::RemoveDead(const MachineRequest& req) {
  return ObserveRpc("TopologyService.RemoveDead", [&] {
    RequireKind(req.kind());
    const auto id     = RequireId(req);
    const auto result = req.kind() == MACHINE_KIND_NODE ? ctx_.nodes->RemoveDead(id) : ctx_.racks->RemoveDead(id);

    MachineResponse resp;
    resp.set_changed(result == store::DeleteResult::kDeleted);
    return resp;
  });
}

MachineResponse TopologyService::RemoveDecommissioning(const MachineRequest& req) {
  return ObserveRpc("TopologyService.RemoveDecommissioning", [&] {
    RequireKind(req.kind());
    const auto id = RequireId(req);
    const auto result =
        req.kind() == MACHINE_KIND_NODE ? ctx_.nodes->RemoveDecommissioning(id) : ctx_.racks->RemoveDecommissioning(id);

    MachineResponse resp;
    resp.set_changed(result == store::DeleteResult::kDeleted);
    return resp;
  });
}

SyncUpstreamsResponse TopologyService::SyncUpstreams(const SyncUpstreamsRequest&) {
  return ObserveRpc("TopologyService.SyncUpstreams", [&] {
    if (!ctx_.reconciler) {
      throw util::InvalidState("upstream reconciliation is disabled");
    }
    const auto summary = ctx_.reconciler->SyncUpstreams();

    SyncUpstreamsResponse resp;
    resp.set_requests_checked(summary.requests_checked);
    resp.set_requests_skipped(summary.requests_skipped);
    resp.set_requests_reconciled(summary.requests_reconciled);
    resp.set_upstreams_removed(summary.upstreams_removed);
    resp.set_failures(summary.failures);
    return resp;
  });
}

} // namespace rackwise::service
