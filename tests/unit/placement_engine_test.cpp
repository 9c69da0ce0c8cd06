#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/core/placement_engine.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/topology/node_manager.hpp"
#include "internal/topology/rack_manager.hpp"
#include "rackwise/v1.hpp"

namespace {

using rackwise::core::DiscoveryResult;
using rackwise::core::NodeLossResult;
using rackwise::core::PlacementEngine;
using rackwise::core::RackCheckState;
using rackwise::model::MachineState;
using rackwise::topology::NodeManager;
using rackwise::topology::RackManager;

struct Fixture {
  Fixture()
      : store(std::make_shared<rackwise::store::memory::MemoryStore>()),
        nodes(std::make_shared<NodeManager>(store, "/nodes")),
        racks(std::make_shared<RackManager>(store, "/racks")),
        engine(nodes, racks) {}

  void AssertBucketsDisjoint() const {
    for (const auto& id : nodes->GetActive()) {
      assert(!nodes->IsDecommissioning(id) && !nodes->IsDead(id));
    }
    for (const auto& id : nodes->GetDecommissioning()) {
      assert(!nodes->IsDead(id));
    }
    for (const auto& id : racks->GetActive()) {
      assert(!racks->IsDecommissioning(id) && !racks->IsDead(id));
    }
    for (const auto& id : racks->GetDecommissioning()) {
      assert(!racks->IsDead(id));
    }
  }

  std::shared_ptr<rackwise::store::memory::MemoryStore> store;
  std::shared_ptr<NodeManager>                          nodes;
  std::shared_ptr<RackManager>                          racks;
  PlacementEngine                                       engine;
};

rackwise::v1::Offer MakeOffer(const std::string& node_id, const std::string& hostname, const std::string& rack) {
  rackwise::v1::Offer offer;
  offer.set_node_id(node_id);
  offer.set_hostname(hostname);
  if (!rack.empty()) {
    (*offer.mutable_attributes())["rackid"] = rack;
  }
  return offer;
}

rackwise::v1::PendingTaskRequest MakeTaskRequest(unsigned instances, bool rack_sensitive) {
  rackwise::v1::PendingTaskRequest task_request;
  task_request.set_pending_task_id("web-pending-1");
  auto* request = task_request.mutable_request();
  request->set_id("web");
  request->set_instances(instances);
  request->set_rack_sensitive(rack_sensitive);
  return task_request;
}

rackwise::v1::TaskId MakeTask(const std::string& id, const std::string& host, const std::string& rack) {
  rackwise::v1::TaskId task;
  task.set_id(id);
  task.set_request_id("web");
  task.set_host(host);
  task.set_rack_id(rack);
  return task;
}

void TestDiscoveryClassifiesNewRackThenActive() {
  Fixture f;

  auto first = f.engine.CheckOffer(MakeOffer("node-1", "worker-1.dc.example.com", "rack-a"));
  assert(first == DiscoveryResult::kNewRack);

  auto node = f.nodes->GetActiveObject("node_1");
  assert(node.has_value());
  assert(node->host == "worker_1");
  assert(node->rack_id == "rack_a");
  assert(f.racks->IsActive("rack_a"));

  auto second = f.engine.CheckOffer(MakeOffer("node-2", "worker-2", "rack-a"));
  assert(second == DiscoveryResult::kActive);

  // Already active: nothing to do.
  assert(!f.engine.CheckOffer(MakeOffer("node-1", "worker-1", "rack-a")).has_value());
  f.AssertBucketsDisjoint();
}

void TestMissingRackAttributeUsesDefaultRack() {
  Fixture f;
  assert(f.engine.CheckOffer(MakeOffer("n1", "h1", "")) == DiscoveryResult::kNewRack);
  assert(f.racks->IsActive("DEFAULT"));
  assert(f.nodes->GetActiveObject("n1")->rack_id == "DEFAULT");
}

void TestFairShareWithThreeRacksAndFiveInstances() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("a1", "a1", "ra"));
  f.engine.CheckOffer(MakeOffer("b1", "b1", "rb"));
  f.engine.CheckOffer(MakeOffer("c1", "c1", "rc"));
  assert(f.racks->NumActive() == 3);

  const auto task_request = MakeTaskRequest(5, true);

  // 5 / 3 ~= 1.667: one task on the rack is below the share.
  std::vector<rackwise::v1::TaskId> one_on_ra{MakeTask("t1", "a9", "ra")};
  assert(f.engine.CheckRack(MakeOffer("a1", "a1", "ra"), task_request, one_on_ra) == RackCheckState::kRackOk);

  // Two tasks reach it.
  std::vector<rackwise::v1::TaskId> two_on_ra{MakeTask("t1", "a8", "ra"), MakeTask("t2", "a9", "ra")};
  assert(f.engine.CheckRack(MakeOffer("a1", "a1", "ra"), task_request, two_on_ra) == RackCheckState::kRackSaturated);

  // An untouched rack is always fine.
  assert(f.engine.CheckRack(MakeOffer("b1", "b1", "rb"), task_request, two_on_ra) == RackCheckState::kRackOk);
}

void TestAlreadyOnNodeTakesPrecedence() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("a1", "a1.example.com", "ra"));
  f.engine.CheckOffer(MakeOffer("b1", "b1.example.com", "rb"));

  std::vector<rackwise::v1::TaskId> tasks{MakeTask("t1", "a1", "ra")};
  const auto verdict = f.engine.CheckRack(MakeOffer("a1", "a1.example.com", "ra"), MakeTaskRequest(10, true), tasks);
  assert(verdict == RackCheckState::kAlreadyOnNode);
  assert(!rackwise::core::IsAcceptable(verdict));
}

void TestNotRackSensitiveSkipsRackMath() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("a1", "a1", "ra"));

  std::vector<rackwise::v1::TaskId> tasks{MakeTask("t1", "a1", "ra"), MakeTask("t2", "a2", "ra")};
  const auto verdict = f.engine.CheckRack(MakeOffer("a1", "a1", "ra"), MakeTaskRequest(1, false), tasks);
  assert(verdict == RackCheckState::kNotRackSensitive);
  assert(rackwise::core::IsAcceptable(verdict));
}

void TestDecommissioningChecksComeFirst() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("a1", "a1", "ra"));
  f.engine.CheckOffer(MakeOffer("b1", "b1", "rb"));
  f.engine.CheckOffer(MakeOffer("b2", "b2", "rb"));

  f.nodes->Decommission("a1");
  assert(f.engine.CheckRack(MakeOffer("a1", "a1", "ra"), MakeTaskRequest(1, false), {}) == RackCheckState::kNodeDecommissioning);

  f.racks->Decommission("rb");
  assert(f.engine.CheckRack(MakeOffer("b2", "b2", "rb"), MakeTaskRequest(1, false), {}) == RackCheckState::kRackDecommissioning);
  f.AssertBucketsDisjoint();
}

void TestDecommissioningNodeIsNotResurrectedByOffer() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("a1", "a1", "ra"));
  f.nodes->Decommission("a1");

  assert(f.engine.CheckOffer(MakeOffer("a1", "a1", "ra")) == DiscoveryResult::kNodeDecommissioning);
  assert(!f.nodes->IsActive("a1"));

  f.nodes->MarkAsDecommissioned(*f.nodes->GetDecommissioningObject("a1"));
  assert(f.engine.CheckOffer(MakeOffer("a1", "a1", "ra")) == DiscoveryResult::kNodeDecommissioning);
  assert(f.nodes->GetDecommissioningObject("a1")->state == MachineState::kDecommissioned);
  f.AssertBucketsDisjoint();
}

void TestNodeInDecommissioningRackIsSavedButClassified() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("a1", "a1", "ra"));
  f.racks->Decommission("ra");

  assert(f.engine.CheckOffer(MakeOffer("a2", "a2", "ra")) == DiscoveryResult::kRackDecommissioning);
  assert(f.nodes->IsActive("a2"));
  assert(!f.racks->IsActive("ra"));
  f.AssertBucketsDisjoint();
}

void TestRackDiesWithItsLastNode() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("A", "A", "R"));
  f.engine.CheckOffer(MakeOffer("B", "B", "R"));

  assert(f.engine.NodeLost("A") == NodeLossResult::kNodeDead);
  assert(f.nodes->IsDead("A"));
  assert(f.racks->IsActive("R"));

  assert(f.engine.NodeLost("B") == NodeLossResult::kNodeAndRackDead);
  assert(f.racks->IsDead("R"));
  assert(!f.racks->IsActive("R"));

  // Duplicate and unknown notifications are ignored.
  assert(f.engine.NodeLost("B") == NodeLossResult::kIgnored);
  assert(f.engine.NodeLost("nobody") == NodeLossResult::kIgnored);
  f.AssertBucketsDisjoint();
}

void TestLastNodeOfDecommissioningRackLeavesRackInPlace() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("A", "A", "R"));
  f.racks->Decommission("R");

  assert(f.engine.NodeLost("A") == NodeLossResult::kNodeDead);
  assert(f.nodes->IsDead("A"));
  assert(f.racks->IsDecommissioning("R"));
  assert(!f.racks->IsDead("R"));
  f.AssertBucketsDisjoint();
}

void TestLossOfDecommissioningNodeIsIgnored() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("A", "A", "R"));
  f.nodes->Decommission("A");
  assert(f.engine.NodeLost("A") == NodeLossResult::kIgnored);
  assert(!f.nodes->IsDead("A"));
}

void TestDeadNodeAndRackComeBackOnOffer() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("A", "A", "R"));
  assert(f.engine.NodeLost("A") == NodeLossResult::kNodeAndRackDead);

  assert(f.engine.CheckOffer(MakeOffer("A", "A", "R")) == DiscoveryResult::kNewRack);
  assert(f.nodes->IsActive("A") && !f.nodes->IsDead("A"));
  assert(f.racks->IsActive("R") && !f.racks->IsDead("R"));
  f.AssertBucketsDisjoint();
}

void TestResyncRebuildsActiveBuckets() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("stale", "stale", "old-rack"));
  f.engine.CheckOffer(MakeOffer("gone", "gone", "ra"));
  f.engine.CheckOffer(MakeOffer("retiring", "retiring", "ra"));
  f.nodes->Decommission("retiring");

  rackwise::v1::Roster roster;
  auto add = [&roster](const std::string& id, const std::string& rack) {
    auto* entry = roster.add_nodes();
    entry->set_id(id);
    entry->set_hostname(id + ".example.com");
    if (!rack.empty()) (*entry->mutable_attributes())["rackid"] = rack;
  };
  add("n-1", "ra");
  add("n-2", "ra");
  add("n-3", "rb");
  add("n-4", "");
  add("retiring", "ra");

  const auto summary = f.engine.LoadRacksFromMaster(roster);
  assert(summary.racks_cleared == 2);
  assert(summary.nodes_cleared == 2);
  assert(summary.new_racks == 3);
  assert(summary.active_nodes == 4);

  assert((f.nodes->GetActive() == std::vector<std::string>{"n_1", "n_2", "n_3", "n_4"}));
  assert((f.racks->GetActive() == std::vector<std::string>{"DEFAULT", "ra", "rb"}));
  assert(f.nodes->IsDecommissioning("retiring"));
  f.AssertBucketsDisjoint();
}

void TestResyncSkipsEntriesWithUnusableIds() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("keep", "keep", "ra"));

  rackwise::v1::Roster roster;
  auto add = [&roster](const std::string& id, const std::string& rack) {
    auto* entry = roster.add_nodes();
    entry->set_id(id);
    entry->set_hostname("host-" + id);
    (*entry->mutable_attributes())["rackid"] = rack;
  };
  add("n1", "x/y");
  add("n2", "");
  add("n3", ".");
  add("..", "rb");
  add("", "rb");
  add("keep", "ra");
  add("n4", "rb");

  const auto summary = f.engine.LoadRacksFromMaster(roster);
  assert(summary.skipped == 5);
  assert(summary.racks_cleared == 1);
  assert(summary.nodes_cleared == 1);
  assert(summary.new_racks == 2);
  assert(summary.active_nodes == 2);

  assert((f.nodes->GetActive() == std::vector<std::string>{"keep", "n4"}));
  assert((f.racks->GetActive() == std::vector<std::string>{"ra", "rb"}));
  f.AssertBucketsDisjoint();
}

void TestResyncWithOnlyUnusableEntriesStillRuns() {
  Fixture f;
  f.engine.CheckOffer(MakeOffer("old", "old", "ra"));

  rackwise::v1::Roster roster;
  auto* entry = roster.add_nodes();
  entry->set_id("n1");
  entry->set_hostname("n1");
  (*entry->mutable_attributes())["rackid"] = "x/y";

  const auto summary = f.engine.LoadRacksFromMaster(roster);
  assert(summary.skipped == 1);
  assert(summary.active_nodes == 0);
  assert(f.nodes->NumActive() == 0);
  assert(f.racks->NumActive() == 0);
  f.AssertBucketsDisjoint();
}

void TestNoActiveRackAndNoInstancesIsSaturated() {
  Fixture f;
  // Nothing registered: zero racks to share across.
  const auto offer = MakeOffer("a1", "a1", "ra");
  assert(f.engine.CheckRack(offer, MakeTaskRequest(0, true), {}) == RackCheckState::kRackSaturated);
  assert(f.engine.CheckRack(offer, MakeTaskRequest(3, true), {}) == RackCheckState::kRackOk);
}

void TestRacingLifecycleCallsKeepBucketsDisjoint() {
  Fixture f;
  const std::vector<std::string> node_ids{"n1", "n2", "n3", "n4", "n5", "n6"};
  auto rack_of = [](std::size_t i) { return i % 2 == 0 ? std::string("ra") : std::string("rb"); };

  rackwise::v1::Roster roster;
  for (std::size_t i = 0; i < node_ids.size(); ++i) {
    auto* entry = roster.add_nodes();
    entry->set_id(node_ids[i]);
    entry->set_hostname(node_ids[i]);
    (*entry->mutable_attributes())["rackid"] = rack_of(i);
  }

  std::vector<std::thread> workers;
  for (int t = 0; t < 3; ++t) {
    workers.emplace_back([&] {
      for (int round = 0; round < 50; ++round) {
        for (std::size_t i = 0; i < node_ids.size(); ++i) {
          f.engine.CheckOffer(MakeOffer(node_ids[i], node_ids[i], rack_of(i)));
        }
      }
    });
    workers.emplace_back([&] {
      for (int round = 0; round < 50; ++round) {
        for (const auto& id : node_ids) {
          f.engine.NodeLost(id);
        }
      }
    });
  }
  workers.emplace_back([&] {
    for (int round = 0; round < 20; ++round) {
      f.engine.LoadRacksFromMaster(roster);
    }
  });
  for (auto& worker : workers) {
    worker.join();
  }

  f.AssertBucketsDisjoint();
  // Every node ends up somewhere.
  for (const auto& id : node_ids) {
    assert(f.nodes->IsActive(id) || f.nodes->IsDead(id));
  }
}

void TestDiscoveryLogsNameTheirSource() {
  std::ostringstream captured;
  auto               previous = spdlog::default_logger();
  auto               logger   = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  Fixture f;
  f.engine.CheckOffer(MakeOffer("a1", "a1", "ra"));
  f.engine.CheckOffer(MakeOffer("a2", "a2", "ra"));

  rackwise::v1::Roster roster;
  auto* entry = roster.add_nodes();
  entry->set_id("b1");
  entry->set_hostname("b1");
  (*entry->mutable_attributes())["rackid"] = "rb";
  f.engine.LoadRacksFromMaster(roster);

  spdlog::set_default_logger(previous);

  const auto text = captured.str();
  assert(text.find("discovered new rack source=offer node_id=a1") != std::string::npos);
  assert(text.find("discovered new node in existing rack source=offer node_id=a2") != std::string::npos);
  assert(text.find("discovered new rack source=roster node_id=b1") != std::string::npos);
}

void TestEvaluateOfferRegistersBeforeVerdict() {
  Fixture f;
  const auto evaluation = f.engine.EvaluateOffer(MakeOffer("a1", "a1", "ra"), MakeTaskRequest(2, true), {});
  assert(evaluation.discovery == DiscoveryResult::kNewRack);
  // One active rack, share of 2: an empty rack accepts.
  assert(evaluation.verdict == RackCheckState::kRackOk);
}

} // namespace

int main() {
  TestDiscoveryClassifiesNewRackThenActive();
  TestMissingRackAttributeUsesDefaultRack();
  TestFairShareWithThreeRacksAndFiveInstances();
  TestAlreadyOnNodeTakesPrecedence();
  TestNotRackSensitiveSkipsRackMath();
  TestDecommissioningChecksComeFirst();
  TestDecommissioningNodeIsNotResurrectedByOffer();
  TestNodeInDecommissioningRackIsSavedButClassified();
  TestRackDiesWithItsLastNode();
  TestLastNodeOfDecommissioningRackLeavesRackInPlace();
  TestLossOfDecommissioningNodeIsIgnored();
  TestDeadNodeAndRackComeBackOnOffer();
  TestResyncRebuildsActiveBuckets();
  TestResyncSkipsEntriesWithUnusableIds();
  TestResyncWithOnlyUnusableEntriesStillRuns();
  TestNoActiveRackAndNoInstancesIsSaturated();
  TestRacingLifecycleCallsKeepBucketsDisjoint();
  TestDiscoveryLogsNameTheirSource();
  TestEvaluateOfferRegistersBeforeVerdict();

  std::cout << "rackwise_unit_placement_engine: pass\n";
  return 0;
}
