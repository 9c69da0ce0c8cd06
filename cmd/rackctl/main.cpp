#include <grpcpp/grpcpp.h>

#include <iostream>
#include <optional>
#include <string>

#include "rackwise/v1_grpc.hpp"

using namespace rackwise::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rackctl <addr> list [node|rack] [active|decommissioning|dead]\n"
            << "  rackctl <addr> decommission <node|rack> <id>\n"
            << "  rackctl <addr> decommissioned <node|rack> <id>\n"
            << "  rackctl <addr> remove-dead <node|rack> <id>\n"
            << "  rackctl <addr> remove-decommissioning <node|rack> <id>\n"
            << "  rackctl <addr> lost <node_id>\n"
            << "  rackctl <addr> sync-upstreams\n";
}

static std::optional<MachineKind> ParseKind(const std::string& value) {
  if (value == "node") return MACHINE_KIND_NODE;
  if (value == "rack") return MACHINE_KIND_RACK;
  if (value == "all") return MACHINE_KIND_UNSPECIFIED;
  return std::nullopt;
}

static std::optional<MachineBucket> ParseBucket(const std::string& value) {
  if (value == "active") return MACHINE_BUCKET_ACTIVE;
  if (value == "decommissioning") return MACHINE_BUCKET_DECOMMISSIONING;
  if (value == "dead") return MACHINE_BUCKET_DEAD;
  if (value == "all") return MACHINE_BUCKET_UNSPECIFIED;
  return std::nullopt;
}

static std::string StateName(MachineState state) {
  switch (state) {
    case MACHINE_STATE_ACTIVE:
      return "active";
    case MACHINE_STATE_DECOMMISSIONING:
      return "decommissioning";
    case MACHINE_STATE_DECOMMISSIONED:
      return "decommissioned";
    case MACHINE_STATE_DEAD:
      return "dead";
    default:
      return "unknown";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TopologyService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListMachinesRequest req;
    if (argc >= 4) {
      auto kind = ParseKind(argv[3]);
      if (!kind) {
        std::cerr << "unsupported kind: " << argv[3] << "\n";
        return 1;
      }
      req.set_kind(*kind);
    }
    if (argc >= 5) {
      auto bucket = ParseBucket(argv[4]);
      if (!bucket) {
        std::cerr << "unsupported bucket: " << argv[4] << "\n";
        return 1;
      }
      req.set_bucket(*bucket);
    }

    ListMachinesResponse resp;
    auto                 status = stub->ListMachines(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& machine : resp.machines()) {
      std::cout << (machine.kind() == MACHINE_KIND_NODE ? "node" : "rack") << " " << machine.id() << " state=" << StateName(machine.state());
      if (machine.kind() == MACHINE_KIND_NODE) {
        std::cout << " host=" << machine.host() << " rack=" << machine.rack_id();
      }
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "decommission" || cmd == "decommissioned" || cmd == "remove-dead" || cmd == "remove-decommissioning") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    auto kind = ParseKind(argv[3]);
    if (!kind || *kind == MACHINE_KIND_UNSPECIFIED) {
      std::cerr << "kind must be node or rack\n";
      return 1;
    }

    MachineRequest req;
    req.set_kind(*kind);
    req.set_id(argv[4]);

    MachineResponse resp;
    grpc::Status    status;
    if (cmd == "decommission") {
      status = stub->Decommission(&ctx, req, &resp);
    } else if (cmd == "decommissioned") {
      status = stub->MarkDecommissioned(&ctx, req, &resp);
    } else if (cmd == "remove-dead") {
      status = stub->RemoveDead(&ctx, req, &resp);
    } else {
      status = stub->RemoveDecommissioning(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << (resp.changed() ? "changed" : "unchanged") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lost") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    NodeLostRequest req;
    req.set_node_id(argv[3]);

    NodeLostResponse resp;
    auto             status = stub->NodeLost(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << NodeLossResult_Name(resp.result()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sync-upstreams") {
    SyncUpstreamsRequest  req;
    SyncUpstreamsResponse resp;
    auto                  status = stub->SyncUpstreams(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "checked=" << resp.requests_checked() << " skipped=" << resp.requests_skipped()
              << " reconciled=" << resp.requests_reconciled() << " removed=" << resp.upstreams_removed() << " failures=" << resp.failures()
              << "\n";
    return 0;
  }

  Usage();
  return 1;
}
