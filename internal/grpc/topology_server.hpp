#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/topology_service.hpp"
#include "rackwise/v1_grpc.hpp"

namespace rackwise::grpc {

class TopologyServer final : public rackwise::v1::TopologyService::Service {
 public:
  explicit TopologyServer(std::shared_ptr<rackwise::service::TopologyService> svc);

  ::grpc::Status EvaluateOffer(::grpc::ServerContext*, const rackwise::v1::EvaluateOfferRequest*, rackwise::v1::EvaluateOfferResponse*) override;
  ::grpc::Status CheckOffer(::grpc::ServerContext*, const rackwise::v1::CheckOfferRequest*, rackwise::v1::CheckOfferResponse*) override;
  ::grpc::Status NodeLost(::grpc::ServerContext*, const rackwise::v1::NodeLostRequest*, rackwise::v1::NodeLostResponse*) override;
  ::grpc::Status LoadRoster(::grpc::ServerContext*, const rackwise::v1::LoadRosterRequest*, rackwise::v1::LoadRosterResponse*) override;
  ::grpc::Status ListMachines(::grpc::ServerContext*, const rackwise::v1::ListMachinesRequest*, rackwise::v1::ListMachinesResponse*) override;
  ::grpc::Status Decommission(::grpc::ServerContext*, const rackwise::v1::MachineRequest*, rackwise::v1::MachineResponse*) override;
  ::grpc::Status MarkDecommissioned(::grpc::ServerContext*, const rackwise::v1::MachineRequest*, rackwise::v1::MachineResponse*) override;
  ::grpc::Status RemoveDead(::grpc::ServerContext*, const rackwise::v1::MachineRequest*, rackwise::v1::MachineResponse*) override;
  ::grpc::Status RemoveDecommissioning(::grpc::ServerContext*, const rackwise::v1::MachineRequest*, rackwise::v1::MachineResponse*) override;
  ::grpc::Status SyncUpstreams(::grpc::ServerContext*, const rackwise::v1::SyncUpstreamsRequest*, rackwise::v1::SyncUpstreamsResponse*) override;

 private:
  std::shared_ptr<rackwise::service::TopologyService> service_;
};

} // namespace rackwise::grpc
