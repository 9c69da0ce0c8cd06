#pragma once

#include "rackwise/v1.hpp"
#include "service_context.hpp"

namespace rackwise::service {

/*
  Transport-independent TopologyService.

  Sanitizes and validates requests, drives the placement engine and the
  machine managers, and maps results onto response messages. Errors are
  thrown as util:: exceptions (std::invalid_argument for malformed requests).
*/
class TopologyService {
 public:
  explicit TopologyService(ServiceContext ctx);

  rackwise::v1::EvaluateOfferResponse EvaluateOffer(const rackwise::v1::EvaluateOfferRequest& req);
  rackwise::v1::CheckOfferResponse    CheckOffer(const rackwise::v1::CheckOfferRequest& req);
  rackwise::v1::NodeLostResponse      NodeLost(const rackwise::v1::NodeLostRequest& req);
  rackwise::v1::LoadRosterResponse    LoadRoster(const rackwise::v1::LoadRosterRequest& req);

  rackwise::v1::ListMachinesResponse ListMachines(const rackwise::v1::ListMachinesRequest& req);
  rackwise::v1::MachineResponse      Decommission(const rackwise::v1::MachineRequest& req);
  rackwise::v1::MachineResponse      MarkDecommissioned(const rackwise::v1::MachineRequest& req);
  rackwise::v1::MachineResponse      RemoveDead(const rackwise::v1::MachineRequest& req);
  rackwise::v1::MachineResponse      RemoveDecommissioning(const rackwise::v1::MachineRequest& req);

  rackwise::v1::SyncUpstreamsResponse SyncUpstreams(const rackwise::v1::SyncUpstreamsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace rackwise::service
