#include "topology_server.hpp"

#include <exception>
#include <utility>

#include "grpc_error.hpp"

namespace rackwise::grpc {

using namespace rackwise::v1;

namespace {

// Runs one service call; a client that already gave up gets CANCELLED.
template <typename Resp, typename Fn>
::grpc::Status Serve(::grpc::ServerContext* ctx, Resp* resp, Fn&& fn) {
  if (ctx != nullptr && ctx->IsCancelled()) {
    return {::grpc::StatusCode::CANCELLED, "call cancelled by client"};
  }
  try {
    *resp = fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

TopologyServer::TopologyServer(std::shared_ptr<rackwise::service::TopologyService> svc) : service_(std::move(svc)) {}

::grpc::Status TopologyServer::EvaluateOffer(::grpc::ServerContext* ctx, const EvaluateOfferRequest* req, EvaluateOfferResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->EvaluateOffer(*req); });
}

::grpc::Status TopologyServer::CheckOffer(::grpc::ServerContext* ctx, const CheckOfferRequest* req, CheckOfferResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->CheckOffer(*req); });
}

::grpc::Status TopologyServer::NodeLost(::grpc::ServerContext* ctx, const NodeLostRequest* req, NodeLostResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->NodeLost(*req); });
}

::grpc::Status TopologyServer::LoadRoster(::grpc::ServerContext* ctx, const LoadRosterRequest* req, LoadRosterResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->LoadRoster(*req); });
}

::grpc::Status TopologyServer::ListMachines(::grpc::ServerContext* ctx, const ListMachinesRequest* req, ListMachinesResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->ListMachines(*req); });
}

::grpc::Status TopologyServer::Decommission(::grpc::ServerContext* ctx, const MachineRequest* req, MachineResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->Decommission(*req); });
}

::grpc::Status TopologyServer::MarkDecommissioned(::grpc::ServerContext* ctx, const MachineRequest* req, MachineResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->MarkDecommissioned(*req); });
}

::grpc::Status TopologyServer::RemoveDead(::grpc::ServerContext* ctx, const MachineRequest* req, MachineResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->RemoveDead(*req); });
}

::grpc::Status TopologyServer::RemoveDecommissioning(::grpc::ServerContext* ctx, const MachineRequest* req, MachineResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->RemoveDecommissioning(*req); });
}

::grpc::Status TopologyServer::SyncUpstreams(::grpc::ServerContext* ctx, const SyncUpstreamsRequest* req, SyncUpstreamsResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->SyncUpstreams(*req); });
}

} // namespace rackwise::grpc
