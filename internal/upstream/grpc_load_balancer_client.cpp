#include "grpc_load_balancer_client.hpp"

#include <grpcpp/client_context.h>

#include <string_view>

#include "internal/upstream/upstream_info.hpp"
#include "internal/util/errors.hpp"

namespace rackwise::upstream {

using namespace rackwise::v1;

namespace {

void ThrowIfRpcFailed(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return;
  }
  throw util::BackendFailure(std::string(action) + " failed: " + status.error_message());
}

} // namespace

GrpcLoadBalancerClient::GrpcLoadBalancerClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(LoadBalancerService::NewStub(std::move(channel))), deadline_(deadline) {}

std::vector<UpstreamInfo> GrpcLoadBalancerClient::GetUpstreamsForTasks(const std::vector<Task>& tasks, const std::string& request_id,
                                                                       const std::optional<std::string>& group, std::uint32_t port_index) {
  return UpstreamsForTasks(tasks, request_id, group, port_index);
}

std::vector<UpstreamInfo> GrpcLoadBalancerClient::GetRecordedUpstreams(const std::string& load_balancer_request_id) {
  GetRequestUpstreamsRequest request;
  request.set_load_balancer_request_id(load_balancer_request_id);

  GetRequestUpstreamsResponse response;
  ::grpc::ClientContext         ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
  ThrowIfRpcFailed(stub_->GetRequestUpstreams(&ctx, request, &response), "GetRequestUpstreams");

  return {response.upstreams().begin(), response.upstreams().end()};
}

LoadBalancerUpdate GrpcLoadBalancerClient::SubmitRemoval(const std::string& load_balancer_request_id, const std::vector<UpstreamInfo>& upstreams) {
  SubmitRequestRequest request;
  request.set_load_balancer_request_id(load_balancer_request_id);
  for (const auto& upstream : upstreams) {
    *request.add_remove() = upstream;
  }

  LoadBalancerUpdate  response;
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
  ThrowIfRpcFailed(stub_->SubmitRequest(&ctx, request, &response), "SubmitRequest");
  return response;
}

} // namespace rackwise::upstream
