#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "internal/upstream/load_balancer_client.hpp"
#include "rackwise/v1_grpc.hpp"

namespace rackwise::upstream {

// LoadBalancerClient over rackwise.services.v1.LoadBalancerService.
class GrpcLoadBalancerClient : public LoadBalancerClient {
 public:
  explicit GrpcLoadBalancerClient(std::shared_ptr<::grpc::Channel> channel,
                                  std::chrono::milliseconds      deadline = std::chrono::seconds(10));

  std::vector<rackwise::v1::UpstreamInfo> GetUpstreamsForTasks(const std::vector<rackwise::v1::Task>& tasks, const std::string& request_id,
                                                               const std::optional<std::string>& group,
                                                               std::uint32_t                     port_index) override;

  std::vector<rackwise::v1::UpstreamInfo> GetRecordedUpstreams(const std::string& load_balancer_request_id) override;

  rackwise::v1::LoadBalancerUpdate SubmitRemoval(const std::string&                             load_balancer_request_id,
                                                 const std::vector<rackwise::v1::UpstreamInfo>& upstreams) override;

 private:
  std::unique_ptr<rackwise::v1::LoadBalancerService::Stub> stub_;
  std::chrono::milliseconds                                deadline_;
};

} // namespace rackwise::upstream
