#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rackwise/v1.hpp"

namespace rackwise::upstream {

/*
  The external load balancer, reduced to what reconciliation needs.

  Implementations raise util::BackendFailure when the service cannot be
  reached or answers with an error.
*/
class LoadBalancerClient {
 public:
  virtual ~LoadBalancerClient() = default;

  // Upstreams the given tasks should be registered as.
  virtual std::vector<rackwise::v1::UpstreamInfo> GetUpstreamsForTasks(const std::vector<rackwise::v1::Task>& tasks,
                                                                       const std::string&                     request_id,
                                                                       const std::optional<std::string>&      group,
                                                                       std::uint32_t                          port_index) = 0;

  // Upstreams the load balancer currently holds for a request.
  virtual std::vector<rackwise::v1::UpstreamInfo> GetRecordedUpstreams(const std::string& load_balancer_request_id) = 0;

  virtual rackwise::v1::LoadBalancerUpdate SubmitRemoval(const std::string&                             load_balancer_request_id,
                                                         const std::vector<rackwise::v1::UpstreamInfo>& upstreams) = 0;
};

} // namespace rackwise::upstream
