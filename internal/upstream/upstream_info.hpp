#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rackwise/v1.hpp"

namespace rackwise::upstream {

enum class LoadBalancerRequestType {
  kAdd,
  kRemove,
  kDeploy,
};

std::string_view ToString(LoadBalancerRequestType type);

// Identity of a request sent to the load balancer: "<request_id>-<TYPE>".
struct LoadBalancerRequestId {
  std::string             request_id;
  LoadBalancerRequestType type = LoadBalancerRequestType::kRemove;

  std::string ToString() const;
};

// Address, group and rack all have to match.
bool SameUpstream(const rackwise::v1::UpstreamInfo& a, const rackwise::v1::UpstreamInfo& b);

/*
  Recorded upstreams with no counterpart among the implied ones.

  Every recorded entry equal to some implied entry is dropped, so duplicate
  registrations of a live task are all kept off the removal list.
*/
std::vector<rackwise::v1::UpstreamInfo> ExtraUpstreams(std::vector<rackwise::v1::UpstreamInfo>        recorded,
                                                       const std::vector<rackwise::v1::UpstreamInfo>& implied);

// "{hostname}:{ports[port_index]}" per task; group falls back to "default".
std::vector<rackwise::v1::UpstreamInfo> UpstreamsForTasks(const std::vector<rackwise::v1::Task>& tasks, const std::string& request_id,
                                                          const std::optional<std::string>& group, std::uint32_t port_index);

} // namespace rackwise::upstream
