#include "upstream_info.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace rackwise::upstream {

using namespace rackwise::v1;

namespace {

constexpr const char* kDefaultGroup = "default";

}

std::string_view ToString(LoadBalancerRequestType type) {
  switch (type) {
    case LoadBalancerRequestType::kAdd:
      return "ADD";
    case LoadBalancerRequestType::kRemove:
      return "REMOVE";
    case LoadBalancerRequestType::kDeploy:
      return "DEPLOY";
  }
  return "UNKNOWN";
}

std::string LoadBalancerRequestId::ToString() const {
  return request_id + "-" + std::string(upstream::ToString(type));
}

bool SameUpstream(const UpstreamInfo& a, const UpstreamInfo& b) {
  return a.upstream() == b.upstream() && a.group() == b.group() && a.rack_id() == b.rack_id();
}

std::vector<UpstreamInfo> ExtraUpstreams(std::vector<UpstreamInfo> recorded, const std::vector<UpstreamInfo>& implied) {
  for (const auto& live : implied) {
    recorded.erase(std::remove_if(recorded.begin(), recorded.end(),
                                  [&live](const UpstreamInfo& candidate) { return SameUpstream(candidate, live); }),
                   recorded.end());
  }
  return recorded;
}

std::vector<UpstreamInfo> UpstreamsForTasks(const std::vector<Task>& tasks, const std::string& request_id,
                                            const std::optional<std::string>& group, std::uint32_t port_index) {
  std::vector<UpstreamInfo> upstreams;
  upstreams.reserve(tasks.size());
  for (const auto& task : tasks) {
    if (static_cast<int>(port_index) >= task.ports_size()) {
      RACKWISE_LOG_WARN("task has no port at load balancer port index",
                        {observability::StringField("request_id", request_id), observability::StringField("task_id", task.task_id().id()),
                         observability::IntField("port_index", port_index)});
      continue;
    }

    UpstreamInfo upstream;
    upstream.set_upstream(task.hostname() + ":" + std::to_string(task.ports(static_cast<int>(port_index))));
    upstream.set_group(group.value_or(kDefaultGroup));
    upstream.set_rack_id(task.task_id().rack_id());
    upstreams.push_back(std::move(upstream));
  }
  return upstreams;
}

} // namespace rackwise::upstream
