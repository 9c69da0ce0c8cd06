#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/catalog/scheduler_catalog.hpp"
#include "internal/upstream/load_balancer_client.hpp"

namespace rackwise::upstream {

struct ReconcileSummary {
  std::size_t requests_checked    = 0;
  std::size_t requests_skipped    = 0;
  std::size_t requests_reconciled = 0;
  std::size_t upstreams_removed   = 0;
  std::size_t failures            = 0;
};

/*
  Removes load balancer upstreams that no active task backs any more.

  One pass walks every active load-balanced request with a resolvable in-use
  deploy. Passes for the same request are serialized in-process; different
  requests never wait on each other.
*/
class UpstreamReconciler {
 public:
  UpstreamReconciler(std::shared_ptr<catalog::SchedulerCatalog> catalog, std::shared_ptr<LoadBalancerClient> lb_client);

  ReconcileSummary SyncUpstreams();

 private:
  enum class Outcome {
    kInSync,
    kRemoved,
    kFailed,
  };

  Outcome                     SyncRequest(const rackwise::v1::Request& request, const rackwise::v1::Deploy& deploy,
                                          std::size_t* removed);
  std::shared_ptr<std::mutex> RequestMutex(const std::string& request_id);

  std::shared_ptr<catalog::SchedulerCatalog> catalog_;
  std::shared_ptr<LoadBalancerClient>        lb_client_;

  mutable std::mutex                                           request_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> request_mutexes_;
};

} // namespace rackwise::upstream
