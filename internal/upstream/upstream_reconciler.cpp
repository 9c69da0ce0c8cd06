#include "upstream_reconciler.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/upstream/upstream_info.hpp"

namespace rackwise::upstream {

using namespace rackwise::v1;

namespace {

using observability::SizeField;
using observability::StringField;

bool IsFailure(LoadBalancerRequestState state) {
  switch (state) {
    case LOAD_BALANCER_REQUEST_STATE_FAILED:
    case LOAD_BALANCER_REQUEST_STATE_INVALID_REQUEST_NOOP:
    case LOAD_BALANCER_REQUEST_STATE_UNKNOWN:
      return true;
    default:
      return false;
  }
}

} // namespace

UpstreamReconciler::UpstreamReconciler(std::shared_ptr<catalog::SchedulerCatalog> catalog, std::shared_ptr<LoadBalancerClient> lb_client)
    : catalog_(std::move(catalog)), lb_client_(std::move(lb_client)) {
  if (!catalog_ || !lb_client_) {
    throw std::invalid_argument("UpstreamReconciler: catalog and load balancer client are required");
  }
}

std::shared_ptr<std::mutex> UpstreamReconciler::RequestMutex(const std::string& request_id) {
  std::lock_guard<std::mutex> lock(request_mutexes_guard_);
  auto&                       request_mutex = request_mutexes_[request_id];
  if (!request_mutex) {
    request_mutex = std::make_shared<std::mutex>();
  }
  return request_mutex;
}

UpstreamReconciler::Outcome UpstreamReconciler::SyncRequest(const Request& request, const Deploy& deploy, std::size_t* removed) {
  const auto                  request_id = request.id();
  const auto                  lb_request_id = LoadBalancerRequestId{request_id, LoadBalancerRequestType::kRemove}.ToString();
  const auto                  request_mutex = RequestMutex(request_id);
  std::lock_guard<std::mutex> lock(*request_mutex);

  std::optional<std::string> group;
  if (deploy.has_load_balancer_upstream_group()) {
    group = deploy.load_balancer_upstream_group();
  }

  const auto recorded = lb_client_->GetRecordedUpstreams(lb_request_id);
  const auto implied  = lb_client_->GetUpstreamsForTasks(catalog_->ActiveTasksForRequest(request_id), request_id, group,
                                                          deploy.load_balancer_port_index());
  const auto extra    = ExtraUpstreams(recorded, implied);

  if (extra.empty()) {
    return Outcome::kInSync;
  }

  const auto update = lb_client_->SubmitRemoval(lb_request_id, extra);
  if (IsFailure(update.state())) {
    RACKWISE_LOG_WARN("upstream removal was not accepted",
                      {StringField("request_id", request_id), StringField("load_balancer_request_id", lb_request_id),
                       StringField("state", LoadBalancerRequestState_Name(update.state())), StringField("message", update.message())});
    return Outcome::kFailed;
  }

  RACKWISE_LOG_INFO("removed extra upstreams", {StringField("request_id", request_id), SizeField("count", extra.size()),
                                                StringField("state", LoadBalancerRequestState_Name(update.state()))});
  *removed = extra.size();
  return Outcome::kRemoved;
}

ReconcileSummary UpstreamReconciler::SyncUpstreams() {
  ReconcileSummary summary;

  for (const auto& request : catalog_->ActiveRequests()) {
    ++summary.requests_checked;

    if (!request.load_balanced()) {
      ++summary.requests_skipped;
      continue;
    }

    try {
      const auto deploy_id = catalog_->InUseDeployId(request.id());
      if (!deploy_id) {
        ++summary.requests_skipped;
        continue;
      }
      const auto deploy = catalog_->GetDeploy(request.id(), *deploy_id);
      if (!deploy) {
        ++summary.requests_skipped;
        continue;
      }

      std::size_t removed = 0;
      switch (SyncRequest(request, *deploy, &removed)) {
        case Outcome::kInSync:
          break;
        case Outcome::kRemoved:
          ++summary.requests_reconciled;
          summary.upstreams_removed += removed;
          break;
        case Outcome::kFailed:
          ++summary.failures;
          break;
      }
    } catch (const std::exception& e) {
      ++summary.failures;
      RACKWISE_LOG_ERROR("upstream sync failed for request", {StringField("request_id", request.id()), StringField("error", e.what())});
    }
  }

  RACKWISE_LOG_DEBUG("upstream sync pass finished",
                     {SizeField("checked", summary.requests_checked),
                      SizeField("skipped", summary.requests_skipped),
                      SizeField("reconciled", summary.requests_reconciled),
                      SizeField("removed", summary.upstreams_removed),
                      SizeField("failures", summary.failures)});
  return summary;
}

} // namespace rackwise::upstream
