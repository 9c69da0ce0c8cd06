#include "upstream_check_worker.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace rackwise::upstream {

UpstreamCheckWorker::UpstreamCheckWorker(std::shared_ptr<UpstreamReconciler> reconciler, std::chrono::milliseconds interval)
    : reconciler_(std::move(reconciler)), interval_(interval) {
  if (!reconciler_) {
    throw std::invalid_argument("UpstreamCheckWorker: reconciler is null");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("UpstreamCheckWorker: interval must be positive");
  }
}

UpstreamCheckWorker::~UpstreamCheckWorker() {
  Stop();
}

void UpstreamCheckWorker::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&UpstreamCheckWorker::Loop, this);
  RACKWISE_LOG_INFO("upstream check worker started", {observability::IntField("interval_ms", interval_.count())});
}

void UpstreamCheckWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void UpstreamCheckWorker::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
      break;
    }

    lock.unlock();
    try {
      reconciler_->SyncUpstreams();
    } catch (const std::exception& e) {
      RACKWISE_LOG_ERROR("upstream check pass failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace rackwise::upstream
