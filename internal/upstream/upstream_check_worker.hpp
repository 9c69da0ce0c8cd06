#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/upstream/upstream_reconciler.hpp"

namespace rackwise::upstream {

/*
  Runs UpstreamReconciler::SyncUpstreams on a fixed interval.
  A failed pass is logged; the next one runs on schedule.
*/
class UpstreamCheckWorker {
 public:
  UpstreamCheckWorker(std::shared_ptr<UpstreamReconciler> reconciler, std::chrono::milliseconds interval);
  ~UpstreamCheckWorker();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<UpstreamReconciler> reconciler_;
  std::chrono::milliseconds           interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace rackwise::upstream
