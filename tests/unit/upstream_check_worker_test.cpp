#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/scheduler_catalog.hpp"
#include "internal/upstream/load_balancer_client.hpp"
#include "internal/upstream/upstream_check_worker.hpp"
#include "internal/upstream/upstream_reconciler.hpp"
#include "internal/util/errors.hpp"
#include "rackwise/v1.hpp"

namespace {

using namespace std::chrono_literals;

using rackwise::upstream::UpstreamCheckWorker;
using rackwise::upstream::UpstreamReconciler;

// Counts passes; optionally fails every listing.
class CountingCatalog : public rackwise::catalog::SchedulerCatalog {
 public:
  std::vector<rackwise::v1::Request> ActiveRequests() override {
    ++passes;
    if (fail) {
      throw rackwise::util::BackendFailure("catalog unavailable");
    }
    return {};
  }

  std::optional<std::string> InUseDeployId(const std::string&) override {
    return std::nullopt;
  }

  std::optional<rackwise::v1::Deploy> GetDeploy(const std::string&, const std::string&) override {
    return std::nullopt;
  }

  std::vector<rackwise::v1::Task> ActiveTasksForRequest(const std::string&) override {
    return {};
  }

  std::atomic<int>  passes{0};
  std::atomic<bool> fail{false};
};

class UnusedLoadBalancer : public rackwise::upstream::LoadBalancerClient {
 public:
  std::vector<rackwise::v1::UpstreamInfo> GetUpstreamsForTasks(const std::vector<rackwise::v1::Task>&, const std::string&,
                                                               const std::optional<std::string>&, std::uint32_t) override {
    return {};
  }

  std::vector<rackwise::v1::UpstreamInfo> GetRecordedUpstreams(const std::string&) override {
    return {};
  }

  rackwise::v1::LoadBalancerUpdate SubmitRemoval(const std::string&, const std::vector<rackwise::v1::UpstreamInfo>&) override {
    throw std::logic_error("no removal expected");
  }
};

bool WaitForPasses(const CountingCatalog& catalog, int expected) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (catalog.passes.load() >= expected) return true;
    std::this_thread::sleep_for(5ms);
  }
  return false;
}

void TestWorkerRunsPassesOnInterval() {
  auto catalog    = std::make_shared<CountingCatalog>();
  auto reconciler = std::make_shared<UpstreamReconciler>(catalog, std::make_shared<UnusedLoadBalancer>());

  UpstreamCheckWorker worker(reconciler, 10ms);
  worker.Start();
  worker.Start();
  assert(WaitForPasses(*catalog, 3));
  worker.Stop();

  const int after_stop = catalog->passes.load();
  std::this_thread::sleep_for(50ms);
  assert(catalog->passes.load() == after_stop);
}

void TestFailedPassDoesNotStopWorker() {
  auto catalog  = std::make_shared<CountingCatalog>();
  catalog->fail = true;
  auto reconciler = std::make_shared<UpstreamReconciler>(catalog, std::make_shared<UnusedLoadBalancer>());

  UpstreamCheckWorker worker(reconciler, 10ms);
  worker.Start();
  assert(WaitForPasses(*catalog, 2));
}

void TestStopDoesNotWaitForInterval() {
  auto catalog    = std::make_shared<CountingCatalog>();
  auto reconciler = std::make_shared<UpstreamReconciler>(catalog, std::make_shared<UnusedLoadBalancer>());

  UpstreamCheckWorker worker(reconciler, std::chrono::hours(1));
  worker.Start();

  const auto started = std::chrono::steady_clock::now();
  worker.Stop();
  assert(std::chrono::steady_clock::now() - started < 1s);
  assert(catalog->passes.load() == 0);
}

void TestInvalidArgumentsAreRejected() {
  bool threw = false;
  try {
    UpstreamCheckWorker worker(nullptr, 10ms);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  auto reconciler = std::make_shared<UpstreamReconciler>(std::make_shared<CountingCatalog>(), std::make_shared<UnusedLoadBalancer>());
  threw           = false;
  try {
    UpstreamCheckWorker worker(reconciler, 0ms);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWorkerRunsPassesOnInterval();
  TestFailedPassDoesNotStopWorker();
  TestStopDoesNotWaitForInterval();
  TestInvalidArgumentsAreRejected();

  std::cout << "rackwise_unit_upstream_check_worker: pass\n";
  return 0;
}
