#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/machine.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/topology/node_manager.hpp"
#include "internal/util/errors.hpp"

#if RACKWISE_STORE_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#endif

namespace {

using rackwise::store::CoordinationStore;
using rackwise::store::DeleteResult;
using rackwise::store::ErrorCode;

struct BackendFactory {
  std::string                                              name;
  std::function<std::shared_ptr<CoordinationStore>()>      make_store;
  std::function<bool()>                                    supports_restart;
  std::function<void(std::shared_ptr<CoordinationStore>&)> restart;
  std::function<void()>                                    cleanup;
};

void VerifyCreateGetSet(CoordinationStore& store) {
  assert(store.Create("/a/b/c", std::string("payload")));
  assert(store.Exists("/a"));
  assert(store.Exists("/a/b"));
  assert(store.Get("/a/b") == std::optional<std::string>(""));
  assert(store.Get("/a/b/c") == std::optional<std::string>("payload"));

  const auto again = store.Create("/a/b/c", std::string("other"));
  assert(again.code == ErrorCode::AlreadyExists);
  assert(store.Get("/a/b/c") == std::optional<std::string>("payload"));

  assert(store.Create("/a/marker"));
  assert(store.Get("/a/marker") == std::optional<std::string>(""));

  assert(store.SetData("/a/b/c", "updated"));
  assert(store.Get("/a/b/c") == std::optional<std::string>("updated"));

  assert(store.SetData("/a/missing", "x").code == ErrorCode::NotFound);
  assert(!store.Exists("/a/missing"));
  assert(!store.Get("/a/missing"));
}

void VerifyListAndDelete(CoordinationStore& store) {
  assert(store.Create("/list/zeta"));
  assert(store.Create("/list/alpha/deep"));
  assert(store.Create("/list/mid"));

  const auto children = store.ListChildren("/list");
  assert((children == std::vector<std::string>{"alpha", "mid", "zeta"}));
  assert(store.ListChildren("/nowhere").empty());

  bool threw = false;
  try {
    store.Delete("/list/alpha");
  } catch (const rackwise::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(store.Exists("/list/alpha/deep"));

  assert(store.Delete("/list/alpha/deep") == DeleteResult::kDeleted);
  assert(store.Delete("/list/alpha") == DeleteResult::kDeleted);
  assert(store.Delete("/list/alpha") == DeleteResult::kDidNotExist);
  assert((store.ListChildren("/list") == std::vector<std::string>{"mid", "zeta"}));
}

void VerifyMachineManagerOnBackend(const std::shared_ptr<CoordinationStore>& store) {
  rackwise::topology::NodeManager nodes(store, "/topology/nodes");
  nodes.Save(rackwise::model::Node{"n1", "h1", "r1", rackwise::model::MachineState::kActive});
  nodes.Save(rackwise::model::Node{"n2", "h2", "r1", rackwise::model::MachineState::kActive});
  nodes.Decommission("n1");

  assert(nodes.NumActive() == 1);
  assert(nodes.IsDecommissioning("n1"));
  assert(nodes.GetDecommissioningObject("n1")->rack_id == "r1");
  assert(nodes.GetActiveNodesInRack("r1").size() == 1);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  assert(store->Create("/durable/n1", std::string("state")));
  backend.restart(store);

  assert(store->Get("/durable/n1") == std::optional<std::string>("state"));
  assert((store->ListChildren("/durable") == std::vector<std::string>{"n1"}));
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<rackwise::store::memory::MemoryStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<CoordinationStore>&) {},
      .cleanup          = []() {},
  };
}

#if RACKWISE_STORE_SQLITE
uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("rackwise_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() {
    return std::make_shared<rackwise::store::sqlite::SqliteStore>(std::make_shared<rackwise::store::sqlite::SqliteDB>(db_path));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<CoordinationStore>& store) {
        store.reset();
        store = make_store();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackend(BackendFactory backend) {
  {
    auto store = backend.make_store();
    VerifyCreateGetSet(*store);
    VerifyListAndDelete(*store);
    VerifyMachineManagerOnBackend(store);
  }
  VerifyRestartDurability(backend);
  backend.cleanup();

  std::cout << "store parity backend " << backend.name << ": pass\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if RACKWISE_STORE_SQLITE
  RunBackend(MakeSqliteFactory());
#endif

  std::cout << "rackwise_integration_store_parity: pass\n";
  return 0;
}
