#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/store/api/paths.hpp"
#include "internal/topology/machine_traits.hpp"
#include "internal/topology/store_errors.hpp"
#include "internal/util/errors.hpp"

namespace rackwise::topology {

/*
  Persistent three-bucket registry of one machine kind.

  Layout under the configured root:

    {root}/active/{id}            full entity, or an empty marker
    {root}/decommissioning/{id}   entity with state DECOMMISSIONING or DECOMMISSIONED
    {root}/dead/{id}              empty marker

  Every operation goes straight to the store; nothing is cached, so several
  scheduler processes may drive the same tree.
*/
template <typename Machine>
class MachineManager {
 public:
  using Traits = MachineTraits<Machine>;

  MachineManager(std::shared_ptr<store::CoordinationStore> store, std::string root)
      : store_(std::move(store)), root_(std::move(root)) {
    if (!store_) {
      throw std::invalid_argument("MachineManager: store is null");
    }
    store::ValidatePath(root_);
  }

  virtual ~MachineManager() = default;

  const std::string& Root() const {
    return root_;
  }

  std::string ActiveRoot() const {
    return store::MakePath(root_, kActiveBucket);
  }
  std::string DecommissioningRoot() const {
    return store::MakePath(root_, kDecommissioningBucket);
  }
  std::string DeadRoot() const {
    return store::MakePath(root_, kDeadBucket);
  }

  // ---- reads ----

  std::vector<Machine> GetActiveObjects() const {
    return GetObjects(ActiveRoot(), model::MachineState::kActive);
  }
  std::vector<Machine> GetDecommissioningObjects() const {
    return GetObjects(DecommissioningRoot(), model::MachineState::kDecommissioning);
  }
  std::vector<Machine> GetDeadObjects() const {
    return GetObjects(DeadRoot(), model::MachineState::kDead);
  }

  std::optional<Machine> GetActiveObject(const std::string& id) const {
    return GetObject(ActiveRoot(), id, model::MachineState::kActive);
  }
  std::optional<Machine> GetDecommissioningObject(const std::string& id) const {
    return GetObject(DecommissioningRoot(), id, model::MachineState::kDecommissioning);
  }
  std::optional<Machine> GetDeadObject(const std::string& id) const {
    return GetObject(DeadRoot(), id, model::MachineState::kDead);
  }

  std::vector<std::string> GetActive() const {
    return store_->ListChildren(ActiveRoot());
  }
  std::vector<std::string> GetDecommissioning() const {
    return store_->ListChildren(DecommissioningRoot());
  }
  std::vector<std::string> GetDead() const {
    return store_->ListChildren(DeadRoot());
  }

  std::size_t NumActive() const {
    return GetActive().size();
  }
  std::size_t NumDecommissioning() const {
    return GetDecommissioning().size();
  }
  std::size_t NumDead() const {
    return GetDead().size();
  }

  bool IsActive(const std::string& id) const {
    return store_->Exists(store::MakePath(ActiveRoot(), id));
  }
  bool IsDecommissioning(const std::string& id) const {
    return store_->Exists(store::MakePath(DecommissioningRoot(), id));
  }
  bool IsDead(const std::string& id) const {
    return store_->Exists(store::MakePath(DeadRoot(), id));
  }

  // ---- transitions ----

  // Writes the entity under active/. An existing entry is left untouched.
  void Save(const Machine& machine) {
    const auto path   = store::MakePath(ActiveRoot(), Traits::Id(machine));
    const auto result = store_->Create(path, Traits::Encode(machine));
    if (result.code == store::ErrorCode::AlreadyExists) {
      RACKWISE_LOG_WARN("machine already active", {observability::StringField("kind", Traits::kKind),
                                                    observability::StringField("path", path)});
      return;
    }
    ThrowIfStoreError(result, "save " + path);
  }

  // Empty active marker, used when a dead machine is brought back.
  void AddToActive(const std::string& id) {
    CreateMarker(store::MakePath(ActiveRoot(), id));
  }

  // Moves an active machine to decommissioning/ with state DECOMMISSIONING.
  void Decommission(const std::string& id) {
    const auto machine = GetActiveObject(id);
    if (!machine) {
      throw util::NotFound(std::string(Traits::kKind) + " " + id + " is not active");
    }

    const auto path  = store::MakePath(DecommissioningRoot(), id);
    const auto bytes = Traits::Encode(model::WithState(*machine, model::MachineState::kDecommissioning));
    auto       result = store_->Create(path, bytes);
    if (result.code == store::ErrorCode::AlreadyExists) {
      result = store_->SetData(path, bytes);
    }
    ThrowIfStoreError(result, "decommission " + path);

    store_->Delete(store::MakePath(ActiveRoot(), id));
    RACKWISE_LOG_INFO("machine decommissioning", {observability::StringField("kind", Traits::kKind),
                                                  observability::StringField("id", id)});
  }

  // Rewrites the decommissioning entry with state DECOMMISSIONED.
  void MarkAsDecommissioned(const Machine& machine) {
    const auto path   = store::MakePath(DecommissioningRoot(), Traits::Id(machine));
    const auto result = store_->SetData(
        path, Traits::Encode(model::WithState(machine, model::MachineState::kDecommissioned)));
    if (result.code == store::ErrorCode::NotFound) {
      RACKWISE_LOG_WARN("decommissioning entry vanished before it was marked decommissioned",
                        {observability::StringField("kind", Traits::kKind), observability::StringField("path", path)});
      return;
    }
    ThrowIfStoreError(result, "mark decommissioned " + path);
  }

  void MarkAsDead(const std::string& id) {
    store_->Delete(store::MakePath(ActiveRoot(), id));
    CreateMarker(store::MakePath(DeadRoot(), id));
  }

  store::DeleteResult RemoveDead(const std::string& id) {
    return RemoveFrom(kDeadBucket, DeadRoot(), id);
  }

  store::DeleteResult RemoveDecommissioning(const std::string& id) {
    return RemoveFrom(kDecommissioningBucket, DecommissioningRoot(), id);
  }

  // Drops every active entry; returns how many were actually deleted.
  std::size_t ClearActive() {
    std::size_t deleted = 0;
    for (const auto& id : GetActive()) {
      if (store_->Delete(store::MakePath(ActiveRoot(), id)) == store::DeleteResult::kDeleted) {
        ++deleted;
      }
    }
    return deleted;
  }

 private:
  static constexpr const char* kActiveBucket          = "active";
  static constexpr const char* kDecommissioningBucket = "decommissioning";
  static constexpr const char* kDeadBucket            = "dead";

  std::optional<Machine> GetObject(const std::string& bucket, const std::string& id, model::MachineState state) const {
    const auto bytes = store_->Get(store::MakePath(bucket, id));
    if (!bytes) {
      return std::nullopt;
    }
    return Traits::Decode(id, *bytes, state);
  }

  std::vector<Machine> GetObjects(const std::string& bucket, model::MachineState state) const {
    std::vector<Machine> objects;
    for (const auto& id : store_->ListChildren(bucket)) {
      const auto path  = store::MakePath(bucket, id);
      const auto bytes = store_->Get(path);
      if (!bytes) {
        // Removed between listing and reading.
        RACKWISE_LOG_WARN("machine vanished while listing", {observability::StringField("kind", Traits::kKind),
                                                             observability::StringField("path", path)});
        continue;
      }
      objects.push_back(Traits::Decode(id, *bytes, state));
    }
    return objects;
  }

  store::DeleteResult RemoveFrom(const char* bucket_name, const std::string& bucket, const std::string& id) {
    const auto result = store_->Delete(store::MakePath(bucket, id));
    RACKWISE_LOG_INFO("machine removed", {observability::StringField("kind", Traits::kKind), observability::StringField("bucket", bucket_name),
                                          observability::StringField("id", id),
                                          observability::StringField("result", store::ToString(result))});
    return result;
  }

  void CreateMarker(const std::string& path) {
    const auto result = store_->Create(path);
    if (result.code == store::ErrorCode::AlreadyExists) {
      return;
    }
    ThrowIfStoreError(result, "create " + path);
  }

  std::shared_ptr<store::CoordinationStore> store_;
  std::string                               root_;
};

} // namespace rackwise::topology
