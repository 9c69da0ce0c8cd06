#include "store_catalog.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/api/paths.hpp"
#include "internal/util/proto_json.hpp"

namespace rackwise::catalog {

using namespace rackwise::v1;

StoreCatalog::StoreCatalog(std::shared_ptr<store::CoordinationStore> store, std::string root)
    : store_(std::move(store)), root_(std::move(root)) {
  if (!store_) {
    throw std::invalid_argument("StoreCatalog: store is null");
  }
  if (root_ == "/") {
    root_.clear();
  }
  if (!root_.empty()) {
    store::ValidatePath(root_);
  }
}

std::string StoreCatalog::Under(std::initializer_list<std::string_view> segments) const {
  std::string path = root_.empty() ? "/" : root_;
  for (auto segment : segments) {
    path = store::MakePath(path, segment);
  }
  return path;
}

std::string StoreCatalog::RequestPath(const std::string& request_id) const {
  return Under({"requests", "active", request_id});
}

std::string StoreCatalog::InUsePath(const std::string& request_id) const {
  return Under({"deploys", request_id, "in_use"});
}

std::string StoreCatalog::DeployPath(const std::string& request_id, const std::string& deploy_id) const {
  return Under({"deploys", request_id, "ids", deploy_id});
}

std::string StoreCatalog::TaskPath(const std::string& request_id, const std::string& task_id) const {
  return Under({"tasks", "active", request_id, task_id});
}

std::vector<Request> StoreCatalog::ActiveRequests() {
  const auto           parent = Under({"requests", "active"});
  std::vector<Request> requests;
  for (const auto& id : store_->ListChildren(parent)) {
    const auto bytes = store_->Get(RequestPath(id));
    if (!bytes) {
      RACKWISE_LOG_WARN("request vanished while listing", {observability::StringField("request_id", id)});
      continue;
    }
    requests.push_back(util::FromJson<Request>(*bytes));
  }
  return requests;
}

std::optional<std::string> StoreCatalog::InUseDeployId(const std::string& request_id) {
  auto bytes = store_->Get(InUsePath(request_id));
  if (!bytes || bytes->empty()) {
    return std::nullopt;
  }
  return bytes;
}

std::optional<Deploy> StoreCatalog::GetDeploy(const std::string& request_id, const std::string& deploy_id) {
  const auto bytes = store_->Get(DeployPath(request_id, deploy_id));
  if (!bytes) {
    return std::nullopt;
  }
  return util::FromJson<Deploy>(*bytes);
}

std::vector<Task> StoreCatalog::ActiveTasksForRequest(const std::string& request_id) {
  const auto        parent = Under({"tasks", "active", request_id});
  std::vector<Task> tasks;
  for (const auto& id : store_->ListChildren(parent)) {
    const auto bytes = store_->Get(TaskPath(request_id, id));
    if (!bytes) {
      RACKWISE_LOG_WARN("task vanished while listing",
                        {observability::StringField("request_id", request_id), observability::StringField("task_id", id)});
      continue;
    }
    tasks.push_back(util::FromJson<Task>(*bytes));
  }
  return tasks;
}

} // namespace rackwise::catalog
