#include "memory_catalog.hpp"

namespace rackwise::catalog {

using namespace rackwise::v1;

void MemoryCatalog::PutRequest(const Request& request) {
  std::lock_guard lock(mutex_);
  requests_[request.id()] = request;
}

void MemoryCatalog::RemoveRequest(const std::string& request_id) {
  std::lock_guard lock(mutex_);
  requests_.erase(request_id);
}

void MemoryCatalog::PutDeploy(const Deploy& deploy, bool in_use) {
  std::lock_guard lock(mutex_);
  deploys_[{deploy.request_id(), deploy.id()}] = deploy;
  if (in_use) {
    in_use_[deploy.request_id()] = deploy.id();
  }
}

void MemoryCatalog::PutTask(const Task& task) {
  std::lock_guard lock(mutex_);
  tasks_[task.task_id().request_id()][task.task_id().id()] = task;
}

void MemoryCatalog::RemoveTask(const TaskId& task_id) {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id.request_id());
  if (it != tasks_.end()) {
    it->second.erase(task_id.id());
  }
}

std::vector<Request> MemoryCatalog::ActiveRequests() {
  std::lock_guard      lock(mutex_);
  std::vector<Request> out;
  out.reserve(requests_.size());
  for (const auto& [id, request] : requests_) {
    out.push_back(request);
  }
  return out;
}

std::optional<std::string> MemoryCatalog::InUseDeployId(const std::string& request_id) {
  std::lock_guard lock(mutex_);
  auto            it = in_use_.find(request_id);
  if (it == in_use_.end()) return std::nullopt;
  return it->second;
}

std::optional<Deploy> MemoryCatalog::GetDeploy(const std::string& request_id, const std::string& deploy_id) {
  std::lock_guard lock(mutex_);
  auto            it = deploys_.find({request_id, deploy_id});
  if (it == deploys_.end()) return std::nullopt;
  return it->second;
}

std::vector<Task> MemoryCatalog::ActiveTasksForRequest(const std::string& request_id) {
  std::lock_guard   lock(mutex_);
  std::vector<Task> out;
  auto              it = tasks_.find(request_id);
  if (it == tasks_.end()) return out;
  for (const auto& [id, task] : it->second) {
    out.push_back(task);
  }
  return out;
}

} // namespace rackwise::catalog
