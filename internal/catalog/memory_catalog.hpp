#pragma once

#include <map>
#include <mutex>

#include "internal/catalog/scheduler_catalog.hpp"

namespace rackwise::catalog {

// Catalog filled directly by its owner. Used by tests and embedding programs.
class MemoryCatalog : public SchedulerCatalog {
 public:
  void PutRequest(const rackwise::v1::Request& request);
  void RemoveRequest(const std::string& request_id);
  void PutDeploy(const rackwise::v1::Deploy& deploy, bool in_use);
  void PutTask(const rackwise::v1::Task& task);
  void RemoveTask(const rackwise::v1::TaskId& task_id);

  std::vector<rackwise::v1::Request>  ActiveRequests() override;
  std::optional<std::string>          InUseDeployId(const std::string& request_id) override;
  std::optional<rackwise::v1::Deploy> GetDeploy(const std::string& request_id, const std::string& deploy_id) override;
  std::vector<rackwise::v1::Task>     ActiveTasksForRequest(const std::string& request_id) override;

 private:
  std::mutex                                                      mutex_;
  std::map<std::string, rackwise::v1::Request>                    requests_;
  std::map<std::string, std::string>                              in_use_;
  std::map<std::pair<std::string, std::string>, rackwise::v1::Deploy> deploys_;
  std::map<std::string, std::map<std::string, rackwise::v1::Task>>    tasks_;
};

} // namespace rackwise::catalog
