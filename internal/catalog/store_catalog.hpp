#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include "internal/catalog/scheduler_catalog.hpp"
#include "internal/store/api/coordination_store.hpp"

namespace rackwise::catalog {

/*
  Catalog backed by the coordination store.

  Layout under root (protobuf JSON payloads):

    {root}/requests/active/{request_id}              Request
    {root}/deploys/{request_id}/in_use               deploy id as raw bytes
    {root}/deploys/{request_id}/ids/{deploy_id}      Deploy
    {root}/tasks/active/{request_id}/{task_id}       Task

  Records removed between a listing and the read are skipped.
*/
class StoreCatalog : public SchedulerCatalog {
 public:
  StoreCatalog(std::shared_ptr<store::CoordinationStore> store, std::string root);

  std::vector<rackwise::v1::Request>  ActiveRequests() override;
  std::optional<std::string>          InUseDeployId(const std::string& request_id) override;
  std::optional<rackwise::v1::Deploy> GetDeploy(const std::string& request_id, const std::string& deploy_id) override;
  std::vector<rackwise::v1::Task>     ActiveTasksForRequest(const std::string& request_id) override;

  // Every record path the readers above touch is built here.
  std::string RequestPath(const std::string& request_id) const;
  std::string InUsePath(const std::string& request_id) const;
  std::string DeployPath(const std::string& request_id, const std::string& deploy_id) const;
  std::string TaskPath(const std::string& request_id, const std::string& task_id) const;

 private:
  std::string Under(std::initializer_list<std::string_view> segments) const;

  std::shared_ptr<store::CoordinationStore> store_;
  std::string                               root_;
};

} // namespace rackwise::catalog
