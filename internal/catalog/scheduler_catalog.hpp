#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rackwise/v1.hpp"

namespace rackwise::catalog {

/*
  Read-only view of the scheduler's request, deploy and task metadata.

  Owned and written elsewhere; the upstream reconciler only consumes it.
  Absent records come back as nullopt or empty lists.
*/
class SchedulerCatalog {
 public:
  virtual ~SchedulerCatalog() = default;

  virtual std::vector<rackwise::v1::Request> ActiveRequests() = 0;

  virtual std::optional<std::string> InUseDeployId(const std::string& request_id) = 0;

  virtual std::optional<rackwise::v1::Deploy> GetDeploy(const std::string& request_id, const std::string& deploy_id) = 0;

  virtual std::vector<rackwise::v1::Task> ActiveTasksForRequest(const std::string& request_id) = 0;
};

} // namespace rackwise::catalog
