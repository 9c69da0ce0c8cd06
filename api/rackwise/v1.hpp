#pragma once

#include "rackwise/core/v1/machine.pb.h"
#include "rackwise/core/v1/offer.pb.h"
#include "rackwise/core/v1/scheduling.pb.h"

#include "rackwise/services/v1/load_balancer_service.pb.h"
#include "rackwise/services/v1/topology_service.pb.h"

namespace rackwise::v1 {
using namespace ::rackwise::core::v1;
using namespace ::rackwise::services::v1;
}
