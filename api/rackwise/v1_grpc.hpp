#pragma once

#include "rackwise/v1.hpp"

#include "rackwise/services/v1/load_balancer_service.grpc.pb.h"
#include "rackwise/services/v1/topology_service.grpc.pb.h"
