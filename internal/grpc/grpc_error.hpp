#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace rackwise::grpc {

// util::Error kinds and std::invalid_argument to their status codes; anything else is INTERNAL.
::grpc::Status ToStatus(const std::exception& e);

} // namespace rackwise::grpc
