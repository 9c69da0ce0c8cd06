#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace rackwise::grpc {

namespace {

::grpc::StatusCode CodeFor(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::kNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case util::ErrorKind::kAlreadyExists:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case util::ErrorKind::kInvalidState:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case util::ErrorKind::kBackendFailure:
      return ::grpc::StatusCode::UNAVAILABLE;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* err = dynamic_cast<const util::Error*>(&e)) {
    return {CodeFor(err->kind()), err->what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace rackwise::grpc
