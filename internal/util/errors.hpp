#pragma once

#include <stdexcept>
#include <string>

namespace rackwise::util {

/*
  Error taxonomy shared by the topology, upstream and store layers.

  Every type carries an ErrorKind so transports can translate with a single
  switch (see grpc::ToStatus). Malformed requests use std::invalid_argument.
*/

enum class ErrorKind {
  kNotFound,
  kAlreadyExists,
  kInvalidState,
  kBackendFailure,
};

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Machine, bucket entry or catalog record missing.
class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(ErrorKind::kNotFound, msg) {
  }
};

class AlreadyExists : public Error {
 public:
  explicit AlreadyExists(const std::string& msg) : Error(ErrorKind::kAlreadyExists, msg) {
  }
};

// Operation not allowed in the current lifecycle state, or feature disabled.
class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg) : Error(ErrorKind::kInvalidState, msg) {
  }
};

// Coordination store or load balancer unreachable / erroring.
class BackendFailure : public Error {
 public:
  explicit BackendFailure(const std::string& msg) : Error(ErrorKind::kBackendFailure, msg) {
  }
};

} // namespace rackwise::util
