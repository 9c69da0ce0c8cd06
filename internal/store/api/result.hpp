#pragma once

#include <string>
#include <utility>

namespace rackwise::store {

/*
  Expected outcomes of coordination store writes.

  Only the outcomes callers branch on are codes; faults (I/O, corruption,
  lost connection) are thrown as util::BackendFailure by the backends.
*/

enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message; // the path involved, when not OK

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Outcome of a delete. A missing node is not an error.
enum class DeleteResult {
  kDeleted,
  kDidNotExist,
};

const char* ToString(ErrorCode code);
const char* ToString(DeleteResult result);

} // namespace rackwise::store
