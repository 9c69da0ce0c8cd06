#include "internal/store/api/result.hpp"

namespace rackwise::store {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NOT_FOUND";
    case ErrorCode::AlreadyExists:
      return "ALREADY_EXISTS";
  }
  return "UNKNOWN";
}

const char* ToString(DeleteResult result) {
  return result == DeleteResult::kDeleted ? "DELETED" : "DID_NOT_EXIST";
}

} // namespace rackwise::store
