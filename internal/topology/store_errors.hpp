#pragma once

#include <string>

#include "internal/store/api/result.hpp"
#include "internal/util/errors.hpp"

namespace rackwise::topology {

// Converts a non-OK store result into the matching util:: exception.
inline void ThrowIfStoreError(const store::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case store::ErrorCode::NotFound:
      throw util::NotFound(message);
    case store::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case store::ErrorCode::OK:
      break;
  }
  throw util::BackendFailure(message + " (" + store::ToString(result.code) + ")");
}

} // namespace rackwise::topology
