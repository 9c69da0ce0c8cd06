#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace rackwise::util {

/*
  Identifier helpers.

  Node ids, rack ids and hosts become coordination store path segments,
  so '-' is replaced with '_' before use.
*/

inline std::string SafeId(std::string_view value) {
  std::string out(value);
  std::replace(out.begin(), out.end(), '-', '_');
  return out;
}

// "worker-7.dc1.example.com" -> "worker_7"
inline std::string HostFromHostname(std::string_view hostname) {
  const auto dot = hostname.find('.');
  return SafeId(hostname.substr(0, dot));
}

} // namespace rackwise::util
