#include "core/endpoint.hpp"

namespace core::ide {

std::string Endpoint::BaseUrl() const {
  return "http://" + host + ":" + std::to_string(port) + path_prefix;
}

std::string Endpoint::Route(const std::string& suffix) const {
  if (suffix.empty() || suffix.front() == '/') {
    return path_prefix + suffix;
  }
  return path_prefix + "/" + suffix;
}

bool operator==(const Endpoint& lhs, const Endpoint& rhs) {
  return lhs.host == rhs.host && lhs.port == rhs.port && lhs.path_prefix == rhs.path_prefix;
}

bool operator!=(const Endpoint& lhs, const Endpoint& rhs) { return !(lhs == rhs); }

}  // namespace core::ide
