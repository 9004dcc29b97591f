#pragma once

#include <string>

namespace core::ide {

// Address believed to reach the IDE's MCP routes: http://host:port{path_prefix}.
struct Endpoint {
  std::string host;
  int port = 0;
  std::string path_prefix;

  std::string BaseUrl() const;
  std::string Route(const std::string& suffix) const;
};

bool operator==(const Endpoint& lhs, const Endpoint& rhs);
bool operator!=(const Endpoint& lhs, const Endpoint& rhs);

}  // namespace core::ide
