#pragma once

#include <string>

#include "core/endpoint.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace core::ide {

// The two backend routes the bridge relies on. Transport failures surface as
// std::runtime_error from platform::HttpClient; HTTP status is left to callers.
class IdeClient {
 public:
  IdeClient(Endpoint endpoint, platform::HttpClientTimeouts timeouts);

  // GET {endpoint}/list_tools
  platform::HttpClientResponse ListTools() const;

  // POST {endpoint}/{tool_name} with the arguments as the JSON body.
  platform::HttpClientResponse CallTool(const std::string& tool_name,
                                        const nlohmann::json& arguments) const;

  const Endpoint& endpoint() const { return endpoint_; }

 private:
  Endpoint endpoint_;
  platform::HttpClient client_;
};

std::string EncodePathSegment(const std::string& value);

}  // namespace core::ide
