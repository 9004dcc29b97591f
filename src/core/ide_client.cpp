#include "core/ide_client.hpp"

#include <utility>

namespace core::ide {

std::string EncodePathSegment(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  for (unsigned char ch : value) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      encoded.push_back(static_cast<char>(ch));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[(ch >> 4) & 0x0F]);
      encoded.push_back(kHex[ch & 0x0F]);
    }
  }
  return encoded;
}

IdeClient::IdeClient(Endpoint endpoint, platform::HttpClientTimeouts timeouts)
    : endpoint_(std::move(endpoint)), client_(endpoint_.host, endpoint_.port, timeouts) {}

platform::HttpClientResponse IdeClient::ListTools() const {
  return client_.Get(endpoint_.Route("list_tools"));
}

platform::HttpClientResponse IdeClient::CallTool(const std::string& tool_name,
                                                 const nlohmann::json& arguments) const {
  const nlohmann::json body = arguments.is_null() ? nlohmann::json::object() : arguments;
  return client_.Post(endpoint_.Route(EncodePathSegment(tool_name)), body.dump());
}

}  // namespace core::ide
