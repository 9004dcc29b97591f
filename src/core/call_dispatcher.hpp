#pragma once

#include <string>

#include "core/bridge_state.hpp"
#include "core/config.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace core::mcp {

enum class InvocationFailure {
  kNone = 0,
  kToolError,          // the IDE answered {status: null, error: "..."}
  kNoEndpoint,
  kTransportFailure,
  kProtocolViolation,
};

struct InvocationResult {
  std::string text;
  bool is_error = false;
  InvocationFailure failure = InvocationFailure::kNone;
};

// MCP CallToolResult: {"content": [{"type": "text", "text": ...}], "isError": ...}
nlohmann::json ToCallToolResult(const InvocationResult& result);

// Maps a 2xx body from the IDE onto a result. The body must be exactly one of
// {"status": string, "error": null} or {"status": null, "error": string}.
InvocationResult TranslateEnvelope(const std::string& body);

// Forwards one tools/call to the current endpoint. Never throws and never
// retries; every failure comes back as an error result.
class CallDispatcher {
 public:
  CallDispatcher(const BridgeConfig& config, const BridgeState& state);

  InvocationResult Invoke(const std::string& tool_name, const nlohmann::json& arguments) const;

 private:
  const BridgeState& state_;
  platform::HttpClientTimeouts timeouts_;
};

}  // namespace core::mcp
