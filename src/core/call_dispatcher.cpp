#include "core/call_dispatcher.hpp"

#include <exception>
#include <utility>

#include "core/ide_client.hpp"
#include "core/logging.hpp"

namespace core::mcp {
namespace {

using core::logging::LogDebug;
using core::logging::LogWarn;
using nlohmann::json;

InvocationResult Failure(InvocationFailure kind, std::string text) {
  return {std::move(text), true, kind};
}

InvocationResult ProtocolViolation(const std::string& detail) {
  return Failure(InvocationFailure::kProtocolViolation,
                 "Unexpected response from IDE: " + detail);
}

}  // namespace

json ToCallToolResult(const InvocationResult& result) {
  return {{"content", json::array({{{"type", "text"}, {"text", result.text}}})},
          {"isError", result.is_error}};
}

InvocationResult TranslateEnvelope(const std::string& body) {
  const json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    return ProtocolViolation("body is not valid JSON");
  }
  if (!parsed.is_object()) {
    return ProtocolViolation("expected a JSON object with 'status' and 'error'");
  }

  const auto status = parsed.find("status");
  const auto error = parsed.find("error");
  if (status == parsed.end() || error == parsed.end()) {
    return ProtocolViolation("both 'status' and 'error' fields are required");
  }

  if (status->is_string() && error->is_null()) {
    return {status->get<std::string>(), false, InvocationFailure::kNone};
  }
  if (status->is_null() && error->is_string()) {
    return Failure(InvocationFailure::kToolError, error->get<std::string>());
  }
  if (status->is_null() && error->is_null()) {
    return ProtocolViolation("'status' and 'error' are both null");
  }
  if (!status->is_null() && !error->is_null()) {
    return ProtocolViolation("'status' and 'error' are both set");
  }
  return ProtocolViolation("'status' and 'error' must be strings");
}

CallDispatcher::CallDispatcher(const BridgeConfig& config, const BridgeState& state)
    : state_(state),
      timeouts_{config.connect_timeout, config.request_timeout, config.request_timeout} {}

InvocationResult CallDispatcher::Invoke(const std::string& tool_name,
                                        const json& arguments) const {
  const auto endpoint = state_.CurrentEndpoint();
  if (!endpoint) {
    LogWarn("Tool call '" + tool_name + "' rejected: no IDE endpoint");
    return Failure(InvocationFailure::kNoEndpoint, "No working IDE endpoint available.");
  }

  LogDebug("Calling " + endpoint->BaseUrl() + "/" + tool_name + " args=" + arguments.dump());
  platform::HttpClientResponse response;
  try {
    const ide::IdeClient client(*endpoint, timeouts_);
    response = client.CallTool(tool_name, arguments);
  } catch (const std::exception& ex) {
    LogWarn("Tool call '" + tool_name + "' failed in transport: " + ex.what());
    return Failure(InvocationFailure::kTransportFailure, ex.what());
  }

  if (!response.ok()) {
    LogWarn("Tool call '" + tool_name + "' failed with status " +
            std::to_string(response.status));
    return Failure(InvocationFailure::kTransportFailure,
                   "Response failed: " + std::to_string(response.status));
  }

  auto result = TranslateEnvelope(response.body);
  if (result.failure == InvocationFailure::kProtocolViolation) {
    LogWarn("Tool call '" + tool_name + "': " + result.text);
  }
  LogDebug("Tool call '" + tool_name + "' is_error=" + (result.is_error ? "true" : "false"));
  return result;
}

}  // namespace core::mcp
