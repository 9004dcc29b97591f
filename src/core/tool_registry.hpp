#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "core/bridge_state.hpp"
#include "core/config.hpp"
#include "core/endpoint.hpp"
#include "core/tool_catalog.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace core::mcp {

class ToolFetchFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The IDE answers list_tools either with a bare array or with {"tools": [...]}.
struct ToolArrayPayload {
  std::vector<ToolDescriptor> tools;
};
struct WrappedToolsPayload {
  std::vector<ToolDescriptor> tools;
};
using ToolListingPayload = std::variant<ToolArrayPayload, WrappedToolsPayload>;

// Throws ToolFetchFailure for malformed JSON or any other top-level shape.
ToolListingPayload ParseToolListing(const std::string& body);
std::vector<ToolDescriptor> NormalizeToolListing(ToolListingPayload payload);

// Static tools first, in order; remote entries replace same-named ones whose
// content differs, remote-only tools are appended in remote order.
std::vector<ToolDescriptor> MergeTools(const std::vector<ToolDescriptor>& static_tools,
                                       const std::vector<ToolDescriptor>& remote_tools);

class ToolRegistry {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ToolRegistry(const BridgeConfig& config, BridgeState& state,
               std::vector<ToolDescriptor> static_tools = DefaultTools(), Clock clock = {},
               Sleeper sleeper = {});

  // Never throws. Degrades to the stale snapshot, then to the static tools.
  std::vector<ToolDescriptor> ListTools();
  nlohmann::json ListToolsJson();

  void Invalidate();

 private:
  std::vector<ToolDescriptor> FetchWithRetry(const ide::Endpoint& endpoint) const;
  std::vector<ToolDescriptor> FetchOnce(const ide::Endpoint& endpoint) const;
  bool IsFresh(const ToolRegistrySnapshot& snapshot) const;

  BridgeState& state_;
  std::vector<ToolDescriptor> static_tools_;
  Clock clock_;
  Sleeper sleeper_;
  std::chrono::milliseconds ttl_;
  int attempts_;
  std::chrono::milliseconds backoff_unit_;
  platform::HttpClientTimeouts timeouts_;
};

}  // namespace core::mcp
