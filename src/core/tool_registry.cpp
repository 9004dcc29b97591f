#include "core/tool_registry.hpp"

#include <map>
#include <thread>
#include <utility>

#include "core/ide_client.hpp"
#include "core/logging.hpp"

namespace core::mcp {
namespace {

using core::logging::LogDebug;
using core::logging::LogInfo;
using core::logging::LogWarn;
using nlohmann::json;

std::vector<ToolDescriptor> ParseDescriptors(const json& entries) {
  std::vector<ToolDescriptor> tools;
  tools.reserve(entries.size());
  for (const auto& entry : entries) {
    if (!entry.is_object()) {
      LogWarn("Skipping IDE tool entry that is not an object");
      continue;
    }
    const auto name_it = entry.find("name");
    if (name_it == entry.end() || !name_it->is_string()) {
      LogWarn("Skipping IDE tool entry without a string name: " + entry.dump());
      continue;
    }

    ToolDescriptor tool;
    tool.name = name_it->get<std::string>();
    if (const auto it = entry.find("description"); it != entry.end() && it->is_string()) {
      tool.description = it->get<std::string>();
    }
    if (const auto it = entry.find("inputSchema"); it != entry.end() && it->is_object()) {
      tool.input_schema = *it;
    } else {
      tool.input_schema = {{"type", "object"}, {"properties", json::object()}};
    }
    tools.push_back(std::move(tool));
  }
  return tools;
}

}  // namespace

ToolListingPayload ParseToolListing(const std::string& body) {
  const json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    throw ToolFetchFailure("IDE tool listing is not valid JSON");
  }
  if (parsed.is_array()) {
    return ToolArrayPayload{ParseDescriptors(parsed)};
  }
  if (parsed.is_object()) {
    const auto it = parsed.find("tools");
    if (it != parsed.end() && it->is_array()) {
      return WrappedToolsPayload{ParseDescriptors(*it)};
    }
  }
  throw ToolFetchFailure("IDE tool listing is neither an array nor an object with a tools array");
}

std::vector<ToolDescriptor> NormalizeToolListing(ToolListingPayload payload) {
  return std::visit([](auto&& listing) { return std::move(listing.tools); }, std::move(payload));
}

std::vector<ToolDescriptor> MergeTools(const std::vector<ToolDescriptor>& static_tools,
                                       const std::vector<ToolDescriptor>& remote_tools) {
  std::vector<ToolDescriptor> merged;
  std::map<std::string, std::size_t> index;

  const auto overlay = [&](const ToolDescriptor& tool) {
    const auto it = index.find(tool.name);
    if (it == index.end()) {
      index.emplace(tool.name, merged.size());
      merged.push_back(tool);
    } else if (!SameContent(merged[it->second], tool)) {
      merged[it->second] = tool;
    }
  };

  for (const auto& tool : static_tools) {
    overlay(tool);
  }
  for (const auto& tool : remote_tools) {
    overlay(tool);
  }
  return merged;
}

ToolRegistry::ToolRegistry(const BridgeConfig& config, BridgeState& state,
                           std::vector<ToolDescriptor> static_tools, Clock clock, Sleeper sleeper)
    : state_(state),
      static_tools_(std::move(static_tools)),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)),
      ttl_(config.tools_cache_ttl),
      attempts_(config.fetch_attempts < 1 ? 1 : config.fetch_attempts),
      backoff_unit_(config.backoff_unit),
      timeouts_{config.connect_timeout, config.request_timeout, config.request_timeout} {
  if (!clock_) {
    clock_ = [] { return std::chrono::steady_clock::now(); };
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::vector<ToolDescriptor> ToolRegistry::ListTools() {
  const auto endpoint = state_.CurrentEndpoint();
  if (!endpoint) {
    LogDebug("No IDE endpoint available, listing default tools only");
    return static_tools_;
  }

  auto snapshot = state_.Snapshot();
  if (snapshot && snapshot->source != *endpoint) {
    snapshot.reset();
  }
  if (snapshot && IsFresh(*snapshot)) {
    LogDebug("Using cached IDE tools");
    return MergeTools(static_tools_, snapshot->tools);
  }

  try {
    LogDebug("IDE tool cache missing or expired, fetching from " + endpoint->BaseUrl());
    ToolRegistrySnapshot fresh{*endpoint, FetchWithRetry(*endpoint), clock_()};
    auto merged = MergeTools(static_tools_, fresh.tools);
    LogInfo("Listing " + std::to_string(merged.size()) + " tools (" +
            std::to_string(static_tools_.size()) + " default, " +
            std::to_string(fresh.tools.size()) + " reported by the IDE)");
    state_.PublishSnapshot(std::move(fresh));
    return merged;
  } catch (const ToolFetchFailure& ex) {
    if (snapshot) {
      LogWarn(std::string{"Serving stale IDE tools after fetch failure: "} + ex.what());
      return MergeTools(static_tools_, snapshot->tools);
    }
    LogWarn(std::string{"Listing default tools only after fetch failure: "} + ex.what());
    return static_tools_;
  }
}

nlohmann::json ToolRegistry::ListToolsJson() {
  json tools = json::array();
  for (const auto& tool : ListTools()) {
    tools.push_back(ToJson(tool));
  }
  return tools;
}

void ToolRegistry::Invalidate() { state_.InvalidateSnapshot(); }

std::vector<ToolDescriptor> ToolRegistry::FetchWithRetry(const ide::Endpoint& endpoint) const {
  std::string last_error;
  for (int attempt = 1; attempt <= attempts_; ++attempt) {
    try {
      return FetchOnce(endpoint);
    } catch (const std::exception& ex) {
      last_error = ex.what();
      LogWarn("Attempt " + std::to_string(attempt) + " to fetch IDE tools failed: " + last_error);
    }
    if (attempt < attempts_) {
      sleeper_(backoff_unit_ * (1 << attempt));
    }
  }
  throw ToolFetchFailure("Fetching IDE tools failed after " + std::to_string(attempts_) +
                         " attempts: " + last_error);
}

std::vector<ToolDescriptor> ToolRegistry::FetchOnce(const ide::Endpoint& endpoint) const {
  const ide::IdeClient client(endpoint, timeouts_);
  const auto response = client.ListTools();
  if (!response.ok()) {
    throw ToolFetchFailure("HTTP error, status " + std::to_string(response.status));
  }
  return NormalizeToolListing(ParseToolListing(response.body));
}

bool ToolRegistry::IsFresh(const ToolRegistrySnapshot& snapshot) const {
  return clock_() - snapshot.fetched_at < ttl_;
}

}  // namespace core::mcp
