#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/endpoint.hpp"
#include "core/tool_catalog.hpp"

namespace core {

// Remote tool listing as fetched from one endpoint. Never mutated after publish.
struct ToolRegistrySnapshot {
  ide::Endpoint source;
  std::vector<mcp::ToolDescriptor> tools;
  std::chrono::steady_clock::time_point fetched_at;
};

// State shared by the scheduler thread and the request loop. Values are built
// off to the side and swapped in whole, so readers holding a pointer keep a
// consistent view.
class BridgeState {
 public:
  std::shared_ptr<const ide::Endpoint> CurrentEndpoint() const;
  void PublishEndpoint(ide::Endpoint endpoint);
  void ClearEndpoint();

  // Returns the fingerprint that was recorded before this call.
  std::optional<std::string> ExchangeFingerprint(std::string fingerprint);
  std::optional<std::string> Fingerprint() const;

  std::shared_ptr<const ToolRegistrySnapshot> Snapshot() const;
  void PublishSnapshot(ToolRegistrySnapshot snapshot);
  void InvalidateSnapshot();

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const ide::Endpoint> endpoint_;
  std::optional<std::string> fingerprint_;
  std::shared_ptr<const ToolRegistrySnapshot> snapshot_;
};

}  // namespace core
