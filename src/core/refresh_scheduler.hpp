#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "core/bridge_state.hpp"
#include "core/endpoint_resolver.hpp"
#include "core/tool_registry.hpp"

namespace core {

// Periodically re-resolves the IDE endpoint. When the published endpoint
// changes (including to or from none) the tool snapshot is dropped and the
// tools-changed listener fires.
class RefreshScheduler {
 public:
  using ChangeListener = std::function<void()>;

  RefreshScheduler(ide::EndpointResolver& resolver, BridgeState& state,
                   mcp::ToolRegistry& registry, std::chrono::milliseconds interval,
                   ChangeListener on_tools_changed = {});
  ~RefreshScheduler();

  RefreshScheduler(const RefreshScheduler&) = delete;
  RefreshScheduler& operator=(const RefreshScheduler&) = delete;

  // Runs the first tick on the calling thread, then ticks every interval on a
  // worker thread until Stop().
  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  // Returns true when the published endpoint changed.
  bool Tick();

 private:
  void WorkerLoop();

  ide::EndpointResolver& resolver_;
  BridgeState& state_;
  mcp::ToolRegistry& registry_;
  std::chrono::milliseconds interval_;
  ChangeListener on_tools_changed_;

  std::mutex tick_mutex_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::mutex wait_mutex_;
  std::condition_variable cv_;
};

}  // namespace core
