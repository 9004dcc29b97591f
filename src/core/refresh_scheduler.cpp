#include "core/refresh_scheduler.hpp"

#include <exception>
#include <utility>

#include "core/logging.hpp"

namespace core {
namespace {

using core::logging::LogDebug;
using core::logging::LogError;
using core::logging::LogInfo;
using core::logging::LogWarn;

std::string Describe(const std::shared_ptr<const ide::Endpoint>& endpoint) {
  return endpoint ? endpoint->BaseUrl() : std::string{"<none>"};
}

bool SameEndpoint(const std::shared_ptr<const ide::Endpoint>& lhs,
                  const std::shared_ptr<const ide::Endpoint>& rhs) {
  if (!lhs || !rhs) {
    return !lhs && !rhs;
  }
  return *lhs == *rhs;
}

}  // namespace

RefreshScheduler::RefreshScheduler(ide::EndpointResolver& resolver, BridgeState& state,
                                   mcp::ToolRegistry& registry,
                                   std::chrono::milliseconds interval,
                                   ChangeListener on_tools_changed)
    : resolver_(resolver),
      state_(state),
      registry_(registry),
      interval_(interval),
      on_tools_changed_(std::move(on_tools_changed)) {}

RefreshScheduler::~RefreshScheduler() { Stop(); }

void RefreshScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  Tick();
  worker_ = std::thread(&RefreshScheduler::WorkerLoop, this);
  LogDebug("Scheduled endpoint check every " + std::to_string(interval_.count()) + " ms");
}

void RefreshScheduler::Stop() {
  if (running_.exchange(false)) {
    {
      std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    cv_.notify_one();
    if (worker_.joinable()) {
      worker_.join();
    }
  }
}

void RefreshScheduler::WorkerLoop() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
    if (!running_) {
      break;
    }
    Tick();
  }
}

bool RefreshScheduler::Tick() {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  const auto previous = state_.CurrentEndpoint();

  try {
    state_.PublishEndpoint(resolver_.Resolve());
  } catch (const ide::EndpointUnreachable& ex) {
    LogWarn(std::string{"Failed to update IDE endpoint: "} + ex.what() +
            (ex.current_endpoint_failed() ? " (previous endpoint dropped)" : ""));
  } catch (const std::exception& ex) {
    LogError(std::string{"Unexpected error during endpoint check: "} + ex.what());
  }

  const auto current = state_.CurrentEndpoint();
  if (SameEndpoint(previous, current)) {
    return false;
  }

  LogInfo("IDE endpoint changed from " + Describe(previous) + " to " + Describe(current) +
          ", invalidating tools cache");
  registry_.Invalidate();
  if (on_tools_changed_) {
    on_tools_changed_();
  }
  return true;
}

}  // namespace core
