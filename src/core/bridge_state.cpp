#include "core/bridge_state.hpp"

#include <utility>

namespace core {

std::shared_ptr<const ide::Endpoint> BridgeState::CurrentEndpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoint_;
}

void BridgeState::PublishEndpoint(ide::Endpoint endpoint) {
  auto published = std::make_shared<const ide::Endpoint>(std::move(endpoint));
  std::lock_guard<std::mutex> lock(mutex_);
  endpoint_ = std::move(published);
}

void BridgeState::ClearEndpoint() {
  std::lock_guard<std::mutex> lock(mutex_);
  endpoint_.reset();
}

std::optional<std::string> BridgeState::ExchangeFingerprint(std::string fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto previous = std::move(fingerprint_);
  fingerprint_ = std::move(fingerprint);
  return previous;
}

std::optional<std::string> BridgeState::Fingerprint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fingerprint_;
}

std::shared_ptr<const ToolRegistrySnapshot> BridgeState::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

void BridgeState::PublishSnapshot(ToolRegistrySnapshot snapshot) {
  auto published = std::make_shared<const ToolRegistrySnapshot>(std::move(snapshot));
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_ = std::move(published);
}

void BridgeState::InvalidateSnapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_.reset();
}

}  // namespace core
