#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include "core/bridge_state.hpp"
#include "core/config.hpp"
#include "core/endpoint.hpp"
#include "core/liveness_prober.hpp"

namespace core::ide {

class EndpointUnreachable : public std::runtime_error {
 public:
  EndpointUnreachable(const std::string& message, bool current_endpoint_failed)
      : std::runtime_error(message), current_endpoint_failed_(current_endpoint_failed) {}

  // True when the endpoint published before this attempt was probed, did not
  // answer and has already been cleared.
  bool current_endpoint_failed() const noexcept { return current_endpoint_failed_; }

 private:
  bool current_endpoint_failed_;
};

// Picks a working IDE endpoint: explicit port override, else the current
// endpoint if it still answers, else the first live port of the scan range.
// Never publishes a new endpoint; the caller owns what becomes current. A
// current endpoint that fails its own probe is cleared before scanning.
class EndpointResolver {
 public:
  using ChangeListener = std::function<void()>;

  EndpointResolver(BridgeConfig config, BridgeState& state, const LivenessProber& prober,
                   ChangeListener on_fingerprint_change = {});

  Endpoint Resolve();

  Endpoint CandidateFor(int port) const;

 private:
  bool ProbeAndRecord(const Endpoint& candidate);

  BridgeConfig config_;
  BridgeState& state_;
  const LivenessProber& prober_;
  ChangeListener on_fingerprint_change_;
};

}  // namespace core::ide
