#include "core/endpoint_resolver.hpp"

#include <utility>

#include "core/logging.hpp"

namespace core::ide {

using core::logging::LogDebug;
using core::logging::LogInfo;
using core::logging::LogWarn;

EndpointResolver::EndpointResolver(BridgeConfig config, BridgeState& state,
                                   const LivenessProber& prober,
                                   ChangeListener on_fingerprint_change)
    : config_(std::move(config)),
      state_(state),
      prober_(prober),
      on_fingerprint_change_(std::move(on_fingerprint_change)) {}

Endpoint EndpointResolver::CandidateFor(int port) const {
  return Endpoint{config_.host, port, config_.path_prefix};
}

Endpoint EndpointResolver::Resolve() {
  LogDebug("Attempting to find a working IDE endpoint");
  const auto current = state_.CurrentEndpoint();

  if (config_.explicit_port) {
    const auto candidate = CandidateFor(*config_.explicit_port);
    LogDebug("IDE_PORT is set to " + std::to_string(*config_.explicit_port) +
             ", testing only that port");
    if (ProbeAndRecord(candidate)) {
      return candidate;
    }
    const bool current_failed = current && *current == candidate;
    if (current_failed) {
      state_.ClearEndpoint();
    }
    throw EndpointUnreachable("Specified IDE_PORT=" + std::to_string(*config_.explicit_port) +
                                  " is not responding correctly",
                              current_failed);
  }

  bool current_failed = false;
  if (current) {
    if (ProbeAndRecord(*current)) {
      LogDebug("Cached endpoint " + current->BaseUrl() + " is still working");
      return *current;
    }
    LogWarn("Cached endpoint " + current->BaseUrl() + " stopped responding, clearing it");
    // No request may be routed to it while the scan runs.
    state_.ClearEndpoint();
    current_failed = true;
  }

  for (int port = config_.scan_first_port; port <= config_.scan_last_port; ++port) {
    const auto candidate = CandidateFor(port);
    if (ProbeAndRecord(candidate)) {
      LogInfo("Found working IDE endpoint at " + candidate.BaseUrl());
      return candidate;
    }
    LogDebug("Port " + std::to_string(port) + " is not responding correctly");
  }

  // Whatever answers next counts as a change.
  state_.ExchangeFingerprint(std::string{});
  throw EndpointUnreachable("No working IDE endpoint found in range " +
                                std::to_string(config_.scan_first_port) + "-" +
                                std::to_string(config_.scan_last_port),
                            current_failed);
}

bool EndpointResolver::ProbeAndRecord(const Endpoint& candidate) {
  auto result = prober_.Probe(candidate);
  if (!result.alive) {
    return false;
  }
  const auto previous = state_.ExchangeFingerprint(result.fingerprint.value_or(std::string{}));
  if (previous && *previous != result.fingerprint.value_or(std::string{})) {
    LogInfo("IDE tool listing changed since the last check");
    if (on_fingerprint_change_) {
      on_fingerprint_change_();
    }
  }
  return true;
}

}  // namespace core::ide
