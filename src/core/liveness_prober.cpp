#include "core/liveness_prober.hpp"

#include <stdexcept>

#include "core/ide_client.hpp"
#include "core/logging.hpp"

namespace core::ide {

using core::logging::LogDebug;

LivenessProber::LivenessProber(platform::HttpClientTimeouts timeouts) : timeouts_(timeouts) {}

ProbeResult LivenessProber::Probe(const Endpoint& endpoint) const {
  LogDebug("Probing " + endpoint.BaseUrl() + "/list_tools");
  try {
    const IdeClient client(endpoint, timeouts_);
    auto response = client.ListTools();
    if (!response.ok()) {
      LogDebug("Probe of " + endpoint.BaseUrl() + " returned status " +
               std::to_string(response.status));
      return {};
    }
    LogDebug("Probe of " + endpoint.BaseUrl() + " succeeded: " + response.body.substr(0, 100));
    return {true, std::move(response.body)};
  } catch (const std::exception& ex) {
    LogDebug("Probe of " + endpoint.BaseUrl() + " failed: " + ex.what());
    return {};
  }
}

}  // namespace core::ide
