#pragma once

#include <optional>
#include <string>

#include "core/endpoint.hpp"
#include "platform/http_client.hpp"

namespace core::ide {

struct ProbeResult {
  bool alive = false;
  // Raw list_tools body; only ever compared for equality.
  std::optional<std::string> fingerprint;
};

class LivenessProber {
 public:
  explicit LivenessProber(platform::HttpClientTimeouts timeouts = {});
  virtual ~LivenessProber() = default;

  // One GET {endpoint}/list_tools. Transport errors and non-2xx map to !alive.
  virtual ProbeResult Probe(const Endpoint& endpoint) const;

 private:
  platform::HttpClientTimeouts timeouts_;
};

}  // namespace core::ide
