#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace core {

struct BridgeConfig {
  std::string host = "127.0.0.1";
  std::optional<int> explicit_port;
  int scan_first_port = 63342;
  int scan_last_port = 63352;
  std::string path_prefix = "/api/mcp";

  std::chrono::milliseconds refresh_interval{std::chrono::seconds(10)};
  std::chrono::milliseconds tools_cache_ttl{std::chrono::seconds(30)};
  int fetch_attempts = 3;
  std::chrono::milliseconds backoff_unit{std::chrono::seconds(1)};

  std::chrono::milliseconds connect_timeout{std::chrono::seconds(1)};
  std::chrono::milliseconds request_timeout{std::chrono::seconds(5)};
};

BridgeConfig LoadBridgeConfig();

}  // namespace core
