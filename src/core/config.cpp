#include "core/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "core/logging.hpp"

namespace core {
namespace {

using core::logging::LogWarn;

std::optional<int> ReadPort(const char* key) {
  const char* raw = std::getenv(key);
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(raw, &consumed);
    if (consumed != std::string{raw}.size()) {
      LogWarn(std::string{key} + " has trailing characters, ignoring: " + raw);
      return std::nullopt;
    }
    if (parsed <= 0 || parsed > 65535) {
      LogWarn(std::string{key} + " is outside the valid port range, ignoring: " + raw);
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception& ex) {
    LogWarn("Failed to parse " + std::string{key} + ": " + ex.what());
    return std::nullopt;
  }
}

std::optional<std::chrono::seconds> ReadSeconds(const char* key) {
  const char* raw = std::getenv(key);
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const long parsed = std::stol(raw, &consumed);
    if (consumed != std::string{raw}.size()) {
      LogWarn(std::string{key} + " has trailing characters, ignoring: " + raw);
      return std::nullopt;
    }
    if (parsed <= 0) {
      LogWarn(std::string{key} + " must be positive, falling back to default");
      return std::nullopt;
    }
    return std::chrono::seconds(parsed);
  } catch (const std::exception& ex) {
    LogWarn("Failed to parse " + std::string{key} + ": " + ex.what());
    return std::nullopt;
  }
}

}  // namespace

BridgeConfig LoadBridgeConfig() {
  BridgeConfig config;
  if (const char* host = std::getenv("HOST"); host && *host != '\0') {
    config.host = host;
  }
  config.explicit_port = ReadPort("IDE_PORT");

  const auto first = ReadPort("IDE_BRIDGE_SCAN_START");
  const auto last = ReadPort("IDE_BRIDGE_SCAN_END");
  if (first) {
    config.scan_first_port = *first;
  }
  if (last) {
    config.scan_last_port = *last;
  }
  if (config.scan_first_port > config.scan_last_port) {
    LogWarn("Scan range start is above its end, falling back to 63342-63352");
    config.scan_first_port = 63342;
    config.scan_last_port = 63352;
  }

  if (const auto refresh = ReadSeconds("IDE_BRIDGE_REFRESH_SECONDS")) {
    config.refresh_interval = *refresh;
  }
  if (const auto ttl = ReadSeconds("IDE_BRIDGE_TOOLS_TTL_SECONDS")) {
    config.tools_cache_ttl = *ttl;
  }
  return config;
}

}  // namespace core
