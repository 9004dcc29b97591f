#include <cstdlib>
#include <string>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "fake_ide_backend.hpp"

namespace {

using test_support::Assert;

void ClearEnvironment() {
  for (const char* key : {"IDE_PORT", "HOST", "IDE_BRIDGE_SCAN_START", "IDE_BRIDGE_SCAN_END",
                          "IDE_BRIDGE_REFRESH_SECONDS", "IDE_BRIDGE_TOOLS_TTL_SECONDS"}) {
    unsetenv(key);
  }
}

void DefaultsMatchTheJetBrainsPolicy() {
  ClearEnvironment();
  const auto config = core::LoadBridgeConfig();
  Assert(config.host == "127.0.0.1", "Default host is loopback");
  Assert(!config.explicit_port, "No override by default");
  Assert(config.scan_first_port == 63342 && config.scan_last_port == 63352, "Default range");
  Assert(config.path_prefix == "/api/mcp", "Default route prefix");
  Assert(config.refresh_interval == std::chrono::seconds(10), "Default refresh interval");
  Assert(config.tools_cache_ttl == std::chrono::seconds(30), "Default tools TTL");
  Assert(config.fetch_attempts == 3, "Default fetch attempts");
}

void ReadsOverrides() {
  ClearEnvironment();
  setenv("IDE_PORT", "8090", 1);
  setenv("HOST", "localhost", 1);
  setenv("IDE_BRIDGE_REFRESH_SECONDS", "3", 1);
  setenv("IDE_BRIDGE_TOOLS_TTL_SECONDS", "60", 1);
  const auto config = core::LoadBridgeConfig();
  Assert(config.explicit_port == 8090, "IDE_PORT override");
  Assert(config.host == "localhost", "HOST override");
  Assert(config.refresh_interval == std::chrono::seconds(3), "Refresh override");
  Assert(config.tools_cache_ttl == std::chrono::seconds(60), "TTL override");
}

void IgnoresInvalidValues() {
  ClearEnvironment();
  setenv("IDE_PORT", "80x", 1);
  setenv("IDE_BRIDGE_SCAN_START", "9000", 1);
  setenv("IDE_BRIDGE_SCAN_END", "8000", 1);
  setenv("IDE_BRIDGE_REFRESH_SECONDS", "-4", 1);
  auto config = core::LoadBridgeConfig();
  Assert(!config.explicit_port, "Malformed IDE_PORT is ignored");
  Assert(config.scan_first_port == 63342 && config.scan_last_port == 63352,
         "Inverted range falls back to the default");
  Assert(config.refresh_interval == std::chrono::seconds(10), "Non-positive interval ignored");

  setenv("IDE_BRIDGE_REFRESH_SECONDS", "10abc", 1);
  setenv("IDE_BRIDGE_TOOLS_TTL_SECONDS", "5s", 1);
  config = core::LoadBridgeConfig();
  Assert(config.refresh_interval == std::chrono::seconds(10),
         "Interval with trailing characters is ignored");
  Assert(config.tools_cache_ttl == std::chrono::seconds(30),
         "TTL with trailing characters is ignored");

  setenv("IDE_PORT", "70000", 1);
  config = core::LoadBridgeConfig();
  Assert(!config.explicit_port, "Out-of-range IDE_PORT is ignored");
  ClearEnvironment();
}

void ParsesLogLevels() {
  using core::logging::LogLevel;
  using core::logging::ParseLogLevel;
  Assert(ParseLogLevel("DEBUG") == LogLevel::kDebug, "debug");
  Assert(ParseLogLevel("warning") == LogLevel::kWarn, "warning");
  Assert(ParseLogLevel("error") == LogLevel::kError, "error");
  Assert(ParseLogLevel("verbose") == LogLevel::kInfo, "unknown falls back to info");
}

void LogLevelFollowsEnvironment() {
  using core::logging::LogLevel;
  unsetenv("IDE_BRIDGE_LOG_LEVEL");
  core::logging::SetLogLevel(LogLevel::kWarn);

  setenv("LOG_ENABLED", "true", 1);
  core::logging::InitializeFromEnvironment();
  Assert(core::logging::GetLogLevel() == LogLevel::kDebug, "LOG_ENABLED=true enables debug");

  setenv("IDE_BRIDGE_LOG_LEVEL", "error", 1);
  core::logging::InitializeFromEnvironment();
  Assert(core::logging::GetLogLevel() == LogLevel::kError, "Explicit level wins");

  unsetenv("LOG_ENABLED");
  unsetenv("IDE_BRIDGE_LOG_LEVEL");
  core::logging::SetLogLevel(LogLevel::kWarn);
}

}  // namespace

int main() {
  return test_support::RunCases("config_test",
                                {
                                    {"DefaultsMatchTheJetBrainsPolicy", DefaultsMatchTheJetBrainsPolicy},
                                    {"ReadsOverrides", ReadsOverrides},
                                    {"IgnoresInvalidValues", IgnoresInvalidValues},
                                    {"ParsesLogLevels", ParsesLogLevels},
                                    {"LogLevelFollowsEnvironment", LogLevelFollowsEnvironment},
                                });
}
