#include <exception>
#include <iostream>
#include <string>

#include "core/bridge_state.hpp"
#include "core/call_dispatcher.hpp"
#include "core/config.hpp"
#include "core/endpoint_resolver.hpp"
#include "core/liveness_prober.hpp"
#include "core/logging.hpp"
#include "core/mcp_server.hpp"
#include "core/refresh_scheduler.hpp"
#include "core/tool_registry.hpp"

int main() {
  core::logging::InitializeFromEnvironment();

  try {
    const auto config = core::LoadBridgeConfig();
    core::logging::LogInfo("Initializing IDE MCP bridge for host " + config.host +
                           (config.explicit_port
                                ? " port " + std::to_string(*config.explicit_port)
                                : " ports " + std::to_string(config.scan_first_port) + "-" +
                                      std::to_string(config.scan_last_port)));

    core::BridgeState state;
    core::mcp::ToolRegistry registry(config, state);
    core::mcp::CallDispatcher dispatcher(config, state);
    core::mcp::McpServer server(registry, dispatcher, std::cin, std::cout);

    const core::ide::LivenessProber prober(
        {config.connect_timeout, config.request_timeout, config.request_timeout});
    core::ide::EndpointResolver resolver(config, state, prober, [&registry, &server] {
      registry.Invalidate();
      server.NotifyToolsChanged();
    });
    core::RefreshScheduler scheduler(resolver, state, registry, config.refresh_interval,
                                     [&server] { server.NotifyToolsChanged(); });

    // The first resolution completes before any request is read.
    scheduler.Start();
    server.Run();
    scheduler.Stop();
  } catch (const std::exception& ex) {
    core::logging::LogError(std::string{"Fatal MCP bridge error: "} + ex.what());
    return 1;
  }

  return 0;
}
