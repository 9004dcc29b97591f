#include <sstream>
#include <string>
#include <vector>

#include "core/bridge_state.hpp"
#include "core/call_dispatcher.hpp"
#include "core/mcp_server.hpp"
#include "core/tool_catalog.hpp"
#include "core/tool_registry.hpp"
#include "fake_ide_backend.hpp"

namespace {

using nlohmann::json;
using test_support::Assert;
using test_support::FakeIdeBackend;
using test_support::MakeConfig;

constexpr int kPort = 19450;

struct ServerFixture {
  explicit ServerFixture(const std::string& input = {})
      : config(MakeConfig(kPort, kPort)),
        registry(config, state),
        dispatcher(config, state),
        in(input),
        server(registry, dispatcher, in, out) {}

  core::BridgeConfig config;
  core::BridgeState state;
  core::mcp::ToolRegistry registry;
  core::mcp::CallDispatcher dispatcher;
  std::istringstream in;
  std::ostringstream out;
  core::mcp::McpServer server;
};

json Request(int id, const std::string& method, const json& params = json::object()) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

std::vector<json> ReadLines(const std::string& output) {
  std::vector<json> messages;
  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty()) {
      messages.push_back(json::parse(line));
    }
  }
  return messages;
}

void InitializeAdvertisesListChanged() {
  ServerFixture fixture;
  const auto response =
      fixture.server.HandleMessage(Request(1, "initialize", {{"protocolVersion", "2025-03-26"}}));
  Assert(response.has_value(), "initialize must be answered");
  const auto& result = response->at("result");
  Assert(result.at("serverInfo").value("name", "") == "jetbrains/proxy", "serverInfo name");
  Assert(result.at("capabilities").at("tools").value("listChanged", false),
         "tools.listChanged must be advertised");
  Assert(result.value("protocolVersion", "") == "2025-03-26", "Requested version is echoed");
  Assert(fixture.server.initialized(), "Server should be initialized");
}

void ToolsListWithoutEndpointReturnsDefaults() {
  ServerFixture fixture;
  const auto response = fixture.server.HandleMessage(Request(2, "tools/list"));
  const auto& tools = response->at("result").at("tools");
  Assert(tools.size() == core::mcp::DefaultTools().size(), "Default tools expected");
  Assert(tools[0].value("name", "") == "create_new_file_with_text", "Catalog order preserved");
  Assert(tools[0].contains("inputSchema"), "inputSchema must be present");
}

void ToolsCallWithoutEndpointIsErrorResult() {
  ServerFixture fixture;
  const auto response = fixture.server.HandleMessage(
      Request(3, "tools/call", {{"name", "get_terminal_text"}, {"arguments", json::object()}}));
  Assert(!response->contains("error"), "NoEndpoint is a result, not a JSON-RPC error");
  const auto& result = response->at("result");
  Assert(result.value("isError", false), "isError must be set");
  Assert(result.at("content")[0].value("text", "") == "No working IDE endpoint available.",
         "NoEndpoint message expected");
}

void ToolsCallForwardsToBackend() {
  FakeIdeBackend backend(kPort);
  backend.SetToolResponse(200, R"({"status":"file contents","error":null})");
  backend.Start();

  ServerFixture fixture;
  fixture.state.PublishEndpoint({"127.0.0.1", kPort, "/api/mcp"});
  const auto response = fixture.server.HandleMessage(
      Request(4, "tools/call",
              {{"name", "get_file_text_by_path"}, {"arguments", {{"pathInProject", "a.txt"}}}}));
  const auto& result = response->at("result");
  Assert(!result.value("isError", true), "Call should succeed");
  Assert(result.at("content")[0].value("text", "") == "file contents", "Status text expected");
  Assert(backend.last_call_tool() == "get_file_text_by_path", "Backend route mismatch");
}

void ProtocolErrors() {
  ServerFixture fixture;

  const auto unknown = fixture.server.HandleMessage(Request(5, "resources/list"));
  Assert(unknown->at("error").value("code", 0) == -32601, "Unknown method is -32601");

  const auto bad_params =
      fixture.server.HandleMessage(Request(6, "tools/call", {{"arguments", json::object()}}));
  Assert(bad_params->at("error").value("code", 0) == -32602, "Missing name is -32602");

  const auto notification = fixture.server.HandleMessage(
      {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
  Assert(!notification.has_value(), "Notifications are not answered");

  const auto not_object = fixture.server.HandleMessage(json::array());
  Assert(not_object->at("error").value("code", 0) == -32600, "Non-object is -32600");
}

void RunServesNewlineDelimitedMessages() {
  std::string input;
  input += Request(1, "initialize").dump() + "\n";
  input += R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n";
  input += Request(2, "ping").dump() + "\n";
  input += "this is not json\n";
  input += Request(3, "tools/list").dump() + "\n";
  input += R"({"jsonrpc":"2.0","method":"exit"})" "\n";
  input += Request(4, "ping").dump() + "\n";

  ServerFixture fixture(input);
  fixture.server.Run();

  const auto messages = ReadLines(fixture.out.str());
  Assert(messages.size() == 4, "Expected four responses, got " + std::to_string(messages.size()));
  Assert(messages[0].value("id", 0) == 1 && messages[0].contains("result"), "initialize reply");
  Assert(messages[1].value("id", 0) == 2 && messages[1].at("result").empty(), "ping reply");
  Assert(messages[2].at("id").is_null() && messages[2].at("error").value("code", 0) == -32700,
         "Parse error reply");
  Assert(messages[3].value("id", 0) == 3, "tools/list reply; nothing after exit");
}

void RunAnswersContentLengthFramingInKind() {
  const std::string body = Request(7, "ping").dump();
  ServerFixture fixture("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
  fixture.server.Run();

  const std::string expected_body = core::mcp::MakeResultPayload(7, json::object()).dump();
  Assert(fixture.out.str() ==
             "Content-Length: " + std::to_string(expected_body.size()) + "\r\n\r\n" + expected_body,
         "Response must use Content-Length framing: " + fixture.out.str());
}

std::string Frame(const std::string& body) {
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

// Splits Content-Length framed output into its JSON bodies.
std::vector<json> ReadFrames(const std::string& output) {
  std::vector<json> messages;
  std::size_t pos = 0;
  while (pos < output.size()) {
    const auto header_end = output.find("\r\n\r\n", pos);
    Assert(header_end != std::string::npos, "Unterminated header in output");
    const auto length = std::stoul(output.substr(pos + 16, header_end - pos - 16));
    messages.push_back(json::parse(output.substr(header_end + 4, length)));
    pos = header_end + 4 + length;
  }
  return messages;
}

void OversizedFrameIsSkippedAndReadingContinues() {
  const std::size_t oversized = core::mcp::kMaxMessageBytes + 1;
  std::string input = "Content-Length: " + std::to_string(oversized) + "\r\n\r\n";
  input += std::string(oversized, ' ');
  input += Frame(Request(8, "ping").dump());

  ServerFixture fixture(input);
  fixture.server.Run();

  const auto messages = ReadFrames(fixture.out.str());
  Assert(messages.size() == 2, "Expected a parse error and the ping reply");
  Assert(messages[0].at("id").is_null() && messages[0].at("error").value("code", 0) == -32700,
         "Oversized frame is answered with a parse error");
  Assert(messages[1].value("id", 0) == 8 && messages[1].contains("result"),
         "The frame after the oversized one is still served");
}

void AbsurdContentLengthDoesNotEndTheServer() {
  ServerFixture fixture("Content-Length: 18446744073709551615\r\n\r\n" +
                        Request(9, "ping").dump());
  fixture.server.Run();

  const auto messages = ReadFrames(fixture.out.str());
  Assert(messages.size() == 1, "Exactly one reply expected");
  Assert(messages[0].at("error").value("code", 0) == -32700, "Parse error expected");
}

void ToolsChangedNotificationWaitsForInitialize() {
  ServerFixture fixture;
  fixture.server.NotifyToolsChanged();
  Assert(fixture.out.str().empty(), "No notification before initialize");

  fixture.server.HandleMessage(Request(1, "initialize"));
  fixture.server.NotifyToolsChanged();
  const auto messages = ReadLines(fixture.out.str());
  Assert(messages.size() == 1, "One notification expected");
  Assert(messages[0].value("method", "") == "notifications/tools/list_changed",
         "list_changed notification expected");
  Assert(!messages[0].contains("id"), "Notifications carry no id");
}

}  // namespace

int main() {
  return test_support::RunCases(
      "mcp_server_test",
      {
          {"InitializeAdvertisesListChanged", InitializeAdvertisesListChanged},
          {"ToolsListWithoutEndpointReturnsDefaults", ToolsListWithoutEndpointReturnsDefaults},
          {"ToolsCallWithoutEndpointIsErrorResult", ToolsCallWithoutEndpointIsErrorResult},
          {"ToolsCallForwardsToBackend", ToolsCallForwardsToBackend},
          {"ProtocolErrors", ProtocolErrors},
          {"RunServesNewlineDelimitedMessages", RunServesNewlineDelimitedMessages},
          {"RunAnswersContentLengthFramingInKind", RunAnswersContentLengthFramingInKind},
          {"OversizedFrameIsSkippedAndReadingContinues",
           OversizedFrameIsSkippedAndReadingContinues},
          {"AbsurdContentLengthDoesNotEndTheServer", AbsurdContentLengthDoesNotEndTheServer},
          {"ToolsChangedNotificationWaitsForInitialize",
           ToolsChangedNotificationWaitsForInitialize},
      });
}
