#include "core/mcp_server.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>
#include <utility>

#include "core/logging.hpp"

namespace core::mcp {
namespace {

using core::logging::LogDebug;
using core::logging::LogInfo;
using core::logging::LogWarn;
using nlohmann::json;

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr char kDefaultProtocolVersion[] = "2024-11-05";

void StripCarriageReturn(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

// Returns the header name lowercased and its value trimmed, if `line` is a header.
std::optional<std::pair<std::string, std::string>> SplitHeader(const std::string& line) {
  const auto colon = line.find(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  std::string key = line.substr(0, colon);
  std::string value = line.substr(colon + 1);
  key.erase(std::remove_if(key.begin(), key.end(),
                           [](unsigned char ch) { return std::isspace(ch) != 0; }),
            key.end());
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [](unsigned char ch) { return std::isspace(ch) == 0; }));
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return std::make_pair(std::move(key), std::move(value));
}

bool IsContentLengthHeader(const std::string& line) {
  if (line.empty() || line.front() == '{' || line.front() == '[') {
    return false;
  }
  const auto header = SplitHeader(line);
  return header && header->first == "content-length";
}

std::size_t ParseContentLength(const std::string& value) {
  try {
    return static_cast<std::size_t>(std::stoul(value));
  } catch (const std::exception& ex) {
    LogWarn("Invalid Content-Length header '" + value + "': " + ex.what());
    return 0;
  }
}

}  // namespace

json MakeResultPayload(const json& id, const json& result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json MakeErrorPayload(const json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

McpServer::McpServer(ToolRegistry& registry, const CallDispatcher& dispatcher, std::istream& in,
                     std::ostream& out, ServerInfo info)
    : registry_(registry), dispatcher_(dispatcher), in_(in), out_(out), info_(std::move(info)) {}

void McpServer::Run() {
  LogInfo(info_.name + " MCP server running on stdio");
  while (!exit_requested_) {
    auto raw = ReadMessage();
    if (!raw) {
      break;
    }

    const json message = json::parse(*raw, nullptr, false);
    if (message.is_discarded()) {
      LogWarn("Discarding unparseable message: " + raw->substr(0, 200));
      WriteMessage(MakeErrorPayload(nullptr, kParseError, "Parse error"));
      continue;
    }

    if (auto response = HandleMessage(message)) {
      WriteMessage(*response);
    }
  }
  LogInfo("MCP input closed, shutting down");
}

std::optional<json> McpServer::HandleMessage(const json& message) {
  if (!message.is_object()) {
    return MakeErrorPayload(nullptr, kInvalidRequest, "Request must be a JSON object");
  }

  const auto id_it = message.find("id");
  const bool is_notification = id_it == message.end();
  const json id = is_notification ? json() : *id_it;

  const auto method_it = message.find("method");
  if (method_it == message.end() || !method_it->is_string()) {
    if (!is_notification && (message.contains("result") || message.contains("error"))) {
      // A response to something we sent; the bridge sends no requests.
      return std::nullopt;
    }
    return MakeErrorPayload(id, kInvalidRequest, "Missing method");
  }

  const auto method = method_it->get<std::string>();
  const json params = message.value("params", json::object());
  LogDebug("Handling " + method + (is_notification ? " notification" : " request"));

  if (method == "exit") {
    exit_requested_ = true;
    return std::nullopt;
  }
  if (is_notification) {
    return std::nullopt;
  }

  if (method == "initialize") {
    return MakeResultPayload(id, HandleInitialize(params));
  }
  if (method == "tools/list") {
    return MakeResultPayload(id, {{"tools", registry_.ListToolsJson()}});
  }
  if (method == "tools/call") {
    return HandleToolsCall(id, params);
  }
  if (method == "ping" || method == "shutdown") {
    return MakeResultPayload(id, json::object());
  }
  return MakeErrorPayload(id, kMethodNotFound, "Unsupported method: " + method);
}

json McpServer::HandleInitialize(const json& params) {
  initialized_ = true;
  std::string protocol_version = kDefaultProtocolVersion;
  if (const auto it = params.find("protocolVersion"); it != params.end() && it->is_string()) {
    protocol_version = it->get<std::string>();
  }
  return {
      {"protocolVersion", protocol_version},
      {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
      {"capabilities", {{"tools", {{"listChanged", true}}}}},
  };
}

json McpServer::HandleToolsCall(const json& id, const json& params) {
  if (!params.is_object()) {
    return MakeErrorPayload(id, kInvalidParams, "params must be an object");
  }
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    return MakeErrorPayload(id, kInvalidParams, "params.name must be a string");
  }
  const auto arguments = params.value("arguments", json::object());

  try {
    const auto result = dispatcher_.Invoke(name_it->get<std::string>(), arguments);
    return MakeResultPayload(id, ToCallToolResult(result));
  } catch (const std::exception& ex) {
    return MakeErrorPayload(id, kInternalError, ex.what());
  }
}

void McpServer::NotifyToolsChanged() {
  if (!initialized_) {
    LogDebug("Client not initialized yet, skipping tools changed notification");
    return;
  }
  LogInfo("Sending tools changed notification");
  WriteMessage({{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});
}

std::optional<std::string> McpServer::ReadMessage() {
  std::string line;
  while (std::getline(in_, line)) {
    StripCarriageReturn(line);
    if (line.empty()) {
      continue;
    }

    if (!IsContentLengthHeader(line)) {
      std::lock_guard<std::mutex> lock(write_mutex_);
      framing_ = Framing::kNewlineDelimited;
      return line;
    }

    std::size_t content_length = ParseContentLength(SplitHeader(line)->second);
    while (std::getline(in_, line)) {
      StripCarriageReturn(line);
      if (line.empty()) {
        break;
      }
      const auto header = SplitHeader(line);
      if (header && header->first == "content-length") {
        content_length = ParseContentLength(header->second);
      }
    }

    if (content_length > kMaxMessageBytes) {
      LogWarn("Discarding Content-Length framed message of " + std::to_string(content_length) +
              " bytes, limit is " + std::to_string(kMaxMessageBytes));
      in_.ignore(content_length >= static_cast<std::size_t>(
                                       std::numeric_limits<std::streamsize>::max())
                     ? std::numeric_limits<std::streamsize>::max()
                     : static_cast<std::streamsize>(content_length));
      std::lock_guard<std::mutex> lock(write_mutex_);
      framing_ = Framing::kContentLength;
      // An empty body is answered with a parse error.
      return std::string{};
    }

    std::string body(content_length, '\0');
    in_.read(body.data(), static_cast<std::streamsize>(content_length));
    if (in_.gcount() != static_cast<std::streamsize>(content_length)) {
      LogWarn("Input ended inside a Content-Length framed message");
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    framing_ = Framing::kContentLength;
    return body;
  }
  return std::nullopt;
}

void McpServer::WriteMessage(const json& payload) {
  const std::string serialized = payload.dump();
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (framing_ == Framing::kContentLength) {
    out_ << "Content-Length: " << serialized.size() << "\r\n\r\n" << serialized;
  } else {
    out_ << serialized << '\n';
  }
  out_.flush();
}

}  // namespace core::mcp
