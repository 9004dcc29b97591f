#pragma once

#include <atomic>
#include <cstddef>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include "core/call_dispatcher.hpp"
#include "core/tool_registry.hpp"
#include "nlohmann/json.hpp"

namespace core::mcp {

// Content-Length framed messages above this size are skipped unread.
constexpr std::size_t kMaxMessageBytes = 4 * 1024 * 1024;

struct ServerInfo {
  std::string name = "jetbrains/proxy";
  std::string version = "0.1.0";
};

// JSON-RPC 2.0 over a byte stream. Reads newline-delimited JSON and also
// accepts Content-Length framed messages, answering in the framing last seen.
class McpServer {
 public:
  McpServer(ToolRegistry& registry, const CallDispatcher& dispatcher, std::istream& in,
            std::ostream& out, ServerInfo info = {});

  McpServer(const McpServer&) = delete;
  McpServer& operator=(const McpServer&) = delete;

  // Serves until end of input or an "exit" request.
  void Run();

  // Returns the response to send, or nothing for notifications.
  std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

  // Safe to call from any thread. Dropped until the client has initialized.
  void NotifyToolsChanged();

  bool initialized() const { return initialized_.load(); }

 private:
  enum class Framing { kNewlineDelimited, kContentLength };

  std::optional<std::string> ReadMessage();
  void WriteMessage(const nlohmann::json& payload);

  nlohmann::json HandleInitialize(const nlohmann::json& params);
  nlohmann::json HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params);

  ToolRegistry& registry_;
  const CallDispatcher& dispatcher_;
  std::istream& in_;
  std::ostream& out_;
  ServerInfo info_;

  std::mutex write_mutex_;
  Framing framing_ = Framing::kNewlineDelimited;
  std::atomic<bool> initialized_{false};
  bool exit_requested_ = false;
};

nlohmann::json MakeResultPayload(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeErrorPayload(const nlohmann::json& id, int code, const std::string& message);

}  // namespace core::mcp
