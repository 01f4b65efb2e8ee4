#pragma once

#include "dispatcher.hpp"
#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace bridge {

inline constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr const char* kMcpProtocolVersion = "2024-11-05";

inline constexpr int kJsonRpcParseError = -32700;
inline constexpr int kJsonRpcInvalidRequest = -32600;
inline constexpr int kJsonRpcMethodNotFound = -32601;
inline constexpr int kJsonRpcInvalidParams = -32602;
inline constexpr int kJsonRpcInternalError = -32603;

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params = nlohmann::json::object();
  // Absent for notifications.
  std::optional<nlohmann::json> id;
};

// Checks the 2.0 envelope. On failure *err names the problem and, when the message
// carried a usable id, *id_out receives it so the error can still be correlated.
std::optional<JsonRpcRequest> ParseJsonRpcRequest(const nlohmann::json& message,
                                                  nlohmann::json* id_out,
                                                  std::string* err);

nlohmann::json MakeResultResponse(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeErrorResponse(const nlohmann::json& id, int code, const std::string& message);

// -32603 reply owed to `message` when handling it failed outright; nullopt for notifications.
std::optional<nlohmann::json> InternalErrorResponseFor(const nlohmann::json& message);

nlohmann::json ToolDescriptorJson(const ToolSchema& schema);

// MCP CallToolResult: the payload as one text content block, or "Error: <message>"
// with isError set.
nlohmann::json ToolCallResultJson(const InvocationResult& result);

struct McpServerInfo {
  std::string name = "bigquery";
  std::string version = "0.3.0";
};

class McpProtocol {
 public:
  McpProtocol(const Dispatcher* dispatcher, McpServerInfo info);

  // Returns the response to send, or std::nullopt when the message is a notification.
  std::optional<nlohmann::json> Handle(const nlohmann::json& message) const;
  std::optional<nlohmann::json> HandleText(const std::string& body) const;

  const McpServerInfo& info() const { return info_; }

 private:
  nlohmann::json Initialize(const nlohmann::json& params) const;
  nlohmann::json ListTools() const;
  std::optional<nlohmann::json> CallTool(const JsonRpcRequest& req, std::string* err) const;

  const Dispatcher* dispatcher_;
  McpServerInfo info_;
};

}  // namespace bridge
