#include "mcp_protocol.hpp"

#include <iostream>
#include <utility>

namespace bridge {
namespace {

static bool IsValidId(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

static bool IsSupportedProtocolVersion(const std::string& v) {
  return v == "2024-11-05" || v == "2025-03-26" || v == "2025-06-18";
}

}  // namespace

std::optional<JsonRpcRequest> ParseJsonRpcRequest(const nlohmann::json& message,
                                                  nlohmann::json* id_out,
                                                  std::string* err) {
  if (id_out) *id_out = nullptr;
  if (!message.is_object()) {
    if (err) *err = message.is_array() ? "Batch requests are not supported" : "Request must be a JSON object";
    return std::nullopt;
  }

  JsonRpcRequest req;
  auto id_it = message.find("id");
  if (id_it != message.end()) {
    if (!IsValidId(*id_it)) {
      if (err) *err = "id must be a string, an integer or null";
      return std::nullopt;
    }
    req.id = *id_it;
    if (id_out) *id_out = *id_it;
  }

  auto ver_it = message.find("jsonrpc");
  if (ver_it == message.end() || !ver_it->is_string() || ver_it->get<std::string>() != kJsonRpcVersion) {
    if (err) *err = "jsonrpc must be \"2.0\"";
    return std::nullopt;
  }

  auto method_it = message.find("method");
  if (method_it == message.end() || !method_it->is_string()) {
    if (err) *err = "method must be a string";
    return std::nullopt;
  }
  req.method = method_it->get<std::string>();

  auto params_it = message.find("params");
  if (params_it != message.end() && !params_it->is_null()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      if (err) *err = "params must be an object or an array";
      return std::nullopt;
    }
    req.params = *params_it;
  }
  return req;
}

nlohmann::json MakeResultResponse(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json MakeErrorResponse(const nlohmann::json& id, int code, const std::string& message) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::optional<nlohmann::json> InternalErrorResponseFor(const nlohmann::json& message) {
  if (!message.is_object() || !message.contains("method")) return std::nullopt;
  auto id_it = message.find("id");
  if (id_it == message.end() || !IsValidId(*id_it)) return std::nullopt;
  return MakeErrorResponse(*id_it, kJsonRpcInternalError, "Internal error");
}

nlohmann::json ToolDescriptorJson(const ToolSchema& schema) {
  nlohmann::json out;
  out["name"] = schema.name;
  out["description"] = schema.description;
  out["inputSchema"] = InputSchemaJson(schema);
  return out;
}

nlohmann::json ToolCallResultJson(const InvocationResult& result) {
  nlohmann::json content = nlohmann::json::array();
  nlohmann::json block;
  block["type"] = "text";
  block["text"] = result.ok() ? result.payload() : "Error: " + result.error().message;
  content.push_back(std::move(block));
  return nlohmann::json{{"content", std::move(content)}, {"isError", !result.ok()}};
}

McpProtocol::McpProtocol(const Dispatcher* dispatcher, McpServerInfo info)
    : dispatcher_(dispatcher), info_(std::move(info)) {}

std::optional<nlohmann::json> McpProtocol::HandleText(const std::string& body) const {
  auto message = nlohmann::json::parse(body, nullptr, false);
  if (message.is_discarded()) return MakeErrorResponse(nullptr, kJsonRpcParseError, "Parse error");
  return Handle(message);
}

std::optional<nlohmann::json> McpProtocol::Handle(const nlohmann::json& message) const {
  // Replies to server-initiated requests; the bridge never issues any.
  if (message.is_object() && !message.contains("method") && (message.contains("result") || message.contains("error"))) {
    return std::nullopt;
  }

  nlohmann::json id;
  std::string err;
  auto req = ParseJsonRpcRequest(message, &id, &err);
  if (!req) return MakeErrorResponse(id, kJsonRpcInvalidRequest, err);

  if (!req->id) {
    if (req->method.rfind("notifications/", 0) != 0) {
      std::cout << "[http] ignoring notification method=" << req->method << "\n";
    }
    return std::nullopt;
  }

  if (req->method == "initialize") return MakeResultResponse(*req->id, Initialize(req->params));
  if (req->method == "ping") return MakeResultResponse(*req->id, nlohmann::json::object());
  if (req->method == "tools/list") return MakeResultResponse(*req->id, ListTools());
  if (req->method == "tools/call") {
    if (!dispatcher_) return MakeErrorResponse(*req->id, kJsonRpcInternalError, "No dispatcher configured");
    auto result = CallTool(*req, &err);
    if (!result) return MakeErrorResponse(*req->id, kJsonRpcInvalidParams, err);
    return MakeResultResponse(*req->id, *result);
  }
  return MakeErrorResponse(*req->id, kJsonRpcMethodNotFound, "Method not found: " + req->method);
}

nlohmann::json McpProtocol::Initialize(const nlohmann::json& params) const {
  std::string version = kMcpProtocolVersion;
  if (params.is_object()) {
    auto it = params.find("protocolVersion");
    if (it != params.end() && it->is_string() && IsSupportedProtocolVersion(it->get<std::string>())) {
      version = it->get<std::string>();
    }
  }
  nlohmann::json out;
  out["protocolVersion"] = version;
  out["capabilities"] = {{"tools", {{"listChanged", false}}}};
  out["serverInfo"] = {{"name", info_.name}, {"version", info_.version}};
  return out;
}

nlohmann::json McpProtocol::ListTools() const {
  nlohmann::json tools = nlohmann::json::array();
  if (dispatcher_) {
    for (const auto& schema : dispatcher_->tools().ListSchemas()) tools.push_back(ToolDescriptorJson(schema));
  }
  return nlohmann::json{{"tools", std::move(tools)}};
}

std::optional<nlohmann::json> McpProtocol::CallTool(const JsonRpcRequest& req, std::string* err) const {
  if (!req.params.is_object()) {
    if (err) *err = "tools/call params must be an object";
    return std::nullopt;
  }
  auto name_it = req.params.find("name");
  if (name_it == req.params.end() || !name_it->is_string()) {
    if (err) *err = "tools/call requires a string 'name'";
    return std::nullopt;
  }

  InvocationRequest invocation;
  invocation.tool_name = name_it->get<std::string>();
  invocation.request_id = *req.id;
  auto args_it = req.params.find("arguments");
  if (args_it != req.params.end() && !args_it->is_null()) invocation.arguments = *args_it;

  return ToolCallResultJson(dispatcher_->Dispatch(invocation));
}

}  // namespace bridge
