#include "mcp_router.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace bridge {
namespace {

static std::string NormalizePrefix(std::string p) {
  if (p.empty() || p == "/") return {};
  if (p.back() == '/') p.pop_back();
  if (p.empty()) return {};
  if (p.front() != '/') p.insert(p.begin(), '/');
  return p;
}

static std::string EscapeRegex(const std::string& s) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (kSpecial.find(c) != std::string::npos) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static void SendError(httplib::Response* res, const BridgeError& error, const nlohmann::json& request_id = nullptr) {
  nlohmann::json j;
  j["error"] = ErrorToJson(error);
  if (!request_id.is_null()) j["requestId"] = request_id;
  SendJson(res, HttpStatusFor(error), j);
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  return nlohmann::json::parse(req.body, nullptr, false);
}

static bool IsWhitespace(const std::string& s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
  }
  return true;
}

static bool IsValidRequestId(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

// {"toolName": ..., "arguments": {...}, "requestId": ...}; "name" is accepted for "toolName".
static bool ParseCallEnvelope(const nlohmann::json& body, InvocationRequest* out, BridgeError* err) {
  if (!body.is_object()) {
    SetError(err, ErrorCode::kMalformedRequest, "Request body must be a JSON object");
    return false;
  }
  auto name_it = body.find("toolName");
  if (name_it == body.end()) name_it = body.find("name");
  if (name_it == body.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
    SetError(err, ErrorCode::kMalformedRequest, "Request body requires a string 'toolName'");
    return false;
  }
  out->tool_name = name_it->get<std::string>();

  auto args_it = body.find("arguments");
  if (args_it != body.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      SetError(err, ErrorCode::kMalformedRequest, "'arguments' must be a JSON object");
      return false;
    }
    out->arguments = *args_it;
  }

  auto id_it = body.find("requestId");
  if (id_it != body.end()) {
    if (!IsValidRequestId(*id_it)) {
      SetError(err, ErrorCode::kMalformedRequest, "'requestId' must be a string, an integer or null");
      return false;
    }
    out->request_id = *id_it;
  }
  return true;
}

static void LogTransportError(const BridgeError& error) {
  std::cout << "[http] " << KindName(error.kind) << " " << ErrorToJson(error).dump() << "\n";
}

}  // namespace

BridgeError StreamTeardownError(const std::string& session_id, bool write_failed) {
  if (write_failed) {
    return MakeError(ErrorCode::kWriteFailed, "SSE write failed", {{"session_id", session_id}});
  }
  return MakeError(ErrorCode::kConnectionClosed, "SSE client disconnected", {{"session_id", session_id}});
}

McpRouter::McpRouter(SessionManager* sessions,
                     const Dispatcher* dispatcher,
                     const McpProtocol* protocol,
                     McpRouterOptions options)
    : sessions_(sessions),
      dispatcher_(dispatcher),
      protocol_(protocol),
      prefix_(NormalizePrefix(options.prefix)),
      keepalive_(options.keepalive) {
  if (keepalive_.count() <= 0) keepalive_ = std::chrono::milliseconds(15000);
}

void McpRouter::Register(httplib::Server* server) {
  const std::string root = prefix_.empty() ? "/" : prefix_;

  server->Get(root, [this](const httplib::Request&, httplib::Response& res) { HandleStatus(res); });
  server->Post(root, [this](const httplib::Request& req, httplib::Response& res) { HandleJsonRpc(req, res); });
  server->Get(prefix_ + "/tools", [this](const httplib::Request&, httplib::Response& res) { HandleListTools(res); });
  server->Post(prefix_ + "/call",
               [this](const httplib::Request& req, httplib::Response& res) { HandleCall(req, res, std::string()); });
  server->Post(EscapeRegex(prefix_) + R"(/tools/([A-Za-z0-9_.\-]+))",
               [this](const httplib::Request& req, httplib::Response& res) { HandleCall(req, res, req.matches[1]); });
  server->Get(prefix_ + "/sse", [this](const httplib::Request&, httplib::Response& res) { HandleSse(res); });
  auto message_handler = [this](const httplib::Request& req, httplib::Response& res) { HandleMessage(req, res); };
  server->Post(prefix_ + "/messages", message_handler);
  server->Post(prefix_ + "/messages/", message_handler);
}

void McpRouter::HandleStatus(httplib::Response& res) const {
  nlohmann::json j;
  j["status"] = "ok";
  j["message"] = "MCP BigQuery server is running.";
  j["sse_endpoint"] = prefix_ + "/sse";
  SendJson(&res, 200, j);
}

void McpRouter::HandleListTools(httplib::Response& res) const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& schema : dispatcher_->tools().ListSchemas()) tools.push_back(ToolDescriptorJson(schema));
  SendJson(&res, 200, nlohmann::json{{"tools", std::move(tools)}});
}

void McpRouter::HandleCall(const httplib::Request& req, httplib::Response& res, const std::string& tool_from_path) const {
  InvocationRequest call;
  BridgeError err;

  if (tool_from_path.empty()) {
    auto body = ParseJsonBody(req);
    if (body.is_discarded()) {
      SendError(&res, MakeError(ErrorCode::kMalformedRequest, "Request body is not valid JSON"));
      return;
    }
    if (!ParseCallEnvelope(body, &call, &err)) {
      SendError(&res, err);
      return;
    }
  } else {
    call.tool_name = tool_from_path;
    if (!IsWhitespace(req.body)) {
      auto body = ParseJsonBody(req);
      if (body.is_discarded() || !(body.is_object() || body.is_null())) {
        SendError(&res, MakeError(ErrorCode::kMalformedRequest, "Request body must be a JSON object of arguments"));
        return;
      }
      if (body.is_object()) call.arguments = std::move(body);
    }
    if (req.has_header("X-Request-Id")) call.request_id = req.get_header_value("X-Request-Id");
  }

  auto result = dispatcher_->Dispatch(call);
  if (!result.ok()) {
    SendError(&res, result.error(), result.request_id());
    return;
  }
  res.status = 200;
  res.set_content(result.payload(), "application/json");
}

void McpRouter::HandleSse(httplib::Response& res) const {
  BridgeError err;
  auto session_id = sessions_->OpenSession(&err);
  if (session_id.empty()) {
    SendError(&res, err);
    return;
  }
  if (!sessions_->Push(session_id, Frame{"endpoint", prefix_ + "/messages?session_id=" + session_id}, &err)) {
    sessions_->CloseSession(session_id, CloseMode::kAbort, "open_failed");
    SendError(&res, err);
    return;
  }

  res.status = 200;
  res.set_header("Cache-Control", "no-cache");
  res.set_header("X-Accel-Buffering", "no");
  auto* sessions = sessions_;
  const auto keepalive = keepalive_;
  res.set_chunked_content_provider(
      "text/event-stream",
      [sessions, session_id, keepalive](size_t, httplib::DataSink& sink) {
        Frame frame;
        const auto status = sessions->NextFrame(session_id, keepalive, &frame);
        if (status == PollStatus::kClosed) {
          sink.done();
          return true;
        }
        const std::string bytes = status == PollStatus::kFrame ? EncodeSseFrame(frame) : EncodeSseComment("ping");
        const bool ok = (!sink.is_writable || sink.is_writable()) && sink.write && sink.write(bytes.data(), bytes.size());
        if (!ok) {
          LogTransportError(StreamTeardownError(session_id, true));
          sessions->CloseSession(session_id, CloseMode::kAbort, "write_failed");
          return false;
        }
        return true;
      },
      [sessions, session_id](bool success) {
        const bool closed_here =
            sessions->CloseSession(session_id, CloseMode::kAbort, success ? "stream_end" : "disconnect");
        if (!success && closed_here) LogTransportError(StreamTeardownError(session_id, false));
      });
}

void McpRouter::HandleMessage(const httplib::Request& req, httplib::Response& res) const {
  if (!req.has_param("session_id") || req.get_param_value("session_id").empty()) {
    SendError(&res, MakeError(ErrorCode::kMalformedRequest, "session_id is required"));
    return;
  }
  const auto session_id = req.get_param_value("session_id");

  auto message = ParseJsonBody(req);
  if (message.is_discarded()) {
    SendError(&res, MakeError(ErrorCode::kMalformedRequest, "Could not parse message"));
    return;
  }

  std::optional<Frame> on_failure;
  if (auto failure = InternalErrorResponseFor(message)) {
    on_failure = Frame{"message", failure->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
  }

  const auto* protocol = protocol_;
  BridgeError err;
  bool queued = sessions_->Submit(
      session_id,
      [protocol, message = std::move(message)]() -> std::optional<Frame> {
        auto response = protocol->Handle(message);
        if (!response) return std::nullopt;
        return Frame{"message", response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
      },
      std::move(on_failure), &err);
  if (!queued) {
    SendError(&res, err);
    return;
  }
  res.status = 202;
  res.set_content("Accepted", "text/plain");
}

void McpRouter::HandleJsonRpc(const httplib::Request& req, httplib::Response& res) const {
  auto response = protocol_->HandleText(req.body);
  if (!response) {
    res.status = 202;
    return;
  }
  SendJson(&res, 200, *response);
}

void InstallServerHandlers(httplib::Server* server) {
  server->set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    std::cout << "[http] handler exception: " << message << "\n";
    SendError(&res, MakeError(ErrorCode::kHandlerFailed, message));
  });

  server->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
    if (!res.body.empty()) return;
    const int status = res.status;
    BridgeError error = MakeError(ErrorCode::kMalformedRequest, "bad request");
    if (status == 404) {
      error.message = "not found: " + req.path;
    } else if (status >= 500) {
      error = MakeError(ErrorCode::kHandlerFailed, "server error");
    }
    nlohmann::json j;
    j["error"] = ErrorToJson(error);
    res.set_content(j.dump(), "application/json");
  });

  server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
    std::cout << "[http] " << req.method << " " << req.path << " status=" << res.status << "\n";
  });
}

}  // namespace bridge
