#include "errors.hpp"

#include <utility>

namespace bridge {

ErrorKind KindOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::kMalformedRequest:
    case ErrorCode::kUnknownTool:
    case ErrorCode::kSessionNotFound:
    case ErrorCode::kDuplicateTool:
    case ErrorCode::kQueueClosed:
      return ErrorKind::kProtocol;
    case ErrorCode::kInvalidArgument:
      return ErrorKind::kValidation;
    case ErrorCode::kBackendUnavailable:
    case ErrorCode::kBackendQueryError:
    case ErrorCode::kHandlerFailed:
      return ErrorKind::kBackend;
    case ErrorCode::kWriteFailed:
    case ErrorCode::kConnectionClosed:
      return ErrorKind::kTransport;
  }
  return ErrorKind::kProtocol;
}

const char* KindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kProtocol:
      return "protocol_error";
    case ErrorKind::kValidation:
      return "validation_error";
    case ErrorKind::kBackend:
      return "backend_error";
    case ErrorKind::kTransport:
      return "transport_error";
  }
  return "protocol_error";
}

const char* CodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kMalformedRequest:
      return "malformed_request";
    case ErrorCode::kUnknownTool:
      return "unknown_tool";
    case ErrorCode::kSessionNotFound:
      return "session_not_found";
    case ErrorCode::kDuplicateTool:
      return "duplicate_tool";
    case ErrorCode::kQueueClosed:
      return "queue_closed";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kBackendUnavailable:
      return "backend_unavailable";
    case ErrorCode::kBackendQueryError:
      return "backend_query_error";
    case ErrorCode::kHandlerFailed:
      return "handler_failed";
    case ErrorCode::kWriteFailed:
      return "write_failed";
    case ErrorCode::kConnectionClosed:
      return "connection_closed";
  }
  return "unknown";
}

BridgeError MakeError(ErrorCode code, std::string message) {
  BridgeError e;
  e.kind = KindOf(code);
  e.code = code;
  e.message = std::move(message);
  return e;
}

BridgeError MakeError(ErrorCode code, std::string message, nlohmann::json context) {
  auto e = MakeError(code, std::move(message));
  if (context.is_object()) e.context = std::move(context);
  return e;
}

void SetError(BridgeError* err, ErrorCode code, std::string message) {
  if (err) *err = MakeError(code, std::move(message));
}

nlohmann::json ErrorToJson(const BridgeError& error) {
  nlohmann::json j;
  j["type"] = KindName(error.kind);
  j["code"] = CodeName(error.code);
  j["message"] = error.message;
  if (error.context.is_object() && !error.context.empty()) j["context"] = error.context;
  return j;
}

int HttpStatusFor(const BridgeError& error) {
  switch (error.code) {
    case ErrorCode::kMalformedRequest:
    case ErrorCode::kInvalidArgument:
      return 400;
    case ErrorCode::kUnknownTool:
    case ErrorCode::kSessionNotFound:
      return 404;
    case ErrorCode::kDuplicateTool:
      return 409;
    case ErrorCode::kBackendQueryError:
      return 502;
    case ErrorCode::kBackendUnavailable:
    case ErrorCode::kQueueClosed:
      return 503;
    default:
      return 500;
  }
}

}  // namespace bridge
