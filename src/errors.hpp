#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace bridge {

enum class ErrorKind {
  kProtocol,
  kValidation,
  kBackend,
  kTransport,
};

enum class ErrorCode {
  kMalformedRequest,
  kUnknownTool,
  kSessionNotFound,
  kDuplicateTool,
  kQueueClosed,
  kInvalidArgument,
  kBackendUnavailable,
  kBackendQueryError,
  kHandlerFailed,
  kWriteFailed,
  kConnectionClosed,
};

struct BridgeError {
  ErrorKind kind = ErrorKind::kProtocol;
  ErrorCode code = ErrorCode::kMalformedRequest;
  std::string message;
  nlohmann::json context = nlohmann::json::object();
};

ErrorKind KindOf(ErrorCode code);
const char* KindName(ErrorKind kind);
const char* CodeName(ErrorCode code);

BridgeError MakeError(ErrorCode code, std::string message);
BridgeError MakeError(ErrorCode code, std::string message, nlohmann::json context);

// Sets *err when err is non-null. Mirrors the `std::string* err` convention used by callers.
void SetError(BridgeError* err, ErrorCode code, std::string message);

// {"type": <kind>, "code": <code>, "message": ...[, "context": {...}]}
nlohmann::json ErrorToJson(const BridgeError& error);

int HttpStatusFor(const BridgeError& error);

}  // namespace bridge
