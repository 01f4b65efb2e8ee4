#include "dispatcher.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace bridge {
namespace {

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  s.resize(max_chars);
  s += kSuffix;
  return s;
}

static std::string IdForLog(const nlohmann::json& id) {
  if (id.is_null()) return "-";
  if (id.is_string()) return id.get<std::string>();
  return id.dump();
}

static void LogDispatch(const InvocationRequest& request, const InvocationResult& result, long long elapsed_ms) {
  std::ostringstream line;
  line << "[dispatch] id=" << IdForLog(request.request_id) << " tool=" << request.tool_name
       << " arguments=" << TruncateForLog(request.arguments.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), 500)
       << " ok=" << (result.ok() ? 1 : 0) << " elapsed_ms=" << elapsed_ms;
  if (result.ok()) {
    line << " payload_bytes=" << result.payload().size();
  } else {
    line << " error=" << CodeName(result.error().code) << " message=" << TruncateForLog(result.error().message, 500);
  }
  line << "\n";
  std::cout << line.str();
}

}  // namespace

InvocationResult::InvocationResult(nlohmann::json request_id, std::variant<InvocationSuccess, BridgeError> outcome)
    : request_id_(std::move(request_id)), outcome_(std::move(outcome)) {}

InvocationResult InvocationResult::Success(nlohmann::json request_id, std::string payload) {
  return InvocationResult(std::move(request_id), InvocationSuccess{std::move(payload)});
}

InvocationResult InvocationResult::Failure(nlohmann::json request_id, BridgeError error) {
  return InvocationResult(std::move(request_id), std::move(error));
}

std::string SerializePayload(const nlohmann::json& value) {
  return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

Dispatcher::Dispatcher(const ToolRegistry* tools) : tools_(tools) {}

InvocationResult Dispatcher::Dispatch(const InvocationRequest& request) const noexcept {
  const auto started = std::chrono::steady_clock::now();
  auto result = [&]() -> InvocationResult {
    try {
      return DispatchUnchecked(request);
    } catch (const std::exception& e) {
      return InvocationResult::Failure(
          request.request_id,
          MakeError(ErrorCode::kHandlerFailed, std::string("Error executing ") + request.tool_name + ": " + e.what(),
                    {{"tool", request.tool_name}}));
    } catch (...) {
      return InvocationResult::Failure(
          request.request_id,
          MakeError(ErrorCode::kHandlerFailed, "Error executing " + request.tool_name + ": unknown exception",
                    {{"tool", request.tool_name}}));
    }
  }();
  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  try {
    LogDispatch(request, result, elapsed_ms);
  } catch (const std::exception& e) {
    std::cout << "[dispatch] log failed: " << e.what() << "\n";
  }
  return result;
}

InvocationResult Dispatcher::DispatchUnchecked(const InvocationRequest& request) const {
  BridgeError err;
  const auto* tool = tools_ ? tools_->Lookup(request.tool_name, &err) : nullptr;
  if (!tool) {
    if (!tools_) err = MakeError(ErrorCode::kUnknownTool, "Unknown tool: " + request.tool_name);
    return InvocationResult::Failure(request.request_id, std::move(err));
  }

  nlohmann::json validated;
  if (!ValidateArguments(tool->schema, request.arguments, &validated, &err)) {
    return InvocationResult::Failure(request.request_id, std::move(err));
  }

  err = BridgeError{};
  auto output = tool->handler(ToolArguments(validated), &err);
  if (!output) {
    if (err.message.empty()) {
      err = MakeError(ErrorCode::kHandlerFailed, "Error executing " + request.tool_name, {{"tool", request.tool_name}});
    }
    return InvocationResult::Failure(request.request_id, std::move(err));
  }
  return InvocationResult::Success(request.request_id, SerializePayload(*output));
}

}  // namespace bridge
