#pragma once

#include "errors.hpp"
#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace bridge {

struct InvocationRequest {
  std::string tool_name;
  nlohmann::json arguments = nlohmann::json::object();
  // Correlation token echoed back on the result; string, integer or null.
  nlohmann::json request_id;
};

struct InvocationSuccess {
  std::string payload;
};

class InvocationResult {
 public:
  static InvocationResult Success(nlohmann::json request_id, std::string payload);
  static InvocationResult Failure(nlohmann::json request_id, BridgeError error);

  bool ok() const { return std::holds_alternative<InvocationSuccess>(outcome_); }
  const std::string& payload() const { return std::get<InvocationSuccess>(outcome_).payload; }
  const BridgeError& error() const { return std::get<BridgeError>(outcome_); }
  const nlohmann::json& request_id() const { return request_id_; }

 private:
  InvocationResult(nlohmann::json request_id, std::variant<InvocationSuccess, BridgeError> outcome);

  nlohmann::json request_id_;
  std::variant<InvocationSuccess, BridgeError> outcome_;
};

// Stable, human-readable rendering used for Success payloads.
std::string SerializePayload(const nlohmann::json& value);

class Dispatcher {
 public:
  explicit Dispatcher(const ToolRegistry* tools);

  // Never throws: every path yields exactly one result.
  InvocationResult Dispatch(const InvocationRequest& request) const noexcept;

  const ToolRegistry& tools() const { return *tools_; }

 private:
  InvocationResult DispatchUnchecked(const InvocationRequest& request) const;

  const ToolRegistry* tools_;
};

}  // namespace bridge
