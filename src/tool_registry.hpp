#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bridge {

enum class ArgumentType {
  kString,
  kInteger,
  kNumber,
  kBoolean,
  kObject,
  kArray,
};

const char* ArgumentTypeName(ArgumentType type);

struct ArgumentSpec {
  std::string name;
  ArgumentType type = ArgumentType::kString;
  std::string description;
  bool required = false;
};

struct ToolSchema {
  std::string name;
  std::string description;
  std::vector<ArgumentSpec> arguments;

  const ArgumentSpec* FindArgument(const std::string& name) const;
};

// Read-only view over an argument object that already passed ValidateArguments.
class ToolArguments {
 public:
  explicit ToolArguments(const nlohmann::json& values) : values_(values) {}

  bool Has(const std::string& name) const;
  std::string GetString(const std::string& name) const;
  std::optional<std::string> FindString(const std::string& name) const;
  std::optional<int64_t> FindInteger(const std::string& name) const;
  std::optional<bool> FindBoolean(const std::string& name) const;

 private:
  const nlohmann::json& values_;
};

// Returns the tool output as JSON, or std::nullopt with *err set.
using ToolHandler = std::function<std::optional<nlohmann::json>(const ToolArguments& arguments, BridgeError* err)>;

struct ToolDescriptor {
  ToolSchema schema;
  ToolHandler handler;
};

// Populated once during startup, before the listener accepts traffic, and only read afterwards.
class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;
  ToolRegistry(ToolRegistry&&) noexcept = default;
  ToolRegistry& operator=(ToolRegistry&&) noexcept = default;

  bool RegisterTool(ToolSchema schema, ToolHandler handler, BridgeError* err);
  const ToolDescriptor* Lookup(const std::string& name, BridgeError* err) const;
  bool HasTool(const std::string& name) const;
  std::vector<ToolSchema> ListSchemas() const;
  size_t Size() const { return order_.size(); }

 private:
  std::unordered_map<std::string, ToolDescriptor> tools_;
  std::vector<std::string> order_;
};

nlohmann::json InputSchemaJson(const ToolSchema& schema);

// Fills *normalized with the accepted arguments (nulls for optional arguments dropped).
bool ValidateArguments(const ToolSchema& schema,
                       const nlohmann::json& arguments,
                       nlohmann::json* normalized,
                       BridgeError* err);

}  // namespace bridge
