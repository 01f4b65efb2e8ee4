#include "tool_registry.hpp"

#include <string>
#include <utility>

namespace bridge {
namespace {

static bool MatchesType(ArgumentType type, const nlohmann::json& value) {
  switch (type) {
    case ArgumentType::kString:
      return value.is_string();
    case ArgumentType::kInteger:
      return value.is_number_integer();
    case ArgumentType::kNumber:
      return value.is_number();
    case ArgumentType::kBoolean:
      return value.is_boolean();
    case ArgumentType::kObject:
      return value.is_object();
    case ArgumentType::kArray:
      return value.is_array();
  }
  return false;
}

static std::string JsonTypeName(const nlohmann::json& value) {
  if (value.is_number_integer()) return "integer";
  if (value.is_number()) return "number";
  return value.type_name();
}

}  // namespace

const char* ArgumentTypeName(ArgumentType type) {
  switch (type) {
    case ArgumentType::kString:
      return "string";
    case ArgumentType::kInteger:
      return "integer";
    case ArgumentType::kNumber:
      return "number";
    case ArgumentType::kBoolean:
      return "boolean";
    case ArgumentType::kObject:
      return "object";
    case ArgumentType::kArray:
      return "array";
  }
  return "string";
}

const ArgumentSpec* ToolSchema::FindArgument(const std::string& arg_name) const {
  for (const auto& a : arguments) {
    if (a.name == arg_name) return &a;
  }
  return nullptr;
}

bool ToolArguments::Has(const std::string& name) const {
  return values_.is_object() && values_.contains(name) && !values_[name].is_null();
}

std::string ToolArguments::GetString(const std::string& name) const {
  auto v = FindString(name);
  return v ? *v : std::string();
}

std::optional<std::string> ToolArguments::FindString(const std::string& name) const {
  if (!Has(name) || !values_[name].is_string()) return std::nullopt;
  return values_[name].get<std::string>();
}

std::optional<int64_t> ToolArguments::FindInteger(const std::string& name) const {
  if (!Has(name) || !values_[name].is_number_integer()) return std::nullopt;
  return values_[name].get<int64_t>();
}

std::optional<bool> ToolArguments::FindBoolean(const std::string& name) const {
  if (!Has(name) || !values_[name].is_boolean()) return std::nullopt;
  return values_[name].get<bool>();
}

bool ToolRegistry::RegisterTool(ToolSchema schema, ToolHandler handler, BridgeError* err) {
  if (schema.name.empty()) {
    SetError(err, ErrorCode::kInvalidArgument, "tool name must not be empty");
    return false;
  }
  if (!handler) {
    SetError(err, ErrorCode::kInvalidArgument, "tool " + schema.name + " has no handler");
    return false;
  }
  if (tools_.find(schema.name) != tools_.end()) {
    SetError(err, ErrorCode::kDuplicateTool, "Tool already registered: " + schema.name);
    return false;
  }
  const auto name = schema.name;
  tools_.emplace(name, ToolDescriptor{std::move(schema), std::move(handler)});
  order_.push_back(name);
  return true;
}

const ToolDescriptor* ToolRegistry::Lookup(const std::string& name, BridgeError* err) const {
  auto it = tools_.find(name);
  if (it == tools_.end()) {
    if (err) *err = MakeError(ErrorCode::kUnknownTool, "Unknown tool: " + name, {{"tool", name}});
    return nullptr;
  }
  return &it->second;
}

bool ToolRegistry::HasTool(const std::string& name) const {
  return tools_.find(name) != tools_.end();
}

std::vector<ToolSchema> ToolRegistry::ListSchemas() const {
  std::vector<ToolSchema> out;
  out.reserve(order_.size());
  for (const auto& name : order_) out.push_back(tools_.at(name).schema);
  return out;
}

nlohmann::json InputSchemaJson(const ToolSchema& schema) {
  nlohmann::json j;
  j["type"] = "object";
  j["properties"] = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();
  for (const auto& a : schema.arguments) {
    nlohmann::json prop;
    prop["type"] = ArgumentTypeName(a.type);
    if (!a.description.empty()) prop["description"] = a.description;
    j["properties"][a.name] = std::move(prop);
    if (a.required) required.push_back(a.name);
  }
  j["required"] = std::move(required);
  return j;
}

bool ValidateArguments(const ToolSchema& schema,
                       const nlohmann::json& arguments,
                       nlohmann::json* normalized,
                       BridgeError* err) {
  nlohmann::json out = nlohmann::json::object();
  if (!arguments.is_null() && !arguments.is_object()) {
    if (err) {
      *err = MakeError(ErrorCode::kInvalidArgument, "Arguments for " + schema.name + " must be an object",
                       {{"tool", schema.name}});
    }
    return false;
  }

  if (arguments.is_object()) {
    for (const auto& [key, value] : arguments.items()) {
      const auto* spec = schema.FindArgument(key);
      if (!spec) {
        if (err) {
          *err = MakeError(ErrorCode::kInvalidArgument, "Unexpected argument for " + schema.name + ": " + key,
                           {{"tool", schema.name}, {"argument", key}});
        }
        return false;
      }
      if (value.is_null() && !spec->required) continue;
      if (!MatchesType(spec->type, value)) {
        if (err) {
          *err = MakeError(ErrorCode::kInvalidArgument,
                           "Argument '" + key + "' must be of type " + ArgumentTypeName(spec->type) + ", got " +
                               JsonTypeName(value),
                           {{"tool", schema.name}, {"argument", key}});
        }
        return false;
      }
      out[key] = value;
    }
  }

  for (const auto& spec : schema.arguments) {
    if (spec.required && !out.contains(spec.name)) {
      if (err) {
        *err = MakeError(ErrorCode::kInvalidArgument, "Missing required argument: " + spec.name,
                         {{"tool", schema.name}, {"argument", spec.name}});
      }
      return false;
    }
  }

  if (normalized) *normalized = std::move(out);
  return true;
}

}  // namespace bridge
