#include <gtest/gtest.h>

#include "tool_registry.hpp"

#include <string>

namespace {

using bridge::ArgumentType;
using bridge::BridgeError;
using bridge::ErrorCode;
using bridge::ToolArguments;
using bridge::ToolRegistry;
using bridge::ToolSchema;

ToolSchema EchoSchema() {
  ToolSchema schema;
  schema.name = "echo";
  schema.description = "Echo the text back.";
  schema.arguments.push_back({"text", ArgumentType::kString, "text to echo", true});
  schema.arguments.push_back({"times", ArgumentType::kInteger, "repeat count", false});
  return schema;
}

std::optional<nlohmann::json> Echo(const ToolArguments& args, BridgeError*) {
  return nlohmann::json(args.GetString("text"));
}

TEST(ToolRegistryTest, RegisterAndLookup) {
  ToolRegistry registry;
  BridgeError err;
  ASSERT_TRUE(registry.RegisterTool(EchoSchema(), Echo, &err));
  EXPECT_TRUE(registry.HasTool("echo"));
  EXPECT_EQ(registry.Size(), 1u);

  const auto* tool = registry.Lookup("echo", &err);
  ASSERT_NE(tool, nullptr);
  EXPECT_EQ(tool->schema.description, "Echo the text back.");
}

TEST(ToolRegistryTest, DuplicateNameIsRejected) {
  ToolRegistry registry;
  BridgeError err;
  ASSERT_TRUE(registry.RegisterTool(EchoSchema(), Echo, &err));
  EXPECT_FALSE(registry.RegisterTool(EchoSchema(), Echo, &err));
  EXPECT_EQ(err.code, ErrorCode::kDuplicateTool);
  EXPECT_NE(err.message.find("echo"), std::string::npos);
  EXPECT_EQ(registry.Size(), 1u);
}

TEST(ToolRegistryTest, RejectsEmptyNameAndMissingHandler) {
  ToolRegistry registry;
  BridgeError err;
  ToolSchema unnamed;
  EXPECT_FALSE(registry.RegisterTool(unnamed, Echo, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
  EXPECT_FALSE(registry.RegisterTool(EchoSchema(), nullptr, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
}

TEST(ToolRegistryTest, UnknownToolNamesTheTool) {
  ToolRegistry registry;
  BridgeError err;
  EXPECT_EQ(registry.Lookup("drop_everything", &err), nullptr);
  EXPECT_EQ(err.code, ErrorCode::kUnknownTool);
  EXPECT_EQ(err.message, "Unknown tool: drop_everything");
}

TEST(ToolRegistryTest, ListSchemasKeepsRegistrationOrder) {
  ToolRegistry registry;
  for (const char* name : {"zeta", "alpha", "mid"}) {
    ToolSchema s;
    s.name = name;
    ASSERT_TRUE(registry.RegisterTool(s, Echo, nullptr));
  }
  auto schemas = registry.ListSchemas();
  ASSERT_EQ(schemas.size(), 3u);
  EXPECT_EQ(schemas[0].name, "zeta");
  EXPECT_EQ(schemas[1].name, "alpha");
  EXPECT_EQ(schemas[2].name, "mid");
}

TEST(ToolRegistryTest, InputSchemaJsonListsRequired) {
  auto j = bridge::InputSchemaJson(EchoSchema());
  EXPECT_EQ(j["type"], "object");
  EXPECT_EQ(j["properties"]["text"]["type"], "string");
  EXPECT_EQ(j["properties"]["times"]["type"], "integer");
  ASSERT_EQ(j["required"].size(), 1u);
  EXPECT_EQ(j["required"][0], "text");
}

TEST(ValidateArgumentsTest, AcceptsValidArguments) {
  nlohmann::json normalized;
  BridgeError err;
  ASSERT_TRUE(bridge::ValidateArguments(EchoSchema(), {{"text", "hi"}, {"times", 2}}, &normalized, &err));
  EXPECT_EQ(normalized["text"], "hi");
  EXPECT_EQ(normalized["times"], 2);
}

TEST(ValidateArgumentsTest, NullArgumentsActAsEmptyObject) {
  ToolSchema no_args;
  no_args.name = "list_tables";
  nlohmann::json normalized;
  EXPECT_TRUE(bridge::ValidateArguments(no_args, nullptr, &normalized, nullptr));
  EXPECT_TRUE(normalized.is_object());
  EXPECT_TRUE(normalized.empty());
}

TEST(ValidateArgumentsTest, MissingRequiredArgument) {
  BridgeError err;
  EXPECT_FALSE(bridge::ValidateArguments(EchoSchema(), nlohmann::json::object(), nullptr, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
  EXPECT_EQ(err.message, "Missing required argument: text");
}

TEST(ValidateArgumentsTest, WrongType) {
  BridgeError err;
  EXPECT_FALSE(bridge::ValidateArguments(EchoSchema(), {{"text", 42}}, nullptr, &err));
  EXPECT_EQ(err.message, "Argument 'text' must be of type string, got integer");
}

TEST(ValidateArgumentsTest, UnexpectedArgument) {
  BridgeError err;
  EXPECT_FALSE(bridge::ValidateArguments(EchoSchema(), {{"text", "a"}, {"extra", true}}, nullptr, &err));
  EXPECT_EQ(err.message, "Unexpected argument for echo: extra");
}

TEST(ValidateArgumentsTest, NonObjectArguments) {
  BridgeError err;
  EXPECT_FALSE(bridge::ValidateArguments(EchoSchema(), nlohmann::json::array({"hi"}), nullptr, &err));
  EXPECT_EQ(err.code, ErrorCode::kInvalidArgument);
}

TEST(ValidateArgumentsTest, NullOptionalIsDropped) {
  nlohmann::json normalized;
  ASSERT_TRUE(bridge::ValidateArguments(EchoSchema(), {{"text", "a"}, {"times", nullptr}}, &normalized, nullptr));
  EXPECT_FALSE(normalized.contains("times"));
}

TEST(ToolArgumentsTest, TypedAccessors) {
  nlohmann::json values = {{"s", "x"}, {"i", 7}, {"b", true}};
  ToolArguments args(values);
  EXPECT_TRUE(args.Has("s"));
  EXPECT_FALSE(args.Has("missing"));
  EXPECT_EQ(args.GetString("s"), "x");
  EXPECT_EQ(args.GetString("missing"), "");
  EXPECT_EQ(args.FindInteger("i").value_or(0), 7);
  EXPECT_TRUE(args.FindBoolean("b").value_or(false));
  EXPECT_FALSE(args.FindString("i").has_value());
}

}  // namespace
