#include <gtest/gtest.h>

#include "dispatcher.hpp"
#include "stub_backend.hpp"
#include "table_tools.hpp"

#include <stdexcept>
#include <string>

namespace {

using bridge::BridgeError;
using bridge::Dispatcher;
using bridge::ErrorCode;
using bridge::InvocationRequest;
using bridge::ToolRegistry;
using bridge::testing::StubBackend;

class DispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    BridgeError err;
    ASSERT_TRUE(bridge::RegisterTableTools(&registry_, &backend_, &err)) << err.message;
  }

  bridge::InvocationResult Call(const std::string& tool, nlohmann::json arguments, nlohmann::json id = 1) {
    InvocationRequest req;
    req.tool_name = tool;
    req.arguments = std::move(arguments);
    req.request_id = std::move(id);
    return dispatcher_.Dispatch(req);
  }

  StubBackend backend_;
  ToolRegistry registry_;
  Dispatcher dispatcher_{&registry_};
};

TEST_F(DispatcherTest, ExecuteQueryReturnsRows) {
  auto result = Call("execute_query", {{"query", "SELECT 1 AS x"}});
  ASSERT_TRUE(result.ok()) << result.error().message;
  EXPECT_EQ(nlohmann::json::parse(result.payload()), nlohmann::json::parse(R"([{"x":1}])"));
  ASSERT_EQ(backend_.queries.size(), 1u);
  EXPECT_EQ(backend_.queries[0], "SELECT 1 AS x");
}

TEST_F(DispatcherTest, PayloadIsIndentedJson) {
  auto result = Call("list_tables", nlohmann::json::object());
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.payload(), "[\n  \"sales.orders\",\n  \"sales.customers\"\n]");
}

TEST_F(DispatcherTest, ResultEchoesRequestId) {
  auto result = Call("list_tables", nlohmann::json::object(), "req-7");
  EXPECT_EQ(result.request_id(), "req-7");
  auto failed = Call("nope", nlohmann::json::object(), 99);
  EXPECT_EQ(failed.request_id(), 99);
}

TEST_F(DispatcherTest, UnknownToolFailureNamesTheTool) {
  auto result = Call("drop_table", nlohmann::json::object());
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::kUnknownTool);
  EXPECT_NE(result.error().message.find("drop_table"), std::string::npos);
}

TEST_F(DispatcherTest, DescribeTableRejectsNameWithoutDot) {
  auto result = Call("describe_table", {{"table_name", "bad_name_no_dot"}});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::kInvalidArgument);
  EXPECT_EQ(result.error().message, "Invalid table name: bad_name_no_dot");
  EXPECT_EQ(backend_.describe_calls.load(), 0);
}

TEST_F(DispatcherTest, DescribeTableRejectsTwoDots) {
  auto result = Call("describe_table", {{"table_name", "a.b.c"}});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::kInvalidArgument);
  EXPECT_EQ(backend_.describe_calls.load(), 0);
}

TEST_F(DispatcherTest, DescribeTablePassesQualifiedName) {
  auto result = Call("describe_table", {{"table_name", "sales.orders"}});
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(backend_.described.size(), 1u);
  EXPECT_EQ(backend_.described[0], "sales.orders");
  auto rows = nlohmann::json::parse(result.payload());
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_NE(rows[0]["ddl"].get<std::string>().find("sales.orders"), std::string::npos);
}

TEST_F(DispatcherTest, SchemaViolationNeverReachesBackend) {
  auto missing = Call("execute_query", nlohmann::json::object());
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.error().code, ErrorCode::kInvalidArgument);

  auto wrong_type = Call("execute_query", {{"query", 5}});
  ASSERT_FALSE(wrong_type.ok());
  EXPECT_EQ(wrong_type.error().code, ErrorCode::kInvalidArgument);
  EXPECT_EQ(backend_.query_calls.load(), 0);
}

TEST_F(DispatcherTest, BackendFailureBecomesFailure) {
  backend_.fail_with = bridge::MakeError(ErrorCode::kBackendQueryError, "Syntax error: Unexpected end of script");
  auto result = Call("execute_query", {{"query", "SELEC"}});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::kBackendQueryError);
  EXPECT_EQ(result.error().message, "Syntax error: Unexpected end of script");
}

TEST_F(DispatcherTest, PayloadPreservesScalarsNullsAndNesting) {
  nlohmann::json record = {{"id", 42},
                           {"score", 0.5},
                           {"active", true},
                           {"note", nullptr},
                           {"name", "Ada"},
                           {"address", {{"city", "London"}, {"zip", nullptr}}},
                           {"tags", {"a", "b"}}};
  backend_.rows.assign(1, record);
  auto result = Call("execute_query", {{"query", "SELECT *"}});
  ASSERT_TRUE(result.ok());
  auto rows = nlohmann::json::parse(result.payload());
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0], record);
}

TEST(DispatcherBoundaryTest, ThrowingHandlerBecomesFailure) {
  ToolRegistry registry;
  bridge::ToolSchema schema;
  schema.name = "explode";
  ASSERT_TRUE(registry.RegisterTool(
      schema,
      [](const bridge::ToolArguments&, BridgeError*) -> std::optional<nlohmann::json> {
        throw std::runtime_error("boom");
      },
      nullptr));
  Dispatcher dispatcher(&registry);

  InvocationRequest req;
  req.tool_name = "explode";
  auto result = dispatcher.Dispatch(req);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::kHandlerFailed);
  EXPECT_NE(result.error().message.find("boom"), std::string::npos);
}

TEST(DispatcherBoundaryTest, SilentHandlerFailureGetsGenericMessage) {
  ToolRegistry registry;
  bridge::ToolSchema schema;
  schema.name = "quiet";
  ASSERT_TRUE(registry.RegisterTool(
      schema, [](const bridge::ToolArguments&, BridgeError*) -> std::optional<nlohmann::json> { return std::nullopt; },
      nullptr));
  Dispatcher dispatcher(&registry);

  InvocationRequest req;
  req.tool_name = "quiet";
  auto result = dispatcher.Dispatch(req);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().message, "Error executing quiet");
}

}  // namespace
