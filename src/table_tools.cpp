#include "table_tools.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace bridge {
namespace {

static nlohmann::json RecordsToJson(std::vector<Record> records) {
  nlohmann::json out = nlohmann::json::array();
  for (auto& r : records) out.push_back(std::move(r));
  return out;
}

}  // namespace

bool RegisterTableTools(ToolRegistry* registry, IBackend* backend, BridgeError* err) {
  if (!registry || !backend) {
    SetError(err, ErrorCode::kInvalidArgument, "registry and backend are required");
    return false;
  }

  {
    ToolSchema schema;
    schema.name = kExecuteQueryTool;
    schema.description = "Execute a SELECT query on the BigQuery database.";
    schema.arguments.push_back({"query", ArgumentType::kString, "SQL query text, forwarded verbatim", true});
    auto handler = [backend](const ToolArguments& args, BridgeError* e) -> std::optional<nlohmann::json> {
      auto rows = backend->ExecuteQuery(args.GetString("query"), e);
      if (!rows) return std::nullopt;
      return RecordsToJson(std::move(*rows));
    };
    if (!registry->RegisterTool(std::move(schema), handler, err)) return false;
  }

  {
    ToolSchema schema;
    schema.name = kListTablesTool;
    schema.description = "List all tables in the BigQuery database.";
    auto handler = [backend](const ToolArguments&, BridgeError* e) -> std::optional<nlohmann::json> {
      auto tables = backend->ListTables(e);
      if (!tables) return std::nullopt;
      return nlohmann::json(*tables);
    };
    if (!registry->RegisterTool(std::move(schema), handler, err)) return false;
  }

  {
    ToolSchema schema;
    schema.name = kDescribeTableTool;
    schema.description = "Get the schema information for a specific table.";
    schema.arguments.push_back({"table_name", ArgumentType::kString, "Table name as dataset.table", true});
    auto handler = [backend](const ToolArguments& args, BridgeError* e) -> std::optional<nlohmann::json> {
      const auto table_name = args.GetString("table_name");
      if (!ParseQualifiedTableName(table_name, e)) return std::nullopt;
      auto rows = backend->DescribeTable(table_name, e);
      if (!rows) return std::nullopt;
      return RecordsToJson(std::move(*rows));
    };
    if (!registry->RegisterTool(std::move(schema), handler, err)) return false;
  }

  return true;
}

}  // namespace bridge
