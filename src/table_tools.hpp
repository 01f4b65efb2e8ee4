#pragma once

#include "backends/backend.hpp"
#include "tool_registry.hpp"

namespace bridge {

inline constexpr const char* kExecuteQueryTool = "execute_query";
inline constexpr const char* kListTablesTool = "list_tables";
inline constexpr const char* kDescribeTableTool = "describe_table";

// Registers execute_query, list_tables and describe_table bound to `backend`.
// The backend must outlive the registry.
bool RegisterTableTools(ToolRegistry* registry, IBackend* backend, BridgeError* err);

}  // namespace bridge
