#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bridge {

// One row: column name -> scalar, null, nested record or array.
using Record = nlohmann::json;

struct QualifiedTableName {
  std::string dataset;
  std::string table;
};

// Accepts exactly `dataset.table`; the dataset segment is limited to [A-Za-z0-9_].
std::optional<QualifiedTableName> ParseQualifiedTableName(const std::string& name, BridgeError* err);

// Data access contract behind the table tools. Implementations are shared by every
// concurrent dispatch and must tolerate concurrent calls.
class IBackend {
 public:
  virtual ~IBackend() = default;

  virtual std::string Name() const = 0;
  virtual std::optional<std::vector<std::string>> ListTables(BridgeError* err) = 0;
  virtual std::optional<std::vector<Record>> DescribeTable(const std::string& qualified_name, BridgeError* err) = 0;
  virtual std::optional<std::vector<Record>> ExecuteQuery(const std::string& query, BridgeError* err) = 0;
};

}  // namespace bridge
