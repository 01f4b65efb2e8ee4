#pragma once

#include "backends/backend.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

class BigQueryBackend : public IBackend {
 public:
  explicit BigQueryBackend(BigQueryConfig cfg);

  std::string Name() const override;
  std::optional<std::vector<std::string>> ListTables(BridgeError* err) override;
  std::optional<std::vector<Record>> DescribeTable(const std::string& qualified_name, BridgeError* err) override;
  std::optional<std::vector<Record>> ExecuteQuery(const std::string& query, BridgeError* err) override;

 private:
  struct QueryParameter {
    std::string name;
    std::string value;
  };

  std::optional<std::vector<Record>> RunQuery(const std::string& query,
                                              const std::vector<QueryParameter>& params,
                                              BridgeError* err);
  std::optional<std::vector<std::string>> ListDatasets(BridgeError* err);
  std::optional<std::vector<std::string>> ListTablesIn(const std::string& dataset, BridgeError* err);
  std::optional<nlohmann::json> Call(const std::string& method,
                                     const std::string& path,
                                     const nlohmann::json* body,
                                     BridgeError* err);

  void AcquireSlot();
  void ReleaseSlot();

  BigQueryConfig cfg_;
  std::mutex mu_;
  std::condition_variable cv_;
  int in_flight_ = 0;
};

// Converts `rows` ({"f":[{"v":...}]}) of a jobs.query / getQueryResults response into
// records keyed by column name, typed according to `schema` ({"fields":[...]}).
std::optional<std::vector<Record>> DecodeQueryRows(const nlohmann::json& schema,
                                                   const nlohmann::json& rows,
                                                   std::string* err);

// Microseconds since the Unix epoch -> "YYYY-MM-DDTHH:MM:SS[.ffffff]Z".
std::string FormatTimestampMicros(long long micros);

}  // namespace bridge
