#include "backends/bigquery_backend.hpp"

#include <httplib.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace bridge {
namespace {

static std::string PercentEncode(const std::string& in) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

static std::string ToUpperAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return s;
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (s.size() <= max_chars) return s;
  s.resize(max_chars);
  s += "...(truncated)";
  return s;
}

static std::string ExtractApiError(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return {};
  if (j.contains("error") && j["error"].is_object()) {
    const auto& e = j["error"];
    if (e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
  }
  return {};
}

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, int read_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.SchemeHostPort());
  cli->set_connection_timeout(10);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(30);
  return cli;
}

static std::optional<long long> ParseInt64(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
  return v;
}

static std::optional<double> ParseDouble(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return std::nullopt;
  return v;
}

static std::optional<nlohmann::json> DecodeRecord(const nlohmann::json& fields, const nlohmann::json& row, std::string* err);

static std::optional<nlohmann::json> DecodeScalar(const nlohmann::json& field, const nlohmann::json& v, std::string* err) {
  if (v.is_null()) return nlohmann::json(nullptr);
  std::string type;
  if (field.contains("type") && field["type"].is_string()) type = ToUpperAscii(field["type"].get<std::string>());

  if (type == "RECORD" || type == "STRUCT") {
    if (!field.contains("fields") || !field["fields"].is_array()) {
      if (err) *err = "record field without sub-fields";
      return std::nullopt;
    }
    return DecodeRecord(field["fields"], v, err);
  }
  if (!v.is_string()) return v;

  const auto s = v.get<std::string>();
  if (type == "INTEGER" || type == "INT64") {
    if (auto n = ParseInt64(s)) return nlohmann::json(*n);
    return nlohmann::json(s);
  }
  if (type == "FLOAT" || type == "FLOAT64") {
    auto d = ParseDouble(s);
    if (d && std::isfinite(*d)) return nlohmann::json(*d);
    return nlohmann::json(s);
  }
  if (type == "BOOLEAN" || type == "BOOL") {
    if (s == "true") return nlohmann::json(true);
    if (s == "false") return nlohmann::json(false);
    return nlohmann::json(s);
  }
  if (type == "TIMESTAMP") {
    if (auto n = ParseInt64(s)) return nlohmann::json(FormatTimestampMicros(*n));
    if (auto d = ParseDouble(s); d && std::isfinite(*d)) {
      return nlohmann::json(FormatTimestampMicros(static_cast<long long>(std::llround(*d * 1e6))));
    }
    return nlohmann::json(s);
  }
  return nlohmann::json(s);
}

static std::optional<nlohmann::json> DecodeValue(const nlohmann::json& field, const nlohmann::json& v, std::string* err) {
  std::string mode;
  if (field.contains("mode") && field["mode"].is_string()) mode = ToUpperAscii(field["mode"].get<std::string>());
  if (mode != "REPEATED") return DecodeScalar(field, v, err);

  nlohmann::json out = nlohmann::json::array();
  if (v.is_null()) return out;
  if (!v.is_array()) {
    if (err) *err = "repeated field value is not an array";
    return std::nullopt;
  }
  for (const auto& item : v) {
    const auto& inner = (item.is_object() && item.contains("v")) ? item["v"] : item;
    auto decoded = DecodeScalar(field, inner, err);
    if (!decoded) return std::nullopt;
    out.push_back(std::move(*decoded));
  }
  return out;
}

static std::optional<nlohmann::json> DecodeRecord(const nlohmann::json& fields, const nlohmann::json& row, std::string* err) {
  if (!row.is_object() || !row.contains("f") || !row["f"].is_array()) {
    if (err) *err = "row is missing its cell list";
    return std::nullopt;
  }
  const auto& cells = row["f"];
  if (cells.size() != fields.size()) {
    if (err) *err = "row has " + std::to_string(cells.size()) + " cells, schema has " + std::to_string(fields.size());
    return std::nullopt;
  }
  nlohmann::json out = nlohmann::json::object();
  for (size_t i = 0; i < fields.size(); i++) {
    const auto& field = fields[i];
    if (!field.is_object() || !field.contains("name") || !field["name"].is_string()) {
      if (err) *err = "schema field without a name";
      return std::nullopt;
    }
    const auto& cell = cells[i];
    const auto& v = (cell.is_object() && cell.contains("v")) ? cell["v"] : nlohmann::json(nullptr);
    auto decoded = DecodeValue(field, v, err);
    if (!decoded) return std::nullopt;
    out[field["name"].get<std::string>()] = std::move(*decoded);
  }
  return out;
}

static bool AppendRows(const nlohmann::json& schema, const nlohmann::json& resp, std::vector<Record>* out, BridgeError* err) {
  if (!resp.contains("rows")) return true;
  std::string decode_err;
  auto rows = DecodeQueryRows(schema, resp["rows"], &decode_err);
  if (!rows) {
    SetError(err, ErrorCode::kBackendQueryError, "bigquery: cannot decode rows: " + decode_err);
    return false;
  }
  for (auto& r : *rows) out->push_back(std::move(r));
  return true;
}

static void SetPageLimitError(BridgeError* err, const std::string& what, int max_pages) {
  std::cout << "[bigquery] warning: " << what << " still has pages after " << max_pages << "\n";
  if (err) {
    *err = MakeError(ErrorCode::kBackendQueryError,
                     "bigquery: " + what + " exceeds " + std::to_string(max_pages) + " result pages",
                     {{"max_pages", max_pages}});
  }
}

}  // namespace

std::string FormatTimestampMicros(long long micros) {
  long long secs = micros / 1000000;
  long long frac = micros % 1000000;
  if (frac < 0) {
    frac += 1000000;
    secs -= 1;
  }
  long long days = secs / 86400;
  long long rem = secs % 86400;
  if (rem < 0) {
    rem += 86400;
    days -= 1;
  }

  // civil_from_days
  long long z = days + 719468;
  long long era = (z >= 0 ? z : z - 146096) / 146097;
  long long doe = z - era * 146097;
  long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  long long y = yoe + era * 400;
  long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  long long mp = (5 * doy + 2) / 153;
  long long d = doy - (153 * mp + 2) / 5 + 1;
  long long m = mp < 10 ? mp + 3 : mp - 9;
  if (m <= 2) y += 1;

  char buf[64];
  if (frac == 0) {
    std::snprintf(buf, sizeof(buf), "%04lld-%02lld-%02lldT%02lld:%02lld:%02lldZ", y, m, d, rem / 3600, (rem % 3600) / 60,
                  rem % 60);
  } else {
    std::snprintf(buf, sizeof(buf), "%04lld-%02lld-%02lldT%02lld:%02lld:%02lld.%06lldZ", y, m, d, rem / 3600,
                  (rem % 3600) / 60, rem % 60, frac);
  }
  return buf;
}

std::optional<std::vector<Record>> DecodeQueryRows(const nlohmann::json& schema,
                                                   const nlohmann::json& rows,
                                                   std::string* err) {
  std::vector<Record> out;
  if (rows.is_null()) return out;
  if (!rows.is_array()) {
    if (err) *err = "rows is not an array";
    return std::nullopt;
  }
  if (!schema.is_object() || !schema.contains("fields") || !schema["fields"].is_array()) {
    if (err) *err = "response has rows but no schema";
    return std::nullopt;
  }
  out.reserve(rows.size());
  for (const auto& row : rows) {
    auto rec = DecodeRecord(schema["fields"], row, err);
    if (!rec) return std::nullopt;
    out.push_back(std::move(*rec));
  }
  return out;
}

BigQueryBackend::BigQueryBackend(BigQueryConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.max_in_flight <= 0) cfg_.max_in_flight = 1;
  if (cfg_.poll_timeout_ms <= 0) cfg_.poll_timeout_ms = 10000;
  if (cfg_.max_pages <= 0) cfg_.max_pages = 1000;
}

std::string BigQueryBackend::Name() const {
  return "bigquery";
}

void BigQueryBackend::AcquireSlot() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [&] { return in_flight_ < cfg_.max_in_flight; });
  in_flight_++;
}

void BigQueryBackend::ReleaseSlot() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_--;
  }
  cv_.notify_one();
}

std::optional<nlohmann::json> BigQueryBackend::Call(const std::string& method,
                                                    const std::string& path,
                                                    const nlohmann::json* body,
                                                    BridgeError* err) {
  AcquireSlot();
  struct SlotGuard {
    BigQueryBackend* self;
    ~SlotGuard() { self->ReleaseSlot(); }
  } guard{this};

  const int read_timeout = cfg_.poll_timeout_ms / 1000 + 30;
  auto cli = MakeClient(cfg_.endpoint, read_timeout);
  if (!cli->is_valid()) {
    SetError(err, ErrorCode::kBackendUnavailable,
             "bigquery: cannot create client for " + cfg_.endpoint.SchemeHostPort() + " (https requires OpenSSL)");
    return std::nullopt;
  }

  httplib::Headers headers;
  if (!cfg_.access_token.empty()) headers.emplace("Authorization", "Bearer " + cfg_.access_token);

  const auto full_path = cfg_.endpoint.base_path + "/bigquery/v2" + path;
  auto res = method == "POST"
                 ? cli->Post(full_path, headers, body ? body->dump() : std::string("{}"), "application/json")
                 : cli->Get(full_path, headers);

  if (!res) {
    std::cout << "[bigquery] " << method << " " << path << " failed: " << httplib::to_string(res.error()) << "\n";
    SetError(err, ErrorCode::kBackendUnavailable, "bigquery: failed to connect: " + httplib::to_string(res.error()));
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    auto api_msg = ExtractApiError(res->body);
    std::cout << "[bigquery] " << method << " " << path << " http=" << res->status
              << " error=" << TruncateForLog(api_msg.empty() ? res->body : api_msg, 500) << "\n";
    const auto code = (res->status == 429 || res->status >= 500) ? ErrorCode::kBackendUnavailable
                                                                  : ErrorCode::kBackendQueryError;
    std::string msg = api_msg.empty() ? "bigquery: http " + std::to_string(res->status) : api_msg;
    if (err) *err = MakeError(code, std::move(msg), {{"http_status", res->status}});
    return std::nullopt;
  }

  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    SetError(err, ErrorCode::kBackendQueryError, "bigquery: invalid json response");
    return std::nullopt;
  }
  return j;
}

std::optional<std::vector<std::string>> BigQueryBackend::ListDatasets(BridgeError* err) {
  std::vector<std::string> out;
  std::string page_token;
  for (int page = 0;; page++) {
    if (page >= cfg_.max_pages) {
      SetPageLimitError(err, "dataset listing", cfg_.max_pages);
      return std::nullopt;
    }
    std::string path = "/projects/" + PercentEncode(cfg_.project) + "/datasets?maxResults=1000";
    if (!page_token.empty()) path += "&pageToken=" + PercentEncode(page_token);
    auto r = Call("GET", path, nullptr, err);
    if (!r) return std::nullopt;
    if (r->contains("datasets") && (*r)["datasets"].is_array()) {
      for (const auto& d : (*r)["datasets"]) {
        if (!d.is_object() || !d.contains("datasetReference") || !d["datasetReference"].is_object()) continue;
        const auto& ref = d["datasetReference"];
        if (ref.contains("datasetId") && ref["datasetId"].is_string()) out.push_back(ref["datasetId"].get<std::string>());
      }
    }
    if (!r->contains("nextPageToken") || !(*r)["nextPageToken"].is_string()) break;
    page_token = (*r)["nextPageToken"].get<std::string>();
    if (page_token.empty()) break;
  }
  return out;
}

std::optional<std::vector<std::string>> BigQueryBackend::ListTablesIn(const std::string& dataset, BridgeError* err) {
  std::vector<std::string> out;
  std::string page_token;
  for (int page = 0;; page++) {
    if (page >= cfg_.max_pages) {
      SetPageLimitError(err, "table listing of " + dataset, cfg_.max_pages);
      return std::nullopt;
    }
    std::string path = "/projects/" + PercentEncode(cfg_.project) + "/datasets/" + PercentEncode(dataset) +
                       "/tables?maxResults=1000";
    if (!page_token.empty()) path += "&pageToken=" + PercentEncode(page_token);
    auto r = Call("GET", path, nullptr, err);
    if (!r) return std::nullopt;
    if (r->contains("tables") && (*r)["tables"].is_array()) {
      for (const auto& t : (*r)["tables"]) {
        if (!t.is_object() || !t.contains("tableReference") || !t["tableReference"].is_object()) continue;
        const auto& ref = t["tableReference"];
        if (ref.contains("tableId") && ref["tableId"].is_string()) {
          out.push_back(dataset + "." + ref["tableId"].get<std::string>());
        }
      }
    }
    if (!r->contains("nextPageToken") || !(*r)["nextPageToken"].is_string()) break;
    page_token = (*r)["nextPageToken"].get<std::string>();
    if (page_token.empty()) break;
  }
  return out;
}

std::optional<std::vector<std::string>> BigQueryBackend::ListTables(BridgeError* err) {
  std::vector<std::string> datasets = cfg_.datasets;
  if (datasets.empty()) {
    auto listed = ListDatasets(err);
    if (!listed) return std::nullopt;
    datasets = std::move(*listed);
  }
  std::cout << "[bigquery] list_tables datasets=" << datasets.size() << "\n";

  std::vector<std::string> tables;
  for (const auto& d : datasets) {
    auto in_dataset = ListTablesIn(d, err);
    if (!in_dataset) return std::nullopt;
    tables.insert(tables.end(), in_dataset->begin(), in_dataset->end());
  }
  std::cout << "[bigquery] list_tables tables=" << tables.size() << "\n";
  return tables;
}

std::optional<std::vector<Record>> BigQueryBackend::DescribeTable(const std::string& qualified_name, BridgeError* err) {
  auto name = ParseQualifiedTableName(qualified_name, err);
  if (!name) return std::nullopt;
  const std::string query = "SELECT ddl FROM " + name->dataset +
                            ".INFORMATION_SCHEMA.TABLES WHERE table_name = @table_name";
  return RunQuery(query, {{"table_name", name->table}}, err);
}

std::optional<std::vector<Record>> BigQueryBackend::ExecuteQuery(const std::string& query, BridgeError* err) {
  return RunQuery(query, {}, err);
}

std::optional<std::vector<Record>> BigQueryBackend::RunQuery(const std::string& query,
                                                            const std::vector<QueryParameter>& params,
                                                            BridgeError* err) {
  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + std::chrono::seconds(cfg_.query_timeout_seconds);
  std::cout << "[bigquery] query chars=" << query.size() << " params=" << params.size() << "\n";

  nlohmann::json req;
  req["query"] = query;
  req["useLegacySql"] = false;
  req["timeoutMs"] = cfg_.poll_timeout_ms;
  req["formatOptions"] = {{"useInt64Timestamp", true}};
  if (!cfg_.location.empty()) req["location"] = cfg_.location;
  if (!params.empty()) {
    req["parameterMode"] = "NAMED";
    req["queryParameters"] = nlohmann::json::array();
    for (const auto& p : params) {
      req["queryParameters"].push_back(
          {{"name", p.name}, {"parameterType", {{"type", "STRING"}}}, {"parameterValue", {{"value", p.value}}}});
    }
  }

  const auto project_path = "/projects/" + PercentEncode(cfg_.project);
  auto resp = Call("POST", project_path + "/queries", &req, err);
  if (!resp) return std::nullopt;

  std::string job_id;
  std::string job_location = cfg_.location;
  if (resp->contains("jobReference") && (*resp)["jobReference"].is_object()) {
    const auto& ref = (*resp)["jobReference"];
    if (ref.contains("jobId") && ref["jobId"].is_string()) job_id = ref["jobId"].get<std::string>();
    if (ref.contains("location") && ref["location"].is_string()) job_location = ref["location"].get<std::string>();
  }

  auto results_path = [&](const std::string& page_token) {
    std::string p = project_path + "/queries/" + PercentEncode(job_id) +
                    "?formatOptions.useInt64Timestamp=true&timeoutMs=" + std::to_string(cfg_.poll_timeout_ms);
    if (!job_location.empty()) p += "&location=" + PercentEncode(job_location);
    if (!page_token.empty()) p += "&pageToken=" + PercentEncode(page_token);
    return p;
  };

  while (!(resp->contains("jobComplete") && (*resp)["jobComplete"].is_boolean() && (*resp)["jobComplete"].get<bool>())) {
    if (job_id.empty()) {
      SetError(err, ErrorCode::kBackendQueryError, "bigquery: incomplete job without job reference");
      return std::nullopt;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      SetError(err, ErrorCode::kBackendQueryError,
               "bigquery: query timed out after " + std::to_string(cfg_.query_timeout_seconds) + "s");
      return std::nullopt;
    }
    resp = Call("GET", results_path(""), nullptr, err);
    if (!resp) return std::nullopt;
  }

  nlohmann::json schema = resp->contains("schema") ? (*resp)["schema"] : nlohmann::json::object();
  std::vector<Record> rows;
  if (!AppendRows(schema, *resp, &rows, err)) return std::nullopt;

  // The first response is page one.
  for (int page = 1;; page++) {
    if (!resp->contains("pageToken") || !(*resp)["pageToken"].is_string()) break;
    auto token = (*resp)["pageToken"].get<std::string>();
    if (token.empty() || job_id.empty()) break;
    if (page >= cfg_.max_pages) {
      SetPageLimitError(err, "query result", cfg_.max_pages);
      return std::nullopt;
    }
    resp = Call("GET", results_path(token), nullptr, err);
    if (!resp) return std::nullopt;
    if (resp->contains("schema")) schema = (*resp)["schema"];
    if (!AppendRows(schema, *resp, &rows, err)) return std::nullopt;
  }

  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  std::cout << "[bigquery] query done rows=" << rows.size() << " elapsed_ms=" << elapsed_ms << "\n";
  return rows;
}

}  // namespace bridge
