#include "config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace bridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string Trim(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n')) {
    s.erase(s.begin());
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
  return s;
}

static std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      cur = Trim(cur);
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  cur = Trim(cur);
  if (!cur.empty()) out.push_back(cur);
  return out;
}

static bool ParsePositiveInt(const std::string& s, int* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || n <= 0 || n > 1000000000L) return false;
  *out = static_cast<int>(n);
  return true;
}

static void ApplyEnvInt(const char* name, int* target) {
  int v = 0;
  if (ParsePositiveInt(GetEnvStr(name), &v)) *target = v;
}

static std::string NormalizePrefix(std::string p) {
  p = Trim(p);
  if (p.empty() || p == "/") return {};
  while (!p.empty() && p.back() == '/') p.pop_back();
  if (p.empty()) return {};
  if (p.front() != '/') p.insert(p.begin(), '/');
  return p;
}

}  // namespace

std::string HttpEndpoint::SchemeHostPort() const {
  return scheme + "://" + host + ":" + std::to_string(port);
}

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
    if (default_port == 0) default_port = 80;
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
    if (default_port == 0) default_port = 443;
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

BridgeConfig LoadConfigFromEnv() {
  BridgeConfig cfg;

  if (auto host = GetEnvStr("BRIDGE_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  ApplyEnvInt("BRIDGE_LISTEN_PORT", &cfg.listen.port);
  ApplyEnvInt("BRIDGE_HTTP_THREADS", &cfg.listen.threads);
  if (auto prefix = GetEnvStr("BRIDGE_PATH_PREFIX"); !prefix.empty()) cfg.path_prefix = NormalizePrefix(prefix);

  ApplyEnvInt("BRIDGE_DRAIN_TIMEOUT_MS", &cfg.sessions.drain_timeout_ms);
  ApplyEnvInt("BRIDGE_SESSION_QUEUE_CAPACITY", &cfg.sessions.queue_capacity);
  ApplyEnvInt("BRIDGE_KEEPALIVE_SECONDS", &cfg.sessions.keepalive_seconds);
  ApplyEnvInt("BRIDGE_WORKER_THREADS", &cfg.sessions.worker_threads);
  ApplyEnvInt("BRIDGE_SESSION_MAX_IN_FLIGHT", &cfg.sessions.max_in_flight_per_session);
  ApplyEnvInt("BRIDGE_MAX_SESSIONS", &cfg.sessions.max_sessions);

  auto& bq = cfg.bigquery;
  bq.project = GetEnvStr("BQ_PROJECT_ID");
  bq.location = GetEnvStr("BQ_LOCATION");
  bq.key_file = GetEnvStr("BQ_KEY_FILE");
  bq.access_token = Trim(GetEnvStr("BQ_ACCESS_TOKEN"));
  if (auto datasets = GetEnvStr("BQ_DATASETS"); !datasets.empty()) bq.datasets = SplitCsv(datasets);
  if (auto ep = GetEnvStr("BQ_ENDPOINT"); !ep.empty()) bq.endpoint = ParseHttpEndpoint(ep, 0);
  ApplyEnvInt("BQ_QUERY_TIMEOUT_S", &bq.query_timeout_seconds);
  ApplyEnvInt("BQ_MAX_IN_FLIGHT", &bq.max_in_flight);
  ApplyEnvInt("BQ_MAX_PAGES", &bq.max_pages);

  return cfg;
}

int EffectiveMaxSessions(const BridgeConfig& cfg) {
  const int threads = cfg.listen.threads > 0 ? cfg.listen.threads : 1;
  const int reserve = std::max(1, std::min(4, threads / 2));
  const int ceiling = std::max(1, threads - reserve);
  if (cfg.sessions.max_sessions > 0) return std::min(cfg.sessions.max_sessions, ceiling);
  return ceiling;
}

bool ApplyCommandLine(int argc, char** argv, BridgeConfig* cfg, std::string* err) {
  if (!cfg) return false;
  std::vector<std::string> datasets;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    std::string value;
    bool has_value = false;
    auto eq = arg.find('=');
    if (StartsWith(arg, "--") && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
      has_value = true;
    }
    auto take_value = [&]() -> bool {
      if (has_value) return true;
      if (i + 1 >= argc) {
        if (err) *err = "missing value for " + arg;
        return false;
      }
      value = argv[++i];
      return true;
    };

    if (arg == "--project") {
      if (!take_value()) return false;
      cfg->bigquery.project = value;
    } else if (arg == "--location") {
      if (!take_value()) return false;
      cfg->bigquery.location = value;
    } else if (arg == "--key-file") {
      if (!take_value()) return false;
      cfg->bigquery.key_file = value;
    } else if (arg == "--dataset") {
      if (!take_value()) return false;
      for (auto& d : SplitCsv(value)) datasets.push_back(std::move(d));
    } else if (arg == "--host") {
      if (!take_value()) return false;
      cfg->listen.host = value;
    } else if (arg == "--port") {
      if (!take_value()) return false;
      int port = 0;
      if (!ParsePositiveInt(value, &port) || port > 65535) {
        if (err) *err = "invalid --port: " + value;
        return false;
      }
      cfg->listen.port = port;
    } else {
      if (err) *err = "unknown argument: " + arg;
      return false;
    }
  }
  if (!datasets.empty()) cfg->bigquery.datasets = std::move(datasets);
  return true;
}

bool ResolveAccessToken(BigQueryConfig* cfg, std::string* err) {
  if (!cfg) return false;
  if (!cfg->access_token.empty() || cfg->key_file.empty()) return true;

  std::ifstream in(cfg->key_file, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot read key file: " + cfg->key_file;
    return false;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  auto text = Trim(oss.str());
  if (text.empty()) {
    if (err) *err = "key file is empty: " + cfg->key_file;
    return false;
  }

  if (text.front() == '{') {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      if (err) *err = "invalid json in key file: " + cfg->key_file;
      return false;
    }
    if (!j.contains("access_token") || !j["access_token"].is_string()) {
      if (err) *err = "key file has no access_token (service account keys must be exchanged for a token first)";
      return false;
    }
    cfg->access_token = Trim(j["access_token"].get<std::string>());
    if (cfg->access_token.empty()) {
      if (err) *err = "access_token in key file is empty";
      return false;
    }
    return true;
  }

  cfg->access_token = text;
  return true;
}

}  // namespace bridge
