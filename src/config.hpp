#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bridge {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
  int threads = 32;
};

struct HttpEndpoint {
  std::string scheme = "https";
  std::string host = "bigquery.googleapis.com";
  int port = 443;
  std::string base_path;

  std::string SchemeHostPort() const;
};

struct BigQueryConfig {
  std::string project;
  std::string location;
  std::string key_file;
  std::string access_token;
  std::vector<std::string> datasets;
  HttpEndpoint endpoint;
  int query_timeout_seconds = 300;
  int poll_timeout_ms = 10000;
  int max_in_flight = 8;
  // Listing or result pages followed before a call fails instead of returning a partial answer.
  int max_pages = 1000;
};

struct SessionConfig {
  int drain_timeout_ms = 5000;
  int queue_capacity = 256;
  int keepalive_seconds = 15;
  int worker_threads = 8;
  // 0: worker_threads - 1.
  int max_in_flight_per_session = 0;
  // 0: derived from the HTTP thread count, see EffectiveMaxSessions.
  int max_sessions = 0;
};

struct BridgeConfig {
  HttpListenConfig listen;
  std::string path_prefix = "/mcp";
  SessionConfig sessions;
  BigQueryConfig bigquery;
};

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

BridgeConfig LoadConfigFromEnv();

// Every open SSE stream occupies one HTTP thread, so the session limit leaves a reserve of
// threads for POSTed messages and unary calls.
int EffectiveMaxSessions(const BridgeConfig& cfg);

// Applies --host, --port, --project, --location, --key-file and (repeatable) --dataset.
// Flags take precedence over the environment.
bool ApplyCommandLine(int argc, char** argv, BridgeConfig* cfg, std::string* err);

// Reads the OAuth access token from cfg.key_file when no token was given directly.
bool ResolveAccessToken(BigQueryConfig* cfg, std::string* err);

}  // namespace bridge
