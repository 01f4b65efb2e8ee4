#include <gtest/gtest.h>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

namespace {

using bridge::BridgeConfig;

// argv-style view over owned strings.
class Args {
 public:
  Args(std::initializer_list<std::string> args) : storage_(args) {
    storage_.insert(storage_.begin(), "mcp-bridge-server");
    for (auto& s : storage_) ptrs_.push_back(s.data());
  }
  int argc() const { return static_cast<int>(ptrs_.size()); }
  char** argv() { return ptrs_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> ptrs_;
};

std::string WriteTempFile(const std::string& name, const std::string& content) {
  const auto path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  return path;
}

TEST(CommandLineTest, BothFlagForms) {
  BridgeConfig cfg;
  Args args{"--project", "acme", "--location=EU", "--port=9090", "--host", "127.0.0.1", "--key-file=/tmp/k"};
  std::string err;
  ASSERT_TRUE(bridge::ApplyCommandLine(args.argc(), args.argv(), &cfg, &err)) << err;
  EXPECT_EQ(cfg.bigquery.project, "acme");
  EXPECT_EQ(cfg.bigquery.location, "EU");
  EXPECT_EQ(cfg.listen.port, 9090);
  EXPECT_EQ(cfg.listen.host, "127.0.0.1");
  EXPECT_EQ(cfg.bigquery.key_file, "/tmp/k");
}

TEST(CommandLineTest, DatasetsAccumulate) {
  BridgeConfig cfg;
  cfg.bigquery.datasets = {"from_env"};
  Args args{"--dataset", "sales", "--dataset=hr, ops"};
  ASSERT_TRUE(bridge::ApplyCommandLine(args.argc(), args.argv(), &cfg, nullptr));
  EXPECT_EQ(cfg.bigquery.datasets, (std::vector<std::string>{"sales", "hr", "ops"}));
}

TEST(CommandLineTest, RejectsBadInput) {
  std::string err;
  {
    BridgeConfig cfg;
    Args args{"--verbose"};
    EXPECT_FALSE(bridge::ApplyCommandLine(args.argc(), args.argv(), &cfg, &err));
    EXPECT_EQ(err, "unknown argument: --verbose");
  }
  {
    BridgeConfig cfg;
    Args args{"--port", "70000"};
    EXPECT_FALSE(bridge::ApplyCommandLine(args.argc(), args.argv(), &cfg, &err));
    EXPECT_EQ(err, "invalid --port: 70000");
  }
  {
    BridgeConfig cfg;
    Args args{"--project"};
    EXPECT_FALSE(bridge::ApplyCommandLine(args.argc(), args.argv(), &cfg, &err));
    EXPECT_EQ(err, "missing value for --project");
  }
}

TEST(HttpEndpointTest, Parses) {
  auto ep = bridge::ParseHttpEndpoint("http://localhost:9050/prefix/", 0);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "localhost");
  EXPECT_EQ(ep.port, 9050);
  EXPECT_EQ(ep.base_path, "/prefix");
  EXPECT_EQ(ep.SchemeHostPort(), "http://localhost:9050");

  auto tls = bridge::ParseHttpEndpoint("https://bigquery.googleapis.com", 0);
  EXPECT_EQ(tls.scheme, "https");
  EXPECT_EQ(tls.port, 443);
  EXPECT_TRUE(tls.base_path.empty());
}

TEST(EnvConfigTest, ReadsVariables) {
  setenv("BQ_PROJECT_ID", "env-project", 1);
  setenv("BQ_LOCATION", "US", 1);
  setenv("BQ_DATASETS", "a, b,,c", 1);
  setenv("BRIDGE_LISTEN_PORT", "7000", 1);
  setenv("BRIDGE_DRAIN_TIMEOUT_MS", "1500", 1);
  setenv("BRIDGE_PATH_PREFIX", "bridge/", 1);
  setenv("BRIDGE_WORKER_THREADS", "-3", 1);

  auto cfg = bridge::LoadConfigFromEnv();
  EXPECT_EQ(cfg.bigquery.project, "env-project");
  EXPECT_EQ(cfg.bigquery.location, "US");
  EXPECT_EQ(cfg.bigquery.datasets, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(cfg.listen.port, 7000);
  EXPECT_EQ(cfg.sessions.drain_timeout_ms, 1500);
  EXPECT_EQ(cfg.path_prefix, "/bridge");
  EXPECT_EQ(cfg.sessions.worker_threads, 8);

  for (const char* name : {"BQ_PROJECT_ID", "BQ_LOCATION", "BQ_DATASETS", "BRIDGE_LISTEN_PORT", "BRIDGE_DRAIN_TIMEOUT_MS",
                           "BRIDGE_PATH_PREFIX", "BRIDGE_WORKER_THREADS"}) {
    unsetenv(name);
  }
}

TEST(AccessTokenTest, RawTokenFile) {
  bridge::BigQueryConfig cfg;
  cfg.key_file = WriteTempFile("bridge_raw_token.txt", "ya29.token\n");
  std::string err;
  ASSERT_TRUE(bridge::ResolveAccessToken(&cfg, &err)) << err;
  EXPECT_EQ(cfg.access_token, "ya29.token");
  std::remove(cfg.key_file.c_str());
}

TEST(AccessTokenTest, JsonTokenFile) {
  bridge::BigQueryConfig cfg;
  cfg.key_file = WriteTempFile("bridge_json_token.json", R"({"access_token":"ya29.json","expires_in":3599})");
  std::string err;
  ASSERT_TRUE(bridge::ResolveAccessToken(&cfg, &err)) << err;
  EXPECT_EQ(cfg.access_token, "ya29.json");
  std::remove(cfg.key_file.c_str());
}

TEST(AccessTokenTest, ServiceAccountKeyIsRejected) {
  bridge::BigQueryConfig cfg;
  cfg.key_file = WriteTempFile("bridge_sa_key.json", R"({"type":"service_account","private_key":"..."})");
  std::string err;
  EXPECT_FALSE(bridge::ResolveAccessToken(&cfg, &err));
  EXPECT_NE(err.find("no access_token"), std::string::npos);
  EXPECT_TRUE(cfg.access_token.empty());
  std::remove(cfg.key_file.c_str());
}

TEST(AccessTokenTest, ExplicitTokenWinsAndMissingFileFails) {
  bridge::BigQueryConfig cfg;
  cfg.access_token = "direct";
  cfg.key_file = "/nonexistent/key.json";
  EXPECT_TRUE(bridge::ResolveAccessToken(&cfg, nullptr));
  EXPECT_EQ(cfg.access_token, "direct");

  cfg.access_token.clear();
  std::string err;
  EXPECT_FALSE(bridge::ResolveAccessToken(&cfg, &err));
  EXPECT_EQ(err, "cannot read key file: /nonexistent/key.json");
}

TEST(SessionLimitTest, LeavesThreadsForMessages) {
  BridgeConfig cfg;
  cfg.listen.threads = 32;
  EXPECT_EQ(bridge::EffectiveMaxSessions(cfg), 28);
  cfg.listen.threads = 2;
  EXPECT_EQ(bridge::EffectiveMaxSessions(cfg), 1);
  cfg.listen.threads = 32;
  cfg.sessions.max_sessions = 10;
  EXPECT_EQ(bridge::EffectiveMaxSessions(cfg), 10);
  cfg.sessions.max_sessions = 100;
  EXPECT_EQ(bridge::EffectiveMaxSessions(cfg), 28);
}

}  // namespace
