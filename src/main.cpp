#include "backends/bigquery_backend.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "mcp_protocol.hpp"
#include "mcp_router.hpp"
#include "session_manager.hpp"
#include "table_tools.hpp"
#include "tool_registry.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void SignalHandler(int) {
  g_stop_requested = 1;
}

void InstallSignalHandlers() {
  struct sigaction action {};
  action.sa_handler = SignalHandler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

void PrintUsage(const char* argv0) {
  std::cout << "usage: " << argv0
            << " --project <id> --location <loc> [--key-file <path>] [--dataset <name>]... [--host <addr>]"
               " [--port <n>]\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = bridge::LoadConfigFromEnv();

  std::string err;
  if (!bridge::ApplyCommandLine(argc, argv, &cfg, &err)) {
    std::cout << "[bridge] " << err << "\n";
    PrintUsage(argv[0]);
    return 2;
  }
  if (cfg.bigquery.project.empty() || cfg.bigquery.location.empty()) {
    std::cout << "[bridge] project and location are required (--project/--location or BQ_PROJECT_ID/BQ_LOCATION)\n";
    PrintUsage(argv[0]);
    return 2;
  }
  if (!bridge::ResolveAccessToken(&cfg.bigquery, &err)) {
    std::cout << "[bridge] " << err << "\n";
    return 2;
  }

  std::cout << "[bridge] project=" << cfg.bigquery.project << " location=" << cfg.bigquery.location
            << " datasets=" << (cfg.bigquery.datasets.empty() ? std::string("<all>") : std::to_string(cfg.bigquery.datasets.size()))
            << " token=" << (cfg.bigquery.access_token.empty() ? "absent" : "present") << "\n";
  std::cout << "[bigquery] endpoint=" << cfg.bigquery.endpoint.SchemeHostPort() << cfg.bigquery.endpoint.base_path
            << " max_in_flight=" << cfg.bigquery.max_in_flight << "\n";

  auto backend = std::make_unique<bridge::BigQueryBackend>(cfg.bigquery);
  std::cout << "[bridge] backend=" << backend->Name() << "\n";

  bridge::ToolRegistry tools;
  bridge::BridgeError reg_err;
  if (!bridge::RegisterTableTools(&tools, backend.get(), &reg_err)) {
    std::cout << "[bridge] tool registration failed: " << reg_err.message << "\n";
    return 1;
  }
  bridge::Dispatcher dispatcher(&tools);
  bridge::McpProtocol protocol(&dispatcher, bridge::McpServerInfo{});

  bridge::SessionManagerConfig session_cfg;
  session_cfg.drain_timeout = std::chrono::milliseconds(cfg.sessions.drain_timeout_ms);
  session_cfg.queue_capacity = static_cast<size_t>(cfg.sessions.queue_capacity);
  session_cfg.worker_threads = cfg.sessions.worker_threads;
  session_cfg.max_in_flight_per_session = static_cast<size_t>(cfg.sessions.max_in_flight_per_session);
  session_cfg.max_sessions = static_cast<size_t>(bridge::EffectiveMaxSessions(cfg));
  bridge::SessionManager sessions(session_cfg);
  std::cout << "[session] max_sessions=" << session_cfg.max_sessions << " workers=" << session_cfg.worker_threads
            << "\n";

  bridge::McpRouterOptions router_opts;
  router_opts.prefix = cfg.path_prefix;
  router_opts.keepalive = std::chrono::seconds(cfg.sessions.keepalive_seconds);
  bridge::McpRouter router(&sessions, &dispatcher, &protocol, router_opts);

  httplib::Server server;
  const int http_threads = cfg.listen.threads;
  server.new_task_queue = [http_threads] { return new httplib::ThreadPool(static_cast<size_t>(http_threads)); };
  bridge::InstallServerHandlers(&server);
  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);
  router.Register(&server);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["sessions"] = sessions.SessionCount();
    j["tools"] = tools.Size();
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  if (!server.bind_to_port(cfg.listen.host, cfg.listen.port)) {
    std::cout << "[http] bind failed host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
    return 1;
  }
  InstallSignalHandlers();

  std::atomic<bool> listen_done{false};
  bool listen_ok = false;
  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << " prefix=" << router.prefix()
            << " threads=" << http_threads << "\n";
  std::thread http_thread([&] {
    listen_ok = server.listen_after_bind();
    listen_done = true;
  });

  while (!g_stop_requested && !listen_done) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "[bridge] shutting down\n";
  // Streams drain through their writers, so sessions close before the listener stops.
  sessions.Shutdown();
  server.stop();
  http_thread.join();
  std::cout << "[http] listen returned ok=" << (listen_ok ? 1 : 0) << "\n";

  return (listen_ok || g_stop_requested) ? 0 : 1;
}
