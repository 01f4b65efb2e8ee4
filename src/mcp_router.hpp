#pragma once

#include "dispatcher.hpp"
#include "mcp_protocol.hpp"
#include "session_manager.hpp"

#include <httplib.h>

#include <chrono>
#include <string>

namespace bridge {

struct McpRouterOptions {
  std::string prefix = "/mcp";
  std::chrono::milliseconds keepalive{15000};
};

// Unary HTTP and SSE transports in front of one Dispatcher.
class McpRouter {
 public:
  McpRouter(SessionManager* sessions, const Dispatcher* dispatcher, const McpProtocol* protocol, McpRouterOptions options);
  void Register(httplib::Server* server);

  const std::string& prefix() const { return prefix_; }

 private:
  void HandleStatus(httplib::Response& res) const;
  void HandleListTools(httplib::Response& res) const;
  void HandleCall(const httplib::Request& req, httplib::Response& res, const std::string& tool_from_path) const;
  void HandleSse(httplib::Response& res) const;
  void HandleMessage(const httplib::Request& req, httplib::Response& res) const;
  void HandleJsonRpc(const httplib::Request& req, httplib::Response& res) const;

  SessionManager* sessions_;
  const Dispatcher* dispatcher_;
  const McpProtocol* protocol_;
  std::string prefix_;
  std::chrono::milliseconds keepalive_;
};

// Transport error logged when an SSE stream ends abnormally: a failed write, or a client
// that went away before the session closed.
BridgeError StreamTeardownError(const std::string& session_id, bool write_failed);

// JSON error bodies for unmatched routes and escaped exceptions, plus the access log.
void InstallServerHandlers(httplib::Server* server);

}  // namespace bridge
