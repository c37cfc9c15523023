#pragma once

#include "sceneseek/config.hpp"
#include "sceneseek/service_runtime.hpp"

#include <httplib.h>

#include <chrono>
#include <string>

namespace sceneseek::server {

// HTTP surface over ServiceRuntime: /health, POST /chat as an event stream,
// and the per-user conversation endpoints. Identity comes from X-User-Id,
// set by an upstream authenticating proxy.
class HttpServer {
 public:
  HttpServer(ServiceRuntime& runtime, ServerConfig config);

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Blocks until Stop. Returns false when the socket cannot be bound.
  bool Listen();
  void Stop();

 private:
  void RegisterRoutes();
  bool Authorize(const httplib::Request& request, httplib::Response& response) const;
  static std::string UserOf(const httplib::Request& request);

  void HandleChat(const httplib::Request& request, httplib::Response& response);
  void HandleListConversations(const httplib::Request& request, httplib::Response& response);
  void HandleGetConversation(const httplib::Request& request, httplib::Response& response);
  void HandleDeleteConversation(const httplib::Request& request, httplib::Response& response);

  ServiceRuntime& runtime_;
  ServerConfig config_;
  httplib::Server server_;
};

}  // namespace sceneseek::server
