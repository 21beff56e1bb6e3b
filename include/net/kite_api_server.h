#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "kite_http_message.h"
#include "kite_thread_pool.h"

namespace kite {

struct ApiServerOptions {
  std::string host = "127.0.0.1";
  int port = 8080;                           // 0 = pick an ephemeral port
  size_t max_body_bytes = 16 * 1024 * 1024;
  int request_timeout_ms = 30000;            // per-connection read/write timeout
  bool ssl_enabled = false;
  std::string ssl_cert;                      // PEM certificate chain
  std::string ssl_key;                       // PEM private key
};

/**
 * Embedded HTTP/1.1 server for the automation API.
 *
 * One accept thread polls the listening socket; every accepted connection
 * is handed to the worker pool, reads exactly one request, runs the
 * handler and closes. With ssl_enabled the connection is wrapped in
 * OpenSSL using the configured certificate and key.
 *
 * Usage:
 *   KiteApiServer server([&](const HttpRequest& r) { return router.Dispatch(r); }, pool);
 *   server.Start(options);
 *   ...
 *   server.Stop();
 */
class KiteApiServer {
public:
  using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

  KiteApiServer(RequestHandler handler, ThreadPool& pool);
  ~KiteApiServer();

  KiteApiServer(const KiteApiServer&) = delete;
  KiteApiServer& operator=(const KiteApiServer&) = delete;

  /**
   * Bind, listen and start accepting.
   * @return false if TLS setup, bind or listen failed
   */
  bool Start(const ApiServerOptions& options);

  /**
   * Stop accepting and wait for in-flight connections to finish.
   */
  void Stop();

  bool IsRunning() const { return running_; }

  // Bound port, resolved when options.port was 0
  int GetPort() const { return port_; }

  uint64_t requests_served() const { return requests_served_; }

private:
  struct Connection;

  void ServerThread();
  void HandleConnection(int client_socket, const std::string& client_ip);
  bool ReadRequest(Connection& conn, HttpRequest& request, HttpResponse& error);
  void WriteResponse(Connection& conn, const HttpResponse& response);
  bool SetupTls();

  RequestHandler handler_;
  ThreadPool& pool_;
  ApiServerOptions options_;

  std::thread server_thread_;
  std::atomic<bool> running_;
  int port_;
  int server_socket_;
  void* ssl_ctx_;  // SSL_CTX*

  std::atomic<uint64_t> requests_served_;

  // In-flight connections, waited on by Stop()
  std::mutex inflight_mutex_;
  std::condition_variable inflight_cv_;
  int inflight_;
};

}  // namespace kite
