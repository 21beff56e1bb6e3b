#include "kite_api_server.h"
#include "logger.h"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace kite {

namespace {

// Set socket non-blocking
bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

void SetSocketTimeouts(int fd, int timeout_ms) {
  struct timeval tv;
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

std::string LastSslError() {
  unsigned long err_code = ERR_get_error();
  char err_buf[256];
  ERR_error_string_n(err_code, err_buf, sizeof(err_buf));
  return err_buf;
}

HttpResponse ErrorResponse(HttpStatus status, const std::string& code, const std::string& error) {
  nlohmann::json body;
  body["success"] = false;
  body["status"] = code;
  body["error"] = error;
  return MakeJsonResponse(status, body);
}

}  // namespace

struct KiteApiServer::Connection {
  int fd = -1;
  SSL* ssl = nullptr;

  // bytes read, 0 on orderly close, -1 on error or timeout
  int Read(char* buf, int len) {
    if (ssl) {
      return SSL_read(ssl, buf, len);
    }
    ssize_t n = recv(fd, buf, len, 0);
    return static_cast<int>(n);
  }

  bool Write(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
      int n;
      if (ssl) {
        n = SSL_write(ssl, data.data() + sent, static_cast<int>(data.size() - sent));
      } else {
        n = static_cast<int>(send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL));
      }
      if (n <= 0) {
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  ~Connection() {
    if (ssl) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
    }
    if (fd >= 0) {
      close(fd);
    }
  }
};

KiteApiServer::KiteApiServer(RequestHandler handler, ThreadPool& pool)
    : handler_(std::move(handler)),
      pool_(pool),
      running_(false),
      port_(0),
      server_socket_(-1),
      ssl_ctx_(nullptr),
      requests_served_(0),
      inflight_(0) {
}

KiteApiServer::~KiteApiServer() {
  Stop();
}

bool KiteApiServer::SetupTls() {
  SSL_library_init();
  SSL_load_error_strings();
  OpenSSL_add_all_algorithms();

  SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
  if (!ctx) {
    LOG_ERROR("ApiServer", "Failed to create SSL context");
    return false;
  }

  if (SSL_CTX_use_certificate_chain_file(ctx, options_.ssl_cert.c_str()) != 1) {
    LOG_ERROR("ApiServer", "Failed to load certificate " + options_.ssl_cert + ": " + LastSslError());
    SSL_CTX_free(ctx);
    return false;
  }
  if (SSL_CTX_use_PrivateKey_file(ctx, options_.ssl_key.c_str(), SSL_FILETYPE_PEM) != 1) {
    LOG_ERROR("ApiServer", "Failed to load private key " + options_.ssl_key + ": " + LastSslError());
    SSL_CTX_free(ctx);
    return false;
  }
  if (SSL_CTX_check_private_key(ctx) != 1) {
    LOG_ERROR("ApiServer", "Private key does not match certificate");
    SSL_CTX_free(ctx);
    return false;
  }

  SSL_CTX_set_options(ctx, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3);
  SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

  ssl_ctx_ = ctx;
  return true;
}

bool KiteApiServer::Start(const ApiServerOptions& options) {
  if (running_) {
    LOG_WARN("ApiServer", "Server already running");
    return true;
  }

  options_ = options;

  // Peers that disconnect mid-response must not kill the process
  signal(SIGPIPE, SIG_IGN);

  if (options_.ssl_enabled && !SetupTls()) {
    return false;
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  std::string host = options_.host == "localhost" ? "127.0.0.1" : options_.host;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    LOG_ERROR("ApiServer", "Invalid listen address: " + options_.host);
    Stop();
    return false;
  }

  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    LOG_ERROR("ApiServer", "Failed to create socket");
    Stop();
    return false;
  }

  int opt = 1;
  setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (bind(server_socket_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
    LOG_ERROR("ApiServer", "Failed to bind to " + options_.host + ":" +
                               std::to_string(options_.port) + ": " + strerror(errno));
    Stop();
    return false;
  }

  if (listen(server_socket_, 128) < 0) {
    LOG_ERROR("ApiServer", std::string("Failed to listen: ") + strerror(errno));
    Stop();
    return false;
  }

  struct sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (getsockname(server_socket_, (struct sockaddr*)&bound, &bound_len) == 0) {
    port_ = ntohs(bound.sin_port);
  } else {
    port_ = options_.port;
  }

  SetNonBlocking(server_socket_);

  running_ = true;
  server_thread_ = std::thread(&KiteApiServer::ServerThread, this);

  LOG_INFO("ApiServer", std::string("Listening on ") + (ssl_ctx_ ? "https" : "http") + "://" +
                            options_.host + ":" + std::to_string(port_));
  return true;
}

void KiteApiServer::Stop() {
  bool was_running = running_.exchange(false);

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  if (server_socket_ >= 0) {
    close(server_socket_);
    server_socket_ = -1;
  }

  {
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    if (inflight_ > 0) {
      LOG_INFO("ApiServer", "Waiting for " + std::to_string(inflight_) + " in-flight request(s)");
    }
    inflight_cv_.wait(lock, [this] { return inflight_ == 0; });
  }

  if (ssl_ctx_) {
    SSL_CTX_free(static_cast<SSL_CTX*>(ssl_ctx_));
    ssl_ctx_ = nullptr;
  }

  if (was_running) {
    LOG_INFO("ApiServer", "Stopped after " + std::to_string(requests_served_.load()) +
                              " request(s)");
  }
}

void KiteApiServer::ServerThread() {
  LOG_DEBUG("ApiServer", "Accept thread started");

  while (running_) {
    struct pollfd pfd;
    pfd.fd = server_socket_;
    pfd.events = POLLIN;

    int ret = poll(&pfd, 1, 100);  // 100ms timeout
    if (ret <= 0) continue;

    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);
    if (client_socket < 0) continue;

    // Accepted sockets inherit O_NONBLOCK; workers use blocking I/O with timeouts
    int flags = fcntl(client_socket, F_GETFL, 0);
    fcntl(client_socket, F_SETFL, flags & ~O_NONBLOCK);

    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
    std::string client_ip(ip);

    {
      std::lock_guard<std::mutex> lock(inflight_mutex_);
      ++inflight_;
    }

    bool queued = pool_.Post(TaskPriority::NORMAL, [this, client_socket, client_ip]() {
      HandleConnection(client_socket, client_ip);
      std::lock_guard<std::mutex> lock(inflight_mutex_);
      --inflight_;
      inflight_cv_.notify_all();
    });

    if (!queued) {
      LOG_WARN("ApiServer", "Worker pool unavailable, dropping connection from " + client_ip);
      close(client_socket);
      std::lock_guard<std::mutex> lock(inflight_mutex_);
      --inflight_;
      inflight_cv_.notify_all();
    }
  }

  LOG_DEBUG("ApiServer", "Accept thread exiting");
}

bool KiteApiServer::ReadRequest(Connection& conn, HttpRequest& request, HttpResponse& error) {
  std::string data;
  char buffer[8192];

  while (true) {
    int bytes = conn.Read(buffer, sizeof(buffer));
    if (bytes <= 0) {
      if (bytes < 0 && !data.empty() && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        error = ErrorResponse(HTTP_408_REQUEST_TIMEOUT, "timeout", "Timed out reading request");
        return false;
      }
      // Closed or failed before a full request arrived; nothing to answer
      error.status = HTTP_200_OK;
      error.body.clear();
      return false;
    }
    data.append(buffer, bytes);

    ParseStatus status = ParseHttpRequest(data, options_.max_body_bytes, request);
    switch (status) {
      case ParseStatus::COMPLETE:
        return true;
      case ParseStatus::MALFORMED:
        error = ErrorResponse(HTTP_400_BAD_REQUEST, "invalid_parameter", "Malformed HTTP request");
        return false;
      case ParseStatus::TOO_LARGE:
        error = ErrorResponse(HTTP_413_PAYLOAD_TOO_LARGE, "invalid_parameter",
                              "Request body exceeds " + std::to_string(options_.max_body_bytes) +
                                  " bytes");
        return false;
      case ParseStatus::INCOMPLETE:
        break;
    }
  }
}

void KiteApiServer::WriteResponse(Connection& conn, const HttpResponse& response) {
  if (!conn.Write(SerializeHttpResponse(response))) {
    LOG_WARN("ApiServer", "Failed to write response to client");
  }
}

void KiteApiServer::HandleConnection(int client_socket, const std::string& client_ip) {
  Connection conn;
  conn.fd = client_socket;

  int nodelay = 1;
  setsockopt(client_socket, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
  SetSocketTimeouts(client_socket, options_.request_timeout_ms);

  if (ssl_ctx_) {
    conn.ssl = SSL_new(static_cast<SSL_CTX*>(ssl_ctx_));
    if (!conn.ssl) {
      return;
    }
    SSL_set_fd(conn.ssl, client_socket);

    int ssl_ret = SSL_accept(conn.ssl);
    if (ssl_ret <= 0) {
      int ssl_err = SSL_get_error(conn.ssl, ssl_ret);
      LOG_WARN("ApiServer", "SSL handshake failed from " + client_ip + " - SSL_error: " +
                                std::to_string(ssl_err) + " ERR: " + LastSslError());
      SSL_free(conn.ssl);
      conn.ssl = nullptr;
      return;
    }
  }

  auto start = std::chrono::steady_clock::now();

  HttpRequest request;
  HttpResponse error;
  if (!ReadRequest(conn, request, error)) {
    if (!error.body.empty()) {
      LOG_WARN("ApiServer", client_ip + " -> " + std::to_string(static_cast<int>(error.status)) +
                                " " + HttpStatusText(error.status));
      WriteResponse(conn, error);
    }
    return;
  }
  request.client_ip = client_ip;

  HttpResponse response = handler_(request);
  WriteResponse(conn, response);
  ++requests_served_;

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start).count();
  LOG_INFO("ApiServer", request.method_name + " " + request.path + " -> " +
                            std::to_string(static_cast<int>(response.status)) + " (" +
                            std::to_string(elapsed) + "ms)");
}

}  // namespace kite
