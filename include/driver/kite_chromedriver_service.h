#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>

namespace kite {

// chromedriver subprocess manager.
// Spawns chromedriver as a child process and manages its lifecycle. An
// instance already answering on the port is reused and left running on Stop.
class KiteChromedriverService {
public:
  KiteChromedriverService();
  ~KiteChromedriverService();

  // Start chromedriver at binary_path listening on port, then wait until
  // GET /status reports ready
  bool Start(const std::string& binary_path, int port, int timeout_ms = 30000);

  // Terminate the owned child process (SIGTERM, then SIGKILL)
  void Stop();

  bool IsReady() const { return is_ready_; }
  bool OwnsProcess() const { return server_pid_ > 0; }

  // http://127.0.0.1:<port>
  std::string GetServerURL() const;

  double GetUptimeSeconds() const;

private:
  // Poll the status endpoint until ready or timeout
  bool WaitForReady(int timeout_ms);

  // GET /status answered with HTTP 200
  bool HealthCheck();

  bool is_ready_;
  int port_;
  pid_t server_pid_;
  std::chrono::steady_clock::time_point start_time_;
};

}  // namespace kite
