#include "kite_chromedriver_service.h"
#include "logger.h"
#include <curl/curl.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <thread>
#include <vector>

namespace kite {

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  ((std::string*)userp)->append((char*)contents, size * nmemb);
  return size * nmemb;
}

}  // namespace

KiteChromedriverService::KiteChromedriverService()
    : is_ready_(false), port_(0), server_pid_(-1) {}

KiteChromedriverService::~KiteChromedriverService() {
  Stop();
}

bool KiteChromedriverService::Start(const std::string& binary_path, int port, int timeout_ms) {
  if (is_ready_) {
    LOG_DEBUG("Chromedriver", "Already running");
    return true;
  }

  port_ = port;

  // A chromedriver from a previous run may still own the port
  if (HealthCheck()) {
    LOG_INFO("Chromedriver", "Found existing chromedriver on port " + std::to_string(port) +
                                 ", reusing it");
    is_ready_ = true;
    start_time_ = std::chrono::steady_clock::now();
    return true;
  }

  if (access(binary_path.c_str(), X_OK) != 0) {
    LOG_ERROR("Chromedriver", "Binary not found or not executable: " + binary_path);
    return false;
  }

  LOG_INFO("Chromedriver", "Starting " + binary_path + " on port " + std::to_string(port));

  server_pid_ = fork();

  if (server_pid_ == 0) {
    // Child process - exec chromedriver

    // Argument strings must persist for execv
    std::vector<std::string> arg_strings;
    arg_strings.push_back(binary_path);
    arg_strings.push_back("--port=" + std::to_string(port));

    std::vector<const char*> argv;
    for (const auto& str : arg_strings) {
      argv.push_back(str.c_str());
    }
    argv.push_back(NULL);

    // Keep chromedriver's own logging out of our stderr
    int log_fd = open("/tmp/kite-chromedriver.log", O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (log_fd != -1) {
      dup2(log_fd, STDOUT_FILENO);
      dup2(log_fd, STDERR_FILENO);
      close(log_fd);
    }

    execv(binary_path.c_str(), (char* const*)argv.data());

    // If we get here, exec failed
    _exit(1);
  } else if (server_pid_ < 0) {
    LOG_ERROR("Chromedriver", "Failed to fork process");
    server_pid_ = -1;
    return false;
  }

  start_time_ = std::chrono::steady_clock::now();

  if (!WaitForReady(timeout_ms)) {
    LOG_ERROR("Chromedriver", "chromedriver failed to start within timeout");
    Stop();
    return false;
  }

  LOG_INFO("Chromedriver", "chromedriver ready (PID: " + std::to_string(server_pid_) + ")");
  return true;
}

void KiteChromedriverService::Stop() {
  if (!is_ready_ && server_pid_ <= 0) {
    return;
  }

  // Only kill if we own the process; a reused instance keeps running
  if (server_pid_ > 0) {
    LOG_DEBUG("Chromedriver", "Terminating chromedriver (PID: " + std::to_string(server_pid_) + ")");

    kill(server_pid_, SIGTERM);

    // Wait up to 2 seconds for graceful shutdown
    bool exited = false;
    for (int i = 0; i < 20; i++) {
      int status;
      pid_t result = waitpid(server_pid_, &status, WNOHANG);
      if (result != 0) {
        exited = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!exited) {
      LOG_WARN("Chromedriver", "Force killing chromedriver");
      kill(server_pid_, SIGKILL);
      waitpid(server_pid_, NULL, 0);
    }

    server_pid_ = -1;
  }

  is_ready_ = false;
  LOG_INFO("Chromedriver", "Stopped");
}

std::string KiteChromedriverService::GetServerURL() const {
  return "http://127.0.0.1:" + std::to_string(port_);
}

double KiteChromedriverService::GetUptimeSeconds() const {
  if (!is_ready_) {
    return 0.0;
  }
  auto now = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
  return duration.count() / 1000.0;
}

bool KiteChromedriverService::WaitForReady(int timeout_ms) {
  auto start = std::chrono::steady_clock::now();

  while (true) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();

    if (elapsed > timeout_ms) {
      LOG_ERROR("Chromedriver", "Timeout waiting for chromedriver (" +
                                    std::to_string(timeout_ms / 1000) + "s)");
      return false;
    }

    // Child exited early (bad binary, port in use)
    if (server_pid_ > 0) {
      int status;
      if (waitpid(server_pid_, &status, WNOHANG) == server_pid_) {
        LOG_ERROR("Chromedriver", "chromedriver exited during startup");
        server_pid_ = -1;
        return false;
      }
    }

    if (HealthCheck()) {
      is_ready_ = true;
      LOG_DEBUG("Chromedriver", "Ready after " + std::to_string(elapsed) + "ms");
      return true;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

bool KiteChromedriverService::HealthCheck() {
  CURL* curl = curl_easy_init();
  if (!curl) {
    return false;
  }

  std::string response;
  std::string url = GetServerURL() + "/status";

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Thread-safe

  CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_easy_cleanup(curl);

  return (res == CURLE_OK && http_code == 200);
}

}  // namespace kite
