#include "kite_api_handlers.h"
#include "kite_api_server.h"
#include "kite_automation.h"
#include "kite_chromedriver_service.h"
#include "kite_config.h"
#include "kite_element_registry.h"
#include "kite_router.h"
#include "kite_session_registry.h"
#include "kite_thread_pool.h"
#include "kite_wait_engine.h"
#include "kite_webdriver_client.h"
#include "logger.h"

#include <curl/curl.h>
#include <signal.h>
#include <cstring>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested(false);

void HandleSignal(int) {
  g_shutdown_requested = true;
}

void InstallSignalHandlers() {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = HandleSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  signal(SIGPIPE, SIG_IGN);
}

bool WantsHelp(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (WantsHelp(argc, argv)) {
    kite::PrintUsage(argv[0]);
    return 0;
  }

  kite::KiteConfig config;
  std::string error;
  if (!kite::LoadConfig(config, argc, argv, error)) {
    std::cerr << "Configuration error: " << error << std::endl;
    kite::PrintUsage(argv[0]);
    return 1;
  }

  if (config.log_file.empty()) {
    KiteLogger::Logger::Init();
  } else {
    KiteLogger::Logger::Init(config.log_file);
  }
  KiteLogger::Level level = KiteLogger::INFO;
  KiteLogger::Logger::ParseLevel(config.log_level, level);
  KiteLogger::Logger::SetLevel(level);

  kite::LogConfig(config);

  curl_global_init(CURL_GLOBAL_DEFAULT);
  InstallSignalHandlers();

  // Optional managed chromedriver
  kite::KiteChromedriverService chromedriver;
  std::string webdriver_url = config.webdriver_url;
  if (!config.chromedriver_path.empty()) {
    if (!chromedriver.Start(config.chromedriver_path, config.chromedriver_port)) {
      LOG_ERROR("Main", "Failed to start chromedriver from " + config.chromedriver_path);
      curl_global_cleanup();
      return 1;
    }
    webdriver_url = chromedriver.GetServerURL();
  }

  kite::ThreadPool pool(static_cast<size_t>(config.worker_threads));
  kite::KiteElementRegistry elements;

  auto factory = std::make_unique<kite::KiteWebDriverClientFactory>(
      webdriver_url, kite::ChromeArguments(config), config.chrome_binary,
      config.driver_command_timeout_s);

  kite::KiteSessionRegistry sessions(std::move(factory), elements, config.implicit_wait_s,
                                     config.page_load_timeout_s);
  kite::KiteWaitEngine waits(sessions, config.poll_interval_ms);
  kite::KiteAutomation automation(sessions, waits, config.page_load_timeout_s);

  kite::ApiDefaults defaults;
  defaults.page_load_timeout_s = config.page_load_timeout_s;
  defaults.explicit_wait_timeout_s = config.explicit_wait_timeout_s;
  defaults.script_wait_timeout_s = config.script_wait_timeout_s;
  defaults.max_static_wait_s = config.max_static_wait_s;

  kite::KiteApiHandlers handlers(automation, defaults, &pool);
  kite::KiteRouter router;
  handlers.Register(router);

  kite::KiteApiServer server(
      [&router](const kite::HttpRequest& request) { return router.Dispatch(request); }, pool);

  kite::ApiServerOptions options;
  options.host = config.host;
  options.port = config.port;
  options.max_body_bytes = config.max_body_bytes;
  options.request_timeout_ms = config.request_timeout_ms;
  options.ssl_enabled = config.ssl_enabled;
  options.ssl_cert = config.ssl_cert;
  options.ssl_key = config.ssl_key;

  if (!server.Start(options)) {
    LOG_ERROR("Main", "Failed to start API server");
    pool.Shutdown();
    chromedriver.Stop();
    curl_global_cleanup();
    return 1;
  }

  LOG_INFO("Main", "Kite gateway ready with " + std::to_string(pool.GetWorkerCount()) +
                       " worker(s)");

  while (!g_shutdown_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG_INFO("Main", "Shutting down");
  server.Stop();

  size_t closed = sessions.CloseAll();
  LOG_INFO("Main", "Closed " + std::to_string(closed) + " session(s)");

  pool.Shutdown();
  chromedriver.Stop();
  curl_global_cleanup();
  return 0;
}
