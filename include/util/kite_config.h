#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Gateway configuration.
//
// Priority order: CLI args (--key=value) > environment (KITE_<KEY>) >
// JSON config file (--config=path or KITE_CONFIG) > defaults.
//
// Keys use the field names below, e.g. --page_load_timeout_s=60 or
// KITE_PAGE_LOAD_TIMEOUT_S=60. chrome_args is a JSON array in the config
// file and a whitespace-separated list everywhere else.

namespace kite {

struct KiteConfig {
  // Server
  std::string host = "127.0.0.1";
  uint16_t port = 8080;
  int worker_threads = 0;                    // 0 = auto
  int request_timeout_ms = 30000;            // socket read/write timeout
  size_t max_body_bytes = 16 * 1024 * 1024;  // 16MB max body
  bool ssl_enabled = false;
  std::string ssl_cert;
  std::string ssl_key;

  // Driver
  std::string webdriver_url = "http://127.0.0.1:9515";
  std::string chromedriver_path;             // empty = use an externally managed chromedriver
  uint16_t chromedriver_port = 9515;
  std::string chrome_binary;
  bool headless = true;
  std::vector<std::string> chrome_args;      // appended after the defaults
  int driver_command_timeout_s = 120;

  // Timeouts
  int page_load_timeout_s = 30;
  int explicit_wait_timeout_s = 30;
  int implicit_wait_s = 0;
  int script_wait_timeout_s = 30;
  int poll_interval_ms = 250;
  int max_static_wait_s = 120;

  // Logging
  std::string log_file;
  std::string log_level = "info";
};

// Apply one key. Returns false with error set for unknown keys and bad values.
bool SetConfigValue(KiteConfig& config, const std::string& key,
                    const std::string& value, std::string& error);

bool LoadConfigFile(KiteConfig& config, const std::string& path, std::string& error);

// Reads KITE_<KEY> for every known key
bool LoadConfigFromEnv(KiteConfig& config, std::string& error);

// Applies --key=value arguments; --config is skipped (handled by LoadConfig)
bool LoadConfigFromArgs(KiteConfig& config, int argc, char* argv[], std::string& error);

// Full load in priority order followed by validation
bool LoadConfig(KiteConfig& config, int argc, char* argv[], std::string& error);

bool ValidateConfig(const KiteConfig& config, std::string& error);

// Browser arguments sent with every new session
std::vector<std::string> ChromeArguments(const KiteConfig& config);

// Names of all accepted keys, in declaration order
const std::vector<std::string>& ConfigKeys();

void LogConfig(const KiteConfig& config);
void PrintUsage(const char* program);

}  // namespace kite
