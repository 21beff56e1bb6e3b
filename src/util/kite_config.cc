#include "kite_config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace kite {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

bool ParseLong(const std::string& key, const std::string& value, long min, long max,
               long& out, std::string& error) {
  if (value.empty()) {
    error = key + ": expected an integer, got empty value";
    return false;
  }
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    error = key + ": expected an integer, got '" + value + "'";
    return false;
  }
  if (v < min || v > max) {
    error = key + ": " + value + " is out of range [" + std::to_string(min) + ", " +
            std::to_string(max) + "]";
    return false;
  }
  out = v;
  return true;
}

bool ParseInt(const std::string& key, const std::string& value, long min, long max,
              int& out, std::string& error) {
  long v = 0;
  if (!ParseLong(key, value, min, max, v, error)) {
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

bool ParsePort(const std::string& key, const std::string& value, uint16_t& out,
               std::string& error) {
  long v = 0;
  if (!ParseLong(key, value, 0, 65535, v, error)) {
    return false;
  }
  out = static_cast<uint16_t>(v);
  return true;
}

bool ParseBool(const std::string& key, const std::string& value, bool& out,
               std::string& error) {
  std::string lower = ToLower(value);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    out = true;
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    out = false;
    return true;
  }
  error = key + ": expected a boolean, got '" + value + "'";
  return false;
}

std::vector<std::string> SplitWhitespace(const std::string& value) {
  std::vector<std::string> parts;
  std::istringstream iss(value);
  std::string part;
  while (iss >> part) {
    parts.push_back(part);
  }
  return parts;
}

// Config file values are converted to the same text form the env and CLI use
bool JsonValueToString(const std::string& key, const json& value, std::string& out,
                       std::string& error) {
  if (value.is_string()) {
    out = value.get<std::string>();
  } else if (value.is_boolean()) {
    out = value.get<bool>() ? "true" : "false";
  } else if (value.is_number_integer()) {
    out = std::to_string(value.get<long long>());
  } else {
    error = key + ": unsupported value type in config file";
    return false;
  }
  return true;
}

}  // namespace

const std::vector<std::string>& ConfigKeys() {
  static const std::vector<std::string> keys = {
    "host", "port", "worker_threads", "request_timeout_ms", "max_body_bytes",
    "ssl_enabled", "ssl_cert", "ssl_key",
    "webdriver_url", "chromedriver_path", "chromedriver_port", "chrome_binary",
    "headless", "chrome_args", "driver_command_timeout_s",
    "page_load_timeout_s", "explicit_wait_timeout_s", "implicit_wait_s",
    "script_wait_timeout_s", "poll_interval_ms", "max_static_wait_s",
    "log_file", "log_level"
  };
  return keys;
}

bool SetConfigValue(KiteConfig& config, const std::string& key,
                    const std::string& value, std::string& error) {
  // Server
  if (key == "host") {
    config.host = value;
    return true;
  }
  if (key == "port") return ParsePort(key, value, config.port, error);
  if (key == "worker_threads") return ParseInt(key, value, 0, 1024, config.worker_threads, error);
  if (key == "request_timeout_ms") {
    return ParseInt(key, value, 1, INT_MAX, config.request_timeout_ms, error);
  }
  if (key == "max_body_bytes") {
    long v = 0;
    if (!ParseLong(key, value, 1, LONG_MAX, v, error)) return false;
    config.max_body_bytes = static_cast<size_t>(v);
    return true;
  }
  if (key == "ssl_enabled") return ParseBool(key, value, config.ssl_enabled, error);
  if (key == "ssl_cert") {
    config.ssl_cert = value;
    return true;
  }
  if (key == "ssl_key") {
    config.ssl_key = value;
    return true;
  }

  // Driver
  if (key == "webdriver_url") {
    config.webdriver_url = value;
    return true;
  }
  if (key == "chromedriver_path") {
    config.chromedriver_path = value;
    return true;
  }
  if (key == "chromedriver_port") return ParsePort(key, value, config.chromedriver_port, error);
  if (key == "chrome_binary") {
    config.chrome_binary = value;
    return true;
  }
  if (key == "headless") return ParseBool(key, value, config.headless, error);
  if (key == "chrome_args") {
    config.chrome_args = SplitWhitespace(value);
    return true;
  }
  if (key == "driver_command_timeout_s") {
    return ParseInt(key, value, 1, 3600, config.driver_command_timeout_s, error);
  }

  // Timeouts
  if (key == "page_load_timeout_s") {
    return ParseInt(key, value, 1, 3600, config.page_load_timeout_s, error);
  }
  if (key == "explicit_wait_timeout_s") {
    return ParseInt(key, value, 0, 3600, config.explicit_wait_timeout_s, error);
  }
  if (key == "implicit_wait_s") return ParseInt(key, value, 0, 3600, config.implicit_wait_s, error);
  if (key == "script_wait_timeout_s") {
    return ParseInt(key, value, 0, 3600, config.script_wait_timeout_s, error);
  }
  if (key == "poll_interval_ms") return ParseInt(key, value, 1, 60000, config.poll_interval_ms, error);
  if (key == "max_static_wait_s") return ParseInt(key, value, 1, 3600, config.max_static_wait_s, error);

  // Logging
  if (key == "log_file") {
    config.log_file = value;
    return true;
  }
  if (key == "log_level") {
    KiteLogger::Level level;
    if (!KiteLogger::Logger::ParseLevel(value, level)) {
      error = key + ": expected debug, info, warn or error, got '" + value + "'";
      return false;
    }
    config.log_level = ToLower(value);
    return true;
  }

  error = "Unknown configuration key: " + key;
  return false;
}

bool LoadConfigFile(KiteConfig& config, const std::string& path, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Cannot open config file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  json root = json::parse(buffer.str(), nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    error = "Config file is not a JSON object: " + path;
    return false;
  }

  for (auto it = root.begin(); it != root.end(); ++it) {
    const std::string& key = it.key();

    if (key == "chrome_args" && it.value().is_array()) {
      std::vector<std::string> args;
      for (const auto& arg : it.value()) {
        if (!arg.is_string()) {
          error = "chrome_args: every entry must be a string";
          return false;
        }
        args.push_back(arg.get<std::string>());
      }
      config.chrome_args = args;
      continue;
    }

    std::string text;
    if (!JsonValueToString(key, it.value(), text, error)) {
      return false;
    }
    if (!SetConfigValue(config, key, text, error)) {
      return false;
    }
  }

  LOG_DEBUG("Config", "Loaded config file: " + path);
  return true;
}

bool LoadConfigFromEnv(KiteConfig& config, std::string& error) {
  for (const auto& key : ConfigKeys()) {
    std::string env_name = "KITE_" + ToUpper(key);
    const char* value = std::getenv(env_name.c_str());
    if (!value) {
      continue;
    }
    if (!SetConfigValue(config, key, value, error)) {
      error = env_name + ": " + error;
      return false;
    }
  }
  return true;
}

bool LoadConfigFromArgs(KiteConfig& config, int argc, char* argv[], std::string& error) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      error = "Unexpected argument: " + arg;
      return false;
    }

    std::string body = arg.substr(2);
    std::string key;
    std::string value;
    size_t eq = body.find('=');
    if (eq == std::string::npos) {
      // Bare boolean flags: --headless, --ssl_enabled
      key = body;
      value = "true";
    } else {
      key = body.substr(0, eq);
      value = body.substr(eq + 1);
    }
    std::replace(key.begin(), key.end(), '-', '_');

    if (key == "config" || key == "help") {
      continue;
    }
    if (!SetConfigValue(config, key, value, error)) {
      return false;
    }
  }
  return true;
}

bool LoadConfig(KiteConfig& config, int argc, char* argv[], std::string& error) {
  // Locate the config file first, the CLI wins over KITE_CONFIG
  std::string config_path;
  const char* env_path = std::getenv("KITE_CONFIG");
  if (env_path) {
    config_path = env_path;
  }
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      config_path = arg.substr(9);
    }
  }

  if (!config_path.empty() && !LoadConfigFile(config, config_path, error)) {
    return false;
  }
  if (!LoadConfigFromEnv(config, error)) {
    return false;
  }
  if (!LoadConfigFromArgs(config, argc, argv, error)) {
    return false;
  }
  return ValidateConfig(config, error);
}

bool ValidateConfig(const KiteConfig& config, std::string& error) {
  if (config.host.empty()) {
    error = "host must not be empty";
    return false;
  }
  if (config.ssl_enabled && (config.ssl_cert.empty() || config.ssl_key.empty())) {
    error = "ssl_enabled requires both ssl_cert and ssl_key";
    return false;
  }
  if (config.webdriver_url.rfind("http://", 0) != 0 &&
      config.webdriver_url.rfind("https://", 0) != 0) {
    error = "webdriver_url must start with http:// or https://";
    return false;
  }
  if (!config.chromedriver_path.empty() && config.chromedriver_port == 0) {
    error = "chromedriver_port must be set when chromedriver_path is used";
    return false;
  }
  return true;
}

std::vector<std::string> ChromeArguments(const KiteConfig& config) {
  std::vector<std::string> args;
  if (config.headless) {
    args.push_back("--headless=new");
  }
  args.push_back("--disable-gpu");
  args.push_back("--no-sandbox");
  args.push_back("--disable-dev-shm-usage");
  args.push_back("--window-size=1920,1080");
  args.insert(args.end(), config.chrome_args.begin(), config.chrome_args.end());
  return args;
}

void LogConfig(const KiteConfig& config) {
  LOG_INFO("Config", "Listening on " + config.host + ":" + std::to_string(config.port) +
           (config.ssl_enabled ? " (TLS)" : ""));
  LOG_INFO("Config", "WebDriver endpoint: " + config.webdriver_url +
           (config.chromedriver_path.empty() ? "" : " (managed: " + config.chromedriver_path + ")"));
  LOG_INFO("Config", std::string("Headless: ") + (config.headless ? "yes" : "no") +
           ", page load timeout " + std::to_string(config.page_load_timeout_s) + "s" +
           ", explicit wait " + std::to_string(config.explicit_wait_timeout_s) + "s" +
           ", implicit wait " + std::to_string(config.implicit_wait_s) + "s");
}

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program << " [--config=path] [--key=value ...]\n\n";
  std::cerr << "Keys (also settable as KITE_<KEY> environment variables):\n";
  for (const auto& key : ConfigKeys()) {
    std::cerr << "  --" << key << "=...\n";
  }
}

}  // namespace kite
