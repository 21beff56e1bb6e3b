#include "kite_webdriver_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <cctype>
#include <cstdio>

using json = nlohmann::json;

namespace kite {

namespace {

// Callback for curl to write response data
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  ((std::string*)userp)->append((char*)contents, size * nmemb);
  return size * nmemb;
}

std::string HexEscape(unsigned char c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "\\%x ", c);
  return buf;
}

// Double-quoted CSS string body
std::string CssQuoteString(const std::string& text) {
  std::string out;
  for (unsigned char c : text) {
    if (c == '"' || c == '\\') {
      out += '\\';
      out += static_cast<char>(c);
    } else if (c < 0x20 || c == 0x7f) {
      out += HexEscape(c);
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

DriverStatus UnexpectedValue(const std::string& what) {
  return DriverStatus::Fail(DriverError::UNKNOWN, "Unexpected WebDriver response for " + what);
}

bool ParseCookie(const json& j, CookieData& cookie) {
  if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
    return false;
  }
  cookie = CookieData();
  cookie.name = j["name"].get<std::string>();
  if (j.contains("value") && j["value"].is_string()) {
    cookie.value = j["value"].get<std::string>();
  }
  if (j.contains("domain") && j["domain"].is_string()) {
    cookie.domain = j["domain"].get<std::string>();
  }
  if (j.contains("path") && j["path"].is_string()) {
    cookie.path = j["path"].get<std::string>();
  }
  if (j.contains("secure") && j["secure"].is_boolean()) {
    cookie.secure = j["secure"].get<bool>();
  }
  if (j.contains("httpOnly") && j["httpOnly"].is_boolean()) {
    cookie.http_only = j["httpOnly"].get<bool>();
  }
  if (j.contains("expiry") && j["expiry"].is_number()) {
    cookie.has_expiry = true;
    cookie.expiry = j["expiry"].is_number_float()
                        ? static_cast<int64_t>(j["expiry"].get<double>())
                        : j["expiry"].get<int64_t>();
  }
  if (j.contains("sameSite") && j["sameSite"].is_string()) {
    cookie.same_site = j["sameSite"].get<std::string>();
  }
  return true;
}

}  // namespace

DriverError DriverErrorFromW3C(const std::string& error) {
  if (error == "no such element") return DriverError::NO_SUCH_ELEMENT;
  if (error == "stale element reference") return DriverError::STALE_ELEMENT;
  if (error == "no such frame") return DriverError::NO_SUCH_FRAME;
  if (error == "no such alert") return DriverError::NO_SUCH_ALERT;
  if (error == "no such cookie") return DriverError::NO_SUCH_COOKIE;
  if (error == "invalid argument" || error == "invalid selector") {
    return DriverError::INVALID_ARGUMENT;
  }
  if (error == "timeout" || error == "script timeout") return DriverError::TIMEOUT;
  if (error == "invalid session id") return DriverError::INVALID_SESSION;
  if (error == "javascript error") return DriverError::JAVASCRIPT_ERROR;
  return DriverError::UNKNOWN;
}

std::string CssEscapeIdentifier(const std::string& ident) {
  std::string out;
  for (size_t i = 0; i < ident.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(ident[i]);
    if (c == 0) {
      out += "\xEF\xBF\xBD";
    } else if (c < 0x20 || c == 0x7f) {
      out += HexEscape(c);
    } else if (std::isdigit(c) && (i == 0 || (i == 1 && ident[0] == '-'))) {
      out += HexEscape(c);
    } else if (i == 0 && c == '-' && ident.size() == 1) {
      out += "\\-";
    } else if (c >= 0x80 || std::isalnum(c) || c == '-' || c == '_') {
      out += static_cast<char>(c);
    } else {
      out += '\\';
      out += static_cast<char>(c);
    }
  }
  return out;
}

std::string EncodePathSegment(const std::string& segment) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0f];
    }
  }
  return out;
}

void ToWebDriverLocator(const Locator& locator, std::string& using_strategy,
                        std::string& value) {
  switch (locator.strategy) {
    case LocatorStrategy::ID:
      using_strategy = "css selector";
      value = "#" + CssEscapeIdentifier(locator.value);
      return;
    case LocatorStrategy::NAME:
      using_strategy = "css selector";
      value = "*[name=\"" + CssQuoteString(locator.value) + "\"]";
      return;
    case LocatorStrategy::CLASS_NAME:
      using_strategy = "css selector";
      value = "." + CssEscapeIdentifier(locator.value);
      return;
    case LocatorStrategy::TAG_NAME:
      using_strategy = "tag name";
      break;
    case LocatorStrategy::LINK_TEXT:
      using_strategy = "link text";
      break;
    case LocatorStrategy::PARTIAL_LINK_TEXT:
      using_strategy = "partial link text";
      break;
    case LocatorStrategy::XPATH:
      using_strategy = "xpath";
      break;
    case LocatorStrategy::CSS_SELECTOR:
    default:
      using_strategy = "css selector";
      break;
  }
  value = locator.value;
}

// ============================================================
// Transport
// ============================================================

DriverStatus KiteWebDriverClient::Execute(const std::string& base_url, const std::string& method,
                                          const std::string& path, const json* body,
                                          int timeout_s, json& value) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    return DriverStatus::Fail(DriverError::UNKNOWN, "Failed to initialize CURL");
  }

  std::string url = base_url + path;
  std::string payload = body ? body->dump() : std::string();
  std::string response_data;

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json; charset=utf-8");
  headers = curl_slist_append(headers, "Accept: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  if (method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  } else if (method != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Thread-safe
  curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

  CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    std::string error = "HTTP request failed: " + std::string(curl_easy_strerror(res));
    LOG_WARN("WebDriver", method + " " + path + ": " + error);
    return DriverStatus::Fail(
        res == CURLE_OPERATION_TIMEDOUT ? DriverError::TIMEOUT : DriverError::UNKNOWN, error);
  }

  json response = json::parse(response_data, nullptr, false);
  if (response.is_discarded() || !response.is_object()) {
    return DriverStatus::Fail(DriverError::UNKNOWN,
                              "Invalid WebDriver response (HTTP " + std::to_string(http_code) + ")");
  }

  value = response.contains("value") ? response["value"] : json();

  if (value.is_object() && value.contains("error") && value["error"].is_string()) {
    std::string error = value["error"].get<std::string>();
    std::string message = value.contains("message") && value["message"].is_string()
                              ? value["message"].get<std::string>()
                              : error;
    LOG_DEBUG("WebDriver", method + " " + path + " -> " + error + ": " + message);
    return DriverStatus::Fail(DriverErrorFromW3C(error), message);
  }
  if (http_code != 200) {
    return DriverStatus::Fail(DriverError::UNKNOWN,
                              "WebDriver returned HTTP " + std::to_string(http_code));
  }
  return DriverStatus::Ok();
}

KiteWebDriverClient::KiteWebDriverClient(const std::string& base_url,
                                         const std::string& webdriver_session_id,
                                         int command_timeout_s)
    : base_url_(base_url),
      session_id_(webdriver_session_id),
      command_timeout_s_(command_timeout_s),
      quit_(false) {}

KiteWebDriverClient::~KiteWebDriverClient() {
  if (!quit_) {
    DriverStatus status = Quit();
    if (!status.ok()) {
      LOG_WARN("WebDriver", "Failed to end session " + session_id_ + ": " + status.message);
    }
  }
}

std::string KiteWebDriverClient::SessionPath(const std::string& suffix) const {
  return "/session/" + session_id_ + suffix;
}

std::string KiteWebDriverClient::ElementPath(const ElementRef& element,
                                             const std::string& suffix) const {
  return "/element/" + EncodePathSegment(element) + suffix;
}

DriverStatus KiteWebDriverClient::Get(const std::string& suffix, json& value) {
  return Execute(base_url_, "GET", SessionPath(suffix), nullptr, command_timeout_s_, value);
}

DriverStatus KiteWebDriverClient::Post(const std::string& suffix, const json& body) {
  json ignored;
  return Post(suffix, body, ignored);
}

DriverStatus KiteWebDriverClient::Post(const std::string& suffix, const json& body, json& value) {
  return Execute(base_url_, "POST", SessionPath(suffix), &body, command_timeout_s_, value);
}

DriverStatus KiteWebDriverClient::Delete(const std::string& suffix) {
  json ignored;
  return Execute(base_url_, "DELETE", SessionPath(suffix), nullptr, command_timeout_s_, ignored);
}

DriverStatus KiteWebDriverClient::GetString(const std::string& suffix, std::string& out) {
  json value;
  DriverStatus status = Get(suffix, value);
  if (!status.ok()) {
    return status;
  }
  if (!value.is_string()) {
    return UnexpectedValue(suffix);
  }
  out = value.get<std::string>();
  return status;
}

DriverStatus KiteWebDriverClient::GetBool(const std::string& suffix, bool& out) {
  json value;
  DriverStatus status = Get(suffix, value);
  if (!status.ok()) {
    return status;
  }
  if (!value.is_boolean()) {
    return UnexpectedValue(suffix);
  }
  out = value.get<bool>();
  return status;
}

DriverStatus KiteWebDriverClient::ReadElementList(const json& value,
                                                  std::vector<ElementRef>& elements) {
  if (!value.is_array()) {
    return UnexpectedValue("element list");
  }
  elements.clear();
  for (const auto& item : value) {
    if (!item.is_object() || !item.contains(kWebElementKey) || !item[kWebElementKey].is_string()) {
      return UnexpectedValue("element list");
    }
    elements.push_back(item[kWebElementKey].get<std::string>());
  }
  return DriverStatus::Ok();
}

// ============================================================
// Timeouts and navigation
// ============================================================

DriverStatus KiteWebDriverClient::SetPageLoadTimeout(int seconds) {
  return Post("/timeouts", json{{"pageLoad", static_cast<int64_t>(seconds) * 1000}});
}

DriverStatus KiteWebDriverClient::SetImplicitWait(int seconds) {
  return Post("/timeouts", json{{"implicit", static_cast<int64_t>(seconds) * 1000}});
}

DriverStatus KiteWebDriverClient::Navigate(const std::string& url) {
  return Post("/url", json{{"url", url}});
}

DriverStatus KiteWebDriverClient::GetCurrentUrl(std::string& url) {
  return GetString("/url", url);
}

DriverStatus KiteWebDriverClient::GetTitle(std::string& title) {
  return GetString("/title", title);
}

DriverStatus KiteWebDriverClient::GetPageSource(std::string& source) {
  return GetString("/source", source);
}

DriverStatus KiteWebDriverClient::Back() {
  return Post("/back", json::object());
}

DriverStatus KiteWebDriverClient::Forward() {
  return Post("/forward", json::object());
}

DriverStatus KiteWebDriverClient::Refresh() {
  return Post("/refresh", json::object());
}

// ============================================================
// Elements
// ============================================================

DriverStatus KiteWebDriverClient::FindElement(const Locator& locator, ElementRef& element) {
  json body;
  std::string using_strategy, value;
  ToWebDriverLocator(locator, using_strategy, value);
  body["using"] = using_strategy;
  body["value"] = value;

  json result;
  DriverStatus status = Post("/element", body, result);
  if (!status.ok()) {
    return status;
  }
  if (!result.is_object() || !result.contains(kWebElementKey) ||
      !result[kWebElementKey].is_string()) {
    return UnexpectedValue("find element");
  }
  element = result[kWebElementKey].get<std::string>();
  return status;
}

DriverStatus KiteWebDriverClient::FindElements(const Locator& locator,
                                               std::vector<ElementRef>& elements) {
  json body;
  std::string using_strategy, value;
  ToWebDriverLocator(locator, using_strategy, value);
  body["using"] = using_strategy;
  body["value"] = value;

  json result;
  DriverStatus status = Post("/elements", body, result);
  if (!status.ok()) {
    return status;
  }
  return ReadElementList(result, elements);
}

DriverStatus KiteWebDriverClient::FindChildElements(const ElementRef& parent,
                                                    const Locator& locator,
                                                    std::vector<ElementRef>& elements) {
  json body;
  std::string using_strategy, value;
  ToWebDriverLocator(locator, using_strategy, value);
  body["using"] = using_strategy;
  body["value"] = value;

  json result;
  DriverStatus status = Post(ElementPath(parent, "/elements"), body, result);
  if (!status.ok()) {
    return status;
  }
  return ReadElementList(result, elements);
}

DriverStatus KiteWebDriverClient::Click(const ElementRef& element) {
  return Post(ElementPath(element, "/click"), json::object());
}

DriverStatus KiteWebDriverClient::Clear(const ElementRef& element) {
  return Post(ElementPath(element, "/clear"), json::object());
}

DriverStatus KiteWebDriverClient::SendKeys(const ElementRef& element, const std::string& text) {
  return Post(ElementPath(element, "/value"), json{{"text", text}});
}

DriverStatus KiteWebDriverClient::GetAttribute(const ElementRef& element, const std::string& name,
                                               std::string& value, bool& present) {
  json result;
  DriverStatus status = Get(ElementPath(element, "/attribute/" + EncodePathSegment(name)), result);
  if (!status.ok()) {
    return status;
  }
  present = !result.is_null();
  if (result.is_string()) {
    value = result.get<std::string>();
  } else if (present) {
    value = result.dump();
  } else {
    value.clear();
  }
  return status;
}

DriverStatus KiteWebDriverClient::GetText(const ElementRef& element, std::string& text) {
  return GetString(ElementPath(element, "/text"), text);
}

DriverStatus KiteWebDriverClient::GetTagName(const ElementRef& element, std::string& tag_name) {
  return GetString(ElementPath(element, "/name"), tag_name);
}

DriverStatus KiteWebDriverClient::IsDisplayed(const ElementRef& element, bool& displayed) {
  return GetBool(ElementPath(element, "/displayed"), displayed);
}

DriverStatus KiteWebDriverClient::IsEnabled(const ElementRef& element, bool& enabled) {
  return GetBool(ElementPath(element, "/enabled"), enabled);
}

DriverStatus KiteWebDriverClient::IsSelected(const ElementRef& element, bool& selected) {
  return GetBool(ElementPath(element, "/selected"), selected);
}

// ============================================================
// Scripts and screenshots
// ============================================================

DriverStatus KiteWebDriverClient::ExecuteScript(const std::string& script, const json& args,
                                                json& result) {
  json body;
  body["script"] = script;
  body["args"] = args.is_array() ? args : json::array();
  return Post("/execute/sync", body, result);
}

DriverStatus KiteWebDriverClient::TakeScreenshot(std::string& base64_png) {
  return GetString("/screenshot", base64_png);
}

DriverStatus KiteWebDriverClient::TakeElementScreenshot(const ElementRef& element,
                                                        std::string& base64_png) {
  return GetString(ElementPath(element, "/screenshot"), base64_png);
}

// ============================================================
// Cookies
// ============================================================

DriverStatus KiteWebDriverClient::GetCookies(std::vector<CookieData>& cookies) {
  json result;
  DriverStatus status = Get("/cookie", result);
  if (!status.ok()) {
    return status;
  }
  if (!result.is_array()) {
    return UnexpectedValue("cookies");
  }
  cookies.clear();
  for (const auto& item : result) {
    CookieData cookie;
    if (ParseCookie(item, cookie)) {
      cookies.push_back(cookie);
    }
  }
  return status;
}

DriverStatus KiteWebDriverClient::GetCookie(const std::string& name, CookieData& cookie) {
  json result;
  DriverStatus status = Get("/cookie/" + EncodePathSegment(name), result);
  if (!status.ok()) {
    return status;
  }
  if (!ParseCookie(result, cookie)) {
    return UnexpectedValue("cookie");
  }
  return status;
}

DriverStatus KiteWebDriverClient::AddCookie(const CookieData& cookie) {
  json c;
  c["name"] = cookie.name;
  c["value"] = cookie.value;
  if (!cookie.domain.empty()) {
    c["domain"] = cookie.domain;
  }
  if (!cookie.path.empty()) {
    c["path"] = cookie.path;
  }
  c["secure"] = cookie.secure;
  c["httpOnly"] = cookie.http_only;
  if (cookie.has_expiry) {
    c["expiry"] = cookie.expiry;
  }
  if (!cookie.same_site.empty()) {
    c["sameSite"] = cookie.same_site;
  }
  return Post("/cookie", json{{"cookie", c}});
}

DriverStatus KiteWebDriverClient::DeleteCookie(const std::string& name) {
  return Delete("/cookie/" + EncodePathSegment(name));
}

DriverStatus KiteWebDriverClient::DeleteAllCookies() {
  return Delete("/cookie");
}

// ============================================================
// Frames and alerts
// ============================================================

DriverStatus KiteWebDriverClient::SwitchToFrameIndex(int index) {
  return Post("/frame", json{{"id", index}});
}

DriverStatus KiteWebDriverClient::SwitchToFrameElement(const ElementRef& frame) {
  json id = json::object();
  id[kWebElementKey] = frame;
  return Post("/frame", json{{"id", id}});
}

DriverStatus KiteWebDriverClient::SwitchToDefaultContent() {
  return Post("/frame", json{{"id", nullptr}});
}

DriverStatus KiteWebDriverClient::SwitchToParentFrame() {
  return Post("/frame/parent", json::object());
}

DriverStatus KiteWebDriverClient::GetAlertText(std::string& text) {
  json result;
  DriverStatus status = Get("/alert/text", result);
  if (!status.ok()) {
    return status;
  }
  text = result.is_string() ? result.get<std::string>() : std::string();
  return status;
}

DriverStatus KiteWebDriverClient::AcceptAlert() {
  return Post("/alert/accept", json::object());
}

DriverStatus KiteWebDriverClient::DismissAlert() {
  return Post("/alert/dismiss", json::object());
}

DriverStatus KiteWebDriverClient::SendAlertText(const std::string& text) {
  return Post("/alert/text", json{{"text", text}});
}

DriverStatus KiteWebDriverClient::Quit() {
  if (quit_) {
    return DriverStatus::Ok();
  }
  quit_ = true;
  json ignored;
  return Execute(base_url_, "DELETE", SessionPath(""), nullptr, command_timeout_s_, ignored);
}

// ============================================================
// Factory
// ============================================================

KiteWebDriverClientFactory::KiteWebDriverClientFactory(const std::string& webdriver_url,
                                                       const std::vector<std::string>& chrome_args,
                                                       const std::string& chrome_binary,
                                                       int command_timeout_s)
    : webdriver_url_(webdriver_url),
      chrome_args_(chrome_args),
      chrome_binary_(chrome_binary),
      command_timeout_s_(command_timeout_s) {
  // Tolerate a trailing slash in the configured endpoint
  while (!webdriver_url_.empty() && webdriver_url_.back() == '/') {
    webdriver_url_.pop_back();
  }
}

json KiteWebDriverClientFactory::BuildNewSessionRequest() const {
  json chrome_options;
  chrome_options["args"] = chrome_args_;
  if (!chrome_binary_.empty()) {
    chrome_options["binary"] = chrome_binary_;
  }

  json always_match;
  always_match["browserName"] = "chrome";
  always_match["goog:chromeOptions"] = chrome_options;

  json request;
  request["capabilities"]["alwaysMatch"] = always_match;
  return request;
}

std::unique_ptr<KiteDriver> KiteWebDriverClientFactory::Create(std::string& error) {
  json request = BuildNewSessionRequest();
  json value;
  DriverStatus status = KiteWebDriverClient::Execute(webdriver_url_, "POST", "/session",
                                                     &request, command_timeout_s_, value);
  if (!status.ok()) {
    error = "Failed to create WebDriver session: " + status.message;
    return nullptr;
  }

  if (!value.is_object() || !value.contains("sessionId") || !value["sessionId"].is_string()) {
    error = "Failed to create WebDriver session: response carries no sessionId";
    return nullptr;
  }

  std::string session_id = value["sessionId"].get<std::string>();
  LOG_DEBUG("WebDriver", "Opened WebDriver session " + session_id);
  return std::make_unique<KiteWebDriverClient>(webdriver_url_, session_id, command_timeout_s_);
}

}  // namespace kite
