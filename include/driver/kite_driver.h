#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "kite_locator.h"

// Browser driver capability owned by one session.
//
// Implementations are NOT thread-safe; callers serialize access through the
// session command lock. Every call reports its outcome as a DriverStatus and
// never throws.

namespace kite {

// Driver-side element reference (W3C web element id)
using ElementRef = std::string;

// JSON key carrying a web element reference on the wire and in script results
constexpr const char* kWebElementKey = "element-6066-11e4-a07c-4a93c8ac8a56";

enum class DriverError {
  NONE,
  NO_SUCH_ELEMENT,
  STALE_ELEMENT,
  NO_SUCH_FRAME,
  NO_SUCH_ALERT,
  NO_SUCH_COOKIE,
  INVALID_ARGUMENT,
  TIMEOUT,
  INVALID_SESSION,
  JAVASCRIPT_ERROR,
  UNKNOWN
};

const char* DriverErrorToString(DriverError error);

struct DriverStatus {
  DriverError error = DriverError::NONE;
  std::string message;

  bool ok() const { return error == DriverError::NONE; }

  static DriverStatus Ok() { return DriverStatus(); }
  static DriverStatus Fail(DriverError error, const std::string& message) {
    DriverStatus s;
    s.error = error;
    s.message = message;
    return s;
  }
};

struct CookieData {
  std::string name;
  std::string value;
  std::string domain;
  std::string path;
  bool secure = false;
  bool http_only = false;
  bool has_expiry = false;
  int64_t expiry = 0;        // seconds since epoch
  std::string same_site;
};

class KiteDriver {
public:
  virtual ~KiteDriver() = default;

  // Timeouts
  virtual DriverStatus SetPageLoadTimeout(int seconds) = 0;
  virtual DriverStatus SetImplicitWait(int seconds) = 0;

  // Navigation
  virtual DriverStatus Navigate(const std::string& url) = 0;
  virtual DriverStatus GetCurrentUrl(std::string& url) = 0;
  virtual DriverStatus GetTitle(std::string& title) = 0;
  virtual DriverStatus GetPageSource(std::string& source) = 0;
  virtual DriverStatus Back() = 0;
  virtual DriverStatus Forward() = 0;
  virtual DriverStatus Refresh() = 0;

  // Element lookup. FindElement reports NO_SUCH_ELEMENT when nothing matches,
  // FindElements returns an empty list instead.
  virtual DriverStatus FindElement(const Locator& locator, ElementRef& element) = 0;
  virtual DriverStatus FindElements(const Locator& locator, std::vector<ElementRef>& elements) = 0;
  virtual DriverStatus FindChildElements(const ElementRef& parent, const Locator& locator,
                                         std::vector<ElementRef>& elements) = 0;

  // Element interaction
  virtual DriverStatus Click(const ElementRef& element) = 0;
  virtual DriverStatus Clear(const ElementRef& element) = 0;
  virtual DriverStatus SendKeys(const ElementRef& element, const std::string& text) = 0;

  // Element state. present is false when the attribute does not exist.
  virtual DriverStatus GetAttribute(const ElementRef& element, const std::string& name,
                                    std::string& value, bool& present) = 0;
  virtual DriverStatus GetText(const ElementRef& element, std::string& text) = 0;
  virtual DriverStatus GetTagName(const ElementRef& element, std::string& tag_name) = 0;
  virtual DriverStatus IsDisplayed(const ElementRef& element, bool& displayed) = 0;
  virtual DriverStatus IsEnabled(const ElementRef& element, bool& enabled) = 0;
  virtual DriverStatus IsSelected(const ElementRef& element, bool& selected) = 0;

  // Scripts. args and result use kWebElementKey objects for element references.
  virtual DriverStatus ExecuteScript(const std::string& script, const nlohmann::json& args,
                                     nlohmann::json& result) = 0;

  // Screenshots as base64 PNG
  virtual DriverStatus TakeScreenshot(std::string& base64_png) = 0;
  virtual DriverStatus TakeElementScreenshot(const ElementRef& element, std::string& base64_png) = 0;

  // Cookies
  virtual DriverStatus GetCookies(std::vector<CookieData>& cookies) = 0;
  virtual DriverStatus GetCookie(const std::string& name, CookieData& cookie) = 0;
  virtual DriverStatus AddCookie(const CookieData& cookie) = 0;
  virtual DriverStatus DeleteCookie(const std::string& name) = 0;
  virtual DriverStatus DeleteAllCookies() = 0;

  // Frames
  virtual DriverStatus SwitchToFrameIndex(int index) = 0;
  virtual DriverStatus SwitchToFrameElement(const ElementRef& frame) = 0;
  virtual DriverStatus SwitchToDefaultContent() = 0;
  virtual DriverStatus SwitchToParentFrame() = 0;

  // Alerts
  virtual DriverStatus GetAlertText(std::string& text) = 0;
  virtual DriverStatus AcceptAlert() = 0;
  virtual DriverStatus DismissAlert() = 0;
  virtual DriverStatus SendAlertText(const std::string& text) = 0;

  // Releases the browser. The driver must not be used afterwards.
  virtual DriverStatus Quit() = 0;
};

// Creates one driver per session
class KiteDriverFactory {
public:
  virtual ~KiteDriverFactory() = default;

  // Returns nullptr with error set when the browser cannot be started
  virtual std::unique_ptr<KiteDriver> Create(std::string& error) = 0;
};

}  // namespace kite
