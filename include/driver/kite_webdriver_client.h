#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "kite_driver.h"

namespace kite {

// Maps a W3C WebDriver error string ("no such element", ...) to a DriverError
DriverError DriverErrorFromW3C(const std::string& error);

// Translates a Locator into the W3C "using"/"value" pair.
// id, name and className are expressed as CSS selectors.
void ToWebDriverLocator(const Locator& locator, std::string& using_strategy, std::string& value);

// Escapes a string for use as a CSS identifier (#id, .class)
std::string CssEscapeIdentifier(const std::string& ident);

// Percent-encodes one URL path segment
std::string EncodePathSegment(const std::string& segment);

// KiteDriver over the W3C WebDriver HTTP protocol (chromedriver).
//
// One instance wraps one remote WebDriver session. Each command is a
// blocking libcurl request; no state is shared between instances.
class KiteWebDriverClient : public KiteDriver {
public:
  KiteWebDriverClient(const std::string& base_url, const std::string& webdriver_session_id,
                      int command_timeout_s);
  ~KiteWebDriverClient() override;

  // Performs one WebDriver command and unwraps the {"value": ...} envelope.
  // body may be nullptr for GET and DELETE.
  static DriverStatus Execute(const std::string& base_url, const std::string& method,
                              const std::string& path, const nlohmann::json* body,
                              int timeout_s, nlohmann::json& value);

  const std::string& webdriver_session_id() const { return session_id_; }

  DriverStatus SetPageLoadTimeout(int seconds) override;
  DriverStatus SetImplicitWait(int seconds) override;

  DriverStatus Navigate(const std::string& url) override;
  DriverStatus GetCurrentUrl(std::string& url) override;
  DriverStatus GetTitle(std::string& title) override;
  DriverStatus GetPageSource(std::string& source) override;
  DriverStatus Back() override;
  DriverStatus Forward() override;
  DriverStatus Refresh() override;

  DriverStatus FindElement(const Locator& locator, ElementRef& element) override;
  DriverStatus FindElements(const Locator& locator, std::vector<ElementRef>& elements) override;
  DriverStatus FindChildElements(const ElementRef& parent, const Locator& locator,
                                 std::vector<ElementRef>& elements) override;

  DriverStatus Click(const ElementRef& element) override;
  DriverStatus Clear(const ElementRef& element) override;
  DriverStatus SendKeys(const ElementRef& element, const std::string& text) override;

  DriverStatus GetAttribute(const ElementRef& element, const std::string& name,
                            std::string& value, bool& present) override;
  DriverStatus GetText(const ElementRef& element, std::string& text) override;
  DriverStatus GetTagName(const ElementRef& element, std::string& tag_name) override;
  DriverStatus IsDisplayed(const ElementRef& element, bool& displayed) override;
  DriverStatus IsEnabled(const ElementRef& element, bool& enabled) override;
  DriverStatus IsSelected(const ElementRef& element, bool& selected) override;

  DriverStatus ExecuteScript(const std::string& script, const nlohmann::json& args,
                             nlohmann::json& result) override;

  DriverStatus TakeScreenshot(std::string& base64_png) override;
  DriverStatus TakeElementScreenshot(const ElementRef& element, std::string& base64_png) override;

  DriverStatus GetCookies(std::vector<CookieData>& cookies) override;
  DriverStatus GetCookie(const std::string& name, CookieData& cookie) override;
  DriverStatus AddCookie(const CookieData& cookie) override;
  DriverStatus DeleteCookie(const std::string& name) override;
  DriverStatus DeleteAllCookies() override;

  DriverStatus SwitchToFrameIndex(int index) override;
  DriverStatus SwitchToFrameElement(const ElementRef& frame) override;
  DriverStatus SwitchToDefaultContent() override;
  DriverStatus SwitchToParentFrame() override;

  DriverStatus GetAlertText(std::string& text) override;
  DriverStatus AcceptAlert() override;
  DriverStatus DismissAlert() override;
  DriverStatus SendAlertText(const std::string& text) override;

  DriverStatus Quit() override;

private:
  DriverStatus Get(const std::string& suffix, nlohmann::json& value);
  DriverStatus Post(const std::string& suffix, const nlohmann::json& body);
  DriverStatus Post(const std::string& suffix, const nlohmann::json& body, nlohmann::json& value);
  DriverStatus Delete(const std::string& suffix);

  DriverStatus GetString(const std::string& suffix, std::string& out);
  DriverStatus GetBool(const std::string& suffix, bool& out);
  DriverStatus ReadElementList(const nlohmann::json& value, std::vector<ElementRef>& elements);

  std::string SessionPath(const std::string& suffix) const;
  std::string ElementPath(const ElementRef& element, const std::string& suffix) const;

  std::string base_url_;
  std::string session_id_;
  int command_timeout_s_;
  bool quit_;
};

// Opens a new chromedriver session per Create() call
class KiteWebDriverClientFactory : public KiteDriverFactory {
public:
  KiteWebDriverClientFactory(const std::string& webdriver_url,
                             const std::vector<std::string>& chrome_args,
                             const std::string& chrome_binary, int command_timeout_s);

  std::unique_ptr<KiteDriver> Create(std::string& error) override;

  // {"capabilities": {"alwaysMatch": {browserName, goog:chromeOptions}}}
  nlohmann::json BuildNewSessionRequest() const;

private:
  std::string webdriver_url_;
  std::vector<std::string> chrome_args_;
  std::string chrome_binary_;
  int command_timeout_s_;
};

}  // namespace kite
