#pragma once

#include <atomic>
#include <deque>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "kite_driver.h"

// In-memory KiteDriver for tests.
//
// Holds a flat element list with parent links, a page, cookies, frames and
// an optional alert. Failures can be injected per operation name ("Click",
// "Navigate", ...) and every call can be slowed down to expose concurrency.

namespace kite {
namespace testing {

using Clock = std::chrono::steady_clock;

struct FakeElement {
  std::string ref;
  std::string tag;
  std::string text;
  std::map<std::string, std::string> attributes;
  std::string parent;
  bool displayed = true;
  bool enabled = true;
  bool selected = false;
  bool stale = false;

  // Time-based behavior for waits
  Clock::time_point present_at;                        // findable from then on
  Clock::time_point visible_at;                        // displayed from then on
  Clock::time_point hidden_at = Clock::time_point::max();
  std::string later_text;
  Clock::time_point later_text_at = Clock::time_point::max();
};

// Shared across every driver a factory creates
struct FakeDriverProbe {
  std::atomic<int> created{0};
  std::atomic<int> quit{0};
  std::atomic<int> active{0};       // calls in progress over all drivers
  std::atomic<int> max_active{0};
  std::atomic<bool> same_driver_overlap{false};
};

class FakeDriver : public KiteDriver {
public:
  explicit FakeDriver(std::shared_ptr<FakeDriverProbe> probe = nullptr);

  // ---- Test setup ----
  std::string AddElement(const std::string& tag,
                         const std::map<std::string, std::string>& attributes = {},
                         const std::string& text = "", const std::string& parent = "");
  FakeElement* Element(const std::string& ref);
  void SetPage(const std::string& url, const std::string& title, const std::string& source);
  void SetReadyState(const std::string& state);
  void SetScriptHandler(const std::string& script,
                        std::function<DriverStatus(const nlohmann::json&, nlohmann::json&)> handler);
  void FailOn(const std::string& operation, DriverError error, const std::string& message = "");
  void ClearFailures();
  // Empty FindElements results block for the implicit wait
  void SetHonorImplicitWait(bool honor);
  void SetCallDelay(std::chrono::milliseconds delay);
  void SetFrameCount(int count);
  void OpenAlert(const std::string& text);

  // ---- Inspection ----
  int Calls(const std::string& operation) const;
  int implicit_wait() const { return implicit_wait_; }
  int page_load_timeout() const { return page_load_timeout_; }
  int frame_depth() const { return frame_depth_; }
  bool has_alert() const { return has_alert_; }
  const std::string& prompt_text() const { return prompt_text_; }
  const nlohmann::json& last_script_args() const { return last_script_args_; }
  bool is_quit() const { return quit_; }
  bool HasCookie(const std::string& name) const;

  // ---- KiteDriver ----
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

  static constexpr const char* kScreenshot = "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNkYPhfDwAChwGA60e6kgAAAABJRU5ErkJggg==";

private:
  // Records the call, applies the delay, then reports any injected failure
  DriverStatus Begin(const std::string& operation);

  // Requires state_mutex_
  DriverStatus LookupLocked(const ElementRef& ref, FakeElement*& element);
  DriverStatus MatchLocked(const Locator& locator, const std::string& parent,
                           std::vector<ElementRef>& matches);
  bool IsDisplayedLocked(const FakeElement& element) const;

  std::shared_ptr<FakeDriverProbe> probe_;
  std::atomic<int> active_{0};

  mutable std::mutex state_mutex_;
  std::deque<FakeElement> elements_;  // stable addresses for Element()
  std::map<std::string, int> calls_;
  std::map<std::string, DriverStatus> failures_;
  std::map<std::string, std::function<DriverStatus(const nlohmann::json&, nlohmann::json&)>>
      script_handlers_;
  std::map<std::string, CookieData> cookies_;
  std::vector<std::string> history_;
  size_t history_index_ = 0;
  std::chrono::milliseconds delay_{0};

  std::string url_ = "about:blank";
  std::string title_;
  std::string source_ = "<html><head></head><body></body></html>";
  std::string ready_state_ = "complete";
  int implicit_wait_ = 0;
  bool honor_implicit_wait_ = false;
  int page_load_timeout_ = 0;
  int frame_count_ = 0;
  int frame_depth_ = 0;
  bool has_alert_ = false;
  std::string alert_text_;
  std::string prompt_text_;
  nlohmann::json last_script_args_;
  bool quit_ = false;
  int next_ref_ = 1;
};

class FakeDriverFactory : public KiteDriverFactory {
public:
  FakeDriverFactory();

  std::unique_ptr<KiteDriver> Create(std::string& error) override;

  // Called on every new driver before it is handed out
  std::function<void(FakeDriver&)> on_create;

  // Create() fails while set
  std::atomic<bool> fail_create{false};

  std::shared_ptr<FakeDriverProbe> probe() const { return probe_; }

private:
  std::shared_ptr<FakeDriverProbe> probe_;
};

}  // namespace testing
}  // namespace kite
