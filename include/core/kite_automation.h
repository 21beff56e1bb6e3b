#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "action_result.h"
#include "kite_driver.h"
#include "kite_locator.h"
#include "kite_session_registry.h"
#include "kite_wait_engine.h"

namespace kite {

// Properties of a found element, read best-effort
struct ElementSummary {
  std::string element_id;
  std::string tag_name = "unknown";
  std::string text;
  bool displayed = false;
  bool enabled = false;
  bool selected = false;
  bool has_value = false;      // false -> "value" serialized as null
  std::string value;

  nlohmann::json ToJSON() const;
};

struct OptionInfo {
  std::string text;
  std::string value;
  bool has_value = false;

  nlohmann::json ToJSON() const;
};

struct AssertionOutcome {
  bool passed = false;
  bool has_actual = false;     // false -> actual value serialized as null
  std::string actual;
  std::string expected;
};

nlohmann::json CookieToJSON(const CookieData& cookie);

// Accepts epoch seconds (number or digit string) or
// yyyy-MM-ddTHH:mm:ss[.SSS] followed by Z, +hh:mm, +hhmm (or -)
bool ParseCookieExpiry(const nlohmann::json& value, int64_t& epoch_seconds, std::string& error);

// Compares actual against expected for one assertion type:
// equals, notequals, contains, notcontains, startswith, endswith,
// matches (whole-string regex), and with allow_emptiness also empty, notempty.
// A missing actual value (has_actual false) only satisfies notequals,
// notcontains and empty. Returns INVALID_PARAMETER for unknown types and
// malformed patterns.
ActionResult EvaluateAssertion(const std::string& assert_type, bool has_actual,
                               const std::string& actual, const std::string& expected,
                               bool allow_emptiness, bool& passed);

// Operation façade: one call per external request.
//
// Each operation resolves its session, holds the session command lock for
// the driver calls it makes, translates element IDs through the element
// registry and converts every driver failure into an ActionResult.
class KiteAutomation {
public:
  KiteAutomation(KiteSessionRegistry& sessions, KiteWaitEngine& waits,
                 int default_page_load_timeout_s);

  // ---- Navigation ----

  // Loads the URL and polls document.readyState up to timeout_seconds
  // (<= 0 uses the default). A load timeout or readiness failure still
  // succeeds, with status PAGE_LOAD_INCOMPLETE and a warning.
  ActionResult Navigate(const std::string& session_id, const std::string& url,
                        int timeout_seconds, std::string& current_url);
  ActionResult GetCurrentUrl(const std::string& session_id, std::string& url);
  ActionResult GetTitle(const std::string& session_id, std::string& title);
  ActionResult GetPageSource(const std::string& session_id, std::string& source);
  ActionResult Back(const std::string& session_id);
  ActionResult Forward(const std::string& session_id);
  ActionResult Refresh(const std::string& session_id);

  // ---- Elements ----
  ActionResult FindElement(const std::string& session_id, const std::string& locator_type,
                           const std::string& locator_value, ElementSummary& element);
  ActionResult FindElements(const std::string& session_id, const std::string& locator_type,
                            const std::string& locator_value,
                            std::vector<ElementSummary>& elements);
  ActionResult Click(const std::string& session_id, const std::string& element_id);
  ActionResult SendKeys(const std::string& session_id, const std::string& element_id,
                        const std::string& text, bool clear_first);
  ActionResult GetAttribute(const std::string& session_id, const std::string& element_id,
                            const std::string& name, std::string& value, bool& present);
  ActionResult GetText(const std::string& session_id, const std::string& element_id,
                       std::string& text);
  ActionResult IsDisplayed(const std::string& session_id, const std::string& element_id,
                           bool& displayed);
  ActionResult IsEnabled(const std::string& session_id, const std::string& element_id,
                         bool& enabled);
  ActionResult IsSelected(const std::string& session_id, const std::string& element_id,
                          bool& selected);

  // ---- Waits ----
  WaitResult WaitForElement(const std::string& session_id, const std::string& locator_type,
                            const std::string& locator_value, const std::string& condition,
                            int timeout_seconds, const std::string& expected_text);
  WaitResult WaitForScript(const std::string& session_id, const std::string& script,
                           int timeout_seconds);
  ActionResult StaticWait(const std::string& session_id, int seconds);

  // ---- Forms (select elements) ----
  ActionResult SelectByVisibleText(const std::string& session_id, const std::string& element_id,
                                   const std::string& text);
  ActionResult SelectByValue(const std::string& session_id, const std::string& element_id,
                             const std::string& value);
  ActionResult SelectByIndex(const std::string& session_id, const std::string& element_id,
                             int index);
  ActionResult GetSelectedOptions(const std::string& session_id, const std::string& element_id,
                                  std::vector<OptionInfo>& options, bool& is_multiple);
  ActionResult GetAllOptions(const std::string& session_id, const std::string& element_id,
                             std::vector<OptionInfo>& options, bool& is_multiple);
  ActionResult DeselectAll(const std::string& session_id, const std::string& element_id);

  // ---- Frames and alerts ----

  // frame_locator: "index", "name"/"id" (frame or iframe name/id), or any
  // locator strategy
  ActionResult SwitchToFrame(const std::string& session_id, const std::string& frame_locator,
                             const std::string& frame_value);
  ActionResult SwitchToDefaultContent(const std::string& session_id);
  ActionResult SwitchToParentFrame(const std::string& session_id);
  ActionResult HandleAlert(const std::string& session_id, bool accept, std::string& alert_text);
  ActionResult SendAlertText(const std::string& session_id, const std::string& text, bool accept,
                             std::string& alert_text);
  ActionResult GetAlertText(const std::string& session_id, std::string& alert_text);

  // ---- Scripts and screenshots ----

  // args must be an array (or null). Element results come back as
  // {elementId, tagName, text} with the element stored.
  ActionResult ExecuteScript(const std::string& session_id, const std::string& script,
                             const nlohmann::json& args, nlohmann::json& result);
  ActionResult TakeScreenshot(const std::string& session_id, std::string& base64_png);
  ActionResult TakeElementScreenshot(const std::string& session_id,
                                     const std::string& element_id, std::string& base64_png);

  // ---- Cookies ----
  ActionResult GetCookies(const std::string& session_id, std::vector<CookieData>& cookies);
  ActionResult GetCookie(const std::string& session_id, const std::string& name,
                         CookieData& cookie);
  ActionResult AddCookie(const std::string& session_id, const CookieData& cookie);
  ActionResult DeleteCookie(const std::string& session_id, const std::string& name);
  ActionResult DeleteAllCookies(const std::string& session_id);

  // ---- Assertions ----
  ActionResult AssertElement(const std::string& session_id, const std::string& element_id,
                             const std::string& assert_type, const std::string& property,
                             const std::string& expected, const std::string& attribute_name,
                             AssertionOutcome& outcome);
  ActionResult AssertUrl(const std::string& session_id, const std::string& assert_type,
                         const std::string& expected, AssertionOutcome& outcome);
  ActionResult AssertTitle(const std::string& session_id, const std::string& assert_type,
                           const std::string& expected, AssertionOutcome& outcome);

  KiteSessionRegistry& sessions() const { return sessions_; }

private:
  // Locks the session and translates element_id. On failure command is released.
  ActionResult AcquireElement(const std::string& session_id, const std::string& element_id,
                              SessionCommand& command, ElementRef& ref);

  // Select helpers; command must hold the session lock
  ActionResult LoadOptions(SessionCommand& command, const std::string& element_id,
                           const ElementRef& select, std::vector<ElementRef>& options,
                           bool& is_multiple);
  ActionResult CollectOptions(const std::string& session_id, const std::string& element_id,
                              bool selected_only, std::vector<OptionInfo>& options,
                              bool& is_multiple);
  ActionResult SelectMatching(const std::string& session_id, const std::string& element_id,
                              const std::string& attribute, const std::string& wanted);

  ElementSummary Summarize(KiteDriver& driver, const std::string& session_id,
                           const ElementRef& ref);
  ActionResult NoArgCommand(const std::string& session_id, const std::string& description,
                            DriverStatus (KiteDriver::*method)());

  KiteSessionRegistry& sessions_;
  KiteWaitEngine& waits_;
  int default_page_load_timeout_s_;
};

// Converts a driver failure into the façade's status taxonomy
ActionResult FromDriverStatus(const DriverStatus& status, const std::string& context,
                              const std::string& element_id = "");

}  // namespace kite
