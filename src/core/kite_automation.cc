#include "kite_automation.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <thread>

using json = nlohmann::json;

namespace kite {

namespace {

// Escape for use inside a double-quoted CSS attribute value
std::string CssQuote(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
  return out;
}

bool ParseFrameIndex(const std::string& text, int& index) {
  if (text.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v < 0 || v > INT_MAX) {
    return false;
  }
  index = static_cast<int>(v);
  return true;
}

}  // namespace

ActionResult FromDriverStatus(const DriverStatus& status, const std::string& context,
                              const std::string& element_id) {
  switch (status.error) {
    case DriverError::NONE:
      return ActionResult::Success();
    case DriverError::NO_SUCH_ELEMENT:
      return ActionResult::ElementNotFound(element_id.empty() ? status.message : element_id);
    case DriverError::STALE_ELEMENT:
      return ActionResult::ElementStale(element_id);
    case DriverError::NO_SUCH_FRAME:
      return ActionResult::FrameNotFound(status.message);
    case DriverError::NO_SUCH_ALERT:
      return ActionResult::Failure(ActionStatus::NO_ALERT_PRESENT, "No alert present");
    case DriverError::NO_SUCH_COOKIE:
      return ActionResult::CookieNotFound(status.message);
    case DriverError::INVALID_ARGUMENT:
      return ActionResult::InvalidParameter(context + ": " + status.message);
    case DriverError::TIMEOUT:
      return ActionResult::Timeout(context + ": " + status.message);
    default:
      LOG_WARN("Automation", context + ": " + status.message);
      return ActionResult::DriverError(context, status.message);
  }
}

KiteAutomation::KiteAutomation(KiteSessionRegistry& sessions, KiteWaitEngine& waits,
                               int default_page_load_timeout_s)
    : sessions_(sessions),
      waits_(waits),
      default_page_load_timeout_s_(default_page_load_timeout_s) {}

ActionResult KiteAutomation::AcquireElement(const std::string& session_id,
                                            const std::string& element_id,
                                            SessionCommand& command, ElementRef& ref) {
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  if (!sessions_.elements().Get(session_id, element_id, ref)) {
    command.Release();
    return ActionResult::ElementNotFound(element_id);
  }
  return ActionResult::Success();
}

ElementSummary KiteAutomation::Summarize(KiteDriver& driver, const std::string& session_id,
                                         const ElementRef& ref) {
  ElementSummary summary;
  summary.element_id = sessions_.elements().Store(session_id, ref);

  if (!driver.GetTagName(ref, summary.tag_name).ok()) {
    summary.tag_name = "unknown";
  }
  if (!driver.IsDisplayed(ref, summary.displayed).ok()) {
    summary.displayed = false;
  }
  if (!driver.IsEnabled(ref, summary.enabled).ok()) {
    summary.enabled = false;
  }
  if (!driver.IsSelected(ref, summary.selected).ok()) {
    summary.selected = false;
  }
  if (!driver.GetText(ref, summary.text).ok()) {
    summary.text.clear();
  }
  bool present = false;
  if (!driver.GetAttribute(ref, "value", summary.value, present).ok() || !present) {
    summary.has_value = false;
    summary.value.clear();
  } else {
    summary.has_value = true;
  }
  return summary;
}

json ElementSummary::ToJSON() const {
  json j;
  j["elementId"] = element_id;
  j["tagName"] = tag_name;
  j["text"] = text;
  j["displayed"] = displayed;
  j["enabled"] = enabled;
  j["selected"] = selected;
  j["value"] = has_value ? json(value) : json(nullptr);
  return j;
}

ActionResult KiteAutomation::NoArgCommand(const std::string& session_id,
                                          const std::string& description,
                                          DriverStatus (KiteDriver::*method)()) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = (command.driver().*method)();
  if (!status.ok()) {
    return FromDriverStatus(status, "Error during " + description);
  }
  return ActionResult::Success(description + " completed");
}

// ============================================================
// Navigation
// ============================================================

ActionResult KiteAutomation::Navigate(const std::string& session_id, const std::string& url,
                                      int timeout_seconds, std::string& current_url) {
  if (url.empty()) {
    return ActionResult::InvalidParameter("URL is required");
  }
  if (timeout_seconds <= 0) {
    timeout_seconds = default_page_load_timeout_s_;
  }

  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  KiteDriver& driver = command.driver();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
  std::string warning;

  DriverStatus status = driver.SetPageLoadTimeout(timeout_seconds);
  if (!status.ok()) {
    LOG_WARN("Automation", "Failed to set page load timeout: " + status.message);
  }

  status = driver.Navigate(url);
  if (status.error == DriverError::TIMEOUT) {
    warning = "Page may not be fully loaded: " + status.message;
  } else if (status.error == DriverError::INVALID_ARGUMENT) {
    return ActionResult::InvalidParameter("Invalid URL '" + url + "': " + status.message);
  } else if (!status.ok()) {
    return FromDriverStatus(status, "Navigation to " + url + " failed");
  }

  // Wait for document.readyState == "complete"
  if (warning.empty()) {
    bool complete = false;
    std::string last_error;
    while (true) {
      json state;
      DriverStatus ready = driver.ExecuteScript("return document.readyState", json::array(), state);
      if (ready.ok() && state.is_string() && state.get<std::string>() == "complete") {
        complete = true;
        break;
      }
      if (!ready.ok()) {
        last_error = ready.message;
      }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        break;
      }
      auto poll = std::chrono::milliseconds(waits_.poll_interval_ms());
      std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(poll, deadline - now));
    }
    if (!complete) {
      warning = "Page may not be fully loaded: " +
                (last_error.empty() ? std::string("document.readyState did not reach 'complete'")
                                    : last_error);
    }
  }

  if (!driver.GetCurrentUrl(current_url).ok()) {
    current_url = "unknown";
  }

  if (!warning.empty()) {
    LOG_WARN("Automation", "Navigation to " + url + ": " + warning);
    return ActionResult::PageLoadIncomplete(url, warning);
  }

  ActionResult result = ActionResult::Success("Navigated to " + url);
  result.url = url;
  return result;
}

ActionResult KiteAutomation::GetCurrentUrl(const std::string& session_id, std::string& url) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetCurrentUrl(url);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting current URL");
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::GetTitle(const std::string& session_id, std::string& title) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetTitle(title);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting title");
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::GetPageSource(const std::string& session_id, std::string& source) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetPageSource(source);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting page source");
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::Back(const std::string& session_id) {
  return NoArgCommand(session_id, "Navigate back", &KiteDriver::Back);
}

ActionResult KiteAutomation::Forward(const std::string& session_id) {
  return NoArgCommand(session_id, "Navigate forward", &KiteDriver::Forward);
}

ActionResult KiteAutomation::Refresh(const std::string& session_id) {
  return NoArgCommand(session_id, "Page refresh", &KiteDriver::Refresh);
}

// ============================================================
// Elements
// ============================================================

ActionResult KiteAutomation::FindElement(const std::string& session_id,
                                         const std::string& locator_type,
                                         const std::string& locator_value,
                                         ElementSummary& element) {
  Locator locator;
  ActionResult resolved = ResolveLocator(locator_type, locator_value, locator);
  if (!resolved.success) {
    return resolved;
  }

  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }

  ElementRef ref;
  DriverStatus status = command.driver().FindElement(locator, ref);
  if (status.error == DriverError::NO_SUCH_ELEMENT) {
    return ActionResult::ElementNotFound(locator.Describe());
  }
  if (status.error == DriverError::INVALID_ARGUMENT) {
    return ActionResult::InvalidLocator(locator.Describe() + " (" + status.message + ")");
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error finding element");
  }

  element = Summarize(command.driver(), session_id, ref);
  return ActionResult::Success("Element found");
}

ActionResult KiteAutomation::FindElements(const std::string& session_id,
                                          const std::string& locator_type,
                                          const std::string& locator_value,
                                          std::vector<ElementSummary>& elements) {
  Locator locator;
  ActionResult resolved = ResolveLocator(locator_type, locator_value, locator);
  if (!resolved.success) {
    return resolved;
  }

  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }

  std::vector<ElementRef> refs;
  DriverStatus status = command.driver().FindElements(locator, refs);
  if (status.error == DriverError::INVALID_ARGUMENT) {
    return ActionResult::InvalidLocator(locator.Describe() + " (" + status.message + ")");
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error finding elements");
  }

  elements.clear();
  elements.reserve(refs.size());
  for (const auto& ref : refs) {
    elements.push_back(Summarize(command.driver(), session_id, ref));
  }
  return ActionResult::Success("Found " + std::to_string(elements.size()) + " element(s)");
}

ActionResult KiteAutomation::Click(const std::string& session_id, const std::string& element_id) {
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().Click(ref);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error clicking element", element_id);
  }
  return ActionResult::Success("Element clicked");
}

ActionResult KiteAutomation::SendKeys(const std::string& session_id,
                                      const std::string& element_id, const std::string& text,
                                      bool clear_first) {
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }

  if (clear_first) {
    DriverStatus cleared = command.driver().Clear(ref);
    if (!cleared.ok()) {
      return FromDriverStatus(cleared, "Error clearing element", element_id);
    }
  }
  DriverStatus status = command.driver().SendKeys(ref, text);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error sending keys", element_id);
  }
  return ActionResult::Success("Keys sent");
}

ActionResult KiteAutomation::GetAttribute(const std::string& session_id,
                                          const std::string& element_id,
                                          const std::string& name, std::string& value,
                                          bool& present) {
  if (name.empty()) {
    return ActionResult::InvalidParameter("Attribute name is required");
  }
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetAttribute(ref, name, value, present);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting attribute", element_id);
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::GetText(const std::string& session_id,
                                     const std::string& element_id, std::string& text) {
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetText(ref, text);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting text", element_id);
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::IsDisplayed(const std::string& session_id,
                                         const std::string& element_id, bool& displayed) {
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().IsDisplayed(ref, displayed);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error checking visibility", element_id);
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::IsEnabled(const std::string& session_id,
                                       const std::string& element_id, bool& enabled) {
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().IsEnabled(ref, enabled);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error checking enabled state", element_id);
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::IsSelected(const std::string& session_id,
                                        const std::string& element_id, bool& selected) {
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().IsSelected(ref, selected);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error checking selected state", element_id);
  }
  return ActionResult::Success();
}

// ============================================================
// Waits
// ============================================================

WaitResult KiteAutomation::WaitForElement(const std::string& session_id,
                                          const std::string& locator_type,
                                          const std::string& locator_value,
                                          const std::string& condition, int timeout_seconds,
                                          const std::string& expected_text) {
  WaitResult wait;
  if (!sessions_.Exists(session_id)) {
    wait.result = ActionResult::SessionNotFound(session_id);
    return wait;
  }

  WaitSpec spec;
  if (!ParseWaitCondition(condition, spec.condition)) {
    wait.result = ActionResult::InvalidParameter("Invalid wait condition: " + condition);
    return wait;
  }

  std::string value = locator_value;
  spec.expected_text = expected_text;
  if (spec.condition == WaitCondition::TEXT_EQUALS && expected_text.empty()) {
    // Legacy form: locatorValue is "<locator>|<expected text>"
    size_t bar = locator_value.find('|');
    if (bar == std::string::npos) {
      wait.result = ActionResult::InvalidParameter(
          "textEquals needs expectedText or locatorValue in the form 'locator|expectedText'");
      return wait;
    }
    value = locator_value.substr(0, bar);
    spec.expected_text = locator_value.substr(bar + 1);
  }

  ActionResult resolved = ResolveLocator(locator_type, value, spec.locator);
  if (!resolved.success) {
    wait.result = resolved;
    return wait;
  }

  spec.timeout_seconds = timeout_seconds;
  return waits_.WaitForElement(session_id, spec);
}

WaitResult KiteAutomation::WaitForScript(const std::string& session_id,
                                         const std::string& script, int timeout_seconds) {
  return waits_.WaitForScript(session_id, script, timeout_seconds);
}

ActionResult KiteAutomation::StaticWait(const std::string& session_id, int seconds) {
  return waits_.Sleep(session_id, seconds);
}

// ============================================================
// Frames and alerts
// ============================================================

ActionResult KiteAutomation::SwitchToFrame(const std::string& session_id,
                                           const std::string& frame_locator,
                                           const std::string& frame_value) {
  std::string kind = frame_locator;
  std::transform(kind.begin(), kind.end(), kind.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // Validate before taking the lock
  int index = 0;
  Locator locator;
  if (kind == "index") {
    if (!ParseFrameIndex(frame_value, index)) {
      return ActionResult::InvalidParameter("Invalid frame index: " + frame_value);
    }
  } else if (kind != "name" && kind != "id") {
    ActionResult resolved = ResolveLocator(frame_locator, frame_value, locator);
    if (!resolved.success) {
      return resolved;
    }
  } else if (frame_value.empty()) {
    return ActionResult::InvalidParameter("Frame name or id is required");
  }

  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  KiteDriver& driver = command.driver();
  const std::string description = frame_locator + "=" + frame_value;

  DriverStatus status;
  if (kind == "index") {
    status = driver.SwitchToFrameIndex(index);
  } else {
    ElementRef frame;
    if (kind == "name" || kind == "id") {
      // Name first, then id, matching how browsers resolve window.frames[name]
      std::vector<ElementRef> found;
      const std::string quoted = CssQuote(frame_value);
      const char* attributes[] = {"name", "id"};
      for (const char* attribute : attributes) {
        std::string css = std::string("frame[") + attribute + "=" + quoted + "],iframe[" +
                          attribute + "=" + quoted + "]";
        status = driver.FindElements(Locator(LocatorStrategy::CSS_SELECTOR, css), found);
        if (!status.ok() || !found.empty()) {
          break;
        }
      }
      if (!status.ok()) {
        return FromDriverStatus(status, "Error locating frame");
      }
      if (found.empty()) {
        return ActionResult::FrameNotFound(description);
      }
      frame = found.front();
    } else {
      status = driver.FindElement(locator, frame);
      if (status.error == DriverError::NO_SUCH_ELEMENT) {
        return ActionResult::FrameNotFound(description);
      }
      if (!status.ok()) {
        return FromDriverStatus(status, "Error locating frame");
      }
    }
    status = driver.SwitchToFrameElement(frame);
  }

  if (status.error == DriverError::NO_SUCH_FRAME || status.error == DriverError::NO_SUCH_ELEMENT) {
    return ActionResult::FrameNotFound(description);
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error switching to frame");
  }
  return ActionResult::Success("Switched to frame successfully");
}

ActionResult KiteAutomation::SwitchToDefaultContent(const std::string& session_id) {
  ActionResult r = NoArgCommand(session_id, "Switch to default content",
                                &KiteDriver::SwitchToDefaultContent);
  if (r.success) {
    r.message = "Switched to default content successfully";
  }
  return r;
}

ActionResult KiteAutomation::SwitchToParentFrame(const std::string& session_id) {
  ActionResult r = NoArgCommand(session_id, "Switch to parent frame",
                                &KiteDriver::SwitchToParentFrame);
  if (r.success) {
    r.message = "Switched to parent frame successfully";
  }
  return r;
}

ActionResult KiteAutomation::HandleAlert(const std::string& session_id, bool accept,
                                         std::string& alert_text) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  KiteDriver& driver = command.driver();

  DriverStatus status = driver.GetAlertText(alert_text);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error handling alert");
  }
  status = accept ? driver.AcceptAlert() : driver.DismissAlert();
  if (!status.ok()) {
    return FromDriverStatus(status, "Error handling alert");
  }
  return ActionResult::Success(accept ? "accepted" : "dismissed");
}

ActionResult KiteAutomation::SendAlertText(const std::string& session_id,
                                           const std::string& text, bool accept,
                                           std::string& alert_text) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  KiteDriver& driver = command.driver();

  DriverStatus status = driver.GetAlertText(alert_text);
  if (status.ok()) {
    status = driver.SendAlertText(text);
  }
  if (status.ok()) {
    status = accept ? driver.AcceptAlert() : driver.DismissAlert();
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error sending text to alert");
  }
  return ActionResult::Success(accept ? "accepted" : "dismissed");
}

ActionResult KiteAutomation::GetAlertText(const std::string& session_id,
                                          std::string& alert_text) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetAlertText(alert_text);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting alert text");
  }
  return ActionResult::Success();
}

}  // namespace kite
