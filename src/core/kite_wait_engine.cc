#include "kite_wait_engine.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>
#include <vector>

namespace kite {

namespace {

using Clock = std::chrono::steady_clock;

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// "Not yet" errors while polling for an element
bool IsTransient(const DriverStatus& status) {
  return status.error == DriverError::NO_SUCH_ELEMENT ||
         status.error == DriverError::STALE_ELEMENT;
}

ActionResult PollFailure(const Locator& locator, const DriverStatus& status) {
  if (status.error == DriverError::INVALID_ARGUMENT) {
    return ActionResult::InvalidLocator(locator.Describe() + " (" + status.message + ")");
  }
  if (status.error == DriverError::INVALID_SESSION) {
    return ActionResult::DriverError("Browser session is gone", status.message);
  }
  return ActionResult::DriverError("Error during wait", status.message);
}

// Polls must not block in the driver's implicit wait. The session's value
// is restored before the command lock is released.
class ImplicitWaitSuspension {
public:
  explicit ImplicitWaitSuspension(const SessionCommand& command)
      : command_(command),
        saved_(command.session().implicit_wait_seconds.load(std::memory_order_relaxed)) {
    if (saved_ > 0) {
      DriverStatus status = command_.driver().SetImplicitWait(0);
      suspended_ = status.ok();
      if (!suspended_) {
        LOG_WARN("WaitEngine", "Could not suspend implicit wait for session " +
                 command_.session_id() + ": " + status.message);
      }
    }
  }

  ~ImplicitWaitSuspension() {
    if (!suspended_) {
      return;
    }
    DriverStatus status = command_.driver().SetImplicitWait(saved_);
    if (!status.ok()) {
      LOG_WARN("WaitEngine", "Could not restore implicit wait of " + std::to_string(saved_) +
               "s for session " + command_.session_id() + ": " + status.message);
    }
  }

  ImplicitWaitSuspension(const ImplicitWaitSuspension&) = delete;
  ImplicitWaitSuspension& operator=(const ImplicitWaitSuspension&) = delete;

private:
  const SessionCommand& command_;
  int saved_;
  bool suspended_ = false;
};

}  // namespace

bool ParseWaitCondition(const std::string& name, WaitCondition& condition) {
  std::string lower = ToLower(name);
  if (lower == "present") {
    condition = WaitCondition::PRESENT;
  } else if (lower == "visible") {
    condition = WaitCondition::VISIBLE;
  } else if (lower == "clickable") {
    condition = WaitCondition::CLICKABLE;
  } else if (lower == "invisible") {
    condition = WaitCondition::INVISIBLE;
  } else if (lower == "textequals" || lower == "texttobe") {
    condition = WaitCondition::TEXT_EQUALS;
  } else {
    return false;
  }
  return true;
}

const char* WaitConditionToString(WaitCondition condition) {
  switch (condition) {
    case WaitCondition::PRESENT: return "present";
    case WaitCondition::VISIBLE: return "visible";
    case WaitCondition::CLICKABLE: return "clickable";
    case WaitCondition::INVISIBLE: return "invisible";
    case WaitCondition::TEXT_EQUALS: return "textEquals";
    default: return "unknown";
  }
}

KiteWaitEngine::KiteWaitEngine(KiteSessionRegistry& sessions, int poll_interval_ms)
    : sessions_(sessions), poll_interval_ms_(std::max(1, poll_interval_ms)) {}

KiteWaitEngine::PollState KiteWaitEngine::PollElement(KiteDriver& driver, const WaitSpec& spec,
                                                      ElementRef& matched,
                                                      ActionResult& error) {
  std::vector<ElementRef> found;
  DriverStatus status = driver.FindElements(spec.locator, found);
  if (!status.ok()) {
    if (IsTransient(status)) {
      return PollState::NOT_YET;
    }
    error = PollFailure(spec.locator, status);
    return PollState::ERROR;
  }

  if (found.empty()) {
    return spec.condition == WaitCondition::INVISIBLE ? PollState::MET : PollState::NOT_YET;
  }

  const ElementRef& first = found.front();

  switch (spec.condition) {
    case WaitCondition::PRESENT:
      matched = first;
      return PollState::MET;

    case WaitCondition::VISIBLE:
    case WaitCondition::CLICKABLE: {
      bool displayed = false;
      status = driver.IsDisplayed(first, displayed);
      if (status.ok() && displayed && spec.condition == WaitCondition::CLICKABLE) {
        bool enabled = false;
        status = driver.IsEnabled(first, enabled);
        displayed = enabled;
      }
      if (!status.ok()) {
        if (IsTransient(status)) {
          return PollState::NOT_YET;
        }
        error = PollFailure(spec.locator, status);
        return PollState::ERROR;
      }
      if (!displayed) {
        return PollState::NOT_YET;
      }
      matched = first;
      return PollState::MET;
    }

    case WaitCondition::INVISIBLE: {
      bool displayed = false;
      status = driver.IsDisplayed(first, displayed);
      if (!status.ok()) {
        // Node vanished between find and check
        if (IsTransient(status)) {
          return PollState::MET;
        }
        error = PollFailure(spec.locator, status);
        return PollState::ERROR;
      }
      return displayed ? PollState::NOT_YET : PollState::MET;
    }

    case WaitCondition::TEXT_EQUALS: {
      std::string text;
      status = driver.GetText(first, text);
      if (!status.ok()) {
        if (IsTransient(status)) {
          return PollState::NOT_YET;
        }
        error = PollFailure(spec.locator, status);
        return PollState::ERROR;
      }
      return text == spec.expected_text ? PollState::MET : PollState::NOT_YET;
    }
  }

  error = ActionResult::Failure(ActionStatus::INTERNAL_ERROR, "Unhandled wait condition");
  return PollState::ERROR;
}

WaitResult KiteWaitEngine::WaitForElement(const std::string& session_id, const WaitSpec& spec) {
  WaitResult wait;
  if (spec.timeout_seconds < 0) {
    wait.result = ActionResult::InvalidParameter("Timeout must not be negative");
    return wait;
  }

  const auto deadline = Clock::now() + std::chrono::seconds(spec.timeout_seconds);
  const std::string description = std::string(WaitConditionToString(spec.condition)) +
                                  " on " + spec.locator.Describe();

  while (true) {
    {
      SessionCommand command;
      ActionResult acquired = sessions_.Acquire(session_id, command);
      if (!acquired.success) {
        wait.result = acquired;
        return wait;
      }

      ImplicitWaitSuspension no_implicit_wait(command);
      ElementRef matched;
      ActionResult error;
      PollState state = PollElement(command.driver(), spec, matched, error);

      if (state == PollState::ERROR) {
        LOG_WARN("WaitEngine", "Wait for " + description + " failed: " + error.message);
        wait.result = error;
        return wait;
      }

      if (state == PollState::MET) {
        wait.outcome = WaitOutcome::SATISFIED;
        wait.result = ActionResult::Success("Condition met: " + description);

        if (!matched.empty()) {
          // Property reads are best-effort
          KiteDriver& driver = command.driver();
          if (!driver.GetTagName(matched, wait.tag_name).ok()) {
            wait.tag_name = "unknown";
          }
          if (!driver.GetText(matched, wait.text).ok()) {
            wait.text.clear();
          }
          wait.element_id = sessions_.elements().Store(session_id, matched);
        }
        return wait;
      }
    }

    auto now = Clock::now();
    if (now >= deadline) {
      wait.outcome = WaitOutcome::TIMED_OUT;
      wait.result = ActionResult::Timeout("Timed out after " +
                                          std::to_string(spec.timeout_seconds) +
                                          "s waiting for " + description);
      LOG_INFO("WaitEngine", wait.result.message);
      return wait;
    }

    auto remaining = deadline - now;
    auto poll = std::chrono::milliseconds(poll_interval_ms_);
    std::this_thread::sleep_for(std::min<Clock::duration>(poll, remaining));
  }
}

KiteWaitEngine::PollState KiteWaitEngine::PollScript(KiteDriver& driver, const std::string& script,
                                                     ActionResult& error) {
  nlohmann::json value;
  DriverStatus status = driver.ExecuteScript(script, nlohmann::json::array(), value);
  if (!status.ok()) {
    if (status.error == DriverError::INVALID_SESSION) {
      error = ActionResult::DriverError("Browser session is gone", status.message);
      return PollState::ERROR;
    }
    return PollState::NOT_YET;
  }

  if (value.is_boolean()) {
    return value.get<bool>() ? PollState::MET : PollState::NOT_YET;
  }
  if (value.is_string()) {
    return ToLower(value.get<std::string>()) == "true" ? PollState::MET : PollState::NOT_YET;
  }
  return PollState::NOT_YET;
}

WaitResult KiteWaitEngine::WaitForScript(const std::string& session_id, const std::string& script,
                                         int timeout_seconds) {
  WaitResult wait;
  if (script.empty()) {
    wait.result = ActionResult::InvalidParameter("JavaScript code is required");
    return wait;
  }
  if (timeout_seconds < 0) {
    wait.result = ActionResult::InvalidParameter("Timeout must not be negative");
    return wait;
  }

  const auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);

  while (true) {
    {
      SessionCommand command;
      ActionResult acquired = sessions_.Acquire(session_id, command);
      if (!acquired.success) {
        wait.result = acquired;
        return wait;
      }

      ActionResult error;
      PollState state = PollScript(command.driver(), script, error);
      if (state == PollState::ERROR) {
        wait.result = error;
        return wait;
      }
      if (state == PollState::MET) {
        wait.outcome = WaitOutcome::SATISFIED;
        wait.result = ActionResult::Success("JavaScript condition met");
        return wait;
      }
    }

    auto now = Clock::now();
    if (now >= deadline) {
      wait.outcome = WaitOutcome::TIMED_OUT;
      wait.result = ActionResult::Timeout("Timed out after " + std::to_string(timeout_seconds) +
                                          "s waiting for JavaScript condition");
      LOG_INFO("WaitEngine", wait.result.message);
      return wait;
    }

    auto remaining = deadline - now;
    auto poll = std::chrono::milliseconds(poll_interval_ms_);
    std::this_thread::sleep_for(std::min<Clock::duration>(poll, remaining));
  }
}

ActionResult KiteWaitEngine::Sleep(const std::string& session_id, int seconds) {
  if (!sessions_.Exists(session_id)) {
    return ActionResult::SessionNotFound(session_id);
  }
  if (seconds < 0) {
    return ActionResult::InvalidParameter("Wait time must not be negative");
  }

  std::this_thread::sleep_for(std::chrono::seconds(seconds));
  return ActionResult::Success("Waited " + std::to_string(seconds) + "s");
}

}  // namespace kite
