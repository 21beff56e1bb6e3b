#pragma once

#include <string>

#include "action_result.h"
#include "kite_locator.h"
#include "kite_session_registry.h"

namespace kite {

enum class WaitCondition {
  PRESENT,
  VISIBLE,
  CLICKABLE,
  INVISIBLE,
  TEXT_EQUALS
};

// Case-insensitive; "texttobe" is accepted for TEXT_EQUALS
bool ParseWaitCondition(const std::string& name, WaitCondition& condition);
const char* WaitConditionToString(WaitCondition condition);

struct WaitSpec {
  Locator locator;
  WaitCondition condition = WaitCondition::PRESENT;
  std::string expected_text;   // TEXT_EQUALS only
  int timeout_seconds = 0;
};

enum class WaitOutcome {
  SATISFIED,
  TIMED_OUT,
  FAILED
};

struct WaitResult {
  WaitOutcome outcome = WaitOutcome::FAILED;
  ActionResult result;

  // Set for element-producing conditions (present, visible, clickable)
  std::string element_id;
  std::string tag_name;
  std::string text;

  bool HasElement() const { return !element_id.empty(); }
};

// Bounded polling over one session.
//
// Each poll takes the session command lock only for its own duration, so
// other commands on the same session interleave with a running wait. The
// engine sleeps at most the remaining time between polls and never reports
// a timeout before the timeout has elapsed.
class KiteWaitEngine {
public:
  KiteWaitEngine(KiteSessionRegistry& sessions, int poll_interval_ms);

  WaitResult WaitForElement(const std::string& session_id, const WaitSpec& spec);

  // Truthy results: boolean true, or a string equal to "true" (any case).
  // A script error on a poll counts as not yet.
  WaitResult WaitForScript(const std::string& session_id, const std::string& script,
                           int timeout_seconds);

  // Checks the session exists, then blocks for exactly the given seconds
  ActionResult Sleep(const std::string& session_id, int seconds);

  int poll_interval_ms() const { return poll_interval_ms_; }

private:
  enum class PollState { MET, NOT_YET, ERROR };

  PollState PollElement(KiteDriver& driver, const WaitSpec& spec, ElementRef& matched,
                        ActionResult& error);
  PollState PollScript(KiteDriver& driver, const std::string& script, ActionResult& error);

  KiteSessionRegistry& sessions_;
  int poll_interval_ms_;
};

}  // namespace kite
