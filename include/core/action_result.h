#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Status codes returned by every gateway operation.
// Codes are stable and serialized to clients in snake_case.
enum class ActionStatus {
  // Success statuses
  OK,                        // Action completed successfully
  PAGE_LOAD_INCOMPLETE,      // Navigation issued but the page did not finish loading (success with warning)

  // Session errors
  SESSION_NOT_FOUND,         // Session ID doesn't exist or session was closed
  DRIVER_STARTUP_FAILED,     // Browser driver could not be acquired for a new session

  // Element errors
  ELEMENT_NOT_FOUND,         // No match for locator, or element ID unknown/expired
  ELEMENT_STALE,             // Element ID known but the node is no longer in the DOM

  // Validation errors
  INVALID_LOCATOR,           // Locator strategy unknown or value empty
  INVALID_PARAMETER,         // A parameter has invalid value

  // Driver errors
  TIMEOUT,                   // Wait condition or driver operation timed out
  DRIVER_ERROR,              // Underlying driver reported an unexpected failure
  NO_ALERT_PRESENT,          // Alert operation without an open alert
  FRAME_NOT_FOUND,           // Frame locator matched nothing
  COOKIE_NOT_FOUND,          // Named cookie not present
  OPTION_NOT_FOUND,          // Requested dropdown option doesn't exist

  // System errors
  INTERNAL_ERROR,            // Unexpected internal error

  // Unknown
  UNKNOWN                    // Unknown status
};

// Convert ActionStatus to string code
inline const char* ActionStatusToCode(ActionStatus status) {
  switch (status) {
    case ActionStatus::OK: return "ok";
    case ActionStatus::PAGE_LOAD_INCOMPLETE: return "page_load_incomplete";
    case ActionStatus::SESSION_NOT_FOUND: return "session_not_found";
    case ActionStatus::DRIVER_STARTUP_FAILED: return "driver_startup_failed";
    case ActionStatus::ELEMENT_NOT_FOUND: return "element_not_found";
    case ActionStatus::ELEMENT_STALE: return "element_stale";
    case ActionStatus::INVALID_LOCATOR: return "invalid_locator";
    case ActionStatus::INVALID_PARAMETER: return "invalid_parameter";
    case ActionStatus::TIMEOUT: return "timeout";
    case ActionStatus::DRIVER_ERROR: return "driver_error";
    case ActionStatus::NO_ALERT_PRESENT: return "no_alert_present";
    case ActionStatus::FRAME_NOT_FOUND: return "frame_not_found";
    case ActionStatus::COOKIE_NOT_FOUND: return "cookie_not_found";
    case ActionStatus::OPTION_NOT_FOUND: return "option_not_found";
    case ActionStatus::INTERNAL_ERROR: return "internal_error";
    default: return "unknown";
  }
}

// Human-readable message for ActionStatus
inline const char* ActionStatusToMessage(ActionStatus status) {
  switch (status) {
    case ActionStatus::OK: return "Action completed successfully";
    case ActionStatus::PAGE_LOAD_INCOMPLETE: return "Page load did not complete";
    case ActionStatus::SESSION_NOT_FOUND: return "Session not found";
    case ActionStatus::DRIVER_STARTUP_FAILED: return "Failed to start browser driver";
    case ActionStatus::ELEMENT_NOT_FOUND: return "Element not found";
    case ActionStatus::ELEMENT_STALE: return "Element is no longer in the page";
    case ActionStatus::INVALID_LOCATOR: return "Invalid locator";
    case ActionStatus::INVALID_PARAMETER: return "Invalid parameter value";
    case ActionStatus::TIMEOUT: return "Operation timed out";
    case ActionStatus::DRIVER_ERROR: return "Browser driver error";
    case ActionStatus::NO_ALERT_PRESENT: return "No alert present";
    case ActionStatus::FRAME_NOT_FOUND: return "Frame not found";
    case ActionStatus::COOKIE_NOT_FOUND: return "Cookie not found";
    case ActionStatus::OPTION_NOT_FOUND: return "Option not found in dropdown";
    case ActionStatus::INTERNAL_ERROR: return "Internal error";
    default: return "Unknown error";
  }
}

// Structured result for gateway operations
// Provides success/failure status plus detailed information
struct ActionResult {
  bool success;               // True if action completed successfully
  ActionStatus status;        // Detailed status code
  std::string message;        // Human-readable message

  // Optional additional fields for specific errors
  std::string selector;       // For element/locator errors: what failed to resolve
  std::string url;            // For navigation: the URL involved
  std::string warning;        // For success-with-warning outcomes
  std::string error_code;     // Raw driver error text, when there is one

  ActionResult() : success(false), status(ActionStatus::UNKNOWN) {}

  // Create a success result
  static ActionResult Success() {
    ActionResult r;
    r.success = true;
    r.status = ActionStatus::OK;
    r.message = ActionStatusToMessage(ActionStatus::OK);
    return r;
  }

  // Create a success result with custom message
  static ActionResult Success(const std::string& msg) {
    ActionResult r;
    r.success = true;
    r.status = ActionStatus::OK;
    r.message = msg;
    return r;
  }

  // Create a failure result
  static ActionResult Failure(ActionStatus status, const std::string& msg = "") {
    ActionResult r;
    r.success = false;
    r.status = status;
    r.message = msg.empty() ? ActionStatusToMessage(status) : msg;
    return r;
  }

  static ActionResult SessionNotFound(const std::string& session_id) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::SESSION_NOT_FOUND;
    r.message = "Session not found: " + session_id;
    return r;
  }

  // Element ID unknown in its session, or no element matched a locator
  static ActionResult ElementNotFound(const std::string& selector) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::ELEMENT_NOT_FOUND;
    r.message = "Element not found or expired: " + selector;
    r.selector = selector;
    return r;
  }

  static ActionResult ElementStale(const std::string& element_id) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::ELEMENT_STALE;
    r.message = "Element is stale: " + element_id;
    r.selector = element_id;
    return r;
  }

  static ActionResult InvalidLocator(const std::string& detail) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::INVALID_LOCATOR;
    r.message = "Invalid locator: " + detail;
    r.selector = detail;
    return r;
  }

  static ActionResult InvalidParameter(const std::string& msg) {
    return Failure(ActionStatus::INVALID_PARAMETER, msg);
  }

  static ActionResult Timeout(const std::string& msg) {
    return Failure(ActionStatus::TIMEOUT, msg);
  }

  // Driver fault, keeps the driver's own message
  static ActionResult DriverError(const std::string& context, const std::string& driver_message) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::DRIVER_ERROR;
    r.message = context + (driver_message.empty() ? "" : ": " + driver_message);
    r.error_code = driver_message;
    return r;
  }

  // Navigation went out but readiness was not confirmed (success with warning)
  static ActionResult PageLoadIncomplete(const std::string& url, const std::string& warning) {
    ActionResult r;
    r.success = true;
    r.status = ActionStatus::PAGE_LOAD_INCOMPLETE;
    r.message = "Navigation to " + url + " completed with warning";
    r.url = url;
    r.warning = warning;
    return r;
  }

  static ActionResult FrameNotFound(const std::string& frame) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::FRAME_NOT_FOUND;
    r.message = "Frame not found: " + frame;
    r.selector = frame;
    return r;
  }

  static ActionResult CookieNotFound(const std::string& name) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::COOKIE_NOT_FOUND;
    r.message = "Cookie not found: " + name;
    r.error_code = name;
    return r;
  }

  // Create option not found error
  static ActionResult OptionNotFound(const std::string& selector, const std::string& option_value) {
    ActionResult r;
    r.success = false;
    r.status = ActionStatus::OPTION_NOT_FOUND;
    r.message = "Option not found: '" + option_value + "' in " + selector;
    r.selector = selector;
    r.error_code = option_value;
    return r;
  }

  bool HasWarning() const { return !warning.empty(); }

  // Base response object. Failures carry the message under "error".
  nlohmann::json ToJSON() const {
    nlohmann::json j;
    j["success"] = success;
    j["status"] = ActionStatusToCode(status);
    if (success) {
      j["message"] = message;
    } else {
      j["error"] = message;
    }

    // Add optional fields if present
    if (!selector.empty()) {
      j["selector"] = selector;
    }
    if (!url.empty()) {
      j["url"] = url;
    }
    if (!warning.empty()) {
      j["warning"] = warning;
    }
    if (!error_code.empty()) {
      j["error_code"] = error_code;
    }
    return j;
  }
};
