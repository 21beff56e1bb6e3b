#include "kite_automation.h"
#include "kite_script_values.h"
#include "logger.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>

using json = nlohmann::json;

namespace kite {

namespace {

bool AllDigits(const std::string& s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

int TwoDigits(const std::string& s, size_t pos) {
  if (pos + 2 > s.size() || !std::isdigit(static_cast<unsigned char>(s[pos])) ||
      !std::isdigit(static_cast<unsigned char>(s[pos + 1]))) {
    return -1;
  }
  return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

// yyyy-MM-ddTHH:mm:ss[.SSS](Z|+hh:mm|+hhmm|-hh:mm|-hhmm)
bool ParseIsoTimestamp(const std::string& text, int64_t& epoch_seconds) {
  int year, month, day, hour, minute, second;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                  &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return false;
  }

  size_t pos = static_cast<size_t>(consumed);

  // Fractional seconds are accepted and dropped
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
      ++digits;
    }
    if (digits == 0) {
      return false;
    }
  }

  int offset_seconds = 0;
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int hh = TwoDigits(text, pos);
    if (hh < 0) {
      return false;
    }
    pos += 2;
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
    }
    int mm = TwoDigits(text, pos);
    if (mm < 0) {
      return false;
    }
    pos += 2;
    offset_seconds = sign * (hh * 3600 + mm * 60);
  } else {
    return false;
  }
  if (pos != text.size()) {
    return false;
  }

  std::tm tm = {};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  epoch_seconds = static_cast<int64_t>(timegm(&tm)) - offset_seconds;
  return true;
}

}  // namespace

bool ParseCookieExpiry(const json& value, int64_t& epoch_seconds, std::string& error) {
  if (value.is_number_integer()) {
    epoch_seconds = value.get<int64_t>();
    return true;
  }
  if (value.is_number_float()) {
    epoch_seconds = static_cast<int64_t>(value.get<double>());
    return true;
  }
  if (value.is_string()) {
    const std::string text = value.get<std::string>();
    if (AllDigits(text)) {
      epoch_seconds = std::strtoll(text.c_str(), nullptr, 10);
      return true;
    }
    if (ParseIsoTimestamp(text, epoch_seconds)) {
      return true;
    }
  }
  error = "Invalid expiry date format. Expected epoch seconds or yyyy-MM-dd'T'HH:mm:ss.SSSZ";
  return false;
}

json CookieToJSON(const CookieData& cookie) {
  json j;
  j["name"] = cookie.name;
  j["value"] = cookie.value;
  j["domain"] = cookie.domain.empty() ? json(nullptr) : json(cookie.domain);
  j["path"] = cookie.path.empty() ? json(nullptr) : json(cookie.path);
  j["expiry"] = cookie.has_expiry ? json(cookie.expiry) : json(nullptr);
  j["secure"] = cookie.secure;
  j["httpOnly"] = cookie.http_only;
  if (!cookie.same_site.empty()) {
    j["sameSite"] = cookie.same_site;
  }
  return j;
}

// ============================================================
// Scripts and screenshots
// ============================================================

ActionResult KiteAutomation::ExecuteScript(const std::string& session_id,
                                           const std::string& script, const json& args,
                                           json& result) {
  if (script.empty()) {
    return ActionResult::InvalidParameter("Script is required");
  }
  if (!args.is_null() && !args.is_array()) {
    return ActionResult::InvalidParameter("Script arguments must be an array");
  }

  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }

  KiteElementRegistry& elements = sessions_.elements();
  json wire_args;
  ActionResult resolved = ResolveScriptArguments(
      args.is_null() ? json::array() : args,
      [&](const std::string& element_id, ElementRef& ref) {
        return elements.Get(session_id, element_id, ref);
      },
      wire_args);
  if (!resolved.success) {
    return resolved;
  }

  KiteDriver& driver = command.driver();
  json raw;
  DriverStatus status = driver.ExecuteScript(script, wire_args, raw);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error executing script");
  }

  result = TransformScriptResult(raw, [&](const ElementRef& ref) {
    json info;
    info["elementId"] = elements.Store(session_id, ref);

    std::string tag_name;
    info["tagName"] = driver.GetTagName(ref, tag_name).ok() ? tag_name : "unknown";
    std::string text;
    info["text"] = driver.GetText(ref, text).ok() ? text : "";
    return info;
  });
  return ActionResult::Success("Script executed");
}

ActionResult KiteAutomation::TakeScreenshot(const std::string& session_id,
                                            std::string& base64_png) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().TakeScreenshot(base64_png);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error taking screenshot");
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::TakeElementScreenshot(const std::string& session_id,
                                                   const std::string& element_id,
                                                   std::string& base64_png) {
  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().TakeElementScreenshot(ref, base64_png);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error taking element screenshot", element_id);
  }
  return ActionResult::Success();
}

// ============================================================
// Cookies
// ============================================================

ActionResult KiteAutomation::GetCookies(const std::string& session_id,
                                        std::vector<CookieData>& cookies) {
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetCookies(cookies);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting cookies");
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::GetCookie(const std::string& session_id, const std::string& name,
                                       CookieData& cookie) {
  if (name.empty()) {
    return ActionResult::InvalidParameter("Cookie name is required");
  }
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().GetCookie(name, cookie);
  if (status.error == DriverError::NO_SUCH_COOKIE) {
    return ActionResult::CookieNotFound(name);
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error getting cookie");
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::AddCookie(const std::string& session_id, const CookieData& cookie) {
  if (cookie.name.empty()) {
    return ActionResult::InvalidParameter("Cookie name is required");
  }
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  DriverStatus status = command.driver().AddCookie(cookie);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error adding cookie");
  }
  return ActionResult::Success("Cookie added successfully");
}

ActionResult KiteAutomation::DeleteCookie(const std::string& session_id,
                                          const std::string& name) {
  if (name.empty()) {
    return ActionResult::InvalidParameter("Cookie name is required");
  }
  SessionCommand command;
  ActionResult acquired = sessions_.Acquire(session_id, command);
  if (!acquired.success) {
    return acquired;
  }
  KiteDriver& driver = command.driver();

  // Deleting is silent in WebDriver, so check presence first
  CookieData existing;
  DriverStatus status = driver.GetCookie(name, existing);
  if (status.error == DriverError::NO_SUCH_COOKIE) {
    return ActionResult::CookieNotFound(name);
  }
  if (status.ok()) {
    status = driver.DeleteCookie(name);
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error deleting cookie");
  }
  return ActionResult::Success("Cookie deleted successfully");
}

ActionResult KiteAutomation::DeleteAllCookies(const std::string& session_id) {
  ActionResult r = NoArgCommand(session_id, "Delete all cookies", &KiteDriver::DeleteAllCookies);
  if (r.success) {
    r.message = "All cookies deleted successfully";
  }
  return r;
}

}  // namespace kite
