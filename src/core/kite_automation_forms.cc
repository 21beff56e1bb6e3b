#include "kite_automation.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <regex>

using json = nlohmann::json;

namespace kite {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Option text as a user sees it: collapsed whitespace, trimmed
std::string NormalizeSpace(const std::string& text) {
  std::string out;
  bool in_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_space = true;
      continue;
    }
    if (in_space && !out.empty()) {
      out += ' ';
    }
    in_space = false;
    out += c;
  }
  return out;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const Locator kOptionLocator(LocatorStrategy::TAG_NAME, "option");

}  // namespace

json OptionInfo::ToJSON() const {
  json j;
  j["text"] = text;
  j["value"] = has_value ? json(value) : json(nullptr);
  return j;
}

// ============================================================
// Select elements
// ============================================================

ActionResult KiteAutomation::LoadOptions(SessionCommand& command, const std::string& element_id,
                                         const ElementRef& select,
                                         std::vector<ElementRef>& options, bool& is_multiple) {
  KiteDriver& driver = command.driver();

  std::string tag_name;
  DriverStatus status = driver.GetTagName(select, tag_name);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error reading select element", element_id);
  }
  if (ToLower(tag_name) != "select") {
    return ActionResult::InvalidParameter("Element should have been \"select\" but was \"" +
                                          tag_name + "\"");
  }

  std::string multiple;
  bool present = false;
  status = driver.GetAttribute(select, "multiple", multiple, present);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error reading select element", element_id);
  }
  is_multiple = present && ToLower(multiple) != "false";

  status = driver.FindChildElements(select, kOptionLocator, options);
  if (!status.ok()) {
    return FromDriverStatus(status, "Error reading options", element_id);
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::SelectMatching(const std::string& session_id,
                                            const std::string& element_id,
                                            const std::string& attribute,
                                            const std::string& wanted) {
  SessionCommand command;
  ElementRef select;
  ActionResult acquired = AcquireElement(session_id, element_id, command, select);
  if (!acquired.success) {
    return acquired;
  }

  std::vector<ElementRef> options;
  bool is_multiple = false;
  ActionResult loaded = LoadOptions(command, element_id, select, options, is_multiple);
  if (!loaded.success) {
    return loaded;
  }

  KiteDriver& driver = command.driver();
  bool matched = false;
  for (const auto& option : options) {
    std::string candidate;
    DriverStatus status;
    if (attribute.empty()) {
      status = driver.GetText(option, candidate);
      candidate = NormalizeSpace(candidate);
    } else {
      bool present = false;
      status = driver.GetAttribute(option, attribute, candidate, present);
      if (status.ok() && !present) {
        continue;
      }
    }
    if (!status.ok()) {
      return FromDriverStatus(status, "Error reading option", element_id);
    }
    if (candidate != (attribute.empty() ? NormalizeSpace(wanted) : wanted)) {
      continue;
    }

    bool selected = false;
    status = driver.IsSelected(option, selected);
    if (status.ok() && !selected) {
      status = driver.Click(option);
    }
    if (!status.ok()) {
      return FromDriverStatus(status, "Error selecting option", element_id);
    }
    matched = true;
    if (!is_multiple) {
      break;
    }
  }

  if (!matched) {
    return ActionResult::OptionNotFound(element_id, wanted);
  }
  return ActionResult::Success("Option selected");
}

ActionResult KiteAutomation::SelectByVisibleText(const std::string& session_id,
                                                 const std::string& element_id,
                                                 const std::string& text) {
  return SelectMatching(session_id, element_id, "", text);
}

ActionResult KiteAutomation::SelectByValue(const std::string& session_id,
                                           const std::string& element_id,
                                           const std::string& value) {
  return SelectMatching(session_id, element_id, "value", value);
}

ActionResult KiteAutomation::SelectByIndex(const std::string& session_id,
                                           const std::string& element_id, int index) {
  SessionCommand command;
  ElementRef select;
  ActionResult acquired = AcquireElement(session_id, element_id, command, select);
  if (!acquired.success) {
    return acquired;
  }

  std::vector<ElementRef> options;
  bool is_multiple = false;
  ActionResult loaded = LoadOptions(command, element_id, select, options, is_multiple);
  if (!loaded.success) {
    return loaded;
  }
  if (index < 0 || static_cast<size_t>(index) >= options.size()) {
    return ActionResult::OptionNotFound(element_id, "index " + std::to_string(index));
  }

  KiteDriver& driver = command.driver();
  const ElementRef& option = options[static_cast<size_t>(index)];
  bool selected = false;
  DriverStatus status = driver.IsSelected(option, selected);
  if (status.ok() && !selected) {
    status = driver.Click(option);
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error selecting option", element_id);
  }
  return ActionResult::Success("Option selected");
}

ActionResult KiteAutomation::CollectOptions(const std::string& session_id,
                                            const std::string& element_id, bool selected_only,
                                            std::vector<OptionInfo>& result, bool& is_multiple) {
  SessionCommand command;
  ElementRef select;
  ActionResult acquired = AcquireElement(session_id, element_id, command, select);
  if (!acquired.success) {
    return acquired;
  }

  std::vector<ElementRef> options;
  ActionResult loaded = LoadOptions(command, element_id, select, options, is_multiple);
  if (!loaded.success) {
    return loaded;
  }

  KiteDriver& driver = command.driver();
  result.clear();
  for (const auto& option : options) {
    if (selected_only) {
      bool selected = false;
      DriverStatus status = driver.IsSelected(option, selected);
      if (!status.ok()) {
        return FromDriverStatus(status, "Error reading option", element_id);
      }
      if (!selected) {
        continue;
      }
    }

    OptionInfo info;
    DriverStatus status = driver.GetText(option, info.text);
    if (status.ok()) {
      status = driver.GetAttribute(option, "value", info.value, info.has_value);
    }
    if (!status.ok()) {
      return FromDriverStatus(status, "Error reading option", element_id);
    }
    result.push_back(info);
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::GetSelectedOptions(const std::string& session_id,
                                                const std::string& element_id,
                                                std::vector<OptionInfo>& options,
                                                bool& is_multiple) {
  return CollectOptions(session_id, element_id, true, options, is_multiple);
}

ActionResult KiteAutomation::GetAllOptions(const std::string& session_id,
                                           const std::string& element_id,
                                           std::vector<OptionInfo>& options, bool& is_multiple) {
  return CollectOptions(session_id, element_id, false, options, is_multiple);
}

ActionResult KiteAutomation::DeselectAll(const std::string& session_id,
                                         const std::string& element_id) {
  SessionCommand command;
  ElementRef select;
  ActionResult acquired = AcquireElement(session_id, element_id, command, select);
  if (!acquired.success) {
    return acquired;
  }

  std::vector<ElementRef> options;
  bool is_multiple = false;
  ActionResult loaded = LoadOptions(command, element_id, select, options, is_multiple);
  if (!loaded.success) {
    return loaded;
  }
  if (!is_multiple) {
    return ActionResult::InvalidParameter("Not a multi-select element");
  }

  KiteDriver& driver = command.driver();
  for (const auto& option : options) {
    bool selected = false;
    DriverStatus status = driver.IsSelected(option, selected);
    if (status.ok() && selected) {
      status = driver.Click(option);
    }
    if (!status.ok()) {
      return FromDriverStatus(status, "Error deselecting option", element_id);
    }
  }
  return ActionResult::Success("All options deselected");
}

// ============================================================
// Assertions
// ============================================================

ActionResult EvaluateAssertion(const std::string& assert_type, bool has_actual,
                               const std::string& actual, const std::string& expected,
                               bool allow_emptiness, bool& passed) {
  const std::string type = ToLower(assert_type);

  if (type == "equals") {
    passed = has_actual && actual == expected;
  } else if (type == "notequals") {
    passed = !has_actual || actual != expected;
  } else if (type == "contains") {
    passed = has_actual && actual.find(expected) != std::string::npos;
  } else if (type == "notcontains") {
    passed = !has_actual || actual.find(expected) == std::string::npos;
  } else if (type == "startswith") {
    passed = has_actual && StartsWith(actual, expected);
  } else if (type == "endswith") {
    passed = has_actual && EndsWith(actual, expected);
  } else if (type == "matches") {
    try {
      std::regex pattern(expected);
      passed = has_actual && std::regex_match(actual, pattern);
    } catch (const std::regex_error& e) {
      return ActionResult::InvalidParameter("Invalid regular expression '" + expected + "': " +
                                            e.what());
    }
  } else if (allow_emptiness && type == "empty") {
    passed = !has_actual || actual.empty();
  } else if (allow_emptiness && type == "notempty") {
    passed = has_actual && !actual.empty();
  } else {
    return ActionResult::InvalidParameter("Invalid assertion type: " + assert_type);
  }
  return ActionResult::Success();
}

ActionResult KiteAutomation::AssertElement(const std::string& session_id,
                                           const std::string& element_id,
                                           const std::string& assert_type,
                                           const std::string& property,
                                           const std::string& expected,
                                           const std::string& attribute_name,
                                           AssertionOutcome& outcome) {
  const std::string prop = ToLower(property);
  if (prop == "attribute" && attribute_name.empty()) {
    return ActionResult::InvalidParameter("Attribute name is required for 'attribute' property");
  }

  SessionCommand command;
  ElementRef ref;
  ActionResult acquired = AcquireElement(session_id, element_id, command, ref);
  if (!acquired.success) {
    return acquired;
  }
  KiteDriver& driver = command.driver();

  DriverStatus status;
  outcome.has_actual = true;
  bool flag = false;
  if (prop == "text") {
    status = driver.GetText(ref, outcome.actual);
  } else if (prop == "value") {
    status = driver.GetAttribute(ref, "value", outcome.actual, outcome.has_actual);
  } else if (prop == "attribute") {
    status = driver.GetAttribute(ref, attribute_name, outcome.actual, outcome.has_actual);
  } else if (prop == "visible" || prop == "displayed") {
    status = driver.IsDisplayed(ref, flag);
    outcome.actual = flag ? "true" : "false";
  } else if (prop == "enabled") {
    status = driver.IsEnabled(ref, flag);
    outcome.actual = flag ? "true" : "false";
  } else if (prop == "selected") {
    status = driver.IsSelected(ref, flag);
    outcome.actual = flag ? "true" : "false";
  } else {
    return ActionResult::InvalidParameter("Invalid property: " + property);
  }
  if (!status.ok()) {
    return FromDriverStatus(status, "Error performing assertion", element_id);
  }
  if (!outcome.has_actual) {
    outcome.actual.clear();
  }

  ActionResult evaluated = EvaluateAssertion(assert_type, outcome.has_actual, outcome.actual,
                                             expected, true, outcome.passed);
  if (!evaluated.success) {
    return evaluated;
  }

  const std::string type = ToLower(assert_type);
  if (type == "empty") {
    outcome.expected = "";
  } else if (type == "notempty") {
    outcome.expected = "not empty";
  } else {
    outcome.expected = expected;
  }
  return ActionResult::Success(outcome.passed ? "Assertion passed" : "Assertion failed");
}

ActionResult KiteAutomation::AssertUrl(const std::string& session_id,
                                       const std::string& assert_type,
                                       const std::string& expected, AssertionOutcome& outcome) {
  std::string url;
  ActionResult read = GetCurrentUrl(session_id, url);
  if (!read.success) {
    return read;
  }

  outcome.has_actual = true;
  outcome.actual = url;
  outcome.expected = expected;
  ActionResult evaluated = EvaluateAssertion(assert_type, true, url, expected, false,
                                             outcome.passed);
  if (!evaluated.success) {
    return evaluated;
  }
  return ActionResult::Success(outcome.passed ? "Assertion passed" : "Assertion failed");
}

ActionResult KiteAutomation::AssertTitle(const std::string& session_id,
                                         const std::string& assert_type,
                                         const std::string& expected, AssertionOutcome& outcome) {
  std::string title;
  ActionResult read = GetTitle(session_id, title);
  if (!read.success) {
    return read;
  }

  outcome.has_actual = true;
  outcome.actual = title;
  outcome.expected = expected;
  ActionResult evaluated = EvaluateAssertion(assert_type, true, title, expected, false,
                                             outcome.passed);
  if (!evaluated.success) {
    return evaluated;
  }
  return ActionResult::Success(outcome.passed ? "Assertion passed" : "Assertion failed");
}

}  // namespace kite
