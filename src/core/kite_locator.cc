#include "kite_locator.h"
#include <algorithm>
#include <cctype>

namespace kite {

const char* LocatorStrategyToString(LocatorStrategy strategy) {
  switch (strategy) {
    case LocatorStrategy::ID: return "id";
    case LocatorStrategy::NAME: return "name";
    case LocatorStrategy::CLASS_NAME: return "className";
    case LocatorStrategy::TAG_NAME: return "tagName";
    case LocatorStrategy::LINK_TEXT: return "linkText";
    case LocatorStrategy::PARTIAL_LINK_TEXT: return "partialLinkText";
    case LocatorStrategy::CSS_SELECTOR: return "cssSelector";
    case LocatorStrategy::XPATH: return "xpath";
    default: return "unknown";
  }
}

std::string Locator::Describe() const {
  return std::string(LocatorStrategyToString(strategy)) + "=" + value;
}

ActionResult ResolveLocator(const std::string& strategy, const std::string& value,
                            Locator& locator) {
  std::string name = strategy;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  LocatorStrategy resolved;
  if (name == "id") {
    resolved = LocatorStrategy::ID;
  } else if (name == "name") {
    resolved = LocatorStrategy::NAME;
  } else if (name == "class" || name == "classname") {
    resolved = LocatorStrategy::CLASS_NAME;
  } else if (name == "tag" || name == "tagname") {
    resolved = LocatorStrategy::TAG_NAME;
  } else if (name == "link" || name == "linktext") {
    resolved = LocatorStrategy::LINK_TEXT;
  } else if (name == "partiallink" || name == "partiallinktext") {
    resolved = LocatorStrategy::PARTIAL_LINK_TEXT;
  } else if (name == "css" || name == "cssselector") {
    resolved = LocatorStrategy::CSS_SELECTOR;
  } else if (name == "xpath") {
    resolved = LocatorStrategy::XPATH;
  } else {
    return ActionResult::InvalidLocator("unsupported locator type '" + strategy + "'");
  }

  if (value.empty()) {
    return ActionResult::InvalidLocator("empty value for locator type '" + strategy + "'");
  }

  locator = Locator(resolved, value);
  return ActionResult::Success();
}

}  // namespace kite
