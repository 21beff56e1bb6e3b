#pragma once

#include <string>
#include "action_result.h"

namespace kite {

enum class LocatorStrategy {
  ID,
  NAME,
  CLASS_NAME,
  TAG_NAME,
  LINK_TEXT,
  PARTIAL_LINK_TEXT,
  CSS_SELECTOR,
  XPATH
};

const char* LocatorStrategyToString(LocatorStrategy strategy);

// Normalized element query
struct Locator {
  LocatorStrategy strategy = LocatorStrategy::CSS_SELECTOR;
  std::string value;

  Locator() = default;
  Locator(LocatorStrategy s, const std::string& v) : strategy(s), value(v) {}

  bool operator==(const Locator& other) const {
    return strategy == other.strategy && value == other.value;
  }
  bool operator!=(const Locator& other) const { return !(*this == other); }

  // "cssSelector=#login", for logs and error messages
  std::string Describe() const;
};

// Resolves a strategy name and value into a Locator.
//
// Strategy names are case-insensitive and accept the synonyms
// id, name, class/classname, tag/tagname, link/linktext,
// partiallink/partiallinktext, css/cssselector and xpath.
// Fails with INVALID_LOCATOR for unknown strategies and empty values.
ActionResult ResolveLocator(const std::string& strategy, const std::string& value,
                            Locator& locator);

}  // namespace kite
