#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

#include "action_result.h"
#include "kite_driver.h"

// Conversion of script arguments and results between the client's view
// (element IDs) and the driver's view (web element references).

namespace kite {

// True when value is {kWebElementKey: "<ref>"}
bool IsWebElement(const nlohmann::json& value, ElementRef& ref);

nlohmann::json MakeWebElement(const ElementRef& ref);

// Replaces every {"elementId": "<id>"} object, at any depth, with the stored
// driver reference. Unknown IDs fail with ELEMENT_NOT_FOUND.
using ElementLookup = std::function<bool(const std::string& element_id, ElementRef& ref)>;
ActionResult ResolveScriptArguments(const nlohmann::json& args, const ElementLookup& lookup,
                                    nlohmann::json& resolved);

// Walks a script result; every web element reference is handed to the
// callback and replaced by what it returns. Arrays and objects are traversed,
// scalars pass through unchanged.
using ElementReplacer = std::function<nlohmann::json(const ElementRef& ref)>;
nlohmann::json TransformScriptResult(const nlohmann::json& value, const ElementReplacer& replace);

}  // namespace kite
