#include "kite_script_values.h"

using json = nlohmann::json;

namespace kite {

bool IsWebElement(const json& value, ElementRef& ref) {
  if (!value.is_object()) {
    return false;
  }
  auto it = value.find(kWebElementKey);
  if (it == value.end() || !it->is_string()) {
    return false;
  }
  ref = it->get<std::string>();
  return true;
}

json MakeWebElement(const ElementRef& ref) {
  json element = json::object();
  element[kWebElementKey] = ref;
  return element;
}

ActionResult ResolveScriptArguments(const json& args, const ElementLookup& lookup,
                                    json& resolved) {
  if (args.is_object()) {
    // Exactly {"elementId": "..."} refers to a stored element
    auto id = args.find("elementId");
    if (args.size() == 1 && id != args.end() && id->is_string()) {
      ElementRef ref;
      std::string element_id = id->get<std::string>();
      if (!lookup(element_id, ref)) {
        return ActionResult::ElementNotFound(element_id);
      }
      resolved = MakeWebElement(ref);
      return ActionResult::Success();
    }

    resolved = json::object();
    for (auto it = args.begin(); it != args.end(); ++it) {
      json child;
      ActionResult r = ResolveScriptArguments(it.value(), lookup, child);
      if (!r.success) {
        return r;
      }
      resolved[it.key()] = std::move(child);
    }
    return ActionResult::Success();
  }

  if (args.is_array()) {
    resolved = json::array();
    for (const auto& item : args) {
      json child;
      ActionResult r = ResolveScriptArguments(item, lookup, child);
      if (!r.success) {
        return r;
      }
      resolved.push_back(std::move(child));
    }
    return ActionResult::Success();
  }

  resolved = args;
  return ActionResult::Success();
}

json TransformScriptResult(const json& value, const ElementReplacer& replace) {
  ElementRef ref;
  if (IsWebElement(value, ref)) {
    return replace(ref);
  }

  if (value.is_array()) {
    json out = json::array();
    for (const auto& item : value) {
      out.push_back(TransformScriptResult(item, replace));
    }
    return out;
  }

  if (value.is_object()) {
    json out = json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      out[it.key()] = TransformScriptResult(it.value(), replace);
    }
    return out;
  }

  return value;
}

}  // namespace kite
