#include "kite_api_handlers.h"

using json = nlohmann::json;

namespace kite {

namespace {

json OptionList(const std::vector<OptionInfo>& options) {
  json list = json::array();
  for (const auto& option : options) {
    list.push_back(option.ToJSON());
  }
  return list;
}

json AssertionPayload(const AssertionOutcome& outcome, const char* actual_key,
                      const char* expected_key) {
  json payload;
  payload["assertion"] = outcome.passed;
  payload[actual_key] = outcome.has_actual ? json(outcome.actual) : json(nullptr);
  payload[expected_key] = outcome.expected;
  return payload;
}

}  // namespace

// ---- Forms ----

void KiteApiHandlers::RegisterFormRoutes(KiteRouter& router) {
  router.Add(HTTP_POST, "/api/form/select/text/{sessionId}/{elementId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string text;
    if (!ReadStringField(body, "text", text, error)) {
      return BadRequest(error.empty() ? "Visible text is required" : error);
    }
    ActionResult r = automation_.SelectByVisibleText(p.at("sessionId"), p.at("elementId"), text);
    json payload;
    if (r.success) {
      payload["selectedText"] = text;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_POST, "/api/form/select/value/{sessionId}/{elementId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string value;
    if (!ReadStringField(body, "value", value, error)) {
      return BadRequest(error.empty() ? "Value is required" : error);
    }
    ActionResult r = automation_.SelectByValue(p.at("sessionId"), p.at("elementId"), value);
    json payload;
    if (r.success) {
      payload["selectedValue"] = value;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_POST, "/api/form/select/index/{sessionId}/{elementId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    int index = 0;
    if (!body.contains("index") || !ParseIntegerValue(body["index"], index)) {
      return BadRequest("Index is required and must be an integer");
    }
    ActionResult r = automation_.SelectByIndex(p.at("sessionId"), p.at("elementId"), index);
    json payload;
    if (r.success) {
      payload["selectedIndex"] = index;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/form/select/options/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::vector<OptionInfo> options;
    bool is_multiple = false;
    ActionResult r =
        automation_.GetSelectedOptions(p.at("sessionId"), p.at("elementId"), options, is_multiple);
    json payload;
    if (r.success) {
      payload["selectedOptions"] = OptionList(options);
      payload["count"] = options.size();
      payload["isMultiple"] = is_multiple;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/form/select/allOptions/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::vector<OptionInfo> options;
    bool is_multiple = false;
    ActionResult r =
        automation_.GetAllOptions(p.at("sessionId"), p.at("elementId"), options, is_multiple);
    json payload;
    if (r.success) {
      payload["options"] = OptionList(options);
      payload["count"] = options.size();
      payload["isMultiple"] = is_multiple;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/form/select/deselectAll/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.DeselectAll(p.at("sessionId"), p.at("elementId")));
  });
}

// ---- Frames and alerts ----

void KiteApiHandlers::RegisterFrameRoutes(KiteRouter& router) {
  router.Add(HTTP_POST, "/api/frame/switchTo/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string locator, value;
    if (!ReadStringField(body, "frameLocator", locator, error) ||
        !ReadStringField(body, "frameValue", value, error)) {
      return BadRequest(error.empty() ? "Frame locator and value are required" : error);
    }
    return ResultResponse(automation_.SwitchToFrame(p.at("sessionId"), locator, value));
  });

  router.Add(HTTP_GET, "/api/frame/switchToDefault/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.SwitchToDefaultContent(p.at("sessionId")));
  });

  router.Add(HTTP_GET, "/api/frame/switchToParent/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.SwitchToParentFrame(p.at("sessionId")));
  });

  router.Add(HTTP_POST, "/api/frame/alert/handle/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    bool accept = true;
    if (!ReadBoolField(body, "accept", accept, error) && !error.empty()) {
      return BadRequest(error);
    }
    std::string alert_text;
    ActionResult r = automation_.HandleAlert(p.at("sessionId"), accept, alert_text);
    json payload;
    if (r.success) {
      payload["alertText"] = alert_text;
      payload["action"] = accept ? "accepted" : "dismissed";
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_POST, "/api/frame/alert/sendText/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string text;
    if (!ReadStringField(body, "text", text, error)) {
      return BadRequest(error.empty() ? "Text is required" : error);
    }
    bool accept = true;
    if (!ReadBoolField(body, "accept", accept, error) && !error.empty()) {
      return BadRequest(error);
    }
    std::string alert_text;
    ActionResult r = automation_.SendAlertText(p.at("sessionId"), text, accept, alert_text);
    json payload;
    if (r.success) {
      payload["alertText"] = alert_text;
      payload["textSent"] = text;
      payload["action"] = accept ? "accepted" : "dismissed";
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/frame/alert/getText/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string alert_text;
    ActionResult r = automation_.GetAlertText(p.at("sessionId"), alert_text);
    json payload;
    if (r.success) {
      payload["alertText"] = alert_text;
    }
    return ResultResponse(r, payload);
  });
}

// ---- Scripts and screenshots ----

void KiteApiHandlers::RegisterScriptRoutes(KiteRouter& router) {
  router.Add(HTTP_POST, "/api/script/execute/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string script;
    if (!ReadStringField(body, "script", script, error) || script.empty()) {
      return BadRequest(error.empty() ? "Script is required" : error);
    }
    json args = body.contains("args") ? body["args"] : json();

    json result;
    ActionResult r = automation_.ExecuteScript(p.at("sessionId"), script, args, result);
    json payload;
    if (r.success) {
      payload["result"] = result;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/script/screenshot/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string png;
    ActionResult r = automation_.TakeScreenshot(p.at("sessionId"), png);
    json payload;
    if (r.success) {
      payload["screenshot"] = png;
      payload["format"] = "base64";
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/script/screenshot/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string png;
    ActionResult r = automation_.TakeElementScreenshot(p.at("sessionId"), p.at("elementId"), png);
    json payload;
    if (r.success) {
      payload["screenshot"] = png;
      payload["format"] = "base64";
    }
    return ResultResponse(r, payload);
  });
}

// ---- Cookies ----

void KiteApiHandlers::RegisterCookieRoutes(KiteRouter& router) {
  router.Add(HTTP_GET, "/api/cookie/all/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::vector<CookieData> cookies;
    ActionResult r = automation_.GetCookies(p.at("sessionId"), cookies);
    json payload;
    if (r.success) {
      json list = json::array();
      for (const auto& cookie : cookies) {
        list.push_back(CookieToJSON(cookie));
      }
      payload["cookies"] = list;
      payload["count"] = cookies.size();
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_DELETE, "/api/cookie/all/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.DeleteAllCookies(p.at("sessionId")));
  });

  router.Add(HTTP_POST, "/api/cookie/add/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    CookieData cookie;
    if (!ReadStringField(body, "name", cookie.name, error) ||
        !ReadStringField(body, "value", cookie.value, error)) {
      return BadRequest(error.empty() ? "Cookie name and value are required" : error);
    }
    if ((!ReadStringField(body, "domain", cookie.domain, error) && !error.empty()) ||
        (!ReadStringField(body, "path", cookie.path, error) && !error.empty()) ||
        (!ReadStringField(body, "sameSite", cookie.same_site, error) && !error.empty()) ||
        (!ReadBoolField(body, "secure", cookie.secure, error) && !error.empty()) ||
        (!ReadBoolField(body, "httpOnly", cookie.http_only, error) && !error.empty())) {
      return BadRequest(error);
    }
    if (body.contains("expiry") && !body["expiry"].is_null()) {
      if (!ParseCookieExpiry(body["expiry"], cookie.expiry, error)) {
        return BadRequest(error);
      }
      cookie.has_expiry = true;
    }
    return ResultResponse(automation_.AddCookie(p.at("sessionId"), cookie));
  });

  router.Add(HTTP_GET, "/api/cookie/{sessionId}/{name}",
             [this](const HttpRequest&, const RouteParams& p) {
    CookieData cookie;
    ActionResult r = automation_.GetCookie(p.at("sessionId"), p.at("name"), cookie);
    json payload;
    if (r.success) {
      payload["cookie"] = CookieToJSON(cookie);
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_DELETE, "/api/cookie/{sessionId}/{name}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.DeleteCookie(p.at("sessionId"), p.at("name")));
  });
}

// ---- Assertions ----

void KiteApiHandlers::RegisterAssertionRoutes(KiteRouter& router) {
  router.Add(HTTP_POST, "/api/assert/element/{sessionId}/{elementId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string type, property;
    if (!ReadStringField(body, "assertType", type, error) ||
        !ReadStringField(body, "property", property, error)) {
      return BadRequest(error.empty() ? "Assert type and property are required" : error);
    }
    std::string expected, attribute_name;
    if ((!ReadStringField(body, "expectedValue", expected, error) && !error.empty()) ||
        (!ReadStringField(body, "attributeName", attribute_name, error) && !error.empty())) {
      return BadRequest(error);
    }

    AssertionOutcome outcome;
    ActionResult r = automation_.AssertElement(p.at("sessionId"), p.at("elementId"), type,
                                               property, expected, attribute_name, outcome);
    json payload;
    if (r.success) {
      payload = AssertionPayload(outcome, "actualValue", "expectedValue");
      payload["property"] = property;
      if (!attribute_name.empty()) {
        payload["attributeName"] = attribute_name;
      }
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_POST, "/api/assert/url/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string type, expected;
    if (!ReadStringField(body, "assertType", type, error) ||
        !ReadStringField(body, "expectedUrl", expected, error)) {
      return BadRequest(error.empty() ? "Assert type and expected URL are required" : error);
    }
    AssertionOutcome outcome;
    ActionResult r = automation_.AssertUrl(p.at("sessionId"), type, expected, outcome);
    json payload;
    if (r.success) {
      payload = AssertionPayload(outcome, "currentUrl", "expectedUrl");
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_POST, "/api/assert/title/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string type, expected;
    if (!ReadStringField(body, "assertType", type, error) ||
        !ReadStringField(body, "expectedTitle", expected, error)) {
      return BadRequest(error.empty() ? "Assert type and expected title are required" : error);
    }
    AssertionOutcome outcome;
    ActionResult r = automation_.AssertTitle(p.at("sessionId"), type, expected, outcome);
    json payload;
    if (r.success) {
      payload = AssertionPayload(outcome, "currentTitle", "expectedTitle");
    }
    return ResultResponse(r, payload);
  });
}

}  // namespace kite
