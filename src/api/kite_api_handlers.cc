#include "kite_api_handlers.h"
#include "logger.h"
#include <cerrno>
#include <cmath>
#include <climits>
#include <cstdlib>

using json = nlohmann::json;

namespace kite {

// ============================================================
// Response helpers
// ============================================================

HttpStatus HttpStatusFor(ActionStatus status) {
  switch (status) {
    case ActionStatus::OK:
    case ActionStatus::PAGE_LOAD_INCOMPLETE:
      return HTTP_200_OK;
    case ActionStatus::SESSION_NOT_FOUND:
    case ActionStatus::ELEMENT_NOT_FOUND:
    case ActionStatus::NO_ALERT_PRESENT:
    case ActionStatus::FRAME_NOT_FOUND:
    case ActionStatus::COOKIE_NOT_FOUND:
    case ActionStatus::OPTION_NOT_FOUND:
      return HTTP_404_NOT_FOUND;
    case ActionStatus::ELEMENT_STALE:
      return HTTP_410_GONE;
    case ActionStatus::INVALID_LOCATOR:
    case ActionStatus::INVALID_PARAMETER:
      return HTTP_400_BAD_REQUEST;
    case ActionStatus::TIMEOUT:
      return HTTP_408_REQUEST_TIMEOUT;
    case ActionStatus::DRIVER_ERROR:
    case ActionStatus::DRIVER_STARTUP_FAILED:
    case ActionStatus::INTERNAL_ERROR:
    default:
      return HTTP_500_INTERNAL_ERROR;
  }
}

HttpResponse ResultResponse(const ActionResult& result, const json& payload) {
  json body = result.ToJSON();
  if (payload.is_object()) {
    for (auto it = payload.begin(); it != payload.end(); ++it) {
      body[it.key()] = it.value();
    }
  }
  return MakeJsonResponse(result.success ? HTTP_200_OK : HttpStatusFor(result.status), body);
}

HttpResponse BadRequest(const std::string& message) {
  return ResultResponse(ActionResult::InvalidParameter(message));
}

bool ParseIntegerValue(const json& value, int& out) {
  if (value.is_number_integer()) {
    int64_t v = value.get<int64_t>();
    if (v < INT_MIN || v > INT_MAX) {
      return false;
    }
    out = static_cast<int>(v);
    return true;
  }
  if (value.is_number_float()) {
    double v = value.get<double>();
    if (std::floor(v) != v || v < INT_MIN || v > INT_MAX) {
      return false;
    }
    out = static_cast<int>(v);
    return true;
  }
  if (value.is_string()) {
    const std::string text = value.get<std::string>();
    if (text.empty()) {
      return false;
    }
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) {
      return false;
    }
    out = static_cast<int>(v);
    return true;
  }
  return false;
}

bool ParseJsonBody(const HttpRequest& request, json& body, std::string& error) {
  if (request.body.empty()) {
    body = json::object();
    return true;
  }
  body = json::parse(request.body, nullptr, false);
  if (body.is_discarded()) {
    error = "Request body is not valid JSON";
    return false;
  }
  if (!body.is_object()) {
    error = "Request body must be a JSON object";
    return false;
  }
  return true;
}

bool ReadStringField(const json& body, const char* key, std::string& out, std::string& error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return false;
  }
  if (it->is_string()) {
    out = it->get<std::string>();
    return true;
  }
  if (it->is_number() || it->is_boolean()) {
    out = it->dump();
    return true;
  }
  error = std::string("Field '") + key + "' must be a string";
  return false;
}

bool ReadBoolField(const json& body, const char* key, bool& out, std::string& error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return false;
  }
  if (it->is_boolean()) {
    out = it->get<bool>();
    return true;
  }
  if (it->is_string()) {
    const std::string text = it->get<std::string>();
    if (text == "true" || text == "false") {
      out = text == "true";
      return true;
    }
  }
  error = std::string("Field '") + key + "' must be a boolean";
  return false;
}

namespace {

// Reads an optional timeout; absent keeps fallback
bool ReadTimeout(const json& body, int fallback, int& timeout, std::string& error) {
  timeout = fallback;
  auto it = body.find("timeout");
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!ParseIntegerValue(*it, timeout)) {
    error = "Invalid timeout value";
    return false;
  }
  if (timeout < 0) {
    error = "Timeout must not be negative";
    return false;
  }
  return true;
}

// Element payload of a finished wait
json WaitPayload(const WaitResult& wait, const std::string& condition, int timeout) {
  json payload;
  if (!condition.empty()) {
    payload["waitCondition"] = condition;
  }
  payload["timeout"] = timeout;
  if (wait.HasElement()) {
    payload["elementId"] = wait.element_id;
    payload["tagName"] = wait.tag_name;
    payload["text"] = wait.text;
  }
  return payload;
}

}  // namespace

// ============================================================
// Handlers
// ============================================================

KiteApiHandlers::KiteApiHandlers(KiteAutomation& automation, const ApiDefaults& defaults,
                                 const ThreadPool* pool)
    : automation_(automation),
      sessions_(automation.sessions()),
      defaults_(defaults),
      pool_(pool) {}

void KiteApiHandlers::Register(KiteRouter& router) {
  router.Add(HTTP_GET, "/api/status",
             [this](const HttpRequest&, const RouteParams&) { return Status(); });

  RegisterSessionRoutes(router);
  RegisterNavigationRoutes(router);
  RegisterElementRoutes(router);
  RegisterWaitRoutes(router);
  RegisterFormRoutes(router);
  RegisterFrameRoutes(router);
  RegisterScriptRoutes(router);
  RegisterCookieRoutes(router);
  RegisterAssertionRoutes(router);

  LOG_DEBUG("Api", "Registered " + std::to_string(router.size()) + " routes");
}

HttpResponse KiteApiHandlers::Status() const {
  json body = ActionResult::Success("Kite gateway running").ToJSON();
  body["sessions"] = sessions_.Count();
  if (pool_) {
    const TaskMetrics& metrics = pool_->GetMetrics();
    json workers;
    workers["total"] = pool_->GetWorkerCount();
    workers["active"] = metrics.active_workers.load();
    workers["idle"] = metrics.idle_workers.load();
    workers["queued"] = pool_->GetQueueSize();
    workers["completed"] = metrics.tasks_completed.load();
    workers["rejected"] = metrics.tasks_rejected.load();
    body["workers"] = workers;
  }
  return MakeJsonResponse(HTTP_200_OK, body);
}

// ---- Sessions ----

void KiteApiHandlers::RegisterSessionRoutes(KiteRouter& router) {
  router.Add(HTTP_GET, "/api/session/initialize",
             [this](const HttpRequest&, const RouteParams&) {
    std::string session_id;
    ActionResult r = sessions_.Create(session_id);
    json payload;
    if (r.success) {
      payload["sessionId"] = session_id;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/session/close/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(sessions_.Close(p.at("sessionId")));
  });

  router.Add(HTTP_GET, "/api/session/closeAll", [this](const HttpRequest&, const RouteParams&) {
    size_t closed = sessions_.CloseAll();
    json payload;
    payload["closed"] = closed;
    return ResultResponse(
        ActionResult::Success("Closed " + std::to_string(closed) + " session(s)"), payload);
  });

  router.Add(HTTP_GET, "/api/session/list", [this](const HttpRequest&, const RouteParams&) {
    std::map<std::string, std::string> list = sessions_.List();
    json payload;
    payload["sessions"] = list;
    payload["count"] = list.size();
    return ResultResponse(ActionResult::Success(), payload);
  });

  router.Add(HTTP_POST, "/api/session/implicitWait/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    int timeout = 0;
    if (!body.contains("timeout") || !ParseIntegerValue(body["timeout"], timeout)) {
      return BadRequest("Timeout is required and must be a number");
    }
    ActionResult r = sessions_.SetImplicitWait(p.at("sessionId"), timeout);
    json payload;
    if (r.success) {
      payload["timeout"] = timeout;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/session/implicitWait/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    int timeout = 0;
    ActionResult r = sessions_.GetImplicitWait(p.at("sessionId"), timeout);
    json payload;
    if (r.success) {
      payload["timeout"] = timeout;
    }
    return ResultResponse(r, payload);
  });
}

// ---- Navigation ----

void KiteApiHandlers::RegisterNavigationRoutes(KiteRouter& router) {
  router.Add(HTTP_POST, "/api/navigation/to/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string url;
    if (!ReadStringField(body, "url", url, error) || url.empty()) {
      return BadRequest(error.empty() ? "URL is required" : error);
    }
    int timeout = 0;
    if (!ReadTimeout(body, defaults_.page_load_timeout_s, timeout, error)) {
      return BadRequest(error);
    }

    std::string current_url;
    ActionResult r = automation_.Navigate(p.at("sessionId"), url, timeout, current_url);
    json payload;
    if (r.success) {
      payload["url"] = url;
      payload["currentUrl"] = current_url;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/navigation/url/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string url;
    ActionResult r = automation_.GetCurrentUrl(p.at("sessionId"), url);
    json payload;
    if (r.success) {
      payload["url"] = url;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/navigation/title/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string title;
    ActionResult r = automation_.GetTitle(p.at("sessionId"), title);
    json payload;
    if (r.success) {
      payload["title"] = title;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/navigation/source/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string source;
    ActionResult r = automation_.GetPageSource(p.at("sessionId"), source);
    json payload;
    if (r.success) {
      payload["pageSource"] = source;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/navigation/refresh/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.Refresh(p.at("sessionId")));
  });

  router.Add(HTTP_GET, "/api/navigation/back/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.Back(p.at("sessionId")));
  });

  router.Add(HTTP_GET, "/api/navigation/forward/{sessionId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.Forward(p.at("sessionId")));
  });
}

// ---- Elements ----

void KiteApiHandlers::RegisterElementRoutes(KiteRouter& router) {
  router.Add(HTTP_POST, "/api/element/find/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string type, value;
    if (!ReadStringField(body, "locatorType", type, error) ||
        !ReadStringField(body, "locatorValue", value, error)) {
      return BadRequest(error.empty() ? "Locator type and value are required" : error);
    }

    ElementSummary element;
    ActionResult r = automation_.FindElement(p.at("sessionId"), type, value, element);
    json payload;
    if (r.success) {
      payload = element.ToJSON();
      payload["found"] = true;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_POST, "/api/element/findAll/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string type, value;
    if (!ReadStringField(body, "locatorType", type, error) ||
        !ReadStringField(body, "locatorValue", value, error)) {
      return BadRequest(error.empty() ? "Locator type and value are required" : error);
    }

    std::vector<ElementSummary> elements;
    ActionResult r = automation_.FindElements(p.at("sessionId"), type, value, elements);
    json payload;
    if (r.success) {
      json list = json::array();
      for (const auto& element : elements) {
        list.push_back(element.ToJSON());
      }
      payload["count"] = elements.size();
      payload["elements"] = list;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/element/click/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    return ResultResponse(automation_.Click(p.at("sessionId"), p.at("elementId")));
  });

  router.Add(HTTP_POST, "/api/element/sendKeys/{sessionId}/{elementId}",
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
    bool clear_first = false;
    if (!ReadBoolField(body, "clearFirst", clear_first, error) && !error.empty()) {
      return BadRequest(error);
    }
    return ResultResponse(
        automation_.SendKeys(p.at("sessionId"), p.at("elementId"), text, clear_first));
  });

  router.Add(HTTP_GET, "/api/element/attribute/{sessionId}/{elementId}/{name}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string value;
    bool present = false;
    ActionResult r =
        automation_.GetAttribute(p.at("sessionId"), p.at("elementId"), p.at("name"), value, present);
    json payload;
    if (r.success) {
      payload["attributeName"] = p.at("name");
      payload["value"] = present ? json(value) : json(nullptr);
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/element/text/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    std::string text;
    ActionResult r = automation_.GetText(p.at("sessionId"), p.at("elementId"), text);
    json payload;
    if (r.success) {
      payload["text"] = text;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/element/isDisplayed/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    bool displayed = false;
    ActionResult r = automation_.IsDisplayed(p.at("sessionId"), p.at("elementId"), displayed);
    json payload;
    if (r.success) {
      payload["displayed"] = displayed;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/element/isEnabled/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    bool enabled = false;
    ActionResult r = automation_.IsEnabled(p.at("sessionId"), p.at("elementId"), enabled);
    json payload;
    if (r.success) {
      payload["enabled"] = enabled;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_GET, "/api/element/isSelected/{sessionId}/{elementId}",
             [this](const HttpRequest&, const RouteParams& p) {
    bool selected = false;
    ActionResult r = automation_.IsSelected(p.at("sessionId"), p.at("elementId"), selected);
    json payload;
    if (r.success) {
      payload["selected"] = selected;
    }
    return ResultResponse(r, payload);
  });
}

// ---- Waits ----

void KiteApiHandlers::RegisterWaitRoutes(KiteRouter& router) {
  router.Add(HTTP_POST, "/api/wait/explicit/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string type, value, condition;
    if (!ReadStringField(body, "locatorType", type, error) ||
        !ReadStringField(body, "locatorValue", value, error) ||
        !ReadStringField(body, "waitCondition", condition, error)) {
      return BadRequest(error.empty() ? "Locator type, value and wait condition are required"
                                      : error);
    }
    int timeout = 0;
    if (!ReadTimeout(body, defaults_.explicit_wait_timeout_s, timeout, error)) {
      return BadRequest(error);
    }
    std::string expected_text;
    if (!ReadStringField(body, "expectedText", expected_text, error) && !error.empty()) {
      return BadRequest(error);
    }

    WaitResult wait = automation_.WaitForElement(p.at("sessionId"), type, value, condition,
                                                 timeout, expected_text);
    return ResultResponse(wait.result, WaitPayload(wait, condition, timeout));
  });

  router.Add(HTTP_GET, "/api/wait/static/{sessionId}/{seconds}",
             [this](const HttpRequest&, const RouteParams& p) {
    int seconds = 0;
    if (!ParseIntegerValue(json(p.at("seconds")), seconds) || seconds < 1 ||
        seconds > defaults_.max_static_wait_s) {
      return BadRequest("Wait time must be between 1 and " +
                        std::to_string(defaults_.max_static_wait_s) + " seconds");
    }
    ActionResult r = automation_.StaticWait(p.at("sessionId"), seconds);
    json payload;
    if (r.success) {
      payload["waitTime"] = seconds;
    }
    return ResultResponse(r, payload);
  });

  router.Add(HTTP_POST, "/api/wait/javascript/{sessionId}",
             [this](const HttpRequest& req, const RouteParams& p) {
    json body;
    std::string error;
    if (!ParseJsonBody(req, body, error)) {
      return BadRequest(error);
    }
    std::string script;
    if (!ReadStringField(body, "script", script, error) || script.empty()) {
      return BadRequest(error.empty() ? "JavaScript code is required" : error);
    }
    int timeout = 0;
    if (!ReadTimeout(body, defaults_.script_wait_timeout_s, timeout, error)) {
      return BadRequest(error);
    }

    WaitResult wait = automation_.WaitForScript(p.at("sessionId"), script, timeout);
    return ResultResponse(wait.result, WaitPayload(wait, "", timeout));
  });
}

}  // namespace kite
