#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "action_result.h"
#include "kite_automation.h"
#include "kite_http_message.h"
#include "kite_router.h"
#include "kite_thread_pool.h"

namespace kite {

// Defaults applied when a request omits a timeout
struct ApiDefaults {
  int page_load_timeout_s = 30;
  int explicit_wait_timeout_s = 30;
  int script_wait_timeout_s = 30;
  int max_static_wait_s = 120;
};

// HTTP status for a failed operation. Successful results are always 200.
HttpStatus HttpStatusFor(ActionStatus status);

// result.ToJSON() merged with payload, with the mapped HTTP status
HttpResponse ResultResponse(const ActionResult& result,
                            const nlohmann::json& payload = nlohmann::json::object());

// Accepts a JSON integer, an integral float or a numeric string.
// Returns false for anything else.
bool ParseIntegerValue(const nlohmann::json& value, int& out);

// Parses a request body as a JSON object. An empty body yields {}.
bool ParseJsonBody(const HttpRequest& request, nlohmann::json& body, std::string& error);

// Field readers for request bodies. Each returns true when the key holds a
// usable value. A missing or null key returns false with error empty; a
// value of the wrong type returns false with error set. ReadStringField
// also accepts numbers and booleans, rendered as their JSON text.
bool ReadStringField(const nlohmann::json& body, const char* key, std::string& out,
                     std::string& error);
bool ReadBoolField(const nlohmann::json& body, const char* key, bool& out, std::string& error);

HttpResponse BadRequest(const std::string& message);

// REST surface over KiteAutomation.
//
// Every handler parses its path parameters and JSON body, calls exactly one
// façade operation and renders the ActionResult plus the operation payload.
class KiteApiHandlers {
public:
  KiteApiHandlers(KiteAutomation& automation, const ApiDefaults& defaults,
                  const ThreadPool* pool = nullptr);

  // Adds every /api route to router
  void Register(KiteRouter& router);

private:
  void RegisterSessionRoutes(KiteRouter& router);
  void RegisterNavigationRoutes(KiteRouter& router);
  void RegisterElementRoutes(KiteRouter& router);
  void RegisterWaitRoutes(KiteRouter& router);
  void RegisterFormRoutes(KiteRouter& router);
  void RegisterFrameRoutes(KiteRouter& router);
  void RegisterScriptRoutes(KiteRouter& router);
  void RegisterCookieRoutes(KiteRouter& router);
  void RegisterAssertionRoutes(KiteRouter& router);

  HttpResponse Status() const;

  KiteAutomation& automation_;
  KiteSessionRegistry& sessions_;
  ApiDefaults defaults_;
  const ThreadPool* pool_;
};

}  // namespace kite
