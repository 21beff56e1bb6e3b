#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "kite_http_message.h"

namespace kite {

using RouteParams = std::map<std::string, std::string>;
using RouteHandler = std::function<HttpResponse(const HttpRequest&, const RouteParams&)>;

// Decodes %XX escapes; '+' is kept literally unless plus_as_space
std::string UrlDecode(const std::string& text, bool plus_as_space = false);

// "/a/b/" -> {"a", "b"}; empty segments are dropped
std::vector<std::string> SplitPath(const std::string& path);

// Method + path pattern dispatch.
//
// Patterns are slash-separated literal segments and {name} captures, e.g.
// "/api/element/click/{sessionId}/{elementId}". Captured values are
// percent-decoded. When several patterns match, the one with more literal
// segments wins, then the one registered first. A path that matches only
// under other methods yields 405, no match at all yields 404.
class KiteRouter {
public:
  enum class MatchResult { MATCHED, NOT_FOUND, METHOD_NOT_ALLOWED };

  void Add(HttpMethod method, const std::string& pattern, RouteHandler handler);

  // On METHOD_NOT_ALLOWED, allowed lists the methods that would match
  MatchResult Match(HttpMethod method, const std::string& path, const RouteHandler** handler,
                    RouteParams& params, std::vector<HttpMethod>& allowed) const;

  // Runs the matching handler. Handler exceptions become a 500 response.
  HttpResponse Dispatch(const HttpRequest& request) const;

  size_t size() const { return routes_.size(); }

private:
  struct Route {
    HttpMethod method;
    std::string pattern;
    std::vector<std::string> segments;
    size_t literal_count;
    RouteHandler handler;
  };

  static bool MatchSegments(const Route& route, const std::vector<std::string>& segments,
                            RouteParams& params);

  std::vector<Route> routes_;
};

}  // namespace kite
