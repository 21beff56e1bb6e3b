#include "kite_router.h"
#include "logger.h"
#include <algorithm>
#include <exception>

using json = nlohmann::json;

namespace kite {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool IsCapture(const std::string& segment) {
  return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

HttpResponse ErrorResponse(HttpStatus status, const std::string& code, const std::string& error) {
  json body;
  body["success"] = false;
  body["status"] = code;
  body["error"] = error;
  return MakeJsonResponse(status, body);
}

}  // namespace

std::string UrlDecode(const std::string& text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      int hi = HexValue(text[i + 1]);
      int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t slash = path.find('/', start);
    if (slash == std::string::npos) {
      slash = path.size();
    }
    if (slash > start) {
      segments.push_back(path.substr(start, slash - start));
    }
    start = slash + 1;
  }
  return segments;
}

void KiteRouter::Add(HttpMethod method, const std::string& pattern, RouteHandler handler) {
  Route route;
  route.method = method;
  route.pattern = pattern;
  route.segments = SplitPath(pattern);
  route.literal_count = 0;
  for (const auto& segment : route.segments) {
    if (!IsCapture(segment)) {
      ++route.literal_count;
    }
  }
  route.handler = std::move(handler);
  routes_.push_back(std::move(route));
}

bool KiteRouter::MatchSegments(const Route& route, const std::vector<std::string>& segments,
                               RouteParams& params) {
  if (route.segments.size() != segments.size()) {
    return false;
  }
  RouteParams captured;
  for (size_t i = 0; i < segments.size(); ++i) {
    const std::string& expected = route.segments[i];
    if (IsCapture(expected)) {
      captured[expected.substr(1, expected.size() - 2)] = UrlDecode(segments[i]);
    } else if (expected != segments[i]) {
      return false;
    }
  }
  params = std::move(captured);
  return true;
}

KiteRouter::MatchResult KiteRouter::Match(HttpMethod method, const std::string& path,
                                          const RouteHandler** handler, RouteParams& params,
                                          std::vector<HttpMethod>& allowed) const {
  std::vector<std::string> segments = SplitPath(path);
  const Route* best = nullptr;
  RouteParams best_params;
  allowed.clear();

  for (const auto& route : routes_) {
    RouteParams candidate;
    if (!MatchSegments(route, segments, candidate)) {
      continue;
    }
    if (route.method != method) {
      if (std::find(allowed.begin(), allowed.end(), route.method) == allowed.end()) {
        allowed.push_back(route.method);
      }
      continue;
    }
    if (!best || route.literal_count > best->literal_count) {
      best = &route;
      best_params = std::move(candidate);
    }
  }

  if (best) {
    allowed.clear();
    *handler = &best->handler;
    params = std::move(best_params);
    return MatchResult::MATCHED;
  }
  return allowed.empty() ? MatchResult::NOT_FOUND : MatchResult::METHOD_NOT_ALLOWED;
}

HttpResponse KiteRouter::Dispatch(const HttpRequest& request) const {
  const RouteHandler* handler = nullptr;
  RouteParams params;
  std::vector<HttpMethod> allowed;

  MatchResult match = Match(request.method, request.path, &handler, params, allowed);
  if (match == MatchResult::NOT_FOUND) {
    return ErrorResponse(HTTP_404_NOT_FOUND, "not_found",
                         "No route for " + request.method_name + " " + request.path);
  }
  if (match == MatchResult::METHOD_NOT_ALLOWED) {
    HttpResponse response = ErrorResponse(
        HTTP_405_METHOD_NOT_ALLOWED, "method_not_allowed",
        "Method " + request.method_name + " not allowed for " + request.path);
    std::string allow;
    for (HttpMethod m : allowed) {
      if (!allow.empty()) {
        allow += ", ";
      }
      allow += HttpMethodToString(m);
    }
    response.headers["Allow"] = allow;
    return response;
  }

  try {
    return (*handler)(request, params);
  } catch (const std::exception& e) {
    LOG_ERROR("Router", request.method_name + " " + request.path + " failed: " + e.what());
    return ErrorResponse(HTTP_500_INTERNAL_ERROR, "internal_error",
                         std::string("Internal error: ") + e.what());
  }
}

}  // namespace kite
