#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// HTTP/1.1 request parsing and response serialization for the API server.
// One request per connection; no chunked transfer encoding.

namespace kite {

enum HttpMethod {
  HTTP_GET,
  HTTP_POST,
  HTTP_PUT,
  HTTP_DELETE,
  HTTP_OPTIONS,
  HTTP_UNKNOWN
};

enum HttpStatus {
  HTTP_200_OK = 200,
  HTTP_400_BAD_REQUEST = 400,
  HTTP_404_NOT_FOUND = 404,
  HTTP_405_METHOD_NOT_ALLOWED = 405,
  HTTP_408_REQUEST_TIMEOUT = 408,
  HTTP_410_GONE = 410,
  HTTP_413_PAYLOAD_TOO_LARGE = 413,
  HTTP_500_INTERNAL_ERROR = 500,
  HTTP_503_SERVICE_UNAVAILABLE = 503
};

struct HttpRequest {
  HttpMethod method = HTTP_UNKNOWN;
  std::string method_name;                     // as received, for logs
  std::string path;                            // raw, still percent-encoded
  std::string query_string;
  std::map<std::string, std::string> headers;  // lowercase names
  std::string body;
  std::string client_ip;

  // Empty when absent
  std::string Header(const std::string& lowercase_name) const;
};

struct HttpResponse {
  HttpStatus status = HTTP_200_OK;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;  // extra headers (Allow, ...)
};

enum class ParseStatus {
  COMPLETE,
  INCOMPLETE,   // need more bytes
  MALFORMED,
  TOO_LARGE     // Content-Length above the limit
};

// Upper bound for the request line plus headers
constexpr size_t kMaxHeaderBytes = 64 * 1024;

// Parses one request from the bytes received so far
ParseStatus ParseHttpRequest(const std::string& data, size_t max_body_bytes,
                             HttpRequest& request);

HttpMethod ParseHttpMethod(const std::string& name);
const char* HttpMethodToString(HttpMethod method);
const char* HttpStatusText(HttpStatus status);

// Status line, Content-Type, Content-Length, Connection: close, extra headers, body
std::string SerializeHttpResponse(const HttpResponse& response);

// JSON body response. Invalid UTF-8 in strings is replaced, never thrown on.
HttpResponse MakeJsonResponse(HttpStatus status, const nlohmann::json& body);

}  // namespace kite
