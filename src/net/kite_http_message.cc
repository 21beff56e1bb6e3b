#include "kite_http_message.h"
#include <algorithm>
#include <cctype>

namespace kite {

namespace {

std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

std::string HttpRequest::Header(const std::string& lowercase_name) const {
  auto it = headers.find(lowercase_name);
  return it == headers.end() ? std::string() : it->second;
}

HttpMethod ParseHttpMethod(const std::string& name) {
  if (name == "GET") return HTTP_GET;
  if (name == "POST") return HTTP_POST;
  if (name == "PUT") return HTTP_PUT;
  if (name == "DELETE") return HTTP_DELETE;
  if (name == "OPTIONS") return HTTP_OPTIONS;
  return HTTP_UNKNOWN;
}

const char* HttpMethodToString(HttpMethod method) {
  switch (method) {
    case HTTP_GET: return "GET";
    case HTTP_POST: return "POST";
    case HTTP_PUT: return "PUT";
    case HTTP_DELETE: return "DELETE";
    case HTTP_OPTIONS: return "OPTIONS";
    default: return "UNKNOWN";
  }
}

const char* HttpStatusText(HttpStatus status) {
  switch (status) {
    case HTTP_200_OK: return "OK";
    case HTTP_400_BAD_REQUEST: return "Bad Request";
    case HTTP_404_NOT_FOUND: return "Not Found";
    case HTTP_405_METHOD_NOT_ALLOWED: return "Method Not Allowed";
    case HTTP_408_REQUEST_TIMEOUT: return "Request Timeout";
    case HTTP_410_GONE: return "Gone";
    case HTTP_413_PAYLOAD_TOO_LARGE: return "Payload Too Large";
    case HTTP_500_INTERNAL_ERROR: return "Internal Server Error";
    case HTTP_503_SERVICE_UNAVAILABLE: return "Service Unavailable";
    default: return "Unknown";
  }
}

ParseStatus ParseHttpRequest(const std::string& data, size_t max_body_bytes,
                             HttpRequest& request) {
  size_t header_end = data.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return data.size() > kMaxHeaderBytes ? ParseStatus::MALFORMED : ParseStatus::INCOMPLETE;
  }
  if (header_end > kMaxHeaderBytes) {
    return ParseStatus::MALFORMED;
  }

  // Request line: METHOD SP target SP HTTP/x.y
  size_t line_end = data.find("\r\n");
  std::string request_line = data.substr(0, line_end);
  size_t sp1 = request_line.find(' ');
  size_t sp2 = sp1 == std::string::npos ? std::string::npos : request_line.find(' ', sp1 + 1);
  if (sp1 == std::string::npos || sp2 == std::string::npos ||
      request_line.compare(sp2 + 1, 5, "HTTP/") != 0) {
    return ParseStatus::MALFORMED;
  }

  request.method_name = request_line.substr(0, sp1);
  request.method = ParseHttpMethod(request.method_name);
  std::string target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  if (target.empty() || target[0] != '/') {
    return ParseStatus::MALFORMED;
  }
  size_t query_pos = target.find('?');
  if (query_pos != std::string::npos) {
    request.path = target.substr(0, query_pos);
    request.query_string = target.substr(query_pos + 1);
  } else {
    request.path = target;
    request.query_string.clear();
  }

  // Headers
  request.headers.clear();
  size_t pos = line_end + 2;
  while (pos < header_end) {
    size_t next = data.find("\r\n", pos);
    std::string line = data.substr(pos, next - pos);
    pos = next + 2;
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      return ParseStatus::MALFORMED;
    }
    request.headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
  }

  if (!request.Header("transfer-encoding").empty()) {
    return ParseStatus::MALFORMED;
  }

  size_t content_length = 0;
  std::string length_header = request.Header("content-length");
  if (!length_header.empty()) {
    if (length_header.size() > 15 ||
        !std::all_of(length_header.begin(), length_header.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return ParseStatus::MALFORMED;
    }
    content_length = std::stoull(length_header);
    if (content_length > max_body_bytes) {
      return ParseStatus::TOO_LARGE;
    }
  }

  size_t body_start = header_end + 4;
  if (data.size() < body_start + content_length) {
    return ParseStatus::INCOMPLETE;
  }
  request.body = data.substr(body_start, content_length);
  return ParseStatus::COMPLETE;
}

std::string SerializeHttpResponse(const HttpResponse& response) {
  std::string out = "HTTP/1.1 " + std::to_string(static_cast<int>(response.status)) + " " +
                    HttpStatusText(response.status) + "\r\n";
  out += "Content-Type: " + response.content_type + "\r\n";
  out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
  for (const auto& header : response.headers) {
    out += header.first + ": " + header.second + "\r\n";
  }
  out += "Connection: close\r\n";
  out += "\r\n";
  out += response.body;
  return out;
}

HttpResponse MakeJsonResponse(HttpStatus status, const nlohmann::json& body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

}  // namespace kite
