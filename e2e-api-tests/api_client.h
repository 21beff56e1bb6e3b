#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Blocking libcurl client for the gateway's REST API.
//
// Each call is one HTTP request. The parsed body is returned as-is;
// transport failures yield {"success": false, "status": "transport_error",
// "error": "..."} so callers always get an object.
class ApiClient {
public:
    explicit ApiClient(const std::string& base_url, int timeout_s = 120);

    json Get(const std::string& path);
    json Post(const std::string& path, const json& body = json::object());
    json Delete(const std::string& path);

    // Generic entry used by the runner
    json Send(const std::string& method, const std::string& path, const json& body = json());

    // True when GET /api/status answers with success
    bool IsReachable();

    // Metrics of the last request
    double GetLastResponseTimeMs() const { return last_response_time_ms_; }
    int64_t GetLastRequestSize() const { return last_request_size_; }
    int64_t GetLastResponseSize() const { return last_response_size_; }
    long GetLastHttpStatus() const { return last_http_status_; }

    const std::string& GetBaseUrl() const { return base_url_; }

    void SetVerbose(bool verbose) { verbose_ = verbose; }

private:
    std::string base_url_;
    int timeout_s_;
    bool verbose_ = false;

    double last_response_time_ms_ = 0.0;
    int64_t last_request_size_ = 0;
    int64_t last_response_size_ = 0;
    long last_http_status_ = 0;
};
