#include "api_client.h"
#include <curl/curl.h>
#include <chrono>
#include <iostream>

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

json TransportError(const std::string& message) {
    return {
        {"success", false},
        {"status", "transport_error"},
        {"error", message}
    };
}

}  // namespace

ApiClient::ApiClient(const std::string& base_url, int timeout_s)
    : base_url_(base_url), timeout_s_(timeout_s) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

json ApiClient::Get(const std::string& path) {
    return Send("GET", path);
}

json ApiClient::Post(const std::string& path, const json& body) {
    return Send("POST", path, body);
}

json ApiClient::Delete(const std::string& path) {
    return Send("DELETE", path);
}

json ApiClient::Send(const std::string& method, const std::string& path, const json& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return TransportError("Failed to initialize CURL");
    }

    std::string url = base_url_ + path;
    std::string payload = body.is_null() ? std::string() : body.dump();
    std::string response_data;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s_));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Self-signed gateway certificates in test setups
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);

    if (verbose_) {
        std::cerr << "[HTTP] " << method << " " << path;
        if (!payload.empty()) {
            std::cerr << " " << payload;
        }
        std::cerr << std::endl;
    }

    auto start = std::chrono::high_resolution_clock::now();
    CURLcode res = curl_easy_perform(curl);
    auto end = std::chrono::high_resolution_clock::now();

    last_response_time_ms_ = std::chrono::duration<double, std::milli>(end - start).count();
    last_request_size_ = static_cast<int64_t>(payload.size());
    last_response_size_ = static_cast<int64_t>(response_data.size());
    last_http_status_ = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &last_http_status_);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return TransportError(curl_easy_strerror(res));
    }

    json response = json::parse(response_data, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return TransportError("Response is not a JSON object (HTTP " +
                              std::to_string(last_http_status_) + ")");
    }

    if (verbose_) {
        std::cerr << "[HTTP] <- " << last_http_status_ << " " << response.dump() << std::endl;
    }
    return response;
}

bool ApiClient::IsReachable() {
    json status = Get("/api/status");
    return status.value("success", false);
}
