#include "response_validator.h"
#include <cctype>

const std::vector<std::string> ResponseValidator::VALID_STATUS_CODES = {
    // Success
    "ok",
    "page_load_incomplete",
    // Session errors
    "session_not_found",
    "driver_startup_failed",
    // Element errors
    "element_not_found",
    "element_stale",
    "invalid_locator",
    // Validation errors
    "invalid_parameter",
    "option_not_found",
    // Page state errors
    "no_alert_present",
    "frame_not_found",
    "cookie_not_found",
    // System errors
    "timeout",
    "driver_error",
    "internal_error",
    // Router
    "not_found",
    "method_not_allowed",
    // Unknown
    "unknown"
};

namespace {

// 8-4-4-4-12 lowercase hex
bool IsUuid(const std::string& id) {
    if (id.size() != 36) return false;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool ResponseValidator::IsActionResult(const json& response) {
    if (!response.is_object()) return false;
    return response.contains("success") && response["success"].is_boolean() &&
           response.contains("status") && response["status"].is_string();
}

bool ResponseValidator::IsTransportError(const json& response) {
    return HasStatus(response, "transport_error");
}

bool ResponseValidator::IsSuccess(const json& response) {
    return IsActionResult(response) && response["success"].get<bool>();
}

bool ResponseValidator::HasStatus(const json& response, const std::string& status) {
    if (!IsActionResult(response)) return false;
    return response["status"].get<std::string>() == status;
}

std::string ResponseValidator::GetStatus(const json& response) {
    if (IsActionResult(response)) {
        return response["status"].get<std::string>();
    }
    return "unknown";
}

std::string ResponseValidator::GetMessage(const json& response) {
    if (response.contains("message") && response["message"].is_string()) {
        return response["message"].get<std::string>();
    }
    if (response.contains("error") && response["error"].is_string()) {
        return response["error"].get<std::string>();
    }
    return "";
}

bool ResponseValidator::ValidateSessionId(const json& response) {
    if (!IsSuccess(response) || !response.contains("sessionId")) return false;
    if (!response["sessionId"].is_string()) return false;
    return IsUuid(response["sessionId"].get<std::string>());
}

bool ResponseValidator::ValidateElementId(const json& response) {
    if (!IsSuccess(response) || !response.contains("elementId")) return false;
    if (!response["elementId"].is_string()) return false;
    return IsUuid(response["elementId"].get<std::string>());
}

bool ResponseValidator::ValidateBase64Image(const json& response) {
    if (!IsSuccess(response) || !response.contains("screenshot")) return false;
    if (!response["screenshot"].is_string()) return false;
    std::string data = response["screenshot"].get<std::string>();
    // PNG starts with specific base64 sequence
    return data.length() > 100 && data.substr(0, 4) == "iVBO";
}

bool ResponseValidator::ValidateActionResultFields(const json& response) {
    if (!IsActionResult(response)) return false;

    // Success carries "message", failure carries "error"
    const char* text_key = response["success"].get<bool>() ? "message" : "error";
    if (!response.contains(text_key) || !response[text_key].is_string()) return false;

    // Optional fields should have correct types if present
    if (response.contains("selector") && !response["selector"].is_string()) return false;
    if (response.contains("url") && !response["url"].is_string()) return false;
    if (response.contains("warning") && !response["warning"].is_string()) return false;
    if (response.contains("error_code") && !response["error_code"].is_string()) return false;

    return IsValidStatusCode(response["status"].get<std::string>());
}

bool ResponseValidator::IsValidStatusCode(const std::string& status) {
    for (const auto& code : VALID_STATUS_CODES) {
        if (code == status) return true;
    }
    return false;
}
