#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class ResponseValidator {
public:
    // Every gateway response carries "success" and "status"
    static bool IsActionResult(const json& response);
    static bool IsTransportError(const json& response);

    // ActionResult helpers
    static bool IsSuccess(const json& response);
    static bool HasStatus(const json& response, const std::string& status);
    static std::string GetStatus(const json& response);
    static std::string GetMessage(const json& response);

    // Validate specific payloads
    static bool ValidateSessionId(const json& response);
    static bool ValidateElementId(const json& response);
    static bool ValidateBase64Image(const json& response);
    static bool ValidateActionResultFields(const json& response);

    // ActionStatus codes plus the router's own
    static const std::vector<std::string> VALID_STATUS_CODES;

    static bool IsValidStatusCode(const std::string& status);
};
