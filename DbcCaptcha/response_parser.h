#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "captcha_types.h"

// Parses a response body; anything that is not a JSON object is a TransportError.
nlohmann::json ParseResponse(const std::string& Body);

// Throws the matching CaptchaError when the response carries an "error" code.
void CheckServerError(const nlohmann::json& Response);

UserAccount ParseUserAccount(const nlohmann::json& Response);
CaptchaStatus ParseCaptchaStatus(const nlohmann::json& Response);
CaptchaId ParseCaptchaId(const nlohmann::json& Response);
bool ParseReportAck(const nlohmann::json& Response);
