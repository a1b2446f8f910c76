#include "response_parser.h"

#include <cmath>

#include "captcha_error.h"
#include "log.h"

using json = nlohmann::json;

json ParseResponse(const std::string& Body)
{
	if (!Body.length() || Body[0] != '{') {
		throw TransportError("invalid API response: expected a JSON object");
	}

	try {
		return json::parse(Body);
	}
	catch (const json::exception& e) {
		throw TransportError(vformat("invalid API response: %s", e.what()));
	}
}

void CheckServerError(const json& Response)
{
	json::const_iterator Error = Response.find("error");
	if (Error == Response.end() || Error->is_null()) {
		return;
	}
	if (!Error->is_string()) {
		throw TransportError("invalid API response: malformed error field");
	}
	if (!Error->get<std::string>().empty()) {
		ThrowForServerError(Error->get<std::string>());
	}
}

static const json& RequireField(const json& Response, const char* Name)
{
	json::const_iterator Field = Response.find(Name);
	if (Field == Response.end() || Field->is_null()) {
		throw TransportError(vformat("invalid API response: missing \"%s\"", Name));
	}
	return *Field;
}

UserAccount ParseUserAccount(const json& Response)
{
	UserAccount Account;
	try {
		Account.UserId = RequireField(Response, "user").get<long long>();
		double Balance = RequireField(Response, "balance").get<double>();
		Account.BalanceCents = Balance > 0 ? static_cast<long long>(std::floor(Balance)) : 0;
		Account.Rate = Response.value("rate", 0.0);
		Account.IsBanned = Response.value("is_banned", false);
	}
	catch (const json::exception& e) {
		throw TransportError(vformat("invalid API response: %s", e.what()));
	}

	if (Account.UserId <= 0) {
		throw AuthenticationError("access denied, check your credentials");
	}
	return Account;
}

CaptchaStatus ParseCaptchaStatus(const json& Response)
{
	CaptchaStatus Status;
	try {
		Status.Id = RequireField(Response, "captcha").get<CaptchaId>();

		json::const_iterator Text = Response.find("text");
		if (Text != Response.end() && !Text->is_null()) {
			Status.Text = Text->get<std::string>();
		}

		json::const_iterator IsCorrect = Response.find("is_correct");
		if (IsCorrect != Response.end() && !IsCorrect->is_null()) {
			Status.IsCorrect = IsCorrect->get<bool>();
		}
	}
	catch (const json::exception& e) {
		throw TransportError(vformat("invalid API response: %s", e.what()));
	}
	return Status;
}

CaptchaId ParseCaptchaId(const json& Response)
{
	CaptchaId Id = 0;
	try {
		Id = RequireField(Response, "captcha").get<CaptchaId>();
	}
	catch (const json::exception& e) {
		throw TransportError(vformat("invalid API response: %s", e.what()));
	}

	if (Id <= 0) {
		throw TransportError("invalid API response: captcha id is not positive");
	}
	return Id;
}

bool ParseReportAck(const json& Response)
{
	try {
		json::const_iterator Reported = Response.find("reported");
		if (Reported != Response.end() && !Reported->is_null()) {
			return Reported->get<bool>();
		}
		// the service answers with the captcha, now flagged as incorrect
		return !RequireField(Response, "is_correct").get<bool>();
	}
	catch (const json::exception& e) {
		throw TransportError(vformat("invalid API response: %s", e.what()));
	}
}
