#include "captcha_error.h"

const char* ErrorKindName(ErrorKind Kind)
{
	switch (Kind) {
	case ErrorKind::Authentication:
		return "authentication";
	case ErrorKind::Validation:
		return "validation";
	case ErrorKind::Overload:
		return "overload";
	case ErrorKind::Transport:
		return "transport";
	}
	return "unknown";
}

CaptchaError::CaptchaError(ErrorKind InputKind, const std::string& Message) :
	std::runtime_error(Message), ErrorKindValue(InputKind)
{
}

bool CaptchaError::IsRetryable() const
{
	return ErrorKindValue == ErrorKind::Overload || ErrorKindValue == ErrorKind::Transport;
}

void ThrowForServerError(const std::string& Code)
{
	if (Code == "not-logged-in" || Code == "invalid-credentials") {
		throw AuthenticationError("access denied, check your credentials");
	}
	if (Code == "banned") {
		throw AuthenticationError("access denied, account is suspended");
	}
	if (Code == "insufficient-funds") {
		throw AuthenticationError("access denied, balance is too low");
	}
	if (Code == "invalid-captcha" || Code == "upload-failed") {
		throw ValidationError("captcha was rejected by the service: " + Code);
	}
	if (Code == "service-overload") {
		throw OverloadError("captcha was rejected due to service overload, try again later");
	}
	throw TransportError("service reported an error: " + Code);
}
