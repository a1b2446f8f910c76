#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
	Authentication, // bad credentials, banned account, insufficient balance
	Validation,     // payload rejected locally or by the server
	Overload,       // solver pool busy or rate limited
	Transport       // connection failures and malformed responses
};

const char* ErrorKindName(ErrorKind Kind);

class CaptchaError : public std::runtime_error {
public:
	CaptchaError(ErrorKind InputKind, const std::string& Message);

	ErrorKind Kind() const { return ErrorKindValue; }

	// Overload and transport failures may succeed when tried again.
	bool IsRetryable() const;

private:
	ErrorKind ErrorKindValue;
};

class AuthenticationError : public CaptchaError {
public:
	explicit AuthenticationError(const std::string& Message) : CaptchaError(ErrorKind::Authentication, Message) {}
};

class ValidationError : public CaptchaError {
public:
	explicit ValidationError(const std::string& Message) : CaptchaError(ErrorKind::Validation, Message) {}
};

class OverloadError : public CaptchaError {
public:
	explicit OverloadError(const std::string& Message) : CaptchaError(ErrorKind::Overload, Message) {}
};

class TransportError : public CaptchaError {
public:
	explicit TransportError(const std::string& Message) : CaptchaError(ErrorKind::Transport, Message) {}
};

// Maps an "error" code reported by the service to the matching exception.
// Unknown codes become TransportError.
[[noreturn]] void ThrowForServerError(const std::string& Code);
