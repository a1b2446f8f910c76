#pragma once

#include <memory>
#include <string>
#include <vector>

#include "constants.h"
#include "response_parser.h"
#include "transport.h"

struct HttpOptions {
	std::string BaseUrl = DBC_HTTP_BASE_URL;
	std::string Proxy; // e.g. "http://127.0.0.1:8080", empty for a direct connection
	long TimeoutSeconds = DBC_HTTP_REQUEST_TIMEOUT;
	std::string UserAgent = DBC_API_VERSION;
};

// A form field; parts with a FileName are sent as file uploads.
struct FormPart {
	std::string Name;
	std::string Value;
	std::string FileName;
	std::string ContentType;
};

struct HttpResponse {
	long StatusCode = 0;
	std::string Body;
	std::string Location;
};

class HttpSession {
public:
	virtual ~HttpSession() {}

	// Fields are URL-encoded into the query string.
	virtual HttpResponse Get(const std::string& Url, const std::vector<FormPart>& Fields) = 0;
	// Fields are sent as a multipart/form-data body.
	virtual HttpResponse Post(const std::string& Url, const std::vector<FormPart>& Fields) = 0;
};

// libcurl backed session. Every request uses its own easy handle, so one
// session may serve any number of threads.
class CurlSession : public HttpSession {
public:
	explicit CurlSession(const HttpOptions& InputOptions);

	HttpResponse Get(const std::string& Url, const std::vector<FormPart>& Fields) override;
	HttpResponse Post(const std::string& Url, const std::vector<FormPart>& Fields) override;

private:
	HttpOptions Options;
};

class HttpTransport : public TransportClient {
public:
	explicit HttpTransport(const Credentials& InputCredentials, const HttpOptions& InputOptions = HttpOptions());
	HttpTransport(const Credentials& InputCredentials, std::unique_ptr<HttpSession> InputSession, const HttpOptions& InputOptions = HttpOptions());

	UserAccount GetUser() override;
	CaptchaId Submit(const CaptchaSubmission& Submission) override;
	CaptchaStatus CheckStatus(CaptchaId Id) override;
	bool Report(CaptchaId Id) override;

	// Nothing to release: no connection outlives a request.
	void Close() override {}

private:
	std::vector<FormPart> AuthFields() const;
	std::string Url(const std::string& Resource) const;

	// Classifies the response and returns its JSON body.
	nlohmann::json Evaluate(const std::string& Command, const HttpResponse& Response) const;

	HttpOptions Options;
	std::unique_ptr<HttpSession> Session;
};
