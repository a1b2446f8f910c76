#pragma once

#include <atomic>
#include <string>

#include "captcha_types.h"
#include "poll_scheduler.h"

// Operations every transport to the solving service offers.
class TransportClient {
public:
	explicit TransportClient(const Credentials& InputCredentials);
	virtual ~TransportClient() {}

	TransportClient(const TransportClient&) = delete;
	TransportClient& operator=(const TransportClient&) = delete;

	virtual UserAccount GetUser() = 0;
	virtual long long GetBalance();

	// Uploads a captcha and returns the id the service assigned to it.
	virtual CaptchaId Submit(const CaptchaSubmission& Submission) = 0;
	virtual CaptchaStatus CheckStatus(CaptchaId Id) = 0;

	// Reports a solved captcha as incorrectly solved. True when the service
	// accepted the report.
	virtual bool Report(CaptchaId Id) = 0;

	virtual void Close() = 0;

	/*
	Submits the captcha and polls it until it is solved, the service gives up
	on it or Timeout runs out. Running out of time is a normal outcome and
	yields a job in the TIMEOUT state; the captcha may still be solved
	remotely afterwards. A zero Timeout picks the submission's default.
	*/
	CaptchaJob Decode(const CaptchaSubmission& Submission, Milliseconds Timeout, Clock& TimeSource);

	void SetVerbose(bool Enabled) { Verbose = Enabled; }
	bool IsVerbose() const { return Verbose; }

protected:
	const Credentials& Auth() const { return CredentialsValue; }

	// Writes request/response traffic when verbose mode is on.
	void LogTraffic(const char* Direction, const std::string& Command, const std::string& Payload) const;

private:
	const Credentials CredentialsValue;
	std::atomic<bool> Verbose;
};
