#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "captcha_types.h"
#include "http_transport.h"
#include "poll_scheduler.h"
#include "socket_transport.h"
#include "transport.h"

/*
Entry point of the library. Wraps one transport, picked when the client is
built, and turns an upload into a finished job:

	std::unique_ptr<CaptchaClient> Client = CaptchaClient::Socket(Credentials("user", "password"));
	CaptchaJob Job = Client->DecodeFile("captcha.png");
	if (Job.IsSolved()) ...

The transport is closed when the client goes away.
*/
class CaptchaClient {
public:
	explicit CaptchaClient(std::unique_ptr<TransportClient> InputTransport, Clock& InputClock = SteadyClock::Instance());
	~CaptchaClient();

	CaptchaClient(const CaptchaClient&) = delete;
	CaptchaClient& operator=(const CaptchaClient&) = delete;

	static std::unique_ptr<CaptchaClient> Http(const Credentials& InputCredentials, const HttpOptions& Options = HttpOptions());
	static std::unique_ptr<CaptchaClient> Socket(const Credentials& InputCredentials, const SocketOptions& Options = SocketOptions());

	long long GetBalance();
	UserAccount GetUser();

	// TimeoutSeconds of 0 uses the default for the kind of captcha.
	CaptchaJob DecodeImage(const std::string& ImageBytes, int TimeoutSeconds = 0, int Type = 0);
	CaptchaJob DecodeFile(const std::string& Path, int TimeoutSeconds = 0, int Type = 0);
	CaptchaJob DecodeToken(int Type, const std::string& JsonPayload, int TimeoutSeconds = 0);
	CaptchaJob Decode(const CaptchaSubmission& Submission, int TimeoutSeconds = 0);

	// A captcha is reported at most once; repeating an accepted report answers
	// false without asking the service again.
	bool Report(CaptchaId Id);
	void Close();

	void SetVerbose(bool Enabled);
	Clock& TimeSource() { return ClockValue; }

private:
	std::unique_ptr<TransportClient> Transport;
	Clock& ClockValue;
	std::mutex ReportMutex;
	std::set<CaptchaId> ReportedIds;
};
