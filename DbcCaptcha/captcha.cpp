#include "captcha.h"

#include <stdexcept>

#include "captcha_error.h"
#include "log.h"

CaptchaClient::CaptchaClient(std::unique_ptr<TransportClient> InputTransport, Clock& InputClock) :
	Transport(std::move(InputTransport)), ClockValue(InputClock)
{
	if (!Transport) {
		throw std::invalid_argument("CaptchaClient needs a transport");
	}
}

CaptchaClient::~CaptchaClient()
{
	try {
		Transport->Close();
	}
	catch (const std::exception& e) {
		DBC_LOG_ERROR("closing the transport failed: %s", e.what());
	}
}

std::unique_ptr<CaptchaClient> CaptchaClient::Http(const Credentials& InputCredentials, const HttpOptions& Options)
{
	return std::make_unique<CaptchaClient>(std::make_unique<HttpTransport>(InputCredentials, Options));
}

std::unique_ptr<CaptchaClient> CaptchaClient::Socket(const Credentials& InputCredentials, const SocketOptions& Options)
{
	return std::make_unique<CaptchaClient>(std::make_unique<SocketTransport>(InputCredentials, Options));
}

long long CaptchaClient::GetBalance()
{
	return Transport->GetBalance();
}

UserAccount CaptchaClient::GetUser()
{
	return Transport->GetUser();
}

CaptchaJob CaptchaClient::DecodeImage(const std::string& ImageBytes, int TimeoutSeconds, int Type)
{
	return Decode(CaptchaSubmission::FromImage(ImageBytes, Type), TimeoutSeconds);
}

CaptchaJob CaptchaClient::DecodeFile(const std::string& Path, int TimeoutSeconds, int Type)
{
	return Decode(CaptchaSubmission::FromFile(Path, Type), TimeoutSeconds);
}

CaptchaJob CaptchaClient::DecodeToken(int Type, const std::string& JsonPayload, int TimeoutSeconds)
{
	return Decode(CaptchaSubmission::FromToken(Type, JsonPayload), TimeoutSeconds);
}

CaptchaJob CaptchaClient::Decode(const CaptchaSubmission& Submission, int TimeoutSeconds)
{
	if (TimeoutSeconds < 0) {
		throw ValidationError("timeout must not be negative");
	}

	CaptchaJob Job = Transport->Decode(Submission, std::chrono::seconds(TimeoutSeconds), ClockValue);
	if (Job.IsSolved()) {
		DBC_LOG_INFO("captcha %lld solved: %s", Job.Id(), Job.Text().c_str());
	}
	return Job;
}

bool CaptchaClient::Report(CaptchaId Id)
{
	if (Id <= 0) {
		throw ValidationError("captcha id must be positive");
	}

	std::lock_guard<std::mutex> Lock(ReportMutex);
	if (ReportedIds.count(Id)) {
		DBC_LOG_WARN("captcha %lld was already reported", Id);
		return false;
	}
	bool Reported = Transport->Report(Id);
	if (Reported) {
		ReportedIds.insert(Id);
	}
	return Reported;
}

void CaptchaClient::Close()
{
	Transport->Close();
}

void CaptchaClient::SetVerbose(bool Enabled)
{
	Transport->SetVerbose(Enabled);
}
