#include "captcha_types.h"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "captcha_error.h"
#include "constants.h"
#include "log.h"

Credentials::Credentials(const std::string& InputUsername, const std::string& InputPassword, const std::string& InputAuthToken) :
	UsernameValue(InputUsername), Password(InputPassword), AuthToken(InputAuthToken)
{
	if (AuthToken.empty() && (UsernameValue.empty() || Password.empty())) {
		throw ValidationError("either an authtoken or a username and password are required");
	}
}

Credentials Credentials::FromAuthToken(const std::string& InputAuthToken)
{
	return Credentials("", "", InputAuthToken);
}

std::vector<std::pair<std::string, std::string>> Credentials::Fields() const
{
	std::vector<std::pair<std::string, std::string>> Result;
	if (UsesAuthToken()) {
		Result.emplace_back("authtoken", AuthToken);
	}
	else {
		Result.emplace_back("username", UsernameValue);
		Result.emplace_back("password", Password);
	}
	return Result;
}

CaptchaSubmission::CaptchaSubmission(int InputType, const std::string& InputImage, ImageFormat InputFormat, const CaptchaParams& InputParams) :
	TypeCode(InputType), ImageBytes(InputImage), Format(InputFormat), ParamMap(InputParams)
{
}

CaptchaSubmission CaptchaSubmission::FromImage(const std::string& Bytes, int Type)
{
	if (Bytes.empty()) {
		throw ValidationError("captcha image is empty");
	}
	if (Bytes.size() > DBC_MAX_UPLOAD_SIZE) {
		throw ValidationError(vformat("captcha image is too large (%zu bytes, limit %d)", Bytes.size(), DBC_MAX_UPLOAD_SIZE));
	}

	ImageFormat Format = ImageSniffer::Classify(Bytes);
	if (Format == ImageFormat::Unknown) {
		throw ValidationError("unknown captcha image format");
	}

	return CaptchaSubmission(Type, Bytes, Format, CaptchaParams());
}

CaptchaSubmission CaptchaSubmission::FromFile(const std::string& Path, int Type)
{
	std::ifstream File(Path, std::ios::in | std::ios::binary);
	if (!File) {
		throw ValidationError("cannot open captcha file " + Path);
	}

	std::string Bytes((std::istreambuf_iterator<char>(File)), std::istreambuf_iterator<char>());
	if (File.bad()) {
		throw ValidationError("cannot read captcha file " + Path);
	}

	return FromImage(Bytes, Type);
}

CaptchaSubmission CaptchaSubmission::FromParams(int Type, const CaptchaParams& Params)
{
	if (Params.empty()) {
		throw ValidationError(vformat("captcha type %d needs a parameter payload", Type));
	}
	return CaptchaSubmission(Type, std::string(), ImageFormat::Unknown, Params);
}

CaptchaSubmission CaptchaSubmission::FromToken(int Type, const std::string& JsonPayload)
{
	const char* Field = TokenField(Type);
	if (!Field) {
		throw ValidationError(vformat("captcha type %d is not a token type", Type));
	}
	if (JsonPayload.empty()) {
		throw ValidationError(vformat("captcha type %d needs a parameter payload", Type));
	}

	CaptchaParams Params;
	Params[Field] = JsonPayload;
	return CaptchaSubmission(Type, std::string(), ImageFormat::Unknown, Params);
}

const char* CaptchaSubmission::TokenField(int Type)
{
	switch (Type) {
	case 4:  // reCAPTCHA v2
	case 5:  // reCAPTCHA v3
		return "token_params";
	case 7:
		return "hcaptcha_params";
	case 8:  // geetest v3
	case 9:  // geetest v4
		return "geetest_params";
	case 12:
		return "turnstile_params";
	case 14:
		return "lemin_params";
	case 16: // amazon waf
		return "waf_params";
	case 19:
		return "cutcaptcha_params";
	case 25: // reCAPTCHA v2 enterprise
		return "token_enterprise_params";
	default:
		return nullptr;
	}
}

const char* CaptchaSubmission::ImageField() const
{
	// image group captchas carry their grid as a banner
	return TypeCode == 3 ? "banner" : "captchafile";
}

int CaptchaSubmission::DefaultTimeout() const
{
	return IsImage() ? DBC_DEFAULT_TIMEOUT : DBC_DEFAULT_TOKEN_TIMEOUT;
}

const char* JobStatusName(JobStatus Status)
{
	switch (Status) {
	case JobStatus::Created:
		return "CREATED";
	case JobStatus::Submitted:
		return "SUBMITTED";
	case JobStatus::Polling:
		return "POLLING";
	case JobStatus::Solved:
		return "SOLVED";
	case JobStatus::Expired:
		return "EXPIRED";
	case JobStatus::Timeout:
		return "TIMEOUT";
	}
	return "UNKNOWN";
}

bool IsTerminal(JobStatus Status)
{
	return Status == JobStatus::Solved || Status == JobStatus::Expired || Status == JobStatus::Timeout;
}

CaptchaJob::CaptchaJob() :
	IdValue(0), StatusValue(JobStatus::Created), CorrectnessKnown(false), Correct(false)
{
}

void CaptchaJob::Start(TimePoint Now)
{
	if (StatusValue != JobStatus::Created) {
		throw std::logic_error("captcha job already started");
	}
	Created = Now;
}

void CaptchaJob::MarkSubmitted(CaptchaId Id)
{
	if (IdValue != 0) {
		throw std::logic_error("captcha job id is already assigned");
	}
	if (Id <= 0) {
		throw std::logic_error("captcha job id must be positive");
	}
	Advance(JobStatus::Submitted);
	IdValue = Id;
}

void CaptchaJob::MarkPolling()
{
	Advance(JobStatus::Polling);
}

void CaptchaJob::RecordPoll(const PollAttempt& Attempt)
{
	if (StatusValue != JobStatus::Polling) {
		throw std::logic_error("captcha job is not polling");
	}
	PollLog.push_back(Attempt);
}

void CaptchaJob::MarkSolved(const std::string& Text, TimePoint Now)
{
	if (Text.empty()) {
		throw std::logic_error("solved captcha needs a text");
	}
	Advance(JobStatus::Solved);
	TextValue = Text;
	CorrectnessKnown = true;
	Correct = true;
	Resolved = Now;
}

void CaptchaJob::MarkExpired(TimePoint Now)
{
	Advance(JobStatus::Expired);
	CorrectnessKnown = true;
	Correct = false;
	Resolved = Now;
}

void CaptchaJob::MarkTimedOut(TimePoint Now)
{
	Advance(JobStatus::Timeout);
	Resolved = Now;
}

void CaptchaJob::Advance(JobStatus Next)
{
	bool Allowed = false;
	switch (StatusValue) {
	case JobStatus::Created:
		Allowed = Next == JobStatus::Submitted;
		break;
	case JobStatus::Submitted:
		Allowed = Next == JobStatus::Polling;
		break;
	case JobStatus::Polling:
		Allowed = IsTerminal(Next);
		break;
	default:
		break;
	}

	if (!Allowed) {
		throw std::logic_error(vformat("captcha job cannot move from %s to %s", JobStatusName(StatusValue), JobStatusName(Next)));
	}
	StatusValue = Next;
}
