#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "image_sniffer.h"
#include "poll_scheduler.h"

typedef long long CaptchaId;
typedef std::map<std::string, std::string> CaptchaParams;

class Credentials {
public:
	// An authtoken, when given, takes precedence over the username/password pair.
	Credentials(const std::string& InputUsername, const std::string& InputPassword, const std::string& InputAuthToken = "");

	static Credentials FromAuthToken(const std::string& InputAuthToken);

	bool UsesAuthToken() const { return !AuthToken.empty(); }
	const std::string& Username() const { return UsernameValue; }

	// The active credential form as request fields.
	std::vector<std::pair<std::string, std::string>> Fields() const;

private:
	std::string UsernameValue;
	std::string Password;
	std::string AuthToken;
};

class CaptchaSubmission {
public:
	static CaptchaSubmission FromImage(const std::string& Bytes, int Type = 0);
	static CaptchaSubmission FromFile(const std::string& Path, int Type = 0);
	static CaptchaSubmission FromParams(int Type, const CaptchaParams& Params);
	static CaptchaSubmission FromToken(int Type, const std::string& JsonPayload);

	// Name of the field a token payload of this type is uploaded under, or
	// nullptr for types that are not token based.
	static const char* TokenField(int Type);

	bool IsImage() const { return Format != ImageFormat::Unknown; }
	const std::string& Image() const { return ImageBytes; }
	ImageFormat ImageType() const { return Format; }
	const char* ImageField() const;

	int Type() const { return TypeCode; }
	const CaptchaParams& Params() const { return ParamMap; }

	int DefaultTimeout() const;

private:
	CaptchaSubmission(int InputType, const std::string& InputImage, ImageFormat InputFormat, const CaptchaParams& InputParams);

	int TypeCode;
	std::string ImageBytes;
	ImageFormat Format;
	CaptchaParams ParamMap;
};

enum class JobStatus {
	Created,
	Submitted,
	Polling,
	Solved,
	Expired,
	Timeout
};

const char* JobStatusName(JobStatus Status);
bool IsTerminal(JobStatus Status);

// What the service currently knows about an uploaded captcha.
struct CaptchaStatus {
	CaptchaId Id = 0;
	std::string Text;
	bool IsCorrect = true;
};

class CaptchaJob {
public:
	CaptchaJob();

	CaptchaId Id() const { return IdValue; }
	JobStatus Status() const { return StatusValue; }
	const std::string& Text() const { return TextValue; }
	bool HasCorrectness() const { return CorrectnessKnown; }
	bool IsCorrect() const { return Correct; }
	TimePoint CreatedAt() const { return Created; }
	TimePoint ResolvedAt() const { return Resolved; }
	const std::vector<PollAttempt>& Polls() const { return PollLog; }

	bool IsSolved() const { return StatusValue == JobStatus::Solved; }

	void Start(TimePoint Now);
	void MarkSubmitted(CaptchaId Id);
	void MarkPolling();
	void RecordPoll(const PollAttempt& Attempt);
	void MarkSolved(const std::string& Text, TimePoint Now);
	void MarkExpired(TimePoint Now);
	void MarkTimedOut(TimePoint Now);

private:
	void Advance(JobStatus Next);

	CaptchaId IdValue;
	JobStatus StatusValue;
	std::string TextValue;
	bool CorrectnessKnown;
	bool Correct;
	TimePoint Created;
	TimePoint Resolved;
	std::vector<PollAttempt> PollLog;
};

struct UserAccount {
	long long UserId = 0;
	long long BalanceCents = 0;
	double Rate = 0.0;
	bool IsBanned = false;
};
