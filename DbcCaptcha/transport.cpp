#include "transport.h"

#include "captcha_error.h"
#include "log.h"

TransportClient::TransportClient(const Credentials& InputCredentials) :
	CredentialsValue(InputCredentials), Verbose(false)
{
}

long long TransportClient::GetBalance()
{
	return GetUser().BalanceCents;
}

CaptchaJob TransportClient::Decode(const CaptchaSubmission& Submission, Milliseconds Timeout, Clock& TimeSource)
{
	if (Timeout.count() <= 0) {
		Timeout = std::chrono::seconds(Submission.DefaultTimeout());
	}

	CaptchaJob Job;
	Job.Start(TimeSource.Now());

	// the budget covers the upload as well
	PollScheduler Scheduler(Timeout, TimeSource);

	Job.MarkSubmitted(Submit(Submission));
	if (IsVerbose()) {
		DBC_LOG_DEBUG("captcha %lld uploaded, polling for up to %lld ms", Job.Id(), static_cast<long long>(Timeout.count()));
	}
	Job.MarkPolling();

	PollAttempt Attempt;
	while (Scheduler.NextAttempt(Attempt)) {
		Scheduler.Wait(Attempt);
		Job.RecordPoll(Attempt);

		CaptchaStatus Status = CheckStatus(Job.Id());
		if (Status.Id != Job.Id()) {
			throw TransportError(vformat("status for captcha %lld answered with captcha %lld", Job.Id(), Status.Id));
		}

		if (!Status.IsCorrect) {
			Job.MarkExpired(TimeSource.Now());
			DBC_LOG_WARN("captcha %lld could not be solved", Job.Id());
			return Job;
		}

		if (!Status.Text.empty()) {
			Job.MarkSolved(Status.Text, TimeSource.Now());
			if (IsVerbose()) {
				DBC_LOG_DEBUG("captcha %lld solved after %zu polls", Job.Id(), Job.Polls().size());
			}
			return Job;
		}
	}

	Job.MarkTimedOut(TimeSource.Now());
	DBC_LOG_WARN("captcha %lld not solved within %lld ms", Job.Id(), static_cast<long long>(Timeout.count()));
	return Job;
}

void TransportClient::LogTraffic(const char* Direction, const std::string& Command, const std::string& Payload) const
{
	if (Verbose) {
		DBC_LOG_DEBUG("%s %s: %s", Direction, Command.c_str(), Payload.c_str());
	}
}
