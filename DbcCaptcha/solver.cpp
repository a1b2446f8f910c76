#include "solver.h"

#include "captcha_error.h"
#include "log.h"

CaptchaSolver::CaptchaSolver(CaptchaClient& InputClient, const RetryPolicy& InputPolicy) :
	Client(InputClient), Policy(InputPolicy)
{
	if (Policy.MaxAttempts < 1) {
		Policy.MaxAttempts = 1;
	}
	if (Policy.Multiplier < 1) {
		Policy.Multiplier = 1;
	}
}

SolveResult CaptchaSolver::Solve(const CaptchaSubmission& Submission, int TimeoutSeconds)
{
	Clock& TimeSource = Client.TimeSource();
	TimePoint StartedAt = TimeSource.Now();

	SolveResult Result;
	Result.BalanceBefore = BalanceOrUnknown();

	Milliseconds Backoff = Policy.InitialBackoff;
	for (;;) {
		++Result.Attempts;
		try {
			Result.Job = Client.Decode(Submission, TimeoutSeconds);
			break;
		}
		catch (const OverloadError& e) {
			if (Result.Attempts >= Policy.MaxAttempts) {
				DBC_LOG_ERROR("service still overloaded after %d attempts", Result.Attempts);
				throw;
			}
			DBC_LOG_WARN("service overloaded (%s), retrying in %lld ms", e.what(), static_cast<long long>(Backoff.count()));
			TimeSource.SleepFor(Backoff);
			Backoff *= Policy.Multiplier;
		}
	}

	Result.BalanceAfter = BalanceOrUnknown();
	if (Result.BalanceBefore != DBC_BALANCE_UNKNOWN && Result.BalanceAfter != DBC_BALANCE_UNKNOWN) {
		Result.CostKnown = true;
		Result.CostCents = Result.BalanceBefore - Result.BalanceAfter;
	}
	Result.Elapsed = std::chrono::duration_cast<Milliseconds>(TimeSource.Now() - StartedAt);

	if (Result.Job.IsSolved()) {
		DBC_LOG_INFO("captcha %lld solved in %lld ms, cost %s", Result.Job.Id(), static_cast<long long>(Result.Elapsed.count()),
			Result.CostKnown ? vformat("%lld cents", Result.CostCents).c_str() : "unknown");
	}
	else {
		DBC_LOG_WARN("captcha %lld ended as %s after %lld ms", Result.Job.Id(), JobStatusName(Result.Job.Status()), static_cast<long long>(Result.Elapsed.count()));
	}
	return Result;
}

bool CaptchaSolver::ReportIncorrect(CaptchaId Id)
{
	bool Reported = Client.Report(Id);
	if (Reported) {
		DBC_LOG_INFO("reported captcha %lld for refund", Id);
	}
	return Reported;
}

long long CaptchaSolver::BalanceOrUnknown()
{
	try {
		return Client.GetBalance();
	}
	catch (const AuthenticationError&) {
		throw;
	}
	catch (const CaptchaError& e) {
		DBC_LOG_WARN("cannot read the balance: %s", e.what());
		return DBC_BALANCE_UNKNOWN;
	}
}
