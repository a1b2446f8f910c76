#pragma once

#include "captcha.h"

#define DBC_BALANCE_UNKNOWN (-1LL)

struct RetryPolicy {
	int MaxAttempts = 1;
	Milliseconds InitialBackoff{ 1000 };
	int Multiplier = 2;
};

struct SolveResult {
	CaptchaJob Job;
	long long BalanceBefore = DBC_BALANCE_UNKNOWN;
	long long BalanceAfter = DBC_BALANCE_UNKNOWN;
	bool CostKnown = false;
	long long CostCents = 0;
	Milliseconds Elapsed{ 0 };
	int Attempts = 0;
};

// Decorates CaptchaClient::Decode with cost and timing figures and retries
// uploads the service turned away because it was overloaded.
class CaptchaSolver {
public:
	explicit CaptchaSolver(CaptchaClient& InputClient, const RetryPolicy& InputPolicy = RetryPolicy());

	SolveResult Solve(const CaptchaSubmission& Submission, int TimeoutSeconds = 0);
	bool ReportIncorrect(CaptchaId Id);

	// Account balance in cents, or DBC_BALANCE_UNKNOWN when it could not be
	// read. Authentication failures are still thrown.
	long long BalanceOrUnknown();

private:
	CaptchaClient& Client;
	RetryPolicy Policy;
};
