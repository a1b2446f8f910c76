#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

typedef std::chrono::steady_clock::time_point TimePoint;
typedef std::chrono::milliseconds Milliseconds;

class Clock {
public:
	virtual ~Clock() {}
	virtual TimePoint Now() = 0;
	virtual void SleepFor(Milliseconds Duration) = 0;
};

class SteadyClock : public Clock {
public:
	TimePoint Now() override;
	void SleepFor(Milliseconds Duration) override;

	static SteadyClock& Instance();
};

struct PollAttempt {
	size_t Index = 0;
	Milliseconds ElapsedSinceSubmit{0};
	Milliseconds IntervalUsed{0};
};

/*
Produces the waits between status checks of one job. Base intervals never
decrease; the last wait is cut down so the total never passes the timeout.
*/
class PollScheduler {
public:
	PollScheduler(Milliseconds InputTimeout, Clock& InputClock);

	// Base interval for the given attempt, independent of any timeout.
	static Milliseconds IntervalAt(size_t Index);

	// The whole sequence a scheduler with this timeout would wait, assuming
	// status checks take no time.
	static std::vector<Milliseconds> Intervals(Milliseconds Timeout);

	// Fills the next attempt; false once the timeout budget is used up.
	bool NextAttempt(PollAttempt& Attempt);
	void Wait(const PollAttempt& Attempt);

	Milliseconds Elapsed() const;
	Milliseconds Remaining() const;
	Milliseconds Timeout() const { return TimeoutValue; }
	size_t AttemptCount() const { return NextIndex; }

private:
	Milliseconds TimeoutValue;
	Clock& TimeSource;
	TimePoint StartedAt;
	size_t NextIndex;
};
