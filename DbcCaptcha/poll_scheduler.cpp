#include "poll_scheduler.h"

#include <algorithm>
#include <thread>

#include "constants.h"

static const int PollIntervals[] = { 1, 1, 2, 2, 3, 3 };
static const size_t PollIntervalCount = sizeof(PollIntervals) / sizeof(PollIntervals[0]);

TimePoint SteadyClock::Now()
{
	return std::chrono::steady_clock::now();
}

void SteadyClock::SleepFor(Milliseconds Duration)
{
	if (Duration.count() > 0) {
		std::this_thread::sleep_for(Duration);
	}
}

SteadyClock& SteadyClock::Instance()
{
	static SteadyClock Shared;
	return Shared;
}

PollScheduler::PollScheduler(Milliseconds InputTimeout, Clock& InputClock) :
	TimeoutValue(std::max(InputTimeout, Milliseconds(0))), TimeSource(InputClock), StartedAt(InputClock.Now()), NextIndex(0)
{
}

Milliseconds PollScheduler::IntervalAt(size_t Index)
{
	if (Index < PollIntervalCount) {
		return std::chrono::seconds(PollIntervals[Index]);
	}
	return std::chrono::seconds(DBC_DEFAULT_POLL_INTERVAL);
}

std::vector<Milliseconds> PollScheduler::Intervals(Milliseconds Timeout)
{
	std::vector<Milliseconds> Sequence;
	Milliseconds Total(0);

	for (size_t Index = 0; Total < Timeout; ++Index) {
		Milliseconds Interval = std::min(IntervalAt(Index), Timeout - Total);
		Sequence.push_back(Interval);
		Total += Interval;
	}

	return Sequence;
}

bool PollScheduler::NextAttempt(PollAttempt& Attempt)
{
	Milliseconds Left = Remaining();
	if (Left.count() <= 0) {
		return false;
	}

	Attempt.Index = NextIndex;
	Attempt.ElapsedSinceSubmit = Elapsed();
	Attempt.IntervalUsed = std::min(IntervalAt(NextIndex), Left);
	++NextIndex;
	return true;
}

void PollScheduler::Wait(const PollAttempt& Attempt)
{
	TimeSource.SleepFor(Attempt.IntervalUsed);
}

Milliseconds PollScheduler::Elapsed() const
{
	return std::chrono::duration_cast<Milliseconds>(TimeSource.Now() - StartedAt);
}

Milliseconds PollScheduler::Remaining() const
{
	Milliseconds Left = TimeoutValue - Elapsed();
	return Left.count() > 0 ? Left : Milliseconds(0);
}
