#pragma once
#include <QtGlobal>

// Exponential reconnect delay with bounded upward jitter.
// delayMs(k) never decreases as k grows and never exceeds the ceiling.
class Backoff {
public:
	Backoff(int baseMs, int ceilingMs, double jitter);

	// attempt is 1-based: the first retry after one failure.
	qint64 nominalDelayMs(int attempt) const;
	qint64 delayMs(int attempt) const;

	// Same as delayMs with a caller-chosen random fraction in [0, 1).
	qint64 delayMs(int attempt, double fraction) const;

	int ceilingMs() const { return ceilingMs_; }

private:
	int baseMs_;
	int ceilingMs_;
	double jitter_;
};
