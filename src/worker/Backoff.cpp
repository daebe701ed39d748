#include "Backoff.hpp"

#include <QRandomGenerator>
#include <algorithm>

Backoff::Backoff(int baseMs, int ceilingMs, double jitter)
	: baseMs_(qMax(1, baseMs)),
	  ceilingMs_(qMax(baseMs_, ceilingMs)),
	  jitter_(std::clamp(jitter, 0.0, 0.5))
{
}

qint64 Backoff::nominalDelayMs(int attempt) const
{
	if (attempt < 1) attempt = 1;

	qint64 delay = baseMs_;
	for (int i = 1; i < attempt && delay < ceilingMs_; ++i)
		delay *= 2;
	return qMin<qint64>(delay, ceilingMs_);
}

qint64 Backoff::delayMs(int attempt) const
{
	return delayMs(attempt, QRandomGenerator::global()->generateDouble());
}

qint64 Backoff::delayMs(int attempt, double fraction) const
{
	const qint64 nominal = nominalDelayMs(attempt);
	const qint64 upper = qMin<qint64>(ceilingMs_, nominal + static_cast<qint64>(nominal * jitter_));
	const double f = std::clamp(fraction, 0.0, 1.0);
	return nominal + static_cast<qint64>((upper - nominal) * f);
}
