#include <gtest/gtest.h>

#include "worker/Backoff.hpp"

TEST(BackoffTest, NominalDelayDoublesUpToCeiling)
{
	const Backoff b(1000, 60000, 0.5);
	EXPECT_EQ(b.nominalDelayMs(1), 1000);
	EXPECT_EQ(b.nominalDelayMs(2), 2000);
	EXPECT_EQ(b.nominalDelayMs(3), 4000);
	EXPECT_EQ(b.nominalDelayMs(6), 32000);
	EXPECT_EQ(b.nominalDelayMs(7), 60000);
	EXPECT_EQ(b.nominalDelayMs(1000), 60000);
}

TEST(BackoffTest, AttemptBelowOneCountsAsFirst)
{
	const Backoff b(250, 8000, 0.0);
	EXPECT_EQ(b.nominalDelayMs(0), 250);
	EXPECT_EQ(b.nominalDelayMs(-3), 250);
}

TEST(BackoffTest, JitterOnlyAddsAndNeverPassesCeiling)
{
	const Backoff b(1000, 60000, 0.5);
	for (int k = 1; k <= 12; ++k) {
		const qint64 nominal = b.nominalDelayMs(k);
		EXPECT_EQ(b.delayMs(k, 0.0), nominal);
		EXPECT_LE(b.delayMs(k, 1.0), qMin<qint64>(60000, nominal + nominal / 2));
		for (int i = 0; i < 50; ++i) {
			const qint64 d = b.delayMs(k);
			EXPECT_GE(d, nominal);
			EXPECT_LE(d, 60000);
		}
	}
}

TEST(BackoffTest, DelaysNeverDecreaseWithMoreFailures)
{
	const Backoff b(300, 45000, 0.5);
	for (int k = 1; k < 30; ++k)
		EXPECT_LE(b.delayMs(k, 1.0), b.delayMs(k + 1, 0.0)) << "attempt " << k;
}

TEST(BackoffTest, ExcessiveJitterIsClamped)
{
	const Backoff b(100, 10000, 2.0);
	EXPECT_LE(b.delayMs(1, 1.0), 150);
}

TEST(BackoffTest, CeilingBelowBaseIsRaisedToBase)
{
	const Backoff b(5000, 1000, 0.0);
	EXPECT_EQ(b.ceilingMs(), 5000);
	EXPECT_EQ(b.delayMs(3, 0.5), 5000);
}
