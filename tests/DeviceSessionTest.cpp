#include <gtest/gtest.h>

#include "FakeDeviceDriver.hpp"
#include "TestUtil.hpp"
#include "session/DeviceSession.hpp"

namespace {

SessionTimeouts shortTimeouts()
{
	SessionTimeouts t;
	t.connectTimeoutMs = 100;
	t.bootstrapTimeoutMs = 1000;
	t.liveReadTimeoutMs = 50;
	return t;
}

std::unique_ptr<DeviceSession> makeSession(const std::shared_ptr<FakeDeviceScript>& script,
                                           const DeviceConfig& cfg = deviceConfig(QStringLiteral("DEV1")))
{
	return std::make_unique<DeviceSession>(std::make_unique<FakeDeviceDriver>(script), cfg, shortTimeouts());
}

} // namespace

TEST(DeviceSessionTest, ConnectReportsDeviceSerial)
{
	auto script = std::make_shared<FakeDeviceScript>();
	auto session = makeSession(script);

	session->connect();
	EXPECT_TRUE(session->isConnected());
	EXPECT_TRUE(session->isAlive());
	EXPECT_EQ(session->deviceSerial(), QStringLiteral("DEV1"));
}

TEST(DeviceSessionTest, SilentDeviceUsesConfiguredIdentity)
{
	auto script = std::make_shared<FakeDeviceScript>();
	script->serial.clear();
	auto session = makeSession(script, deviceConfig(QString(), 4380));

	session->connect();
	EXPECT_EQ(session->deviceSerial(), QStringLiteral("192.0.2.10:4380"));
}

TEST(DeviceSessionTest, HandshakeGarbageBecomesConnectionError)
{
	auto script = std::make_shared<FakeDeviceScript>();
	script->protocolFailures = 1;
	auto session = makeSession(script);

	EXPECT_THROW(session->connect(), ConnectionError);
	EXPECT_FALSE(session->isConnected());
}

TEST(DeviceSessionTest, OperationsOnClosedSessionFail)
{
	auto script = std::make_shared<FakeDeviceScript>();
	auto session = makeSession(script);
	CancelToken token;

	EXPECT_THROW(session->listUsers(), ConnectionError);
	EXPECT_THROW(session->fetchHistoricalRecords(), ConnectionError);
	EXPECT_THROW(session->subscribeLive(token), ConnectionError);
}

TEST(DeviceSessionTest, DisconnectIsIdempotent)
{
	auto script = std::make_shared<FakeDeviceScript>();
	auto session = makeSession(script);

	session->connect();
	session->disconnect();
	session->disconnect();
	session.reset();

	EXPECT_EQ(script->closeCalls.load(), 1);
}

TEST(DeviceSessionTest, HistoricalRecordsAreStampedWithSerial)
{
	auto script = std::make_shared<FakeDeviceScript>();
	script->history = { punchAt(QStringLiteral("42"), QStringLiteral("2024-01-01 09:00:00")) };
	auto session = makeSession(script);
	session->connect();

	const HistoricalBatch batch = session->fetchHistoricalRecords();
	ASSERT_EQ(batch.records.size(), 1);
	EXPECT_EQ(batch.records[0].deviceSerial, QStringLiteral("DEV1"));
	EXPECT_FALSE(batch.backlogRemaining);
}

TEST(DeviceSessionTest, LiveSubscriptionDeliversPunches)
{
	auto script = std::make_shared<FakeDeviceScript>();
	script->pushLive(punchAt(QStringLiteral("43"), QStringLiteral("2024-01-01 09:05:00")));
	auto session = makeSession(script);
	session->connect();
	CancelToken token;

	LiveSubscription live = session->subscribeLive(token);
	const auto punch = live.next();
	ASSERT_TRUE(punch.has_value());
	EXPECT_EQ(punch->userId, QStringLiteral("43"));
	EXPECT_EQ(punch->deviceSerial, QStringLiteral("DEV1"));
}

TEST(DeviceSessionTest, DroppingSubscriptionStopsCapture)
{
	auto script = std::make_shared<FakeDeviceScript>();
	auto session = makeSession(script);
	session->connect();
	CancelToken token;

	{
		LiveSubscription live = session->subscribeLive(token);
		EXPECT_EQ(script->liveStarts.load(), 1);
		EXPECT_EQ(script->liveStops.load(), 0);
	}
	EXPECT_EQ(script->liveStops.load(), 1);
}

TEST(DeviceSessionTest, CancelledSubscriptionEndsAndStaysEnded)
{
	auto script = std::make_shared<FakeDeviceScript>();
	auto session = makeSession(script);
	session->connect();
	CancelToken token;

	LiveSubscription live = session->subscribeLive(token);
	token.cancel();
	EXPECT_FALSE(live.next().has_value());
	EXPECT_TRUE(live.isTerminated());
	EXPECT_THROW(live.next(), ProtocolError);
}

TEST(DeviceSessionTest, TransportFailureTerminatesSubscription)
{
	auto script = std::make_shared<FakeDeviceScript>();
	script->liveFailures = 1;
	auto session = makeSession(script);
	session->connect();
	CancelToken token;

	LiveSubscription live = session->subscribeLive(token);
	EXPECT_THROW(live.next(), ConnectionError);
	EXPECT_TRUE(live.isTerminated());
	EXPECT_THROW(session->subscribeLive(token), ProtocolError);
}

TEST(DeviceSessionTest, SilentDeadPeerIsDetectedAfterReadTimeout)
{
	auto script = std::make_shared<FakeDeviceScript>();
	auto session = makeSession(script);
	session->connect();
	script->alive = false;
	CancelToken token;

	LiveSubscription live = session->subscribeLive(token);
	EXPECT_THROW(live.next(), ConnectionError);
}
