#include <gtest/gtest.h>

#include <QtEndian>

#include "include/errors.hpp"
#include "zk/ZkConstants.hpp"
#include "zk/ZkProtocol.hpp"

namespace {

QByteArray bytes(std::initializer_list<int> values)
{
	QByteArray out;
	for (int v : values) out.append(static_cast<char>(v));
	return out;
}

void putU16(QByteArray& buf, int offset, quint16 v) { qToLittleEndian<quint16>(v, buf.data() + offset); }
void putU32(QByteArray& buf, int offset, quint32 v) { qToLittleEndian<quint32>(v, buf.data() + offset); }

void putText(QByteArray& buf, int offset, const QByteArray& text)
{
	for (int i = 0; i < text.size(); ++i) buf[offset + i] = text.at(i);
}

QByteArray withTotal(const QByteArray& records)
{
	QByteArray out(4, '\0');
	putU32(out, 0, static_cast<quint32>(records.size()));
	return out + records;
}

// 2024-01-01 09:00:00 in the packed device format
constexpr quint32 kNineOClock = 771411600;

} // namespace

TEST(ZkProtocolTest, ConnectPacketMatchesReferenceBytes)
{
	quint16 reply = ZkConstant::USHRT_LIMIT - 1;
	const QByteArray pkt = ZkProtocol::buildPacket(ZkConstant::CMD_CONNECT, {}, 0, reply);

	EXPECT_EQ(pkt, bytes({ 0xe8, 0x03, 0x17, 0xfc, 0x00, 0x00, 0x00, 0x00 }));
	EXPECT_EQ(reply, 0);
}

TEST(ZkProtocolTest, ReplyIdAdvancesWithEveryPacket)
{
	quint16 reply = 7;
	const QByteArray pkt = ZkProtocol::buildPacket(ZkConstant::CMD_EXIT, {}, 0x1234, reply);

	EXPECT_EQ(reply, 8);
	const auto parsed = ZkProtocol::parsePacket(pkt);
	EXPECT_EQ(parsed.command, ZkConstant::CMD_EXIT);
	EXPECT_EQ(parsed.sessionId, 0x1234);
	EXPECT_EQ(parsed.replyId, 8);
	EXPECT_TRUE(parsed.data.isEmpty());
}

TEST(ZkProtocolTest, ChecksumOfEmptyBuffer)
{
	EXPECT_EQ(ZkProtocol::checksum(QByteArray()), 65534);
}

TEST(ZkProtocolTest, TcpTopCarriesMagicAndLength)
{
	const QByteArray packet(8, '\x01');
	const QByteArray frame = ZkProtocol::wrapTcp(packet);

	ASSERT_EQ(frame.size(), 16);
	EXPECT_EQ(frame.left(8), bytes({ 0x50, 0x50, 0x82, 0x7d, 0x08, 0x00, 0x00, 0x00 }));
	EXPECT_EQ(ZkProtocol::tcpPayloadLength(frame.left(8)), 8);
}

TEST(ZkProtocolTest, TcpTopWithWrongMagicIsRejected)
{
	EXPECT_EQ(ZkProtocol::tcpPayloadLength(bytes({ 0x50, 0x51, 0x82, 0x7d, 0x08, 0, 0, 0 })), -1);
	EXPECT_EQ(ZkProtocol::tcpPayloadLength(bytes({ 0x50, 0x50 })), -1);
}

TEST(ZkProtocolTest, ShortPacketIsAProtocolError)
{
	EXPECT_THROW(ZkProtocol::parsePacket(bytes({ 1, 2, 3 })), ProtocolError);
}

TEST(ZkProtocolTest, CommKeyForZeroPassword)
{
	EXPECT_EQ(ZkProtocol::makeCommKey(0, 0), bytes({ 0x61, 0x7d, 0x32, 0x79 }));
}

TEST(ZkProtocolTest, BufferRequestLayouts)
{
	const QByteArray prep = ZkProtocol::prepareBufferRequest(ZkConstant::CMD_USERTEMP_RRQ, ZkConstant::FCT_USER, 0);
	EXPECT_EQ(prep, bytes({ 0x01, 0x09, 0x00, 0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 }));

	const QByteArray read = ZkProtocol::readBufferRequest(0xFFC0, 16);
	EXPECT_EQ(read, bytes({ 0xc0, 0xff, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00 }));
}

TEST(ZkProtocolTest, DecodesPackedTime)
{
	const auto clock = ZkProtocol::decodeTime(kNineOClock + 5 * 60 + 7);
	EXPECT_EQ(clock.date, QDate(2024, 1, 1));
	EXPECT_EQ(clock.time, QTime(9, 5, 7));
}

TEST(ZkProtocolTest, DecodesHexTime)
{
	const auto clock = ZkProtocol::decodeTimeHex(bytes({ 24, 3, 15, 17, 45, 30 }));
	EXPECT_EQ(clock.date, QDate(2024, 3, 15));
	EXPECT_EQ(clock.time, QTime(17, 45, 30));

	EXPECT_THROW(ZkProtocol::decodeTimeHex(bytes({ 24, 3 })), ProtocolError);
}

TEST(ZkProtocolTest, ImpossibleHexDateDecodesToInvalidDate)
{
	const auto clock = ZkProtocol::decodeTimeHex(bytes({ 24, 2, 31, 8, 0, 0 }));
	EXPECT_FALSE(clock.date.isValid());
}

TEST(ZkProtocolTest, ExtractsSerialNumberOption)
{
	EXPECT_EQ(ZkProtocol::extractOptionValue(QByteArray("~SerialNumber=ABC123\0\0", 22)), QStringLiteral("ABC123"));
	EXPECT_EQ(ZkProtocol::extractOptionValue(QByteArray()), QString());
}

TEST(ZkProtocolTest, ParsesFreeSizes)
{
	QByteArray data(80, '\0');
	putU32(data, 16, 3);
	putU32(data, 32, 120);

	const auto sizes = ZkProtocol::parseSizes(data);
	EXPECT_EQ(sizes.users, 3);
	EXPECT_EQ(sizes.records, 120);

	EXPECT_THROW(ZkProtocol::parseSizes(QByteArray(12, '\0')), ProtocolError);
}

TEST(ZkProtocolTest, BufferDescriptorWithinLimit)
{
	QByteArray reply(9, '\0');
	putU32(reply, 1, 4 + 3 * 40);
	EXPECT_EQ(ZkProtocol::bufferDescriptorSize(reply, ZkProtocol::bufferSizeLimit(3, ZkConstant::MAX_ATTLOG_RECORD)),
	          4 + 3 * 40);
}

TEST(ZkProtocolTest, OversizedBufferDescriptorIsRejected)
{
	const qint64 limit = ZkProtocol::bufferSizeLimit(10, ZkConstant::MAX_USER_RECORD);
	EXPECT_EQ(limit, 4 + (10 + ZkConstant::BUFFER_SLACK_RECORDS) * 72);

	QByteArray huge(9, '\0');
	putU32(huge, 1, 0x7FFFFFF0u);
	EXPECT_THROW(ZkProtocol::bufferDescriptorSize(huge, limit), ProtocolError);

	QByteArray negative(9, '\0');
	putU32(negative, 1, 0xFFFFFFFFu);
	EXPECT_THROW(ZkProtocol::bufferDescriptorSize(negative, limit), ProtocolError);

	EXPECT_THROW(ZkProtocol::bufferDescriptorSize(bytes({ 0, 1, 2 }), limit), ProtocolError);
}

TEST(ZkProtocolTest, ParsesCompactUserRecords)
{
	QByteArray records(56, '\0');
	putU16(records, 0, 1);
	putText(records, 8, "Alice");
	putU32(records, 24, 42);
	putU16(records, 28, 2);
	putU32(records, 28 + 24, 43);

	const auto users = ZkProtocol::parseUsers(withTotal(records), 2);
	ASSERT_EQ(users.size(), 2);
	EXPECT_EQ(users[0].uid, 1);
	EXPECT_EQ(users[0].userId, QStringLiteral("42"));
	EXPECT_EQ(users[0].name, QStringLiteral("Alice"));
	EXPECT_EQ(users[1].userId, QStringLiteral("43"));
	EXPECT_TRUE(users[1].name.isEmpty());
}

TEST(ZkProtocolTest, ParsesExtendedUserRecords)
{
	QByteArray records(72, '\0');
	putU16(records, 0, 5);
	records[2] = static_cast<char>(14);
	putText(records, 11, "Bob Builder");
	putText(records, 48, "E-1001");

	const auto users = ZkProtocol::parseUsers(withTotal(records), 1);
	ASSERT_EQ(users.size(), 1);
	EXPECT_EQ(users[0].uid, 5);
	EXPECT_EQ(users[0].privilege, 14);
	EXPECT_EQ(users[0].name, QStringLiteral("Bob Builder"));
	EXPECT_EQ(users[0].userId, QStringLiteral("E-1001"));
}

TEST(ZkProtocolTest, UnknownUserRecordSizeIsRejected)
{
	EXPECT_THROW(ZkProtocol::parseUsers(withTotal(QByteArray(30, '\0')), 1), ProtocolError);
}

TEST(ZkProtocolTest, CompactAttendanceMapsUidThroughUserList)
{
	QByteArray records(16, '\0');
	putU16(records, 0, 1);
	putU32(records, 3, kNineOClock);
	putU16(records, 8, 7);
	putU32(records, 8 + 3, kNineOClock + 60);

	DeviceUser alice;
	alice.uid = 1;
	alice.userId = QStringLiteral("42");

	const auto punches = ZkProtocol::parseAttendance(withTotal(records), 2, { alice });
	ASSERT_EQ(punches.size(), 2);
	EXPECT_EQ(punches[0].userId, QStringLiteral("42"));
	EXPECT_EQ(punches[0].date, QDate(2024, 1, 1));
	EXPECT_EQ(punches[0].time, QTime(9, 0, 0));
	EXPECT_EQ(punches[1].userId, QStringLiteral("7"));
	EXPECT_EQ(punches[1].time, QTime(9, 1, 0));
	EXPECT_EQ(punches[1].sequence, 1);
}

TEST(ZkProtocolTest, SixteenByteAttendanceCarriesNumericUserId)
{
	QByteArray records(16, '\0');
	putU32(records, 0, 4242);
	putU32(records, 4, kNineOClock);
	records[8] = static_cast<char>(1);
	records[9] = static_cast<char>(4);

	const auto punches = ZkProtocol::parseAttendance(withTotal(records), 1, {});
	ASSERT_EQ(punches.size(), 1);
	EXPECT_EQ(punches[0].userId, QStringLiteral("4242"));
	EXPECT_EQ(punches[0].status, 1);
	EXPECT_EQ(punches[0].punch, 4);
}

TEST(ZkProtocolTest, ExtendedAttendanceCarriesStringUserId)
{
	QByteArray records(40, '\0');
	putU16(records, 0, 9);
	putText(records, 2, "1001");
	putU32(records, 27, kNineOClock);

	const auto punches = ZkProtocol::parseAttendance(withTotal(records), 1, {});
	ASSERT_EQ(punches.size(), 1);
	EXPECT_EQ(punches[0].uid, 9);
	EXPECT_EQ(punches[0].userId, QStringLiteral("1001"));
	EXPECT_EQ(punches[0].time, QTime(9, 0, 0));
}

TEST(ZkProtocolTest, LiveEventWithStringUserId)
{
	QByteArray data(32, '\0');
	putText(data, 0, "43");
	data[24] = static_cast<char>(1);
	data[25] = static_cast<char>(0);
	putText(data, 26, bytes({ 24, 1, 1, 9, 5, 0 }));

	const auto punches = ZkProtocol::parseLiveEvents(data);
	ASSERT_EQ(punches.size(), 1);
	EXPECT_EQ(punches[0].userId, QStringLiteral("43"));
	EXPECT_EQ(punches[0].status, 1);
	EXPECT_EQ(punches[0].date, QDate(2024, 1, 1));
	EXPECT_EQ(punches[0].time, QTime(9, 5, 0));
}

TEST(ZkProtocolTest, LivePacketWithSeveralRecords)
{
	QByteArray data(104, '\0');
	putText(data, 0, "42");
	putText(data, 26, bytes({ 24, 1, 1, 9, 0, 0 }));
	putText(data, 52, "43");
	putText(data, 52 + 26, bytes({ 24, 1, 1, 9, 5, 0 }));

	const auto punches = ZkProtocol::parseLiveEvents(data);
	ASSERT_EQ(punches.size(), 2);
	EXPECT_EQ(punches[0].userId, QStringLiteral("42"));
	EXPECT_EQ(punches[1].userId, QStringLiteral("43"));
	EXPECT_EQ(punches[1].time, QTime(9, 5, 0));
}

TEST(ZkProtocolTest, CompactLiveEvent)
{
	QByteArray data(10, '\0');
	putU16(data, 0, 17);
	putText(data, 4, bytes({ 23, 12, 31, 23, 59, 59 }));

	const auto punches = ZkProtocol::parseLiveEvents(data);
	ASSERT_EQ(punches.size(), 1);
	EXPECT_EQ(punches[0].userId, QStringLiteral("17"));
	EXPECT_EQ(punches[0].date, QDate(2023, 12, 31));
	EXPECT_EQ(punches[0].time, QTime(23, 59, 59));
}

TEST(ZkProtocolTest, TruncatedLivePayloadYieldsNothing)
{
	EXPECT_TRUE(ZkProtocol::parseLiveEvents(QByteArray(9, '\0')).isEmpty());
}
