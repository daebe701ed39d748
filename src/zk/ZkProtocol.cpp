#include "ZkProtocol.hpp"

#include <QtEndian>

#include "include/errors.hpp"
#include "zk/ZkConstants.hpp"

namespace ZkProtocol {

namespace {

template <typename T>
void appendLe(QByteArray& out, T value)
{
	char buf[sizeof(T)];
	qToLittleEndian<T>(value, buf);
	out.append(buf, static_cast<int>(sizeof(T)));
}

template <typename T>
T readLe(const QByteArray& in, int offset)
{
	if (offset < 0 || offset + static_cast<int>(sizeof(T)) > in.size())
		throw ProtocolError(QStringLiteral("short read at offset %1 of %2 bytes").arg(offset).arg(in.size()));
	return qFromLittleEndian<T>(in.constData() + offset);
}

quint8 byteAt(const QByteArray& in, int offset)
{
	if (offset < 0 || offset >= in.size())
		throw ProtocolError(QStringLiteral("short read at offset %1 of %2 bytes").arg(offset).arg(in.size()));
	return static_cast<quint8>(in.at(offset));
}

QDate makeDate(int year, int month, int day)
{
	// QDate(y, m, d) is invalid for out-of-range values; the normalizer rejects it.
	return QDate(year, month, day);
}

QTime makeTime(int hour, int minute, int second)
{
	return QTime(hour, minute, second);
}

QString userIdForUid(int uid, const QVector<DeviceUser>& users)
{
	for (const auto& u : users) {
		if (u.uid == uid) return u.userId;
	}
	return QString::number(uid);
}

} // namespace

quint16 checksum(const QByteArray& buf)
{
	qint32 sum = 0;
	int i = 0;
	const int len = buf.size();

	for (; i + 1 < len; i += 2) {
		sum += static_cast<quint8>(buf.at(i)) | (static_cast<quint8>(buf.at(i + 1)) << 8);
		if (sum > ZkConstant::USHRT_LIMIT)
			sum -= ZkConstant::USHRT_LIMIT;
	}
	if (i < len)
		sum += static_cast<quint8>(buf.at(len - 1));

	while (sum > ZkConstant::USHRT_LIMIT)
		sum -= ZkConstant::USHRT_LIMIT;

	qint32 result = ~sum;
	while (result < 0)
		result += ZkConstant::USHRT_LIMIT;

	return static_cast<quint16>(result);
}

QByteArray buildPacket(quint16 command, const QByteArray& payload, quint16 sessionId, quint16& replyId)
{
	QByteArray buf;
	buf.reserve(ZkConstant::HEADER_SIZE + payload.size());
	appendLe<quint16>(buf, command);
	appendLe<quint16>(buf, 0);
	appendLe<quint16>(buf, sessionId);
	appendLe<quint16>(buf, replyId);
	buf.append(payload);

	const quint16 sum = checksum(buf);

	quint32 next = static_cast<quint32>(replyId) + 1;
	if (next >= ZkConstant::USHRT_LIMIT)
		next -= ZkConstant::USHRT_LIMIT;
	replyId = static_cast<quint16>(next);

	qToLittleEndian<quint16>(sum, buf.data() + 2);
	qToLittleEndian<quint16>(replyId, buf.data() + 6);
	return buf;
}

QByteArray wrapTcp(const QByteArray& packet)
{
	QByteArray out;
	out.reserve(ZkConstant::TOP_SIZE + packet.size());
	appendLe<quint16>(out, ZkConstant::MACHINE_PREPARE_DATA_1);
	appendLe<quint16>(out, ZkConstant::MACHINE_PREPARE_DATA_2);
	appendLe<quint32>(out, static_cast<quint32>(packet.size()));
	out.append(packet);
	return out;
}

int tcpPayloadLength(const QByteArray& top)
{
	if (top.size() < ZkConstant::TOP_SIZE)
		return -1;
	if (readLe<quint16>(top, 0) != ZkConstant::MACHINE_PREPARE_DATA_1
	    || readLe<quint16>(top, 2) != ZkConstant::MACHINE_PREPARE_DATA_2)
		return -1;
	const quint32 len = readLe<quint32>(top, 4);
	if (len > 0x7FFFFFFF)
		return -1;
	return static_cast<int>(len);
}

Packet parsePacket(const QByteArray& raw)
{
	if (raw.size() < ZkConstant::HEADER_SIZE)
		throw ProtocolError(QStringLiteral("packet of %1 bytes is shorter than a header").arg(raw.size()));

	Packet p;
	p.command = readLe<quint16>(raw, 0);
	p.checksum = readLe<quint16>(raw, 2);
	p.sessionId = readLe<quint16>(raw, 4);
	p.replyId = readLe<quint16>(raw, 6);
	p.data = raw.mid(ZkConstant::HEADER_SIZE);
	return p;
}

QByteArray makeCommKey(quint32 key, quint32 sessionId, quint8 ticks)
{
	quint32 k = 0;
	for (int i = 0; i < 32; ++i) {
		if (key & (1U << i))
			k = (k << 1) | 1;
		else
			k <<= 1;
	}
	k += sessionId;

	quint8 b[4] = {
		static_cast<quint8>((k & 0xFF) ^ 'Z'),
		static_cast<quint8>(((k >> 8) & 0xFF) ^ 'K'),
		static_cast<quint8>(((k >> 16) & 0xFF) ^ 'S'),
		static_cast<quint8>(((k >> 24) & 0xFF) ^ 'O'),
	};

	// swap 16-bit halves
	const quint8 swapped[4] = { b[2], b[3], b[0], b[1] };

	QByteArray out(4, '\0');
	out[0] = static_cast<char>(swapped[0] ^ ticks);
	out[1] = static_cast<char>(swapped[1] ^ ticks);
	out[2] = static_cast<char>(ticks);
	out[3] = static_cast<char>(swapped[3] ^ ticks);
	return out;
}

QByteArray prepareBufferRequest(quint16 command, quint32 fct, quint32 ext)
{
	QByteArray out;
	out.append(static_cast<char>(1));
	appendLe<qint16>(out, static_cast<qint16>(command));
	appendLe<qint32>(out, static_cast<qint32>(fct));
	appendLe<qint32>(out, static_cast<qint32>(ext));
	return out;
}

QByteArray readBufferRequest(qint32 start, qint32 size)
{
	QByteArray out;
	appendLe<qint32>(out, start);
	appendLe<qint32>(out, size);
	return out;
}

WallClock decodeTime(quint32 raw)
{
	const int second = raw % 60;  raw /= 60;
	const int minute = raw % 60;  raw /= 60;
	const int hour   = raw % 24;  raw /= 24;
	const int day    = raw % 31 + 1; raw /= 31;
	const int month  = raw % 12 + 1; raw /= 12;
	const int year   = static_cast<int>(raw) + 2000;

	return { makeDate(year, month, day), makeTime(hour, minute, second) };
}

WallClock decodeTimeHex(const QByteArray& timehex)
{
	if (timehex.size() < 6)
		throw ProtocolError(QStringLiteral("expected 6 bytes of packed time, got %1").arg(timehex.size()));

	return {
		makeDate(byteAt(timehex, 0) + 2000, byteAt(timehex, 1), byteAt(timehex, 2)),
		makeTime(byteAt(timehex, 3), byteAt(timehex, 4), byteAt(timehex, 5))
	};
}

QString decodeString(const QByteArray& field)
{
	const int nul = field.indexOf('\0');
	return QString::fromUtf8(nul < 0 ? field : field.left(nul)).trimmed();
}

QString extractOptionValue(const QByteArray& data)
{
	const int eq = data.indexOf('=');
	const QByteArray value = eq < 0 ? data : data.mid(eq + 1);
	return decodeString(value);
}

DeviceSizes parseSizes(const QByteArray& data)
{
	if (data.size() < 80)
		throw ProtocolError(QStringLiteral("free sizes reply of %1 bytes, expected 80").arg(data.size()));

	DeviceSizes s;
	s.users = readLe<qint32>(data, 4 * 4);
	s.records = readLe<qint32>(data, 8 * 4);
	return s;
}

qint32 bufferDescriptorSize(const QByteArray& data, qint64 limit)
{
	if (data.size() < 5)
		throw ProtocolError(QStringLiteral("short buffer descriptor of %1 bytes").arg(data.size()));
	const qint32 size = readLe<qint32>(data, 1);
	if (size < 0 || size > limit)
		throw ProtocolError(QStringLiteral("buffer of %1 bytes announced, at most %2 expected").arg(size).arg(limit));
	return size;
}

qint64 bufferSizeLimit(int recordCount, int maxRecordSize)
{
	return 4 + (static_cast<qint64>(qMax(0, recordCount)) + ZkConstant::BUFFER_SLACK_RECORDS) * maxRecordSize;
}

QVector<DeviceUser> parseUsers(const QByteArray& buffer, int userCount)
{
	QVector<DeviceUser> users;
	if (userCount <= 0 || buffer.size() <= 4)
		return users;

	const quint32 total = readLe<quint32>(buffer, 0);
	const int packetSize = static_cast<int>(total / static_cast<quint32>(userCount));
	if (packetSize != 28 && packetSize != 72)
		throw ProtocolError(QStringLiteral("unsupported user record size %1").arg(packetSize));

	const QByteArray data = buffer.mid(4);
	for (int pos = 0; pos + packetSize <= data.size(); pos += packetSize) {
		DeviceUser u;
		u.uid = readLe<quint16>(data, pos);
		u.privilege = byteAt(data, pos + 2);
		if (packetSize == 28) {
			// <HB5s8sIxBhI
			u.name = decodeString(data.mid(pos + 8, 8));
			u.userId = QString::number(readLe<quint32>(data, pos + 24));
		} else {
			// <HB8s24sIx7sx24s
			u.name = decodeString(data.mid(pos + 11, 24));
			u.userId = decodeString(data.mid(pos + 48, 24));
		}
		users.push_back(u);
	}
	return users;
}

QVector<DevicePunch> parseAttendance(const QByteArray& buffer, int recordCount,
                                     const QVector<DeviceUser>& users)
{
	QVector<DevicePunch> punches;
	if (recordCount <= 0 || buffer.size() <= 4)
		return punches;

	const quint32 total = readLe<quint32>(buffer, 0);
	const int recordSize = static_cast<int>(total / static_cast<quint32>(recordCount));
	if (recordSize != 8 && recordSize != 16 && recordSize < 40)
		throw ProtocolError(QStringLiteral("unsupported attendance record size %1").arg(recordSize));

	const QByteArray data = buffer.mid(4);
	qint64 sequence = 0;
	for (int pos = 0; pos + recordSize <= data.size(); pos += recordSize) {
		DevicePunch p;
		WallClock clock;
		if (recordSize == 8) {
			// <HB4sB
			p.uid = readLe<quint16>(data, pos);
			p.status = byteAt(data, pos + 2);
			clock = decodeTime(readLe<quint32>(data, pos + 3));
			p.punch = byteAt(data, pos + 7);
			p.userId = userIdForUid(p.uid, users);
		} else if (recordSize == 16) {
			// <I4sBB2sI
			p.userId = QString::number(readLe<quint32>(data, pos));
			clock = decodeTime(readLe<quint32>(data, pos + 4));
			p.status = byteAt(data, pos + 8);
			p.punch = byteAt(data, pos + 9);
			for (const auto& u : users) {
				if (u.userId == p.userId) { p.uid = u.uid; break; }
			}
		} else {
			// <H24sB4sB8s
			p.uid = readLe<quint16>(data, pos);
			p.userId = decodeString(data.mid(pos + 2, 24));
			p.status = byteAt(data, pos + 26);
			clock = decodeTime(readLe<quint32>(data, pos + 27));
			p.punch = byteAt(data, pos + 31);
		}
		p.date = clock.date;
		p.time = clock.time;
		p.sequence = sequence++;
		punches.push_back(p);
	}
	return punches;
}

QVector<DevicePunch> parseLiveEvents(const QByteArray& payload)
{
	QVector<DevicePunch> punches;
	QByteArray data = payload;

	while (data.size() >= 10) {
		DevicePunch p;
		QByteArray timehex;
		int chunk = 0;

		if (data.size() >= 52) {
			// <24sBB6s20s
			p.userId = decodeString(data.left(24));
			p.status = byteAt(data, 24);
			p.punch = byteAt(data, 25);
			timehex = data.mid(26, 6);
			chunk = 52;
		} else if (data.size() >= 37) {
			p.userId = decodeString(data.left(24));
			p.status = byteAt(data, 24);
			p.punch = byteAt(data, 25);
			timehex = data.mid(26, 6);
			chunk = 37;
		} else if (data.size() >= 36) {
			p.userId = decodeString(data.left(24));
			p.status = byteAt(data, 24);
			p.punch = byteAt(data, 25);
			timehex = data.mid(26, 6);
			chunk = 36;
		} else if (data.size() >= 32) {
			// <24sBB6s
			p.userId = decodeString(data.left(24));
			p.status = byteAt(data, 24);
			p.punch = byteAt(data, 25);
			timehex = data.mid(26, 6);
			chunk = 32;
		} else if (data.size() == 14) {
			// <HBB6s4s
			p.uid = readLe<quint16>(data, 0);
			p.userId = QString::number(p.uid);
			p.status = byteAt(data, 2);
			p.punch = byteAt(data, 3);
			timehex = data.mid(4, 6);
			chunk = 14;
		} else if (data.size() == 12) {
			// <IBB6s
			const quint32 id = readLe<quint32>(data, 0);
			p.uid = static_cast<int>(id & 0xFFFF);
			p.userId = QString::number(id);
			p.status = byteAt(data, 4);
			p.punch = byteAt(data, 5);
			timehex = data.mid(6, 6);
			chunk = 12;
		} else if (data.size() == 10) {
			// <HBB6s
			p.uid = readLe<quint16>(data, 0);
			p.userId = QString::number(p.uid);
			p.status = byteAt(data, 2);
			p.punch = byteAt(data, 3);
			timehex = data.mid(4, 6);
			chunk = 10;
		} else {
			break;
		}

		data.remove(0, chunk);
		const WallClock clock = decodeTimeHex(timehex);
		p.date = clock.date;
		p.time = clock.time;
		punches.push_back(p);
	}
	return punches;
}

} // namespace ZkProtocol
