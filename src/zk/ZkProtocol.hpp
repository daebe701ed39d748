#pragma once
#include <QByteArray>
#include <QDate>
#include <QString>
#include <QTime>
#include <QVector>
#include <QtGlobal>

#include "include/types.hpp"

// Pure encoding and decoding of ZKTeco TCP frames and record layouts.
// Malformed input throws ProtocolError.
namespace ZkProtocol {

struct Packet {
	quint16 command = 0;
	quint16 checksum = 0;
	quint16 sessionId = 0;
	quint16 replyId = 0;
	QByteArray data;
};

struct WallClock {
	QDate date;
	QTime time;
};

struct DeviceSizes {
	int users = 0;
	int records = 0;
};

quint16 checksum(const QByteArray& buf);

// Builds header + payload. The checksum covers the current reply id, which
// is then advanced (wrapping at 65535) and written into the header.
QByteArray buildPacket(quint16 command, const QByteArray& payload, quint16 sessionId, quint16& replyId);

QByteArray wrapTcp(const QByteArray& packet);

// Length announced by an 8-byte TCP top, or -1 when the magic is wrong.
int tcpPayloadLength(const QByteArray& top);

Packet parsePacket(const QByteArray& raw);

QByteArray makeCommKey(quint32 key, quint32 sessionId, quint8 ticks = 50);

// `<bhii`: buffered read request for command/fct/ext.
QByteArray prepareBufferRequest(quint16 command, quint32 fct, quint32 ext);
// `<ii`: chunk read request.
QByteArray readBufferRequest(qint32 start, qint32 size);

WallClock decodeTime(quint32 raw);
WallClock decodeTimeHex(const QByteArray& timehex);

QString decodeString(const QByteArray& field);
QString extractOptionValue(const QByteArray& data);

DeviceSizes parseSizes(const QByteArray& data);

// Size announced by a CMD_PREPARE_BUFFER reply. Anything negative or past
// `limit` bytes is a ProtocolError rather than an allocation.
qint32 bufferDescriptorSize(const QByteArray& data, qint64 limit);
qint64 bufferSizeLimit(int recordCount, int maxRecordSize);

// `buffer` starts with the 4-byte total size as returned by a buffered read.
QVector<DeviceUser> parseUsers(const QByteArray& buffer, int userCount);
QVector<DevicePunch> parseAttendance(const QByteArray& buffer, int recordCount,
                                     const QVector<DeviceUser>& users);

// Payload of one CMD_REG_EVENT packet; may hold several records.
QVector<DevicePunch> parseLiveEvents(const QByteArray& data);

} // namespace ZkProtocol
