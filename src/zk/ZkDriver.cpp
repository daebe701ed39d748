#include "ZkDriver.hpp"

#include <QCoreApplication>
#include <QThread>

#include "include/errors.hpp"
#include "log/logging.hpp"
#include "zk/ZkConstants.hpp"

using ZkProtocol::Packet;

namespace {
// Longest single blocking wait; cancellation is checked between slices.
constexpr int kIoSliceMs = 100;
constexpr int kGoodbyeTimeoutMs = 1000;

int sliceMs(const QDeadlineTimer& deadline)
{
	return static_cast<int>(qBound<qint64>(1, deadline.remainingTime(), kIoSliceMs));
}
} // namespace

ZkDriver::ZkDriver() = default;

ZkDriver::~ZkDriver()
{
	close();
}

bool ZkDriver::isOk(const Packet& p)
{
	return p.command == ZkConstant::CMD_ACK_OK
		|| p.command == ZkConstant::CMD_PREPARE_DATA
		|| p.command == ZkConstant::CMD_DATA;
}

void ZkDriver::open(const DeviceConfig& config, int connectTimeoutMs)
{
	close();

	peer_ = QStringLiteral("%1:%2").arg(config.address).arg(config.port);
	socket_ = std::make_unique<QTcpSocket>();
	socket_->setSocketOption(QAbstractSocket::KeepAliveOption, 1);
	socket_->setSocketOption(QAbstractSocket::LowDelayOption, 1);
	socket_->connectToHost(config.address, config.port);

	// waitForConnected() gives up the attempt on timeout, so pump events instead.
	const QDeadlineTimer connectDeadline(connectTimeoutMs);
	while (socket_->state() != QAbstractSocket::ConnectedState) {
		QString reason;
		if (cancelRequested())
			reason = QStringLiteral("cancelled");
		else if (connectDeadline.hasExpired())
			reason = QStringLiteral("timed out after %1 ms").arg(connectTimeoutMs);
		else if (socket_->state() == QAbstractSocket::UnconnectedState)
			reason = socket_->errorString();

		if (!reason.isEmpty()) {
			socket_->abort();
			socket_.reset();
			throw ConnectionError(QStringLiteral("connect to %1 failed: %2").arg(peer_, reason));
		}
		QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
		QThread::msleep(5);
	}

	sessionId_ = 0;
	replyId_ = ZkConstant::USHRT_LIMIT - 1;
	const int savedTimeout = ioTimeoutMs_;
	ioTimeoutMs_ = connectTimeoutMs;

	try {
		Packet reply = sendCommand(ZkConstant::CMD_CONNECT);
		sessionId_ = reply.sessionId;

		if (reply.command == ZkConstant::CMD_ACK_UNAUTH) {
			qCDebug(LC_ZK).noquote() << "auth requested by" << peer_;
			reply = sendCommand(ZkConstant::CMD_AUTH,
				ZkProtocol::makeCommKey(static_cast<quint32>(config.password), sessionId_));
		}

		if (reply.command == ZkConstant::CMD_ACK_UNAUTH)
			throw ConnectionError(QStringLiteral("%1 rejected the comm key").arg(peer_));
		if (!isOk(reply))
			throw ConnectionError(QStringLiteral("%1 refused the connection, reply %2").arg(peer_).arg(reply.command));
	} catch (const SyncError&) {
		ioTimeoutMs_ = savedTimeout;
		socket_->abort();
		socket_.reset();
		throw;
	}

	ioTimeoutMs_ = savedTimeout;
	connected_ = true;
	users_.clear();
	pending_.clear();
	qCDebug(LC_ZK).noquote().nospace() << "session peer=" << peer_ << " id=" << sessionId_;
}

void ZkDriver::close() noexcept
{
	if (!socket_) return;

	if (connected_) {
		closing_ = true;
		ioTimeoutMs_ = qMin(ioTimeoutMs_, kGoodbyeTimeoutMs);
		try {
			if (capturing_)
				registerEvents(0);
			sendCommand(ZkConstant::CMD_EXIT);
		} catch (const SyncError& e) {
			qCDebug(LC_ZK).noquote() << "exit on" << peer_ << "failed:" << e.message();
		}
		closing_ = false;
	}

	capturing_ = false;
	connected_ = false;
	socket_->abort();
	socket_.reset();
}

bool ZkDriver::isAlive() const
{
	return connected_ && socket_ && socket_->state() == QAbstractSocket::ConnectedState;
}

// ---------------------------------------------------------------------------
// framing

void ZkDriver::throwIfCancelled() const
{
	if (!closing_ && cancelRequested())
		throw ConnectionError(QStringLiteral("I/O with %1 cancelled").arg(peer_));
}

void ZkDriver::writeFrame(const QByteArray& packet)
{
	if (!socket_ || socket_->state() != QAbstractSocket::ConnectedState)
		throw ConnectionError(QStringLiteral("socket to %1 is closed").arg(peer_));

	throwIfCancelled();

	const QByteArray frame = ZkProtocol::wrapTcp(packet);
	if (socket_->write(frame) != frame.size())
		throw ConnectionError(QStringLiteral("write to %1 failed: %2").arg(peer_, socket_->errorString()));

	const QDeadlineTimer deadline(ioTimeoutMs_);
	while (socket_->bytesToWrite() > 0) {
		throwIfCancelled();
		if (deadline.hasExpired())
			throw ConnectionError(QStringLiteral("write to %1 timed out").arg(peer_));
		if (!socket_->waitForBytesWritten(sliceMs(deadline))
		    && socket_->error() != QAbstractSocket::SocketTimeoutError)
			throw ConnectionError(QStringLiteral("write to %1 failed: %2").arg(peer_, socket_->errorString()));
	}
}

QByteArray ZkDriver::readExactly(int n, const QDeadlineTimer& deadline)
{
	while (socket_->bytesAvailable() < n) {
		throwIfCancelled();
		if (socket_->state() != QAbstractSocket::ConnectedState)
			throw ConnectionError(QStringLiteral("%1 closed the connection").arg(peer_));
		if (deadline.hasExpired())
			throw ConnectionError(QStringLiteral("read from %1 timed out").arg(peer_));

		if (!socket_->waitForReadyRead(sliceMs(deadline))
		    && socket_->error() != QAbstractSocket::SocketTimeoutError)
			throw ConnectionError(QStringLiteral("read from %1 failed: %2").arg(peer_, socket_->errorString()));
	}
	return socket_->read(n);
}

Packet ZkDriver::readPacket(const QDeadlineTimer& deadline)
{
	const QByteArray top = readExactly(ZkConstant::TOP_SIZE, deadline);
	const int length = ZkProtocol::tcpPayloadLength(top);
	if (length < ZkConstant::HEADER_SIZE)
		throw ProtocolError(QStringLiteral("invalid frame from %1").arg(peer_));

	return ZkProtocol::parsePacket(readExactly(length, deadline));
}

bool ZkDriver::waitForFrame(int waitMs)
{
	if (socket_->bytesAvailable() > 0)
		return true;
	if (socket_->state() != QAbstractSocket::ConnectedState)
		throw ConnectionError(QStringLiteral("%1 closed the connection").arg(peer_));
	if (socket_->waitForReadyRead(waitMs))
		return true;
	if (socket_->error() != QAbstractSocket::SocketTimeoutError
	    || socket_->state() != QAbstractSocket::ConnectedState)
		throw ConnectionError(QStringLiteral("read from %1 failed: %2").arg(peer_, socket_->errorString()));
	return false;
}

Packet ZkDriver::sendCommand(quint16 command, const QByteArray& payload)
{
	writeFrame(ZkProtocol::buildPacket(command, payload, sessionId_, replyId_));

	Packet reply = readPacket(QDeadlineTimer(ioTimeoutMs_));
	replyId_ = reply.replyId;
	return reply;
}

void ZkDriver::sendAckOk()
{
	quint16 reply = ZkConstant::USHRT_LIMIT - 1;
	writeFrame(ZkProtocol::buildPacket(ZkConstant::CMD_ACK_OK, {}, sessionId_, reply));
}

// ---------------------------------------------------------------------------
// commands

QString ZkDriver::serialNumber()
{
	const Packet reply = sendCommand(ZkConstant::CMD_OPTIONS_RRQ, QByteArray("~SerialNumber\0", 14));
	if (!isOk(reply)) {
		qCDebug(LC_ZK).noquote() << peer_ << "does not report a serial number";
		return {};
	}
	return ZkProtocol::extractOptionValue(reply.data);
}

void ZkDriver::enableDevice()
{
	const Packet reply = sendCommand(ZkConstant::CMD_ENABLEDEVICE);
	if (!isOk(reply))
		throw ProtocolError(QStringLiteral("%1 refused to enable").arg(peer_));
}

void ZkDriver::registerEvents(quint32 flags)
{
	QByteArray payload(4, '\0');
	qToLittleEndian<quint32>(flags, payload.data());
	const Packet reply = sendCommand(ZkConstant::CMD_REG_EVENT, payload);
	if (!isOk(reply))
		throw ProtocolError(QStringLiteral("%1 refused event registration %2").arg(peer_).arg(flags));
}

ZkProtocol::DeviceSizes ZkDriver::readSizes()
{
	const Packet reply = sendCommand(ZkConstant::CMD_GET_FREE_SIZES);
	if (!isOk(reply))
		throw ProtocolError(QStringLiteral("%1 refused the size query").arg(peer_));
	return ZkProtocol::parseSizes(reply.data);
}

QByteArray ZkDriver::receiveChunk(const Packet& first)
{
	if (first.command == ZkConstant::CMD_DATA)
		return first.data;
	if (first.command != ZkConstant::CMD_PREPARE_DATA)
		throw ProtocolError(QStringLiteral("%1 answered a chunk read with %2").arg(peer_).arg(first.command));

	QByteArray data;
	const QDeadlineTimer deadline(ioTimeoutMs_);
	for (;;) {
		const Packet p = readPacket(deadline);
		if (p.command == ZkConstant::CMD_DATA) {
			data.append(p.data);
		} else if (p.command == ZkConstant::CMD_ACK_OK) {
			break;
		} else {
			throw ProtocolError(QStringLiteral("%1 interrupted a data transfer with %2").arg(peer_).arg(p.command));
		}
	}
	return data;
}

QByteArray ZkDriver::readChunk(qint32 start, qint32 size)
{
	for (int attempt = 0; attempt < 3; ++attempt) {
		const Packet reply = sendCommand(ZkConstant::CMD_READ_BUFFER, ZkProtocol::readBufferRequest(start, size));
		const QByteArray chunk = receiveChunk(reply);
		if (!chunk.isEmpty())
			return chunk;
		qCDebug(LC_ZK).noquote() << "empty chunk from" << peer_ << "at" << start << "retry" << attempt + 1;
	}
	throw ProtocolError(QStringLiteral("%1 returned no data for chunk at %2").arg(peer_).arg(start));
}

QByteArray ZkDriver::readWithBuffer(quint16 command, qint64 maxSize, quint32 fct, quint32 ext)
{
	const Packet reply = sendCommand(ZkConstant::CMD_PREPARE_BUFFER,
		ZkProtocol::prepareBufferRequest(command, fct, ext));
	if (!isOk(reply))
		throw ProtocolError(QStringLiteral("%1 refused buffered read of %2").arg(peer_).arg(command));

	if (reply.command == ZkConstant::CMD_DATA)
		return reply.data;

	const qint32 size = ZkProtocol::bufferDescriptorSize(reply.data, maxSize);

	QByteArray data;
	data.reserve(size);
	for (qint32 start = 0; start < size; start += ZkConstant::MAX_CHUNK) {
		const qint32 len = qMin<qint32>(ZkConstant::MAX_CHUNK, size - start);
		data.append(readChunk(start, len));
	}

	const Packet freed = sendCommand(ZkConstant::CMD_FREE_DATA);
	if (!isOk(freed))
		qCDebug(LC_ZK).noquote() << peer_ << "did not acknowledge free data";

	return data;
}

QVector<DeviceUser> ZkDriver::readUsers()
{
	const auto sizes = readSizes();
	if (sizes.users <= 0) {
		users_.clear();
		return users_;
	}

	const QByteArray buffer = readWithBuffer(ZkConstant::CMD_USERTEMP_RRQ,
		ZkProtocol::bufferSizeLimit(sizes.users, ZkConstant::MAX_USER_RECORD), ZkConstant::FCT_USER);
	users_ = ZkProtocol::parseUsers(buffer, sizes.users);
	return users_;
}

HistoricalBatch ZkDriver::readAttendance()
{
	HistoricalBatch batch;
	const auto sizes = readSizes();
	if (sizes.records <= 0)
		return batch;

	if (users_.isEmpty())
		readUsers();

	const QByteArray buffer = readWithBuffer(ZkConstant::CMD_ATTLOG_RRQ,
		ZkProtocol::bufferSizeLimit(sizes.records, ZkConstant::MAX_ATTLOG_RECORD));
	batch.records = ZkProtocol::parseAttendance(buffer, sizes.records, users_);
	qCDebug(LC_ZK).noquote().nospace() << "attendance peer=" << peer_
		<< " announced=" << sizes.records << " parsed=" << batch.records.size();
	return batch;
}

// ---------------------------------------------------------------------------
// live capture

void ZkDriver::startLiveCapture()
{
	if (capturing_) return;
	if (users_.isEmpty())
		readUsers();

	sendCommand(ZkConstant::CMD_CANCELCAPTURE);
	const Packet verify = sendCommand(ZkConstant::CMD_STARTVERIFY);
	if (!isOk(verify))
		throw ProtocolError(QStringLiteral("%1 refused verify mode").arg(peer_));
	enableDevice();
	registerEvents(ZkConstant::EF_ATTLOG);
	pending_.clear();
	capturing_ = true;
}

std::optional<DevicePunch> ZkDriver::waitForPunch(int waitMs)
{
	if (!pending_.isEmpty())
		return pending_.dequeue();

	if (!waitForFrame(waitMs))
		return std::nullopt;

	const Packet p = readPacket(QDeadlineTimer(ioTimeoutMs_));
	sendAckOk();

	if (p.command != ZkConstant::CMD_REG_EVENT || p.data.isEmpty())
		return std::nullopt;

	for (DevicePunch punch : ZkProtocol::parseLiveEvents(p.data)) {
		for (const auto& u : users_) {
			if (u.userId == punch.userId) { punch.uid = u.uid; break; }
		}
		pending_.enqueue(punch);
	}

	if (pending_.isEmpty())
		return std::nullopt;
	return pending_.dequeue();
}

void ZkDriver::stopLiveCapture() noexcept
{
	if (!capturing_) return;
	capturing_ = false;
	pending_.clear();

	if (!isAlive()) return;
	try {
		registerEvents(0);
	} catch (const SyncError& e) {
		qCDebug(LC_ZK).noquote() << "end capture on" << peer_ << "failed:" << e.message();
	}
}
