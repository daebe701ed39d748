#pragma once
#include <QDeadlineTimer>
#include <QQueue>
#include <QTcpSocket>
#include <memory>

#include "session/DeviceDriver.hpp"
#include "zk/ZkProtocol.hpp"

// ZKTeco terminal over TCP. Blocking I/O on the calling thread, no event loop needed.
class ZkDriver : public DeviceDriver {
public:
	ZkDriver();
	~ZkDriver() override;

	void open(const DeviceConfig& config, int connectTimeoutMs) override;
	void close() noexcept override;
	bool isAlive() const override;

	QString serialNumber() override;
	void setIoTimeout(int ms) override { ioTimeoutMs_ = ms; }

	QVector<DeviceUser> readUsers() override;
	HistoricalBatch readAttendance() override;

	void startLiveCapture() override;
	std::optional<DevicePunch> waitForPunch(int waitMs) override;
	void stopLiveCapture() noexcept override;

private:
	ZkProtocol::Packet sendCommand(quint16 command, const QByteArray& payload = {});
	void writeFrame(const QByteArray& packet);
	ZkProtocol::Packet readPacket(const QDeadlineTimer& deadline);
	bool waitForFrame(int waitMs);
	QByteArray readExactly(int n, const QDeadlineTimer& deadline);
	void throwIfCancelled() const;

	void sendAckOk();
	void enableDevice();
	void registerEvents(quint32 flags);
	ZkProtocol::DeviceSizes readSizes();

	QByteArray readWithBuffer(quint16 command, qint64 maxSize, quint32 fct = 0, quint32 ext = 0);
	QByteArray readChunk(qint32 start, qint32 size);
	QByteArray receiveChunk(const ZkProtocol::Packet& first);

	static bool isOk(const ZkProtocol::Packet& p);

	std::unique_ptr<QTcpSocket> socket_;
	QString peer_;
	quint16 sessionId_ = 0;
	quint16 replyId_ = 0;
	int ioTimeoutMs_ = 10000;
	bool connected_ = false;
	bool capturing_ = false;
	bool closing_ = false;				// goodbye commands ignore cancellation

	QVector<DeviceUser> users_;			// uid -> user_id for compact records
	QQueue<DevicePunch> pending_;
};
