#include "DeviceSession.hpp"

#include <QElapsedTimer>

#include "include/errors.hpp"
#include "log/logging.hpp"

DeviceSession::DeviceSession(std::unique_ptr<DeviceDriver> driver, const DeviceConfig& config,
                             const SessionTimeouts& timeouts, const CancelToken* cancel)
	: driver_(std::move(driver)), config_(config), timeouts_(timeouts)
{
	if (!driver_)
		throw ConnectionError(QStringLiteral("no driver for device %1").arg(config_.identityKey()));
	driver_->bindCancelToken(cancel);
}

DeviceSession::~DeviceSession()
{
	disconnect();
}

void DeviceSession::connect()
{
	if (connected_) return;

	try {
		driver_->open(config_, timeouts_.connectTimeoutMs);
		driver_->setIoTimeout(timeouts_.bootstrapTimeoutMs);
		serial_ = driver_->serialNumber().trimmed();
	} catch (const ProtocolError& e) {
		driver_->close();
		throw ConnectionError(QStringLiteral("handshake with %1 failed: %2")
			.arg(config_.identityKey(), e.message()));
	} catch (const ConnectionError&) {
		driver_->close();
		throw;
	}

	if (serial_.isEmpty())
		serial_ = config_.identityKey();
	else if (!config_.serial.isEmpty() && serial_ != config_.serial)
		qCWarning(LC_SESSION).noquote().nospace() << "serial_mismatch device=" << config_.identityKey()
			<< " reported=" << serial_ << " cause=device";

	connected_ = true;
	subscribed_ = false;
	qCInfo(LC_SESSION).noquote().nospace() << "connected device=" << config_.identityKey()
		<< " address=" << config_.address << ":" << config_.port << " serial=" << serial_;
}

void DeviceSession::disconnect() noexcept
{
	if (!connected_) return;
	connected_ = false;
	driver_->close();
	qCInfo(LC_SESSION).noquote().nospace() << "disconnected device=" << config_.identityKey();
}

bool DeviceSession::isAlive() const
{
	return connected_ && driver_->isAlive();
}

void DeviceSession::requireConnected(const char* operation) const
{
	if (!connected_)
		throw ConnectionError(QStringLiteral("%1 on a closed session for %2")
			.arg(QString::fromLatin1(operation), config_.identityKey()));
}

QVector<DeviceUser> DeviceSession::listUsers()
{
	requireConnected("listUsers");
	QVector<DeviceUser> users = driver_->readUsers();
	qCDebug(LC_SESSION).noquote().nospace() << "users device=" << config_.identityKey()
		<< " count=" << users.size();
	return users;
}

HistoricalBatch DeviceSession::fetchHistoricalRecords()
{
	requireConnected("fetchHistoricalRecords");
	HistoricalBatch batch = driver_->readAttendance();
	for (auto& r : batch.records)
		r.deviceSerial = serial_;
	qCDebug(LC_SESSION).noquote().nospace() << "history device=" << config_.identityKey()
		<< " count=" << batch.records.size() << " more=" << batch.backlogRemaining;
	return batch;
}

LiveSubscription DeviceSession::subscribeLive(CancelToken& token)
{
	requireConnected("subscribeLive");
	if (subscribed_)
		throw ProtocolError(QStringLiteral("live subscription already used on this session for %1")
			.arg(config_.identityKey()));

	driver_->startLiveCapture();
	subscribed_ = true;
	qCInfo(LC_SESSION).noquote().nospace() << "live_capture device=" << config_.identityKey();
	return LiveSubscription(this, &token, qMax(1, config_.pollIntervalMs));
}

// ---------------------------------------------------------------------------

LiveSubscription::LiveSubscription(DeviceSession* session, CancelToken* token, int sliceMs)
	: session_(session), token_(token), sliceMs_(sliceMs)
{
}

LiveSubscription::LiveSubscription(LiveSubscription&& other) noexcept
	: session_(other.session_), token_(other.token_), sliceMs_(other.sliceMs_),
	  terminated_(other.terminated_)
{
	other.session_ = nullptr;
	other.token_ = nullptr;
	other.terminated_ = true;
}

LiveSubscription::~LiveSubscription()
{
	if (session_ && session_->connected_)
		session_->driver_->stopLiveCapture();
}

std::optional<DevicePunch> LiveSubscription::next()
{
	if (!session_ || terminated_)
		throw ProtocolError(QStringLiteral("live subscription is terminated"));

	DeviceDriver* driver = session_->driver_.get();
	const int healthCheckMs = session_->timeouts_.liveReadTimeoutMs;

	QElapsedTimer silence;
	silence.start();

	try {
		while (!token_->isCancelled()) {
			session_->requireConnected("next");

			std::optional<DevicePunch> punch = driver->waitForPunch(sliceMs_);
			if (punch) {
				punch->deviceSerial = session_->serial_;
				return punch;
			}

			// Silence is normal. Past the read timeout, make sure the peer is still there.
			if (silence.elapsed() >= healthCheckMs) {
				if (!driver->isAlive())
					throw ConnectionError(QStringLiteral("device %1 stopped responding")
						.arg(session_->config_.identityKey()));
				silence.restart();
			}
		}
	} catch (const SyncError&) {
		terminated_ = true;
		throw;
	}

	terminated_ = true;
	return std::nullopt;
}
