#include "DeviceWorker.hpp"

#include <QDeadlineTimer>
#include <QMutexLocker>
#include <memory>
#include <optional>

#include "fsm/connection_fsm_setup.hpp"
#include "include/errors.hpp"
#include "log/logging.hpp"
#include "services/AttendanceStore.hpp"
#include "session/DeviceSession.hpp"

DeviceWorker::DeviceWorker(const DeviceConfig& config, const SyncOptions& options,
                           AttendanceStore* store, DriverFactory factory, QObject* parent)
	: QObject(parent),
	  config_(config),
	  options_(options),
	  identity_(config.identityKey()),
	  store_(store),
	  factory_(std::move(factory)),
	  normalizer_(config),
	  backoff_(options.backoffBaseMs, options.backoffCeilingMs, options.backoffJitter),
	  fsm_(this)
{
	health_.deviceSerial = identity_;

	connect(&fsm_, &ConnectionFsm::stateChanged, this, [this](ConnectionState s) {
		{
			QMutexLocker lock(&healthMutex_);
			health_.state = s;
		}
		emit stateChanged(identity_, s);
	});

	fsm_.setOwner(identity_);
	setupConnectionFsm(fsm_);
}

DeviceWorker::~DeviceWorker() = default;

void DeviceWorker::stop()
{
	token_.cancel();
}

DeviceHealth DeviceWorker::health() const
{
	QMutexLocker lock(&healthMutex_);
	return health_;
}

void DeviceWorker::noteRestart()
{
	QMutexLocker lock(&healthMutex_);
	++health_.restarts;
}

void DeviceWorker::markTerminal()
{
	// After QThread::terminate() run() never returned, so running_ is stale and
	// the dead thread may still hold healthMutex_.
	running_.store(false);
	fsm_.terminate();
	if (!healthMutex_.tryLock(100)) {
		qCCritical(LC_WORKER).noquote() << "health of" << identity_ << "left locked by a terminated thread";
		return;
	}
	health_.state = fsm_.current();
	health_.terminal = true;
	healthMutex_.unlock();
}

void DeviceWorker::run()
{
	if (running_.exchange(true)) return;

	try {
		controlLoop();
	} catch (const std::exception& e) {
		const QString reason = QString::fromUtf8(e.what());
		qCCritical(LC_WORKER).noquote().nospace() << "worker_crashed device=" << identity_
			<< " state=" << toString(fsm_.current()) << " error=" << reason;
		{
			QMutexLocker lock(&healthMutex_);
			health_.lastError = reason;
		}
		if (!fsm_.isTerminal() && fsm_.current() != ConnectionState::Reconnecting)
			fsm_.transitionTo(ConnectionState::Reconnecting);

		store_->releaseThreadConnection();
		running_.store(false);
		emit crashed(identity_, reason);
		return;
	}

	store_->releaseThreadConnection();
	running_.store(false);
	emit finished(identity_);
}

void DeviceWorker::controlLoop()
{
	while (!token_.isCancelled()) {
		enter(ConnectionState::Connecting);
		runSession();
		if (token_.isCancelled()) break;

		const int attempt = ++retryStreak_;
		const qint64 delay = backoff_.delayMs(attempt);
		qCInfo(LC_WORKER).noquote().nospace() << "retry device=" << identity_
			<< " attempt=" << attempt << " delay_ms=" << delay;
		if (token_.waitFor(delay)) break;
	}

	enterTerminal();
}

void DeviceWorker::runSession()
{
	const SessionTimeouts timeouts{ options_.connectTimeoutMs, options_.bootstrapTimeoutMs,
	                                options_.liveReadTimeoutMs };
	std::unique_ptr<DeviceSession> session;

	try {
		session = std::make_unique<DeviceSession>(factory_(config_), config_, timeouts, &token_);
		session->connect();
		if (token_.isCancelled()) return;

		enter(ConnectionState::Bootstrapping);
		bootstrap(*session);
		if (token_.isCancelled()) return;

		enter(ConnectionState::Live);
		captureLive(*session);
	} catch (const StoreError& e) {
		recordStoreFailure(e);
	} catch (const ConnectionError& e) {
		recordDeviceFailure(e);
	} catch (const ProtocolError& e) {
		recordDeviceFailure(e);
	}

	if (session)
		session->disconnect();
	if (!token_.isCancelled())
		enter(ConnectionState::Reconnecting);
}

void DeviceWorker::bootstrap(DeviceSession& session)
{
	const QDeadlineTimer deadline(options_.bootstrapTimeoutMs);

	const QDateTime resumeFrom = store_->latestEventTimestamp(session.deviceSerial());
	qCInfo(LC_WORKER).noquote().nospace() << "bootstrap device=" << identity_
		<< " serial=" << session.deviceSerial()
		<< " last_persisted=" << (resumeFrom.isValid() ? resumeFrom.toString(Qt::ISODate) : QStringLiteral("none"));

	const QDateTime seenAt = QDateTime::currentDateTimeUtc();
	const QVector<DeviceUser> users = session.listUsers();
	int usersSynced = 0;
	for (const auto& u : users) {
		if (token_.isCancelled()) return;
		try {
			store_->upsertUser(normalizer_.normalizeUser(u, seenAt));
			++usersSynced;
		} catch (const ValidationError& e) {
			{
				QMutexLocker lock(&healthMutex_);
				++health_.validationRejected;
			}
			qCWarning(LC_WORKER).noquote().nospace() << "user_rejected device=" << identity_
				<< " reason=" << e.message();
		}
	}

	int batches = 0;
	qint64 records = 0;
	for (;;) {
		if (token_.isCancelled()) return;
		if (deadline.hasExpired())
			throw ConnectionError(QStringLiteral("bootstrap of %1 exceeded %2 ms")
				.arg(identity_).arg(options_.bootstrapTimeoutMs));

		const HistoricalBatch batch = session.fetchHistoricalRecords();
		++batches;
		for (const auto& punch : batch.records) {
			if (token_.isCancelled()) return;
			persist(punch);
		}
		records += batch.records.size();
		if (!batch.backlogRemaining) break;
	}

	qCInfo(LC_WORKER).noquote().nospace() << "bootstrap_done device=" << identity_
		<< " users=" << usersSynced << " records=" << records << " batches=" << batches;
}

void DeviceWorker::captureLive(DeviceSession& session)
{
	LiveSubscription live = session.subscribeLive(token_);
	while (std::optional<DevicePunch> punch = live.next())
		persist(*punch);
}

void DeviceWorker::persist(const DevicePunch& punch)
{
	AttendanceEvent event;
	try {
		event = normalizer_.normalize(punch);
	} catch (const ValidationError& e) {
		{
			QMutexLocker lock(&healthMutex_);
			++health_.validationRejected;
		}
		qCWarning(LC_WORKER).noquote().nospace() << "record_rejected device=" << identity_
			<< " reason=" << e.message();
		return;
	}

	const InsertOutcome outcome = store_->insertEventIfAbsent(event);
	recordPersisted(outcome == InsertOutcome::Inserted);

	if (outcome == InsertOutcome::Inserted)
		qCDebug(LC_WORKER).noquote().nospace() << "event_persisted device=" << identity_
			<< " user=" << event.userId << " ts=" << event.timestampText();
}

void DeviceWorker::enter(ConnectionState to)
{
	fsm_.transitionTo(to);
}

void DeviceWorker::enterTerminal()
{
	fsm_.terminate();
	// Health is written directly so the snapshot matches even if no stateChanged follows.
	QMutexLocker lock(&healthMutex_);
	health_.state = fsm_.current();
	health_.terminal = true;
}

void DeviceWorker::recordDeviceFailure(const SyncError& e)
{
	// Device I/O interrupted by stop() is not a device failure.
	if (token_.isCancelled()) {
		qCDebug(LC_WORKER).noquote() << "session of" << identity_ << "interrupted:" << e.message();
		return;
	}
	int failures = 0;
	{
		QMutexLocker lock(&healthMutex_);
		failures = ++health_.consecutiveFailures;
		health_.lastError = e.message();
	}
	qCWarning(LC_WORKER).noquote().nospace() << "session_failed device=" << identity_
		<< " state=" << toString(fsm_.current()) << " cause=device failures=" << failures
		<< " error=" << e.message();
}

void DeviceWorker::recordStoreFailure(const StoreError& e)
{
	quint64 failures = 0;
	{
		QMutexLocker lock(&healthMutex_);
		failures = ++health_.storeFailures;
		health_.lastError = e.message();
	}
	qCWarning(LC_WORKER).noquote().nospace() << "session_failed device=" << identity_
		<< " state=" << toString(fsm_.current()) << " cause=storage store_failures=" << failures
		<< " error=" << e.message();
}

// Only a new event counts as progress: a flapping device that replays the same
// history on every connect keeps backing off.
void DeviceWorker::recordPersisted(bool inserted)
{
	QMutexLocker lock(&healthMutex_);
	if (!inserted) {
		++health_.duplicatesSuppressed;
		return;
	}
	retryStreak_ = 0;
	++health_.eventsPersisted;
	health_.consecutiveFailures = 0;
	health_.lastSuccessAt = QDateTime::currentDateTimeUtc();
}
