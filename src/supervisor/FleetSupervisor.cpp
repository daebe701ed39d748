#include "FleetSupervisor.hpp"

#include <QDeadlineTimer>
#include <QMetaObject>
#include <QSet>

#include "include/errors.hpp"
#include "log/logging.hpp"
#include "worker/DeviceWorker.hpp"

FleetSupervisor::FleetSupervisor(const QVector<DeviceConfig>& devices, const SyncOptions& options,
                                 AttendanceStore* store, DriverFactory factory, QObject* parent)
	: QObject(parent),
	  options_(options),
	  crashBackoff_(options.crashRestartMs, qMax(options.crashRestartMs, options.backoffCeilingMs),
	                options.backoffJitter)
{
	qRegisterMetaType<ConnectionState>("ConnectionState");

	QSet<QString> seen;
	for (const auto& d : devices) {
		const QString key = d.identityKey();
		if (seen.contains(key))
			throw ConfigError(QStringLiteral("device %1 is configured twice").arg(key));
		seen.insert(key);
	}

	for (const auto& d : devices) {
		const QString key = d.identityKey();
		WorkerSlot slot;
		try {
			slot.worker = new DeviceWorker(d, options_, store, factory);
		} catch (const SyncError&) {
			for (auto& created : workers_)
				delete created.worker;
			workers_.clear();
			throw;
		}
		slot.thread = new QThread(this);
		slot.thread->setObjectName(QStringLiteral("worker-%1").arg(key));
		slot.worker->moveToThread(slot.thread);

		connect(slot.thread, &QThread::started, slot.worker, &DeviceWorker::run);
		connect(slot.worker, &DeviceWorker::crashed, this, &FleetSupervisor::onWorkerCrashed);
		connect(slot.worker, &DeviceWorker::stateChanged, this, &FleetSupervisor::onWorkerStateChanged);
		workers_.push_back(slot);
	}

	healthTimer_.setInterval(qMax(1, options_.healthIntervalMs));
	connect(&healthTimer_, &QTimer::timeout, this, &FleetSupervisor::logHealthSummary);
}

FleetSupervisor::~FleetSupervisor()
{
	stop();
	for (auto& slot : workers_) {
		delete slot.worker;
		slot.worker = nullptr;
	}
}

FleetSupervisor::WorkerSlot* FleetSupervisor::find(const QString& identity)
{
	for (auto& slot : workers_) {
		if (slot.worker->identity() == identity) return &slot;
	}
	return nullptr;
}

void FleetSupervisor::start()
{
	if (started_) return;
	started_ = true;

	for (auto& slot : workers_)
		slot.thread->start();
	healthTimer_.start();

	qCInfo(LC_FLEET).noquote().nospace() << "fleet_started devices=" << workers_.size();
}

bool FleetSupervisor::stop()
{
	if (!started_ || stopped_) {
		stopped_ = true;
		for (auto& slot : workers_)
			slot.worker->markTerminal();
		return stoppedCleanly_;
	}

	stopping_ = true;
	healthTimer_.stop();
	qCInfo(LC_FLEET).noquote().nospace() << "fleet_stopping devices=" << workers_.size()
		<< " grace_ms=" << options_.shutdownGraceMs;

	for (auto& slot : workers_)
		slot.worker->stop();

	const QDeadlineTimer deadline(options_.shutdownGraceMs);
	for (auto& slot : workers_) {
		slot.thread->quit();
		if (!slot.thread->wait(deadline)) {
			qCCritical(LC_FLEET).noquote().nospace() << "worker_stuck device=" << slot.worker->identity()
				<< " grace_ms=" << options_.shutdownGraceMs << " action=terminate";
			stoppedCleanly_ = false;
			slot.thread->terminate();
			slot.thread->wait();
		}
		slot.worker->markTerminal();
	}

	stopped_ = true;
	logHealthSummary();
	qCInfo(LC_FLEET).noquote().nospace() << "fleet_stopped clean=" << stoppedCleanly_;
	return stoppedCleanly_;
}

QMap<QString, DeviceHealth> FleetSupervisor::fleetHealth() const
{
	QMap<QString, DeviceHealth> out;
	for (const auto& slot : workers_)
		out.insert(slot.worker->identity(), slot.worker->health());
	return out;
}

void FleetSupervisor::logHealthSummary() const
{
	quint64 persisted = 0, duplicates = 0, rejected = 0;
	int live = 0;

	for (const auto& slot : workers_) {
		const DeviceHealth h = slot.worker->health();
		persisted += h.eventsPersisted;
		duplicates += h.duplicatesSuppressed;
		rejected += h.validationRejected;
		if (h.state == ConnectionState::Live) ++live;

		qCInfo(LC_FLEET).noquote().nospace() << "health device=" << h.deviceSerial
			<< " state=" << toString(h.state)
			<< " failures=" << h.consecutiveFailures
			<< " last_success=" << (h.lastSuccessAt.isValid() ? h.lastSuccessAt.toString(Qt::ISODate) : QStringLiteral("never"))
			<< " persisted=" << h.eventsPersisted
			<< " duplicates=" << h.duplicatesSuppressed
			<< " rejected=" << h.validationRejected
			<< " store_failures=" << h.storeFailures
			<< " restarts=" << h.restarts;
	}

	qCInfo(LC_FLEET).noquote().nospace() << "health_summary devices=" << workers_.size()
		<< " live=" << live << " persisted=" << persisted
		<< " duplicates=" << duplicates << " rejected=" << rejected;
}

void FleetSupervisor::onWorkerCrashed(const QString& identity, const QString& reason)
{
	WorkerSlot* slot = find(identity);
	if (!slot || stopping_) return;

	const int crashes = ++slot->crashes;
	const qint64 delay = crashBackoff_.delayMs(crashes);
	qCWarning(LC_FLEET).noquote().nospace() << "worker_restart device=" << identity
		<< " crashes=" << crashes << " delay_ms=" << delay << " reason=" << reason;

	DeviceWorker* worker = slot->worker;
	QTimer::singleShot(delay, this, [this, worker]() {
		if (stopping_) return;
		worker->noteRestart();
		QMetaObject::invokeMethod(worker, &DeviceWorker::run, Qt::QueuedConnection);
	});
}

void FleetSupervisor::onWorkerStateChanged(const QString& identity, ConnectionState state)
{
	if (state == ConnectionState::Live) {
		if (WorkerSlot* slot = find(identity))
			slot->crashes = 0;
	}
	emit deviceStateChanged(identity, state);
}
