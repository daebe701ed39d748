#pragma once
#include <QMap>
#include <QObject>
#include <QString>
#include <QThread>
#include <QTimer>
#include <QVector>
#include <vector>

#include "include/options.hpp"
#include "include/types.hpp"
#include "session/DeviceDriver.hpp"
#include "worker/Backoff.hpp"

class AttendanceStore;
class DeviceWorker;

// Runs one DeviceWorker per configured terminal, each on its own thread,
// restarts crashed workers and stops the fleet within a bounded grace period.
class FleetSupervisor : public QObject {
	Q_OBJECT
public:
		FleetSupervisor(const QVector<DeviceConfig>& devices, const SyncOptions& options,
		                AttendanceStore* store, DriverFactory factory, QObject* parent = nullptr);
		~FleetSupervisor() override;

		void start();
		// Returns false when a worker had to be terminated after the grace period.
		bool stop();

		QMap<QString, DeviceHealth> fleetHealth() const;
		int size() const { return static_cast<int>(workers_.size()); }
		bool isRunning() const { return started_ && !stopped_; }

signals:
		void deviceStateChanged(const QString& identity, ConnectionState state);

public slots:
		void logHealthSummary() const;

private slots:
		void onWorkerCrashed(const QString& identity, const QString& reason);
		void onWorkerStateChanged(const QString& identity, ConnectionState state);

private:
		struct WorkerSlot {
			DeviceWorker* worker = nullptr;
			QThread* thread = nullptr;
			int crashes = 0;
		};
		WorkerSlot* find(const QString& identity);

		SyncOptions options_;
		Backoff crashBackoff_;
		std::vector<WorkerSlot> workers_;
		QTimer healthTimer_;
		bool started_ = false;
		bool stopping_ = false;
		bool stopped_ = false;
		bool stoppedCleanly_ = true;
};
