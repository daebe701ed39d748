#pragma once
#include <QMutex>
#include <QObject>
#include <QString>
#include <atomic>

#include "fsm/connection_fsm.hpp"
#include "include/options.hpp"
#include "include/types.hpp"
#include "normalize/EventNormalizer.hpp"
#include "session/CancelToken.hpp"
#include "session/DeviceDriver.hpp"
#include "worker/Backoff.hpp"

class AttendanceStore;
class DeviceSession;
class SyncError;
class StoreError;

// Owns the lifecycle of one terminal: connect, catch up, stay live,
// reconnect with backoff. run() blocks the thread it is moved to until
// stop() is called or an unmodeled exception escapes (reported via crashed()).
class DeviceWorker : public QObject {
    Q_OBJECT
public:
				DeviceWorker(const DeviceConfig& config, const SyncOptions& options,
				             AttendanceStore* store, DriverFactory factory, QObject* parent = nullptr);
				~DeviceWorker() override;

				// Thread-safe. Returns immediately; run() winds down on its own thread.
				void stop();

				DeviceHealth health() const;
				void noteRestart();
				// Called once the worker's thread has finished.
				void markTerminal();
				QString identity() const { return identity_; }
				bool isRunning() const { return running_.load(); }

public slots:
				void run();

signals:
				void stateChanged(const QString& identity, ConnectionState state);
				void crashed(const QString& identity, const QString& reason);
				void finished(const QString& identity);

private:
				void controlLoop();
				void runSession();
				void bootstrap(DeviceSession& session);
				void captureLive(DeviceSession& session);
				void persist(const DevicePunch& punch);

				void enter(ConnectionState to);
				void enterTerminal();
				void recordDeviceFailure(const SyncError& e);
				void recordStoreFailure(const StoreError& e);
				void recordPersisted(bool inserted);

				DeviceConfig config_;
				SyncOptions options_;
				QString identity_;
				AttendanceStore* store_;
				DriverFactory factory_;
				EventNormalizer normalizer_;
				Backoff backoff_;

				ConnectionFsm fsm_;
				CancelToken token_;
				std::atomic<bool> running_{false};
				int retryStreak_ = 0;

				mutable QMutex healthMutex_;
				DeviceHealth health_;
};
