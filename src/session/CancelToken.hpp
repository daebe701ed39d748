#pragma once
#include <QDeadlineTimer>
#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <atomic>

// Cooperative cancellation shared by a worker and whoever stops it.
class CancelToken {
public:
	void cancel() {
		QMutexLocker lock(&mutex_);
		cancelled_.store(true);
		cond_.wakeAll();
	}

	bool isCancelled() const { return cancelled_.load(); }

	// Sleeps up to ms; wakes early on cancel. Returns true when cancelled.
	bool waitFor(qint64 ms) {
		QMutexLocker lock(&mutex_);
		QDeadlineTimer deadline(ms);
		while (!cancelled_.load()) {
			if (!cond_.wait(&mutex_, deadline))
				break;
		}
		return cancelled_.load();
	}

private:
	std::atomic<bool> cancelled_{false};
	QMutex mutex_;
	QWaitCondition cond_;
};
