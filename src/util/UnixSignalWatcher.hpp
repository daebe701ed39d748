#pragma once
#include <QObject>
#include <QVector>

class QSocketNotifier;

// Delivers POSIX signals as a Qt signal on the thread that owns the watcher.
// The handler only writes the signal number to a socket pair.
class UnixSignalWatcher : public QObject {
	Q_OBJECT
public:
	explicit UnixSignalWatcher(const QVector<int>& signalNumbers, QObject* parent = nullptr);
	~UnixSignalWatcher() override;

signals:
	void signalReceived(int signalNumber);

private slots:
	void onReadable();

private:
	static void handler(int signalNumber);
	static int s_fds[2];

	QVector<int> watched_;
	QSocketNotifier* notifier_ = nullptr;
};
