#include "UnixSignalWatcher.hpp"

#include <QSocketNotifier>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

#include "include/errors.hpp"
#include "log/logging.hpp"

int UnixSignalWatcher::s_fds[2] = { -1, -1 };

UnixSignalWatcher::UnixSignalWatcher(const QVector<int>& signalNumbers, QObject* parent)
	: QObject(parent), watched_(signalNumbers)
{
	if (s_fds[0] < 0 && ::socketpair(AF_UNIX, SOCK_STREAM, 0, s_fds) != 0)
		throw ConfigError(QStringLiteral("signal socketpair failed: %1")
			.arg(QString::fromLocal8Bit(std::strerror(errno))));

	notifier_ = new QSocketNotifier(s_fds[1], QSocketNotifier::Read, this);
	connect(notifier_, &QSocketNotifier::activated, this, &UnixSignalWatcher::onReadable);

	for (int sig : watched_) {
		struct sigaction sa;
		std::memset(&sa, 0, sizeof(sa));
		sa.sa_handler = &UnixSignalWatcher::handler;
		sigemptyset(&sa.sa_mask);
		sa.sa_flags = SA_RESTART;
		if (::sigaction(sig, &sa, nullptr) != 0)
			throw ConfigError(QStringLiteral("sigaction(%1) failed: %2")
				.arg(sig).arg(QString::fromLocal8Bit(std::strerror(errno))));
	}
}

UnixSignalWatcher::~UnixSignalWatcher()
{
	for (int sig : watched_)
		::signal(sig, SIG_DFL);
}

void UnixSignalWatcher::handler(int signalNumber)
{
	const char c = static_cast<char>(signalNumber);
	// A full buffer already holds a pending wakeup.
	if (::write(s_fds[0], &c, sizeof(c)) < 0)
		return;
}

void UnixSignalWatcher::onReadable()
{
	notifier_->setEnabled(false);
	char c = 0;
	const ssize_t n = ::read(s_fds[1], &c, sizeof(c));
	notifier_->setEnabled(true);

	if (n != sizeof(c)) {
		qCWarning(LC_FLEET) << "signal pipe read failed:" << std::strerror(errno);
		return;
	}

	qCInfo(LC_FLEET).noquote().nospace() << "signal_received signal=" << static_cast<int>(c);
	emit signalReceived(static_cast<int>(c));
}
