#include "connection_fsm.hpp"
#include "log/logging.hpp"

#include <stdexcept>

ConnectionFsm::ConnectionFsm(QObject* parent) : QObject(parent)
{
}

void ConnectionFsm::addTransition(const Transition& t)
{
		trans_.push_back(t);
}

void ConnectionFsm::start(ConnectionState initial)
{
		current_ = initial;
		terminal_ = false;
		enterTime_.start();
		emit stateChanged(current_);
}

const Transition* ConnectionFsm::find(ConnectionState from, ConnectionState to) const
{
	for (const auto& t : trans_) {
		if (t.from == from && t.to == to) return &t;
	}
	return nullptr;
}

bool ConnectionFsm::canTransition(ConnectionState to) const
{
	return !terminal_ && find(current_, to) != nullptr;
}

void ConnectionFsm::transitionTo(ConnectionState to)
{
	const Transition* t = terminal_ ? nullptr : find(current_, to);
	if (!t) {
		qCCritical(LC_FSM).noquote().nospace() << "illegal_transition device=" << owner_
			<< " from=" << toString(current_) << " to=" << toString(to)
			<< " terminal=" << terminal_;
		throw std::logic_error(std::string("illegal connection state transition ")
			+ toString(current_) + " -> " + toString(to));
	}

	const qint64 dwell = enterTime_.elapsed();
	qCDebug(LC_FSM) << "[EXIT]" << toString(current_) << "after dwell=" << dwell << "ms";

	const ConnectionState from = current_;
	current_ = to;
	enterTime_.restart();

	qCInfo(LC_FSM).noquote().nospace() << "state device=" << owner_
		<< " from=" << toString(from) << " to=" << toString(to) << " via=" << t->name;

	emit stateChanged(current_);
}

void ConnectionFsm::terminate()
{
	if (terminal_) return;

	const ConnectionState from = current_;
	current_ = ConnectionState::Disconnected;
	terminal_ = true;
	enterTime_.restart();

	qCInfo(LC_FSM).noquote().nospace() << "state device=" << owner_
		<< " from=" << toString(from) << " to=" << toString(current_) << " via=shutdown terminal=true";

	emit stateChanged(current_);
}
