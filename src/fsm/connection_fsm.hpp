#pragma once
#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <vector>

#include "include/states.hpp"

struct Transition {
		const char* name = "unnamed";			// label used in logs
		ConnectionState from;
		ConnectionState to;
};

// Validated connection lifecycle of one device worker.
// Transitions not in the table are defects and throw std::logic_error.
class ConnectionFsm : public QObject {
		Q_OBJECT
public:
			explicit ConnectionFsm(QObject* parent = nullptr);

			void setOwner(const QString& deviceKey) { owner_ = deviceKey; }
			void addTransition(const Transition& t);
			void start(ConnectionState initial);

			bool canTransition(ConnectionState to) const;
			void transitionTo(ConnectionState to);

			// Shutdown: any state may move to Disconnected, after which nothing may leave it.
			void terminate();

			ConnectionState current() const { return current_; }
			bool isTerminal() const { return terminal_; }

signals:
			void stateChanged(ConnectionState);

private:
		const Transition* find(ConnectionState from, ConnectionState to) const;

		QString owner_;
		ConnectionState current_ = ConnectionState::Disconnected;
		bool terminal_ = false;
		QElapsedTimer enterTime_;
		std::vector<Transition> trans_;
};
