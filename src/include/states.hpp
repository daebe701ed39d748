#pragma once
#include <QMetaType>

enum class ConnectionState {
	Disconnected = 0,	// initial and terminal
	Connecting,			// 1
	Bootstrapping,		// 2
	Live,				// 3
	Reconnecting		// 4
};

inline const char* toString(ConnectionState s)
{
	switch (s) {
		case ConnectionState::Disconnected:		return "disconnected";
		case ConnectionState::Connecting:		return "connecting";
		case ConnectionState::Bootstrapping:	return "bootstrapping";
		case ConnectionState::Live:				return "live";
		case ConnectionState::Reconnecting:		return "reconnecting";
	}
	return "unknown";
}

enum class InsertOutcome { Inserted, AlreadyExists };

Q_DECLARE_METATYPE(ConnectionState)
