//connection_fsm_setup.hpp
#pragma once
#include "connection_fsm.hpp"

inline void setupConnectionFsm(ConnectionFsm& fsm)
{
		using S = ConnectionState;

		fsm.addTransition({"start",            S::Disconnected,  S::Connecting});
		fsm.addTransition({"connected",        S::Connecting,    S::Bootstrapping});
		fsm.addTransition({"connect-failed",   S::Connecting,    S::Reconnecting});
		fsm.addTransition({"caught-up",        S::Bootstrapping, S::Live});
		fsm.addTransition({"bootstrap-failed", S::Bootstrapping, S::Reconnecting});
		fsm.addTransition({"live-failed",      S::Live,          S::Reconnecting});
		fsm.addTransition({"retry",            S::Reconnecting,  S::Connecting});

		// A worker that crashed before it ever connected restarts through Reconnecting.
		fsm.addTransition({"crash-restart",    S::Disconnected,  S::Reconnecting});

		fsm.start(S::Disconnected);
}
