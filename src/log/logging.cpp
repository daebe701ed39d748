#include "log/logging.hpp"

Q_LOGGING_CATEGORY(LC_SESSION, "attendsync.session")
Q_LOGGING_CATEGORY(LC_ZK,      "attendsync.zk")
Q_LOGGING_CATEGORY(LC_WORKER,  "attendsync.worker")
Q_LOGGING_CATEGORY(LC_STORE,   "attendsync.store")
Q_LOGGING_CATEGORY(LC_FLEET,   "attendsync.fleet")
Q_LOGGING_CATEGORY(LC_FSM,     "attendsync.fsm")
Q_LOGGING_CATEGORY(LC_CONFIG,  "attendsync.config")
