#pragma once
#include <QString>

struct DatabaseConfig {
	QString driver = QStringLiteral("QPSQL");	// QPSQL or QSQLITE
	QString host = QStringLiteral("localhost");
	int     port = 5432;
	QString name = QStringLiteral("attendance");
	QString user;
	QString password;
	QString options;							// extra driver connect options
};

// Timing knobs shared by every worker. Milliseconds unless noted.
struct SyncOptions {
	int    backoffBaseMs = 1000;
	int    backoffCeilingMs = 60000;
	double backoffJitter = 0.5;				// fraction of the nominal delay, 0..0.5
	int    connectTimeoutMs = 5000;
	int    bootstrapTimeoutMs = 30000;
	int    liveReadTimeoutMs = 60000;
	int    shutdownGraceMs = 10000;
	int    healthIntervalMs = 60000;
	int    crashRestartMs = 5000;
};
