#pragma once
#include <QByteArray>
#include <QString>
#include <QVector>

#include "include/options.hpp"
#include "include/types.hpp"

// Daemon configuration read from a JSON file. Loading validates; any
// problem is a ConfigError and nothing is started.
struct AppConfig {
	DatabaseConfig database;
	SyncOptions sync;
	QVector<DeviceConfig> devices;
	QString logFile;		// empty: console only
	QString logRules;		// QLoggingCategory filter rules, ';' separated

	static AppConfig load(const QString& path);
	static AppConfig fromJson(const QByteArray& raw);

	void validate() const;
};
