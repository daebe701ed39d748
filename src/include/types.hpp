#pragma once
#include <QDate>
#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QTime>
#include <QVector>
#include <QtGlobal>

#include "include/states.hpp"

// One terminal as listed in the configuration file.
struct DeviceConfig {
	QString serial;						// may be empty; the address is the identity then
	QString address;
	quint16 port = 4370;
	int     password = 0;				// comm key
	QString timezone = QStringLiteral("UTC");
	int     pollIntervalMs = 1000;		// live wait slice

	QString identityKey() const {
		return serial.isEmpty() ? QStringLiteral("%1:%2").arg(address).arg(port) : serial;
	}
};

// Device-native user record, before normalization.
struct DeviceUser {
	int     uid = 0;					// internal slot number on the terminal
	QString userId;
	QString name;
	int     privilege = 0;
};

// Device-native punch. The wall clock is the device's own, without a zone.
struct DevicePunch {
	QString userId;
	int     uid = 0;
	QDate   date;
	QTime   time;
	int     status = 0;
	int     punch = 0;
	QString deviceSerial;				// stamped by the session
	qint64  sequence = -1;				// device-side ordinal when known
};

struct UserRecord {
	QString   userId;
	QString   displayName;
	QDateTime lastSeenAt;
};

// Canonical event. Natural key is (userId, timestamp, deviceSerial).
struct AttendanceEvent {
	QString   userId;
	QString   deviceSerial;
	QDateTime timestamp;				// UTC, whole seconds
	qint64    rawSequence = -1;		// informational only, never part of the key

	QString timestampText() const {
		return timestamp.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
	}
};

struct HistoricalBatch {
	QVector<DevicePunch> records;
	bool backlogRemaining = false;
};

struct DeviceHealth {
	QString         deviceSerial;		// identity key
	ConnectionState state = ConnectionState::Disconnected;
	QDateTime       lastSuccessAt;
	int             consecutiveFailures = 0;

	quint64 eventsPersisted = 0;
	quint64 duplicatesSuppressed = 0;
	quint64 validationRejected = 0;
	quint64 storeFailures = 0;
	int     restarts = 0;
	QString lastError;
	bool    terminal = false;
};

Q_DECLARE_METATYPE(DeviceHealth)
