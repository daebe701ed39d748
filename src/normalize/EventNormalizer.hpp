#pragma once
#include <QDateTime>
#include <QTimeZone>

#include "include/types.hpp"

// Turns device-native records into canonical ones. Pure: no I/O, no state
// besides the device configuration. Rejects with ValidationError.
class EventNormalizer {
public:
	explicit EventNormalizer(const DeviceConfig& config);

	AttendanceEvent normalize(const DevicePunch& punch) const;
	UserRecord normalizeUser(const DeviceUser& user, const QDateTime& seenAt) const;

	// Device wall clock in `zone` -> UTC, truncated to whole seconds.
	static QDateTime toCanonicalUtc(const QDate& date, const QTime& time, const QTimeZone& zone);

	// "NN-<id>" placeholder for users known only from attendance.
	static QString placeholderName(const QString& userId);

private:
	DeviceConfig config_;
	QTimeZone zone_;
};
