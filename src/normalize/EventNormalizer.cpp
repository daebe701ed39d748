#include "EventNormalizer.hpp"

#include "include/errors.hpp"

EventNormalizer::EventNormalizer(const DeviceConfig& config)
	: config_(config), zone_(config.timezone.toUtf8())
{
	if (!zone_.isValid())
		throw ConfigError(QStringLiteral("device %1: unknown timezone '%2'")
			.arg(config_.identityKey(), config_.timezone));
}

QDateTime EventNormalizer::toCanonicalUtc(const QDate& date, const QTime& time, const QTimeZone& zone)
{
	const QDateTime local(date, QTime(time.hour(), time.minute(), time.second()), zone);
	return local.toUTC();
}

QString EventNormalizer::placeholderName(const QString& userId)
{
	return QStringLiteral("NN-%1").arg(userId);
}

AttendanceEvent EventNormalizer::normalize(const DevicePunch& punch) const
{
	const QString userId = punch.userId.trimmed();
	if (userId.isEmpty())
		throw ValidationError(QStringLiteral("record without a user id from %1").arg(config_.identityKey()));

	if (!punch.date.isValid() || !punch.time.isValid())
		throw ValidationError(QStringLiteral("record for user %1 from %2 has no valid timestamp")
			.arg(userId, config_.identityKey()));

	QString serial = punch.deviceSerial.trimmed();
	if (!config_.serial.isEmpty()) {
		if (!serial.isEmpty() && serial != config_.serial)
			throw ValidationError(QStringLiteral("record from device %1 arrived on the connection configured for %2")
				.arg(serial, config_.serial));
		serial = config_.serial;
	} else if (serial.isEmpty()) {
		serial = config_.identityKey();
	}

	const QDateTime utc = toCanonicalUtc(punch.date, punch.time, zone_);
	if (!utc.isValid())
		throw ValidationError(QStringLiteral("record for user %1 from %2 has a timestamp outside %3")
			.arg(userId, serial, config_.timezone));

	AttendanceEvent e;
	e.userId = userId;
	e.deviceSerial = serial;
	e.timestamp = utc;
	e.rawSequence = punch.sequence;
	return e;
}

UserRecord EventNormalizer::normalizeUser(const DeviceUser& user, const QDateTime& seenAt) const
{
	const QString userId = user.userId.trimmed();
	if (userId.isEmpty())
		throw ValidationError(QStringLiteral("user without an id from %1 (uid %2)")
			.arg(config_.identityKey()).arg(user.uid));

	const QString name = user.name.trimmed();

	UserRecord u;
	u.userId = userId;
	u.displayName = name.isEmpty() ? placeholderName(userId) : name;
	u.lastSeenAt = seenAt.toUTC();
	return u;
}
