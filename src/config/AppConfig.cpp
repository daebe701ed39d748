#include "AppConfig.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSet>
#include <QTimeZone>
#include <climits>

#include "include/errors.hpp"
#include "log/logging.hpp"

namespace {

int intOption(const QJsonObject& o, const char* key, int fallback)
{
	const QJsonValue v = o.value(QLatin1String(key));
	if (v.isUndefined() || v.isNull())
		return fallback;
	if (!v.isDouble())
		throw ConfigError(QStringLiteral("'%1' must be a number").arg(QLatin1String(key)));
	const double d = v.toDouble();
	if (d != static_cast<double>(static_cast<qint64>(d)) || d < INT_MIN || d > INT_MAX)
		throw ConfigError(QStringLiteral("'%1' must be an integer").arg(QLatin1String(key)));
	return static_cast<int>(d);
}

QString stringOption(const QJsonObject& o, const char* key, const QString& fallback)
{
	const QJsonValue v = o.value(QLatin1String(key));
	if (v.isUndefined() || v.isNull())
		return fallback;
	if (!v.isString())
		throw ConfigError(QStringLiteral("'%1' must be a string").arg(QLatin1String(key)));
	return v.toString();
}

DeviceConfig parseDevice(const QJsonObject& o, int index)
{
	DeviceConfig d;
	try {
		d.serial = stringOption(o, "serial", QString()).trimmed();
		d.address = stringOption(o, "address", QString()).trimmed();
		const int port = intOption(o, "port", d.port);
		if (port < 1 || port > 65535)
			throw ConfigError(QStringLiteral("port %1 out of range").arg(port));
		d.port = static_cast<quint16>(port);
		d.password = intOption(o, "password", d.password);
		d.timezone = stringOption(o, "timezone", d.timezone).trimmed();
		d.pollIntervalMs = intOption(o, "poll_interval_ms", d.pollIntervalMs);
	} catch (const ConfigError& e) {
		throw ConfigError(QStringLiteral("devices[%1]: %2").arg(index).arg(e.message()));
	}
	return d;
}

} // namespace

AppConfig AppConfig::load(const QString& path)
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly))
		throw ConfigError(QStringLiteral("cannot read config %1: %2").arg(path, f.errorString()));

	AppConfig cfg = fromJson(f.readAll());
	LOG_INFO(QStringLiteral("loaded %1 with %2 device(s), database driver %3")
		.arg(path).arg(cfg.devices.size()).arg(cfg.database.driver));
	return cfg;
}

AppConfig AppConfig::fromJson(const QByteArray& raw)
{
	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(raw, &perr);
	if (perr.error != QJsonParseError::NoError)
		throw ConfigError(QStringLiteral("JSON parse error at offset %1: %2")
			.arg(perr.offset).arg(perr.errorString()));
	if (!doc.isObject())
		throw ConfigError(QStringLiteral("config root must be an object"));

	const QJsonObject root = doc.object();
	AppConfig cfg;

	const QJsonObject db = root.value(QStringLiteral("database")).toObject();
	cfg.database.driver   = stringOption(db, "driver", cfg.database.driver);
	cfg.database.host     = stringOption(db, "host", cfg.database.host);
	cfg.database.port     = intOption(db, "port", cfg.database.port);
	cfg.database.name     = stringOption(db, "name", cfg.database.name);
	cfg.database.user     = stringOption(db, "user", cfg.database.user);
	cfg.database.password = stringOption(db, "password", cfg.database.password);
	cfg.database.options  = stringOption(db, "options", cfg.database.options);

	const QJsonObject sync = root.value(QStringLiteral("sync")).toObject();
	SyncOptions& s = cfg.sync;
	s.backoffBaseMs     = intOption(sync, "backoff_base_ms", s.backoffBaseMs);
	s.backoffCeilingMs  = intOption(sync, "backoff_ceiling_ms", s.backoffCeilingMs);
	s.connectTimeoutMs  = intOption(sync, "connect_timeout_ms", s.connectTimeoutMs);
	s.bootstrapTimeoutMs = intOption(sync, "bootstrap_timeout_ms", s.bootstrapTimeoutMs);
	s.liveReadTimeoutMs = intOption(sync, "live_read_timeout_ms", s.liveReadTimeoutMs);
	s.shutdownGraceMs   = intOption(sync, "shutdown_grace_ms", s.shutdownGraceMs);
	s.healthIntervalMs  = intOption(sync, "health_interval_ms", s.healthIntervalMs);
	s.crashRestartMs    = intOption(sync, "crash_restart_ms", s.crashRestartMs);
	const QJsonValue jitter = sync.value(QStringLiteral("backoff_jitter"));
	if (!jitter.isUndefined() && !jitter.isNull()) {
		if (!jitter.isDouble())
			throw ConfigError(QStringLiteral("'backoff_jitter' must be a number"));
		s.backoffJitter = jitter.toDouble();
	}

	const QJsonObject log = root.value(QStringLiteral("log")).toObject();
	cfg.logFile = stringOption(log, "file", QString());
	cfg.logRules = stringOption(log, "rules", QString());

	const QJsonValue devices = root.value(QStringLiteral("devices"));
	if (!devices.isUndefined() && !devices.isArray())
		throw ConfigError(QStringLiteral("'devices' must be an array"));
	const QJsonArray arr = devices.toArray();
	for (int i = 0; i < arr.size(); ++i) {
		if (!arr.at(i).isObject())
			throw ConfigError(QStringLiteral("devices[%1] must be an object").arg(i));
		cfg.devices.push_back(parseDevice(arr.at(i).toObject(), i));
	}

	cfg.validate();
	return cfg;
}

void AppConfig::validate() const
{
	if (database.driver != QLatin1String("QPSQL") && database.driver != QLatin1String("QSQLITE"))
		throw ConfigError(QStringLiteral("database driver '%1' is not supported (QPSQL or QSQLITE)")
			.arg(database.driver));
	if (database.name.isEmpty())
		throw ConfigError(QStringLiteral("database name is empty"));

	const struct { const char* key; int value; } positives[] = {
		{ "backoff_base_ms", sync.backoffBaseMs },
		{ "backoff_ceiling_ms", sync.backoffCeilingMs },
		{ "connect_timeout_ms", sync.connectTimeoutMs },
		{ "bootstrap_timeout_ms", sync.bootstrapTimeoutMs },
		{ "live_read_timeout_ms", sync.liveReadTimeoutMs },
		{ "shutdown_grace_ms", sync.shutdownGraceMs },
		{ "health_interval_ms", sync.healthIntervalMs },
		{ "crash_restart_ms", sync.crashRestartMs },
	};
	for (const auto& p : positives) {
		if (p.value <= 0)
			throw ConfigError(QStringLiteral("'%1' must be positive").arg(QLatin1String(p.key)));
	}
	if (sync.backoffBaseMs > sync.backoffCeilingMs)
		throw ConfigError(QStringLiteral("backoff_base_ms exceeds backoff_ceiling_ms"));
	if (sync.backoffJitter < 0.0 || sync.backoffJitter > 0.5)
		throw ConfigError(QStringLiteral("backoff_jitter must be within [0, 0.5]"));

	if (devices.isEmpty())
		throw ConfigError(QStringLiteral("no devices configured"));

	QSet<QString> keys;
	for (int i = 0; i < devices.size(); ++i) {
		const DeviceConfig& d = devices.at(i);
		if (d.address.isEmpty())
			throw ConfigError(QStringLiteral("devices[%1]: address is empty").arg(i));
		if (d.port == 0)
			throw ConfigError(QStringLiteral("devices[%1]: port is 0").arg(i));
		if (d.pollIntervalMs <= 0)
			throw ConfigError(QStringLiteral("devices[%1]: poll_interval_ms must be positive").arg(i));
		if (!QTimeZone(d.timezone.toUtf8()).isValid())
			throw ConfigError(QStringLiteral("devices[%1]: unknown timezone '%2'").arg(i).arg(d.timezone));

		const QString key = d.identityKey();
		if (keys.contains(key))
			throw ConfigError(QStringLiteral("devices[%1]: duplicate device %2").arg(i).arg(key));
		keys.insert(key);
	}

	qCDebug(LC_CONFIG) << "config valid, devices:" << devices.size();
}
