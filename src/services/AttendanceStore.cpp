#include "AttendanceStore.hpp"
#include "services/SqlCommon.hpp"

#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>
#include <QTimeZone>
#include <QVariant>

#include "include/errors.hpp"
#include "log/logging.hpp"
#include "normalize/EventNormalizer.hpp"

using namespace SqlCommon;

namespace {

QString utcText(const QDateTime& dt)
{
    return dt.toUTC().toString(timestampFormat());
}

QDateTime readUtc(const QVariant& v)
{
    if (v.isNull())
        return {};
    if (v.metaType().id() == QMetaType::QDateTime) {
        const QDateTime dt = v.toDateTime();
        return QDateTime(dt.date(), dt.time(), QTimeZone::utc());
    }
    const QDateTime dt = QDateTime::fromString(v.toString(), timestampFormat());
    return dt.isValid() ? QDateTime(dt.date(), dt.time(), QTimeZone::utc()) : QDateTime();
}

QStringList schemaStatements(const QString& driver)
{
    const QString idColumn = isSqlite(driver)
        ? QStringLiteral("id INTEGER PRIMARY KEY AUTOINCREMENT")
        : QStringLiteral("id BIGSERIAL PRIMARY KEY");

    return {
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS users ("
            "user_id VARCHAR(50) PRIMARY KEY, "
            "username VARCHAR(100), "
            "last_seen_at TIMESTAMP, "
            "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
            "updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS attendance (%1, "
            "user_id VARCHAR(50) NOT NULL REFERENCES users(user_id), "
            "timestamp TIMESTAMP NOT NULL, "
            "device_serial VARCHAR(150) NOT NULL, "
            "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
            "CONSTRAINT uq_attendance_natural_key UNIQUE (user_id, timestamp, device_serial))").arg(idColumn),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_attendance_user_id ON attendance(user_id)"),
        QStringLiteral("CREATE INDEX IF NOT EXISTS idx_attendance_timestamp ON attendance(timestamp)"),
    };
}

} // namespace

AttendanceStore::AttendanceStore(const DatabaseConfig& config)
    : config_(config), storeTag_(nextStoreTag())
{
}

AttendanceStore::~AttendanceStore()
{
    releaseThreadConnection();
}

// Drops the thread's connection before throwing. After a server restart the
// handle still reports isOpen(); the next call has to open a fresh one.
void AttendanceStore::fail(const QString& what, const QSqlError& err)
{
    qCWarning(LC_STORE).noquote().nospace() << "store_failure op=" << what
        << " cause=storage error=" << err.text();
    resetThreadConnection();
    throw StoreError(QStringLiteral("%1: %2").arg(what, err.text()));
}

void AttendanceStore::exec(QSqlQuery& q, const QString& what)
{
    if (!q.exec())
        fail(what, q.lastError());
}

QSqlDatabase AttendanceStore::connectionForThisThread()
{
    const QString name = connectionNameForCurrentThread(storeTag_);
    QSqlDatabase db;

    if (!QSqlDatabase::contains(name)) {
        db = QSqlDatabase::addDatabase(config_.driver, name);
        db.setDatabaseName(config_.name);
        QString options = config_.options;
        if (isSqlite(config_.driver)) {
            const QString busy = QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000");
            options = options.isEmpty() ? busy : busy + QLatin1Char(';') + options;
        } else {
            db.setHostName(config_.host);
            db.setPort(config_.port);
            db.setUserName(config_.user);
            db.setPassword(config_.password);
        }
        db.setConnectOptions(options);
    } else {
        db = QSqlDatabase::database(name, /*open=*/false);
    }

    if (!db.isOpen()) {
        if (!db.open()) {
            const QSqlError err = db.lastError();
            qCWarning(LC_STORE).noquote().nospace() << "store_unavailable driver=" << config_.driver
                << " database=" << config_.name << " cause=storage error=" << err.text()
                << " drivers=" << QSqlDatabase::drivers().join(',');
            throw StoreError(QStringLiteral("database open failed: %1").arg(err.text()));
        }

        if (isSqlite(config_.driver)) {   // per-connection options
            QSqlQuery pragma(db);
            if (!pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL")))
                qCDebug(LC_STORE) << "journal_mode=WAL not applied:" << pragma.lastError().text();
            if (!pragma.exec(QStringLiteral("PRAGMA synchronous=NORMAL")))
                qCDebug(LC_STORE) << "synchronous=NORMAL not applied:" << pragma.lastError().text();
            if (!pragma.exec(QStringLiteral("PRAGMA foreign_keys=ON")))
                fail(QStringLiteral("enable foreign keys"), pragma.lastError());
        }
    }
    return db;
}

void AttendanceStore::resetThreadConnection()
{
    const QString name = connectionNameForCurrentThread(storeTag_);
    if (!QSqlDatabase::contains(name))
        return;
    QSqlDatabase db = QSqlDatabase::database(name, /*open=*/false);
    if (db.isOpen() && db.driver()->hasFeature(QSqlDriver::Transactions))
        db.rollback();
    db.close();
}

void AttendanceStore::releaseThreadConnection()
{
    const QString name = connectionNameForCurrentThread(storeTag_);
    if (!QSqlDatabase::contains(name))
        return;
    {
        QSqlDatabase db = QSqlDatabase::database(name, /*open=*/false);
        db.close();
    }
    QSqlDatabase::removeDatabase(name);
}

void AttendanceStore::ensureSchema()
{
    QSqlDatabase db = connectionForThisThread();
    QSqlQuery q(db);

    for (const QString& sql : schemaStatements(config_.driver)) {
        if (!q.exec(sql))
            fail(QStringLiteral("create schema"), q.lastError());
    }

    qCInfo(LC_STORE).noquote().nospace() << "schema_ready driver=" << db.driverName()
        << " database=" << db.databaseName();
}

void AttendanceStore::upsertUser(const UserRecord& user)
{
    QSqlDatabase db = connectionForThisThread();
    QSqlQuery q(db);
    q.prepare(QStringLiteral(
        "INSERT INTO users (user_id, username, last_seen_at, updated_at) "
        "VALUES (?, ?, ?, CURRENT_TIMESTAMP) "
        "ON CONFLICT (user_id) DO UPDATE SET "
        "username = excluded.username, "
        "last_seen_at = excluded.last_seen_at, "
        "updated_at = CURRENT_TIMESTAMP"));
    q.addBindValue(user.userId);
    q.addBindValue(user.displayName);
    q.addBindValue(user.lastSeenAt.isValid() ? QVariant(utcText(user.lastSeenAt)) : QVariant());

    exec(q, QStringLiteral("upsert user %1").arg(user.userId));
}

InsertOutcome AttendanceStore::insertEventIfAbsent(const AttendanceEvent& event)
{
    QSqlDatabase db = connectionForThisThread();
    if (!db.transaction())
        fail(QStringLiteral("begin transaction"), db.lastError());

    const QString ts = event.timestampText();
    int affected = 0;
    {
        QSqlQuery user(db);
        user.prepare(QStringLiteral(
            "INSERT INTO users (user_id, username, last_seen_at) VALUES (?, ?, ?) "
            "ON CONFLICT (user_id) DO NOTHING"));
        user.addBindValue(event.userId);
        user.addBindValue(EventNormalizer::placeholderName(event.userId));
        user.addBindValue(ts);
        exec(user, QStringLiteral("ensure user %1").arg(event.userId));

        QSqlQuery ins(db);
        ins.prepare(QStringLiteral(
            "INSERT INTO attendance (user_id, timestamp, device_serial) VALUES (?, ?, ?) "
            "ON CONFLICT (user_id, timestamp, device_serial) DO NOTHING"));
        ins.addBindValue(event.userId);
        ins.addBindValue(ts);
        ins.addBindValue(event.deviceSerial);
        exec(ins, QStringLiteral("insert attendance"));
        affected = ins.numRowsAffected();

        if (!db.commit())
            fail(QStringLiteral("commit attendance"), db.lastError());
    }

    return affected == 1 ? InsertOutcome::Inserted : InsertOutcome::AlreadyExists;
}

qint64 AttendanceStore::attendanceCount()
{
    QSqlDatabase db = connectionForThisThread();
    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT COUNT(*) FROM attendance"));
    exec(q, QStringLiteral("count attendance"));
    return q.next() ? q.value(0).toLongLong() : 0;
}

bool AttendanceStore::eventExists(const AttendanceEvent& event)
{
    QSqlDatabase db = connectionForThisThread();
    QSqlQuery q(db);
    q.prepare(QStringLiteral(
        "SELECT 1 FROM attendance WHERE user_id = ? AND timestamp = ? AND device_serial = ?"));
    q.addBindValue(event.userId);
    q.addBindValue(event.timestampText());
    q.addBindValue(event.deviceSerial);
    exec(q, QStringLiteral("look up attendance"));
    return q.next();
}

std::optional<UserRecord> AttendanceStore::findUser(const QString& userId)
{
    QSqlDatabase db = connectionForThisThread();
    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT user_id, username, last_seen_at FROM users WHERE user_id = ?"));
    q.addBindValue(userId);
    exec(q, QStringLiteral("look up user %1").arg(userId));
    if (!q.next())
        return std::nullopt;

    UserRecord u;
    u.userId = q.value(0).toString();
    u.displayName = q.value(1).toString();
    u.lastSeenAt = readUtc(q.value(2));
    return u;
}

QDateTime AttendanceStore::latestEventTimestamp(const QString& deviceSerial)
{
    QSqlDatabase db = connectionForThisThread();
    QSqlQuery q(db);
    q.prepare(QStringLiteral("SELECT MAX(timestamp) FROM attendance WHERE device_serial = ?"));
    q.addBindValue(deviceSerial);
    exec(q, QStringLiteral("latest attendance for %1").arg(deviceSerial));
    return q.next() ? readUtc(q.value(0)) : QDateTime();
}
