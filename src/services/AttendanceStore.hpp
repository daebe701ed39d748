#pragma once
#include <QDateTime>
#include <QSqlDatabase>
#include <QString>
#include <optional>

class QSqlError;
class QSqlQuery;

#include "include/options.hpp"
#include "include/states.hpp"
#include "include/types.hpp"

// Durable users/attendance tables. Safe to call from any number of threads:
// every thread gets its own connection and uniqueness is enforced by the
// database, never by a lock in this process.
class AttendanceStore {
public:
	explicit AttendanceStore(const DatabaseConfig& config);
	~AttendanceStore();

	AttendanceStore(const AttendanceStore&) = delete;
	AttendanceStore& operator=(const AttendanceStore&) = delete;

	// Creates tables and indexes when absent. Throws StoreError.
	void ensureSchema();

	void upsertUser(const UserRecord& user);

	// Creates the event unless its natural key exists. A missing user is
	// created with a placeholder name in the same transaction.
	InsertOutcome insertEventIfAbsent(const AttendanceEvent& event);

	qint64 attendanceCount();
	bool eventExists(const AttendanceEvent& event);
	std::optional<UserRecord> findUser(const QString& userId);
	QDateTime latestEventTimestamp(const QString& deviceSerial);

	// Drops the calling thread's connection. Workers call this on exit.
	void releaseThreadConnection();

private:
	QSqlDatabase connectionForThisThread();
	void resetThreadConnection();
	[[noreturn]] void fail(const QString& what, const QSqlError& err);
	void exec(QSqlQuery& q, const QString& what);

	DatabaseConfig config_;
	QString storeTag_;
};
