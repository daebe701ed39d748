#include <gtest/gtest.h>

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QStringList>
#include <atomic>
#include <thread>
#include <vector>

#include "TestUtil.hpp"
#include "include/errors.hpp"
#include "services/AttendanceStore.hpp"

namespace {

// Opens the calling thread's connection of `s` and returns its name.
QString openThreadConnection(AttendanceStore& s)
{
	const QStringList before = QSqlDatabase::connectionNames();
	s.attendanceCount();
	for (const QString& name : QSqlDatabase::connectionNames()) {
		if (!before.contains(name)) return name;
	}
	return {};
}

// Runs `sql` on an already open named connection, bypassing the store.
bool execOn(const QString& connection, const QString& sql)
{
	QSqlDatabase db = QSqlDatabase::database(connection, /*open=*/false);
	QSqlQuery q(db);
	return q.exec(sql);
}

} // namespace

class AttendanceStoreTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(db.dir.isValid());
		store = std::make_unique<AttendanceStore>(db.config());
		store->ensureSchema();
	}

	TempDatabase db;
	std::unique_ptr<AttendanceStore> store;
};

TEST_F(AttendanceStoreTest, SchemaCreationIsIdempotent)
{
	EXPECT_NO_THROW(store->ensureSchema());
	EXPECT_EQ(store->attendanceCount(), 0);
}

TEST_F(AttendanceStoreTest, SecondInsertOfSameKeyIsReportedAsExisting)
{
	const AttendanceEvent e = eventAt(QStringLiteral("42"), QStringLiteral("DEV1"), QStringLiteral("2024-01-01 09:00:00"));

	EXPECT_EQ(store->insertEventIfAbsent(e), InsertOutcome::Inserted);
	EXPECT_EQ(store->insertEventIfAbsent(e), InsertOutcome::AlreadyExists);
	EXPECT_EQ(store->attendanceCount(), 1);
	EXPECT_TRUE(store->eventExists(e));
}

TEST_F(AttendanceStoreTest, RawSequenceIsNotPartOfTheKey)
{
	AttendanceEvent e = eventAt(QStringLiteral("42"), QStringLiteral("DEV1"), QStringLiteral("2024-01-01 09:00:00"));
	e.rawSequence = 1;
	ASSERT_EQ(store->insertEventIfAbsent(e), InsertOutcome::Inserted);

	e.rawSequence = 2;
	EXPECT_EQ(store->insertEventIfAbsent(e), InsertOutcome::AlreadyExists);
}

TEST_F(AttendanceStoreTest, KeyComponentsAreDistinguished)
{
	EXPECT_EQ(store->insertEventIfAbsent(eventAt("42", "DEV1", "2024-01-01 09:00:00")), InsertOutcome::Inserted);
	EXPECT_EQ(store->insertEventIfAbsent(eventAt("42", "DEV2", "2024-01-01 09:00:00")), InsertOutcome::Inserted);
	EXPECT_EQ(store->insertEventIfAbsent(eventAt("43", "DEV1", "2024-01-01 09:00:00")), InsertOutcome::Inserted);
	EXPECT_EQ(store->insertEventIfAbsent(eventAt("42", "DEV1", "2024-01-01 09:00:01")), InsertOutcome::Inserted);
	EXPECT_EQ(store->attendanceCount(), 4);
}

TEST_F(AttendanceStoreTest, UnknownUserIsCreatedWithPlaceholderName)
{
	ASSERT_EQ(store->insertEventIfAbsent(eventAt("77", "DEV1", "2024-01-01 09:00:00")), InsertOutcome::Inserted);

	const auto user = store->findUser(QStringLiteral("77"));
	ASSERT_TRUE(user.has_value());
	EXPECT_EQ(user->displayName, QStringLiteral("NN-77"));
}

TEST_F(AttendanceStoreTest, KnownUserKeepsName)
{
	UserRecord alice{ QStringLiteral("42"), QStringLiteral("Alice"), QDateTime::currentDateTimeUtc() };
	store->upsertUser(alice);
	ASSERT_EQ(store->insertEventIfAbsent(eventAt("42", "DEV1", "2024-01-01 09:00:00")), InsertOutcome::Inserted);

	const auto user = store->findUser(QStringLiteral("42"));
	ASSERT_TRUE(user.has_value());
	EXPECT_EQ(user->displayName, QStringLiteral("Alice"));
}

TEST_F(AttendanceStoreTest, UpsertUpdatesExistingUser)
{
	const QDateTime first = QDateTime(QDate(2024, 1, 1), QTime(8, 0, 0), QTimeZone::utc());
	const QDateTime second = QDateTime(QDate(2024, 1, 2), QTime(8, 0, 0), QTimeZone::utc());

	store->upsertUser({ QStringLiteral("42"), QStringLiteral("NN-42"), first });
	store->upsertUser({ QStringLiteral("42"), QStringLiteral("Alice"), second });

	const auto user = store->findUser(QStringLiteral("42"));
	ASSERT_TRUE(user.has_value());
	EXPECT_EQ(user->displayName, QStringLiteral("Alice"));
	EXPECT_EQ(user->lastSeenAt, second);
	EXPECT_FALSE(store->findUser(QStringLiteral("43")).has_value());
}

TEST_F(AttendanceStoreTest, LatestTimestampIsPerDevice)
{
	EXPECT_FALSE(store->latestEventTimestamp(QStringLiteral("DEV1")).isValid());

	store->insertEventIfAbsent(eventAt("42", "DEV1", "2024-01-01 09:00:00"));
	store->insertEventIfAbsent(eventAt("43", "DEV1", "2024-01-01 09:05:00"));
	store->insertEventIfAbsent(eventAt("42", "DEV2", "2024-01-02 07:00:00"));

	const QDateTime latest = store->latestEventTimestamp(QStringLiteral("DEV1"));
	EXPECT_EQ(latest, QDateTime(QDate(2024, 1, 1), QTime(9, 5, 0), QTimeZone::utc()));
}

TEST_F(AttendanceStoreTest, ConcurrentInsertsOfOneKeyCreateOneRow)
{
	constexpr int kThreads = 8;
	const AttendanceEvent e = eventAt(QStringLiteral("42"), QStringLiteral("DEV1"), QStringLiteral("2024-01-01 09:00:00"));

	std::atomic<bool> go{false};
	std::atomic<int> inserted{0};
	std::atomic<int> existing{0};
	std::atomic<int> failed{0};
	std::vector<std::thread> threads;

	for (int i = 0; i < kThreads; ++i) {
		threads.emplace_back([&] {
			while (!go.load()) std::this_thread::yield();
			try {
				if (store->insertEventIfAbsent(e) == InsertOutcome::Inserted)
					++inserted;
				else
					++existing;
			} catch (const StoreError&) {
				++failed;
			}
			store->releaseThreadConnection();
		});
	}
	go.store(true);
	for (auto& t : threads) t.join();

	EXPECT_EQ(failed.load(), 0);
	EXPECT_EQ(inserted.load(), 1);
	EXPECT_EQ(existing.load(), kThreads - 1);
	EXPECT_EQ(store->attendanceCount(), 1);
}

TEST_F(AttendanceStoreTest, FailedReadReopensConnection)
{
	ASSERT_EQ(store->insertEventIfAbsent(eventAt("42", "DEV1", "2024-01-01 09:00:00")), InsertOutcome::Inserted);

	AttendanceStore reader(db.config());
	const QString connection = openThreadConnection(reader);
	ASSERT_FALSE(connection.isEmpty());

	// Shadows the real table on this connection only; statements against it fail
	// while the handle stays open.
	ASSERT_TRUE(execOn(connection, QStringLiteral("CREATE TEMP TABLE attendance (x INTEGER)")));
	EXPECT_THROW(reader.latestEventTimestamp(QStringLiteral("DEV1")), StoreError);

	const QDateTime latest = reader.latestEventTimestamp(QStringLiteral("DEV1"));
	EXPECT_EQ(latest, eventAt("42", "DEV1", "2024-01-01 09:00:00").timestamp);
	EXPECT_EQ(reader.attendanceCount(), 1);
}

TEST_F(AttendanceStoreTest, FailedWriteReopensConnection)
{
	AttendanceStore writer(db.config());
	const QString connection = openThreadConnection(writer);
	ASSERT_FALSE(connection.isEmpty());

	ASSERT_TRUE(execOn(connection, QStringLiteral("PRAGMA query_only = ON")));
	const AttendanceEvent e = eventAt("42", "DEV1", "2024-01-01 09:00:00");
	EXPECT_THROW(writer.insertEventIfAbsent(e), StoreError);

	EXPECT_EQ(writer.insertEventIfAbsent(e), InsertOutcome::Inserted);
	EXPECT_EQ(store->attendanceCount(), 1);
}

TEST(AttendanceStoreUnavailableTest, UnreachableDatabaseIsAStoreError)
{
	DatabaseConfig cfg;
	cfg.driver = QStringLiteral("QSQLITE");
	cfg.name = QStringLiteral("/nonexistent-attendsync-dir/sub/attendsync.db");

	AttendanceStore store(cfg);
	EXPECT_THROW(store.ensureSchema(), StoreError);
	EXPECT_THROW(store.insertEventIfAbsent(eventAt("42", "DEV1", "2024-01-01 09:00:00")), StoreError);
}
