#pragma once
#include <QAtomicInteger>
#include <QString>
#include <QThread>

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("attendsync"); }

    // Distinguishes stores that share a thread (tests open several).
    inline QString nextStoreTag()
    {
        static QAtomicInteger<quint32> counter(0);
        return QString("%1_%2").arg(baseConnName()).arg(counter.fetchAndAddRelaxed(1));
    }

    inline QString connectionNameForCurrentThread(const QString& storeTag)
    {
        return QString("%1_%2").arg(storeTag)
							   .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }

    inline bool isSqlite(const QString& driver) { return driver == QLatin1String("QSQLITE"); }

    // TIMESTAMP columns are written and compared as this text in UTC.
    inline QString timestampFormat() { return QStringLiteral("yyyy-MM-dd HH:mm:ss"); }
} // namespace SqlCommon
