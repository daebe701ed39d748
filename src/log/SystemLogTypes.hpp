#pragma once
#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QtGlobal>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

inline SysLogLevel toSysLogLevel(QtMsgType type)
{
	switch (type) {
		case QtDebugMsg:	return SysLogLevel::Debug;
		case QtInfoMsg:		return SysLogLevel::Info;
		case QtWarningMsg:	return SysLogLevel::Warn;
		case QtCriticalMsg:	return SysLogLevel::Error;
		case QtFatalMsg:	return SysLogLevel::Critical;
	}
	return SysLogLevel::Info;
}

struct SystemLogEntry {
    SysLogLevel level = SysLogLevel::Info;
    QString category;   // e.g. "attendsync.worker"
    QString line;       // already formatted with the message pattern
    QDateTime ts;
};

Q_DECLARE_METATYPE(SystemLogEntry)
