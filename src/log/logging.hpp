// logging.hpp
#pragma once
#include <QDebug>
#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>

Q_DECLARE_LOGGING_CATEGORY(LC_SESSION)
Q_DECLARE_LOGGING_CATEGORY(LC_ZK)
Q_DECLARE_LOGGING_CATEGORY(LC_WORKER)
Q_DECLARE_LOGGING_CATEGORY(LC_STORE)
Q_DECLARE_LOGGING_CATEGORY(LC_FLEET)
Q_DECLARE_LOGGING_CATEGORY(LC_FSM)
Q_DECLARE_LOGGING_CATEGORY(LC_CONFIG)

// "%{time ...} %{type} %{category} - %{message}"
#define ATTENDSYNC_MESSAGE_PATTERN \
	"%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{category} - %{message}"

namespace GlobalLogger {

inline void logMessage(QtMsgType type, const QString& functionName, const QString& message)
{
		const QString fullMsg = QString("[%1] %2").arg(functionName, message);

		switch (type) {
			case QtDebugMsg:
					qDebug().noquote() << fullMsg;
					break;
			case QtInfoMsg:
					qInfo().noquote() << fullMsg;
					break;
			case QtWarningMsg:
					qWarning().noquote() << fullMsg;
					break;
			case QtCriticalMsg:
					qCritical().noquote() << fullMsg;
					break;
			case QtFatalMsg:
					qFatal("%s", fullMsg.toUtf8().constData());
					break;
		}
}

}		// namespace GlobalLogger

#define LOG_DEBUG(msg)		GlobalLogger::logMessage(QtDebugMsg, __FUNCTION__, msg)
#define LOG_INFO(msg)			GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_WARN(msg)			GlobalLogger::logMessage(QtWarningMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg) GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)
