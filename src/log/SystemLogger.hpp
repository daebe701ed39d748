#pragma once
#include <QObject>
#include <QString>
#include <QThread>

#include "SystemLogTypes.hpp"

namespace syslog_detail { class SystemLogWriter; }

// Mirrors every Qt log message into an append-only file written by a
// dedicated thread. Console output is kept through the previous handler.
class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(const QString& filePath);  // once at startup
    static void shutdown();                      // restores the previous handler

signals:
    void appendRequested(const SystemLogEntry& e);

private:
	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;
};
