#include "SystemLogger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <atomic>
#include <iostream>

#include "log/SystemLogTypes.hpp"

namespace syslog_detail {
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(const QString& path) : path_(path) {}

public slots:
    void append(const SystemLogEntry& e) {
        if (!file_.isOpen() && !open())
            return;
        QTextStream out(&file_);
        out << e.line << '\n';
        out.flush();
    }

private:
    // Logging from here would re-enter the handler, so failures go to stderr.
    bool open() {
        const QFileInfo info(path_);
        if (!QDir().mkpath(info.absolutePath())) {
            std::cerr << "log directory create failed: " << info.absolutePath().toStdString() << std::endl;
            return false;
        }
        file_.setFileName(path_);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::cerr << "log file open failed: " << file_.errorString().toStdString() << std::endl;
            return false;
        }
        return true;
    }

    QString path_;
    QFile file_;
};
} // namespace syslog_detail

namespace {
QtMessageHandler s_previous = nullptr;
std::atomic<bool> s_active{false};

void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (s_previous)
        s_previous(type, ctx, msg);
    if (!s_active.load())
        return;

    SystemLogEntry e;
    e.level = toSysLogLevel(type);
    e.category = QString::fromLatin1(ctx.category ? ctx.category : "default");
    e.line = qFormatLogMessage(type, ctx, msg);
    e.ts = QDateTime::currentDateTime();
    emit SystemLogger::instance().appendRequested(e);
}
} // namespace

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(const QString& filePath)
{
    auto& inst = instance();
    if (inst.th) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.th = new QThread;
	inst.th->setObjectName(QStringLiteral("syslog-writer"));
	inst.wr = new syslog_detail::SystemLogWriter(filePath);
	inst.wr->moveToThread(inst.th);

    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
    inst.th->start();

    s_active.store(true);
    s_previous = qInstallMessageHandler(messageHandler);
}

void SystemLogger::shutdown() {
	auto& inst = instance();
 	if (!inst.th) return;

    s_active.store(false);
    qInstallMessageHandler(s_previous);
    s_previous = nullptr;

	inst.th->quit();
    if (!inst.th->wait(3000)) {
        inst.th->terminate();
        inst.th->wait();
    }

    delete inst.th;
    inst.th = nullptr;
	inst.wr = nullptr;
}

#include "SystemLogger.moc"
