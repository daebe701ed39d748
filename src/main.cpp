#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QDebug>
#include <csignal>
#include <exception>
#include <memory>

#include "config/AppConfig.hpp"
#include "include/common_path.hpp"
#include "include/errors.hpp"
#include "log/SystemLogger.hpp"
#include "log/logging.hpp"
#include "services/AttendanceStore.hpp"
#include "supervisor/FleetSupervisor.hpp"
#include "util/UnixSignalWatcher.hpp"
#include "zk/ZkDriver.hpp"

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName(QStringLiteral("attendsync"));
				QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

				qSetMessagePattern(QStringLiteral(ATTENDSYNC_MESSAGE_PATTERN));
				QLoggingCategory::setFilterRules(QStringLiteral("attendsync.*.debug=false"));

				QCommandLineParser parser;
				parser.setApplicationDescription(QStringLiteral("Attendance terminal to database synchronization daemon"));
				parser.addHelpOption();
				parser.addVersionOption();
				const QCommandLineOption configOpt(QStringList{ QStringLiteral("c"), QStringLiteral("config") },
						QStringLiteral("Configuration file."), QStringLiteral("path"), QStringLiteral(DEFAULT_CONFIG_FILE));
				const QCommandLineOption checkOpt(QStringLiteral("check-config"),
						QStringLiteral("Validate the configuration and exit."));
				parser.addOption(configOpt);
				parser.addOption(checkOpt);
				parser.process(app);

				const AppConfig cfg = AppConfig::load(parser.value(configOpt));
				if (parser.isSet(checkOpt)) {
						LOG_INFO(QStringLiteral("configuration OK"));
						return 0;
				}

				if (!cfg.logRules.isEmpty()) {
						QString rules = cfg.logRules;
						QLoggingCategory::setFilterRules(rules.replace(QLatin1Char(';'), QLatin1Char('\n')));
				}
				if (!cfg.logFile.isEmpty())
						SystemLogger::init(cfg.logFile);

				// database
				AttendanceStore store(cfg.database);
				store.ensureSchema();

				FleetSupervisor fleet(cfg.devices, cfg.sync, &store,
						[](const DeviceConfig&) { return std::make_unique<ZkDriver>(); });

				UnixSignalWatcher signalWatcher({ SIGTERM, SIGINT });
				QObject::connect(&signalWatcher, &UnixSignalWatcher::signalReceived, &app, [](int) {
						QCoreApplication::quit();
				});

				bool clean = true;
				QObject::connect(&app, &QCoreApplication::aboutToQuit, [&fleet, &clean] {
						LOG_INFO(QStringLiteral("shutting down"));
						clean = fleet.stop();
				});

				fleet.start();
				const int rc = app.exec();

				SystemLogger::shutdown();
				return (rc == 0 && clean) ? 0 : 1;
		} catch (const ConfigError& e) {
				LOG_CRITICAL(QStringLiteral("configuration error: %1").arg(e.message()));
		} catch (const StoreError& e) {
				LOG_CRITICAL(QStringLiteral("store initialization failed: %1").arg(e.message()));
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		SystemLogger::shutdown();
		return 1;
}
