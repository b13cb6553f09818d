#include <QCoreApplication>
#include <QString>

#include <string>

#include <nlohmann/json.hpp>

#include "common/engine_config.hpp"
#include "common/logging.hpp"
#include "daemon/killwatch_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("killwatch-daemon"));

    bool trace = qEnvironmentVariableIntValue("KILLWATCH_TRACE") == 1;
    QString configPath;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        } else if (arg == QStringLiteral("--config") && i + 1 < argc) {
            configPath = QString::fromLocal8Bit(argv[++i]);
        }
    }
    killwatch::logging::initLogging(QStringLiteral("killwatch-daemon"), trace);

    killwatch::EngineConfig config = killwatch::loadEngineConfig();
    if (!configPath.isEmpty()) {
        std::string error;
        if (!killwatch::loadEngineConfigFile(configPath.toStdString(), config, &error)) {
            KWLOG_ERROR(QStringLiteral("main"),
                        QStringLiteral("main"),
                        QStringLiteral("config_load_failed"),
                        QStringLiteral("invalid_config"),
                        QStringLiteral("exit"),
                        killwatch::logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"path", configPath.toStdString()},
                                        {"error", error}}));
            return 1;
        }
    }

    KWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               configPath.isEmpty() ? QStringLiteral("default_config")
                                    : QStringLiteral("config_file"),
               killwatch::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    // The daemon lives for the lifetime of the process.
    killwatch::KillwatchDaemon daemon(config);
    daemon.start();

    return app.exec();
}
