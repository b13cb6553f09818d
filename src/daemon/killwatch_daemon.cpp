#include "daemon/killwatch_daemon.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/killwatch_version.hpp"
#include "common/logging.hpp"
#include "daemon/killwatch_api_server.hpp"

namespace killwatch {

KillwatchDaemon::KillwatchDaemon(const EngineConfig &config, QObject *parent)
    : QObject(parent)
    , m_store(std::make_unique<KillwatchStore>())
{
    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        KWLOG_ERROR(QStringLiteral("KillwatchDaemon"),
                    QStringLiteral("KillwatchDaemon"),
                    QStringLiteral("integrity_check_failed"),
                    QStringLiteral("database_corrupt"),
                    QStringLiteral("continue_degraded"),
                    ::killwatch::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"message", integrityMessage}}));
    }

    m_coordinator = std::make_unique<MatchCoordinator>(*m_store, *m_store, config);
    connect(m_coordinator.get(), &MatchCoordinator::matchFound,
            this, &KillwatchDaemon::handleMatchFound);
}

KillwatchDaemon::~KillwatchDaemon() = default;

void KillwatchDaemon::start()
{
    KWLOG_INFO(QStringLiteral("KillwatchDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_starting"),
               QStringLiteral("process_start"),
               QStringLiteral("event_loop"),
               ::killwatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"version", KILLWATCH_VERSION},
                               {"config", engineConfigToJson(m_coordinator->config())}}));

    m_store->setMeta("daemon_version", KILLWATCH_VERSION);
    m_store->setMeta("daemon_started_at", toIso8601Utc(std::chrono::system_clock::now()));

    m_coordinator->start();

    if (!m_apiServer) {
        m_apiServer = std::make_unique<KillwatchApiServer>(*m_store, *m_coordinator, this);
        if (!m_apiServer->start()) {
            KWLOG_WARN(QStringLiteral("KillwatchDaemon"),
                       QStringLiteral("start"),
                       QStringLiteral("api_unavailable"),
                       QStringLiteral("listen_failed"),
                       QStringLiteral("continue_without_api"),
                       ::killwatch::logging::defaultWho(),
                       QString(),
                       nlohmann::json::object());
        }
    }
}

void KillwatchDaemon::handleMatchFound(const QString &profileId, qint64 killmailId)
{
    // Alert dispatch keys on (profile, killmail); consumers deduplicate.
    KWLOG_INFO(QStringLiteral("KillwatchDaemon"),
               QStringLiteral("handleMatchFound"),
               QStringLiteral("profile_alert"),
               QStringLiteral("profile_matched"),
               QStringLiteral("alert_handoff"),
               ::killwatch::logging::defaultWho(),
               ::killwatch::logging::currentCorrelationId(),
               (nlohmann::json{{"profileId", profileId.toStdString()},
                               {"killmailId", killmailId}}));
}

} // namespace killwatch
