#pragma once

#include <memory>

#include <QObject>
#include <QString>

#include "common/engine_config.hpp"
#include "daemon/killwatch_store.hpp"
#include "matching/match_coordinator.hpp"

namespace killwatch {

class KillwatchApiServer;

/**
 * KillwatchDaemon wires the profile store, the match coordinator and the
 * API server together and hands every match to the alerting side.
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class KillwatchDaemon : public QObject
{
    Q_OBJECT
public:
    explicit KillwatchDaemon(const EngineConfig &config, QObject *parent = nullptr);
    ~KillwatchDaemon() override;

    // Loads profiles, starts the recorder, the flush timer and the API socket.
    void start();

    MatchCoordinator &coordinator() { return *m_coordinator; }

private slots:
    void handleMatchFound(const QString &profileId, qint64 killmailId);

private:
    // Declaration order is destruction order in reverse: the coordinator
    // flushes into the store while shutting down.
    std::unique_ptr<KillwatchStore> m_store;
    std::unique_ptr<MatchCoordinator> m_coordinator;
    std::unique_ptr<KillwatchApiServer> m_apiServer;
};

} // namespace killwatch
