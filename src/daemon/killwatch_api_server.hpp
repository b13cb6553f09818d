#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

#include "daemon/killwatch_store.hpp"
#include "matching/match_coordinator.hpp"

namespace killwatch {

/**
 * KillwatchApiServer is the administrative surface of the matching engine:
 * a minimal JSON-RPC-like protocol over a local UNIX socket covering
 * matching, reloads, statistics and profile management.
 */
class KillwatchApiServer : public QObject
{
    Q_OBJECT
public:
    KillwatchApiServer(KillwatchStore &store,
                       MatchCoordinator &coordinator,
                       QObject *parent = nullptr);
    ~KillwatchApiServer() override;

    // Start listening on $XDG_RUNTIME_DIR/killwatch.sock
    bool start();
    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    KillwatchStore &m_store;
    MatchCoordinator &m_coordinator;
    QLocalServer m_server;
};

} // namespace killwatch
