#include "daemon/killwatch_api_server.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QUuid>

#include <unistd.h>

#include "common/engine_config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "matching/filter_compiler.hpp"

namespace killwatch {

namespace {

constexpr std::size_t kDefaultMatchLimit = 50;
constexpr std::size_t kMaxMatchLimit = 1000;

QString runtimeSocketPath()
{
    const QString socketName = qEnvironmentVariable("KILLWATCH_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/killwatch.sock");
}

std::optional<std::size_t> readLimit(const nlohmann::json &params)
{
    auto it = params.find("limit");
    if (it == params.end()) {
        return kDefaultMatchLimit;
    }
    if (!it->is_number_unsigned() || it->get<std::size_t>() == 0) {
        return std::nullopt;
    }
    return std::min(it->get<std::size_t>(), kMaxMatchLimit);
}

std::string readId(const nlohmann::json &params)
{
    auto it = params.find("id");
    if (it == params.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

KillwatchApiServer::KillwatchApiServer(KillwatchStore &store,
                                       MatchCoordinator &coordinator,
                                       QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_coordinator(coordinator)
{
}

KillwatchApiServer::~KillwatchApiServer() = default;

bool KillwatchApiServer::start()
{
    const QString socketPath = runtimeSocketPath();
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            KWLOG_ERROR(QStringLiteral("KillwatchApiServer"),
                        QStringLiteral("start"),
                        QStringLiteral("socket_dir_failed"),
                        QStringLiteral("mkpath_failed"),
                        QStringLiteral("abort_listen"),
                        ::killwatch::logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"path", socketInfo.absolutePath().toStdString()}}));
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                KWLOG_ERROR(QStringLiteral("KillwatchApiServer"),
                            QStringLiteral("start"),
                            QStringLiteral("stale_socket_remove_failed"),
                            QStringLiteral("socket_in_use"),
                            QStringLiteral("abort_listen"),
                            ::killwatch::logging::defaultWho(),
                            QString(),
                            (nlohmann::json{{"path", socketPath.toStdString()}}));
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        KWLOG_ERROR(QStringLiteral("KillwatchApiServer"),
                    QStringLiteral("start"),
                    QStringLiteral("listen_failed"),
                    QStringLiteral("socket_error"),
                    QStringLiteral("abort_listen"),
                    ::killwatch::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", socketPath.toStdString()},
                                    {"error", m_server.errorString().toStdString()}}));
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &KillwatchApiServer::handleNewConnection);

    KWLOG_INFO(QStringLiteral("KillwatchApiServer"),
               QStringLiteral("start"),
               QStringLiteral("api_listening"),
               QStringLiteral("daemon_start"),
               QStringLiteral("local_socket"),
               ::killwatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", socketPath.toStdString()}}));
    return true;
}

void KillwatchApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &KillwatchApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void KillwatchApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    handleRequest(socket, payload);
}

void KillwatchApiServer::handleRequest(QLocalSocket *socket,
                                       const QByteArray &payload)
{
    if (!socket) {
        return;
    }
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray KillwatchApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    ::killwatch::logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        KWLOG_WARN(QStringLiteral("KillwatchApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   ::killwatch::logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        KWLOG_WARN(QStringLiteral("KillwatchApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("missing_method"),
                   QStringLiteral("json_parse"),
                   ::killwatch::logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    KWLOG_INFO(QStringLiteral("KillwatchApiServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("api_request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_rpc"),
               ::killwatch::logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method},
                               {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        nlohmann::json result;

        if (method == "match" || method == "match_all_profiles") {
            if (!params.contains("killmail") || !params["killmail"].is_object()) {
                return makeErrorResponse("Missing killmail", id);
            }
            const Killmail killmail = params["killmail"].get<Killmail>();
            result["matches"] = method == "match"
                ? m_coordinator.match(killmail)
                : m_coordinator.matchAllProfiles(killmail);
        } else if (method == "reload") {
            result["reloaded"] = m_coordinator.reload();
            result["generation"] = m_coordinator.stats().generation;
        } else if (method == "stats") {
            result["stats"] = m_coordinator.stats();
            result["config"] = engineConfigToJson(m_coordinator.config());
        } else if (method == "flush") {
            result["flushed"] = m_coordinator.flushPendingMatches();
        } else if (method == "list_profiles") {
            result["profiles"] = m_store.listProfiles();
        } else if (method == "get_profile") {
            const std::string profileId = readId(params);
            if (profileId.empty()) {
                return makeErrorResponse("Missing profile id", id);
            }
            const auto profile = m_store.getProfile(profileId);
            if (!profile.has_value()) {
                return makeErrorResponse("Profile not found", id);
            }
            result["profile"] = *profile;
        } else if (method == "upsert_profile") {
            if (!params.contains("profile") || !params["profile"].is_object()) {
                return makeErrorResponse("Missing profile", id);
            }
            const SurveillanceProfile profile = params["profile"].get<SurveillanceProfile>();
            if (profile.name.empty()) {
                return makeErrorResponse("Profile name is required", id);
            }
            std::string error;
            if (!FilterCompiler::validate(profile.filterTree, &error)) {
                return makeErrorResponse(QStringLiteral("Invalid filter: %1")
                                             .arg(QString::fromStdString(error)),
                                         id);
            }
            result["id"] = m_store.upsertProfile(profile);
            result["reloaded"] = m_coordinator.reload();
        } else if (method == "delete_profile") {
            const std::string profileId = readId(params);
            if (profileId.empty()) {
                return makeErrorResponse("Missing profile id", id);
            }
            result["deleted"] = m_store.deleteProfile(profileId);
            result["reloaded"] = m_coordinator.reload();
        } else if (method == "set_profile_active") {
            const std::string profileId = readId(params);
            if (profileId.empty() || !params.contains("active")
                || !params["active"].is_boolean()) {
                return makeErrorResponse("Missing profile id or active flag", id);
            }
            result["updated"] = m_store.setProfileActive(profileId, params["active"].get<bool>());
            result["reloaded"] = m_coordinator.reload();
        } else if (method == "validate_filter") {
            if (!params.contains("filter")) {
                return makeErrorResponse("Missing filter", id);
            }
            std::string error;
            result["valid"] = FilterCompiler::validate(params["filter"], &error);
            result["error"] = error;
        } else if (method == "test_filter") {
            if (!params.contains("filter") || !params.contains("killmail")
                || !params["killmail"].is_object()) {
                return makeErrorResponse("Missing filter or killmail", id);
            }
            const FilterTestResult tested = MatchCoordinator::testFilter(
                params["filter"], params["killmail"].get<Killmail>());
            result["compiled"] = tested.compiled;
            result["matched"] = tested.matched;
            result["error"] = tested.error;
        } else if (method == "get_profile_matches") {
            const std::string profileId = readId(params);
            const auto limit = readLimit(params);
            if (profileId.empty() || !limit) {
                return makeErrorResponse("Missing profile id or invalid limit", id);
            }
            result["matches"] = m_store.getProfileMatches(profileId, *limit);
        } else if (method == "get_recent_matches") {
            const auto limit = readLimit(params);
            if (!limit) {
                return makeErrorResponse("Invalid limit", id);
            }
            result["matches"] = m_store.getRecentMatches(*limit);
        } else {
            return makeErrorResponse("Unknown method", id);
        }

        KWLOG_INFO(QStringLiteral("KillwatchApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_completed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_rpc"),
                   ::killwatch::logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method},
                                   {"durationMs",
                                    std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const std::exception &ex) {
        KWLOG_ERROR(QStringLiteral("KillwatchApiServer"),
                    QStringLiteral("handleRequest"),
                    QStringLiteral("api_request_error"),
                    QStringLiteral("exception"),
                    QStringLiteral("json_rpc"),
                    ::killwatch::logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"method", method},
                                    {"what", ex.what()}}));
        return makeErrorResponse(ex.what(), id);
    }
}

QByteArray KillwatchApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray KillwatchApiServer::makeResultResponse(const nlohmann::json &result,
                                                  int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

} // namespace killwatch
