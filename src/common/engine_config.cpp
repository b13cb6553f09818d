#include "common/engine_config.hpp"

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QtGlobal>

#include <cstdint>
#include <limits>

namespace killwatch {

namespace {

void overrideSize(const char *name, std::size_t &value)
{
    bool ok = false;
    const int parsed = qEnvironmentVariableIntValue(name, &ok);
    if (ok && parsed >= 0) {
        value = static_cast<std::size_t>(parsed);
    }
}

void overrideInt(const char *name, int &value)
{
    bool ok = false;
    const int parsed = qEnvironmentVariableIntValue(name, &ok);
    if (ok && parsed > 0) {
        value = parsed;
    }
}

void overrideMillis(const char *name, std::chrono::milliseconds &value)
{
    bool ok = false;
    const int parsed = qEnvironmentVariableIntValue(name, &ok);
    if (ok && parsed >= 0) {
        value = std::chrono::milliseconds(parsed);
    }
}

void overrideDouble(const char *name, double &value)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    bool ok = false;
    const double parsed = qEnvironmentVariable(name).toDouble(&ok);
    if (ok && parsed >= 0.0 && parsed <= 1.0) {
        value = parsed;
    }
}

bool readUnsigned(const nlohmann::json &config, const char *key, std::size_t &out,
                  std::string *error,
                  uint64_t max = std::numeric_limits<std::size_t>::max())
{
    auto it = config.find(key);
    if (it == config.end()) {
        return true;
    }
    const bool negative = it->is_number_integer() && !it->is_number_unsigned()
        && it->get<int64_t>() < 0;
    if (!it->is_number_integer() || negative) {
        if (error) {
            *error = std::string(key) + " must be a non-negative integer";
        }
        return false;
    }
    if (it->get<uint64_t>() > max) {
        if (error) {
            *error = std::string(key) + " must be at most " + std::to_string(max);
        }
        return false;
    }
    out = static_cast<std::size_t>(it->get<uint64_t>());
    return true;
}

// Capped at INT_MAX because QTimer takes int milliseconds.
bool readMillis(const nlohmann::json &config, const char *key,
                std::chrono::milliseconds &out, std::string *error)
{
    std::size_t value = static_cast<std::size_t>(out.count());
    if (!readUnsigned(config, key, value, error,
                      static_cast<uint64_t>(std::numeric_limits<int>::max()))) {
        return false;
    }
    out = std::chrono::milliseconds(static_cast<int64_t>(value));
    return true;
}

} // namespace

EngineConfig loadEngineConfig()
{
    EngineConfig config;
    overrideSize("KILLWATCH_MAX_CANDIDATES", config.maxCandidates);
    overrideSize("KILLWATCH_PARALLEL_THRESHOLD", config.sequentialThreshold);
    overrideInt("KILLWATCH_MAX_WORKERS", config.maxWorkers);
    overrideMillis("KILLWATCH_CANDIDATE_TIMEOUT_MS", config.candidateTimeout);
    overrideMillis("KILLWATCH_MATCH_TIMEOUT_MS", config.matchTimeout);
    overrideMillis("KILLWATCH_CACHE_TTL_MS", config.cacheTtl);
    overrideMillis("KILLWATCH_FLUSH_INTERVAL_MS", config.flushInterval);
    overrideDouble("KILLWATCH_FREQUENCY_DECAY", config.frequencyDecay);
    overrideSize("KILLWATCH_RECORDER_QUEUE", config.recorderQueueCapacity);
    overrideSize("KILLWATCH_MAX_PENDING", config.maxPendingMatches);
    return config;
}

bool applyEngineConfigJson(const nlohmann::json &config, EngineConfig &out, std::string *error)
{
    if (!config.is_object()) {
        if (error) {
            *error = "config must be a JSON object";
        }
        return false;
    }

    EngineConfig next = out;
    std::size_t workers = static_cast<std::size_t>(next.maxWorkers);
    if (!readUnsigned(config, "maxCandidates", next.maxCandidates, error)
        || !readUnsigned(config, "sequentialThreshold", next.sequentialThreshold, error)
        || !readUnsigned(config, "maxWorkers", workers, error,
                         static_cast<uint64_t>(std::numeric_limits<int>::max()))
        || !readMillis(config, "candidateTimeoutMs", next.candidateTimeout, error)
        || !readMillis(config, "matchTimeoutMs", next.matchTimeout, error)
        || !readMillis(config, "cacheTtlMs", next.cacheTtl, error)
        || !readMillis(config, "flushIntervalMs", next.flushInterval, error)
        || !readUnsigned(config, "recorderQueueCapacity", next.recorderQueueCapacity, error)
        || !readMillis(config, "recorderSubmitTimeoutMs", next.recorderSubmitTimeout, error)
        || !readUnsigned(config, "maxPendingMatches", next.maxPendingMatches, error)) {
        return false;
    }
    if (workers == 0) {
        if (error) {
            *error = "maxWorkers must be at least 1";
        }
        return false;
    }
    next.maxWorkers = static_cast<int>(workers);

    auto decay = config.find("frequencyDecay");
    if (decay != config.end()) {
        if (!decay->is_number() || decay->get<double>() < 0.0 || decay->get<double>() > 1.0) {
            if (error) {
                *error = "frequencyDecay must be a number between 0 and 1";
            }
            return false;
        }
        next.frequencyDecay = decay->get<double>();
    }

    out = next;
    return true;
}

bool loadEngineConfigFile(const std::string &path, EngineConfig &out, std::string *error)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = "cannot open config file " + path;
        }
        return false;
    }

    const QByteArray contents = file.readAll();
    const auto parsed = nlohmann::json::parse(contents.toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        if (error) {
            *error = "config file is not valid JSON";
        }
        return false;
    }
    return applyEngineConfigJson(parsed, out, error);
}

nlohmann::json engineConfigToJson(const EngineConfig &config)
{
    return nlohmann::json{
        {"maxCandidates", config.maxCandidates},
        {"sequentialThreshold", config.sequentialThreshold},
        {"maxWorkers", config.maxWorkers},
        {"candidateTimeoutMs", config.candidateTimeout.count()},
        {"matchTimeoutMs", config.matchTimeout.count()},
        {"cacheTtlMs", config.cacheTtl.count()},
        {"flushIntervalMs", config.flushInterval.count()},
        {"frequencyDecay", config.frequencyDecay},
        {"recorderQueueCapacity", config.recorderQueueCapacity},
        {"recorderSubmitTimeoutMs", config.recorderSubmitTimeout.count()},
        {"maxPendingMatches", config.maxPendingMatches}
    };
}

std::string defaultDatabasePath()
{
    const QString overridePath = qEnvironmentVariable("KILLWATCH_DB_PATH");
    if (!overridePath.isEmpty()) {
        return overridePath.toStdString();
    }
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty() ? QStringLiteral(".") : home;
    return (base + QStringLiteral("/.local/share/killwatch/killwatch.db")).toStdString();
}

} // namespace killwatch
