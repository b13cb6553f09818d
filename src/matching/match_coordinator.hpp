#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/engine_config.hpp"
#include "common/models.hpp"
#include "matching/evaluator.hpp"
#include "matching/match_cache.hpp"
#include "matching/match_recorder.hpp"
#include "matching/profile_generation.hpp"
#include "matching/profile_source.hpp"

namespace killwatch {

struct FilterTestResult {
    bool compiled = false;
    bool matched = false;
    std::string error;
};

// MatchCoordinator owns the active profile generation, the match cache, the
// pending match buffer and the frequency table. State changes happen under
// one short-held mutex; predicate evaluation runs outside it against an
// immutable generation snapshot.
class MatchCoordinator : public QObject
{
    Q_OBJECT

public:
    MatchCoordinator(ProfileSource &source,
                     MatchPersistence &persistence,
                     const EngineConfig &config,
                     QObject *parent = nullptr);
    ~MatchCoordinator() override;

    // Loads the first generation, starts the recorder thread and the flush timer.
    void start();
    void stop();

    std::vector<std::string> match(const Killmail &killmail);

    // Returns false and keeps the current generation when the source fails.
    bool reload();

    EngineStats stats() const;

    // Moves the pending buffer to the recorder. Returns the number of matches handed over.
    std::size_t flushPendingMatches();

    // Evaluates every compiled profile directly. Nothing is cached or recorded.
    std::vector<std::string> matchAllProfiles(const Killmail &killmail) const;

    static FilterTestResult testFilter(const nlohmann::json &definition, const Killmail &killmail);

    std::shared_ptr<const ProfileGeneration> currentGeneration() const;
    const MatchRecorder &recorder() const { return m_recorder; }
    MatchRecorder &recorder() { return m_recorder; }
    const EngineConfig &config() const { return m_config; }

signals:
    void matchFound(const QString &profileId, qint64 killmailId);
    void generationChanged(quint64 generation);

private:
    ProfileSource &m_source;
    EngineConfig m_config;
    Evaluator m_evaluator;
    MatchRecorder m_recorder;
    QTimer m_flushTimer;

    // Guards everything below.
    mutable std::mutex m_mutex;
    std::shared_ptr<const ProfileGeneration> m_generation;
    MatchCache m_cache;
    MatchBatch m_pending;
    std::shared_ptr<const FrequencyTable> m_frequencies;
    uint64_t m_matchesProcessed = 0;
    uint64_t m_totalMatches = 0;
    uint64_t m_timedOutMatches = 0;
    uint64_t m_failedReloads = 0;
    std::chrono::system_clock::time_point m_lastFlush;

    // Serializes reloads against each other, not against match().
    std::mutex m_reloadMutex;
    uint64_t m_nextGeneration = 1;
};

} // namespace killwatch
