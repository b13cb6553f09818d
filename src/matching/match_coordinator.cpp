#include "matching/match_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "common/logging.hpp"
#include "matching/candidate_selector.hpp"

namespace killwatch {

namespace {

MatchRecord makeRecord(const std::string &profileId,
                       const Killmail &killmail,
                       std::chrono::system_clock::time_point matchedAt)
{
    MatchRecord record;
    record.profileId = profileId;
    record.killmailId = killmail.killmailId;
    record.killmailTime = killmail.killmailTime;
    record.victimCharacterName = killmail.victim.characterName;
    record.victimShipName = killmail.victim.shipName;
    record.solarSystemName = killmail.solarSystemName;
    record.totalValue = killmail.totalValue;
    record.matchedAt = matchedAt;
    return record;
}

} // namespace

MatchCoordinator::MatchCoordinator(ProfileSource &source,
                                   MatchPersistence &persistence,
                                   const EngineConfig &config,
                                   QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_config(config)
    , m_evaluator(config)
    , m_recorder(persistence, config)
    , m_generation(buildGeneration({}, 0))
    , m_cache(config.cacheTtl)
    , m_frequencies(std::make_shared<const FrequencyTable>())
{
    m_flushTimer.setInterval(static_cast<int>(m_config.flushInterval.count()));
    connect(&m_flushTimer, &QTimer::timeout, this, [this]() {
        flushPendingMatches();
    });
}

MatchCoordinator::~MatchCoordinator()
{
    stop();
}

void MatchCoordinator::start()
{
    if (!reload()) {
        KWLOG_WARN(QStringLiteral("MatchCoordinator"),
                   QStringLiteral("start"),
                   QStringLiteral("initial_reload_failed"),
                   QStringLiteral("profile_source_unavailable"),
                   QStringLiteral("start_with_empty_generation"),
                   ::killwatch::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    m_recorder.start();
    if (m_config.flushInterval.count() > 0) {
        m_flushTimer.start();
    }
}

void MatchCoordinator::stop()
{
    m_flushTimer.stop();
    flushPendingMatches();
    m_recorder.stop();
}

std::shared_ptr<const ProfileGeneration> MatchCoordinator::currentGeneration() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

std::vector<std::string> MatchCoordinator::match(const Killmail &killmail)
{
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + m_config.matchTimeout;

    try {
        const std::string fingerprint = MatchCache::fingerprint(killmail);

        std::shared_ptr<const ProfileGeneration> generation;
        std::shared_ptr<const FrequencyTable> frequencies;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_matchesProcessed;
            generation = m_generation;
            frequencies = m_frequencies;
            if (auto cached = m_cache.lookup(fingerprint, generation->number, started)) {
                return *cached;
            }
        }

        const CandidateSelection selection = CandidateSelector::select(
            killmail, *generation, *frequencies, m_config.maxCandidates);
        EvaluationResult evaluation = m_evaluator.evaluate(generation, selection.slots,
                                                           killmail, deadline);
        if (evaluation.timedOut) {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_timedOutMatches;
            return {};
        }

        bool flushNow = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cache.store(fingerprint, evaluation.matched, generation->number,
                          std::chrono::steady_clock::now());
            const auto matchedAt = std::chrono::system_clock::now();
            for (const auto &profileId : evaluation.matched) {
                m_pending.push_back(PendingMatch{profileId, makeRecord(profileId, killmail, matchedAt)});
            }
            m_totalMatches += evaluation.matched.size();
            flushNow = m_config.maxPendingMatches > 0
                && m_pending.size() >= m_config.maxPendingMatches;
        }

        KWLOG_DEBUG(QStringLiteral("MatchCoordinator"),
                    QStringLiteral("match"),
                    QStringLiteral("killmail_matched"),
                    QStringLiteral("killmail_received"),
                    QString::fromStdString(toSelectionPathString(selection.path)),
                    ::killwatch::logging::defaultWho(),
                    ::killwatch::logging::currentCorrelationId(),
                    nlohmann::json{{"killmailId", killmail.killmailId},
                                   {"generation", generation->number},
                                   {"candidates", selection.slots.size()},
                                   {"matches", evaluation.matched.size()},
                                   {"failed", evaluation.failed},
                                   {"slow", evaluation.slow}});

        for (const auto &profileId : evaluation.matched) {
            emit matchFound(QString::fromStdString(profileId), killmail.killmailId);
        }
        if (flushNow) {
            flushPendingMatches();
        }
        return evaluation.matched;
    } catch (const std::exception &ex) {
        KWLOG_ERROR(QStringLiteral("MatchCoordinator"),
                    QStringLiteral("match"),
                    QStringLiteral("match_failed"),
                    QStringLiteral("unexpected_exception"),
                    QStringLiteral("return_empty"),
                    ::killwatch::logging::defaultWho(),
                    ::killwatch::logging::currentCorrelationId(),
                    nlohmann::json{{"killmailId", killmail.killmailId},
                                   {"error", ex.what()}});
        return {};
    }
}

bool MatchCoordinator::reload()
{
    std::lock_guard<std::mutex> reloadLock(m_reloadMutex);

    std::shared_ptr<const ProfileGeneration> generation;
    try {
        const std::vector<SurveillanceProfile> profiles = m_source.listActiveProfiles();
        generation = buildGeneration(profiles, m_nextGeneration);
    } catch (const std::exception &ex) {
        uint64_t activeGeneration = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_failedReloads;
            activeGeneration = m_generation->number;
        }
        KWLOG_ERROR(QStringLiteral("MatchCoordinator"),
                    QStringLiteral("reload"),
                    QStringLiteral("reload_failed"),
                    QStringLiteral("profile_source_error"),
                    QStringLiteral("keep_previous_generation"),
                    ::killwatch::logging::defaultWho(),
                    ::killwatch::logging::currentCorrelationId(),
                    nlohmann::json{{"activeGeneration", activeGeneration},
                                   {"error", ex.what()}});
        return false;
    }
    ++m_nextGeneration;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_generation = generation;
        m_cache.clear();
    }

    KWLOG_INFO(QStringLiteral("MatchCoordinator"),
               QStringLiteral("reload"),
               QStringLiteral("generation_swapped"),
               QStringLiteral("reload_requested"),
               QStringLiteral("atomic_swap"),
               ::killwatch::logging::defaultWho(),
               ::killwatch::logging::currentCorrelationId(),
               nlohmann::json{{"generation", generation->number},
                              {"compiled", generation->profiles.size()},
                              {"failed", generation->failedProfileIds.size()}});
    emit generationChanged(generation->number);
    return true;
}

std::size_t MatchCoordinator::flushPendingMatches()
{
    MatchBatch batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        batch.swap(m_pending);
        m_cache.purgeExpired(std::chrono::steady_clock::now());
        m_lastFlush = std::chrono::system_clock::now();
        if (!batch.empty()) {
            auto next = std::make_shared<FrequencyTable>(*m_frequencies);
            MatchRecorder::applyFrequencyDecay(*next, batch, m_config.frequencyDecay);
            m_frequencies = std::move(next);
        }
    }

    if (batch.empty()) {
        return 0;
    }

    const std::size_t count = batch.size();
    const bool queued = m_recorder.submit(std::move(batch));
    KWLOG_DEBUG(QStringLiteral("MatchCoordinator"),
                QStringLiteral("flushPendingMatches"),
                QStringLiteral("pending_matches_flushed"),
                QStringLiteral("flush_interval"),
                QStringLiteral("hand_to_recorder"),
                ::killwatch::logging::defaultWho(),
                QString(),
                nlohmann::json{{"matches", count},
                               {"queued", queued}});
    return count;
}

EngineStats MatchCoordinator::stats() const
{
    EngineStats stats;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stats.generation = m_generation->number;
        stats.profilesLoaded = m_generation->profilesLoaded;
        stats.compiledProfiles = m_generation->profiles.size();
        stats.failedProfileIds = m_generation->failedProfileIds;
        stats.indexedProfiles = m_generation->indexes.indexedCount();
        stats.unindexedProfiles = m_generation->indexes.unindexed().size();
        stats.indexes = m_generation->indexes.cardinalities();

        stats.matchesProcessed = m_matchesProcessed;
        stats.totalMatches = m_totalMatches;
        stats.timedOutMatches = m_timedOutMatches;
        stats.pendingMatches = m_pending.size();

        stats.cacheSize = m_cache.size();
        stats.cacheHits = m_cache.hits();
        stats.cacheMisses = m_cache.misses();

        stats.failedReloads = m_failedReloads;
        // Generation 0 is the empty set loaded at construction, not a reload.
        if (m_generation->number > 0) {
            stats.lastReload = m_generation->builtAt;
        }
        stats.lastFlush = m_lastFlush;
    }
    stats.recordedMatches = m_recorder.recordedMatches();
    stats.failedMatchRecords = m_recorder.failedMatchRecords();
    stats.droppedBatches = m_recorder.droppedBatches();
    return stats;
}

std::vector<std::string> MatchCoordinator::matchAllProfiles(const Killmail &killmail) const
{
    const std::shared_ptr<const ProfileGeneration> generation = currentGeneration();
    std::vector<std::string> matched;
    for (const auto &profile : generation->profiles) {
        if (profile.predicate(killmail)) {
            matched.push_back(profile.id);
        }
    }
    std::sort(matched.begin(), matched.end());
    return matched;
}

FilterTestResult MatchCoordinator::testFilter(const nlohmann::json &definition,
                                              const Killmail &killmail)
{
    FilterTestResult result;
    CompileResult compiled = FilterCompiler::compile(definition);
    if (!compiled.ok()) {
        result.error = compiled.error;
        return result;
    }
    result.compiled = true;
    result.matched = compiled.predicate(killmail);
    return result;
}

} // namespace killwatch
