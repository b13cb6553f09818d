#include "matching/match_recorder.hpp"

#include <QThread>

#include <algorithm>
#include <exception>
#include <map>
#include <utility>

#include "common/logging.hpp"

namespace killwatch {

MatchRecorder::MatchRecorder(MatchPersistence &persistence, const EngineConfig &config)
    : m_persistence(persistence)
    , m_capacity(std::max<std::size_t>(1, config.recorderQueueCapacity))
    , m_submitTimeout(config.recorderSubmitTimeout)
{
}

MatchRecorder::~MatchRecorder()
{
    stop();
}

void MatchRecorder::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread) {
        return;
    }
    m_stopping = false;
    m_thread.reset(QThread::create([this]() { run(); }));
    m_thread->setObjectName(QStringLiteral("killwatch-recorder"));
    m_thread->start();
}

void MatchRecorder::stop()
{
    std::unique_ptr<QThread> thread;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_thread) {
            return;
        }
        m_stopping = true;
        thread = std::move(m_thread);
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();
    thread->wait();
}

bool MatchRecorder::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread != nullptr;
}

std::size_t MatchRecorder::queuedBatches() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool MatchRecorder::submit(MatchBatch batch)
{
    if (batch.empty()) {
        return true;
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_thread) {
        lock.unlock();
        persistBatch(batch);
        return true;
    }

    const bool hasRoom = m_notFull.wait_for(lock, m_submitTimeout, [this]() {
        return m_queue.size() < m_capacity || m_stopping;
    });
    if (!hasRoom || m_stopping) {
        const std::size_t queued = m_queue.size();
        lock.unlock();
        m_dropped.fetch_add(1);
        m_failed.fetch_add(batch.size());
        KWLOG_ERROR(QStringLiteral("MatchRecorder"),
                    QStringLiteral("submit"),
                    QStringLiteral("match_batch_dropped"),
                    hasRoom ? QStringLiteral("recorder_stopping")
                            : QStringLiteral("recorder_queue_full"),
                    QStringLiteral("drop_batch"),
                    ::killwatch::logging::defaultWho(),
                    ::killwatch::logging::currentCorrelationId(),
                    nlohmann::json{{"matches", batch.size()},
                                   {"queuedBatches", queued},
                                   {"capacity", m_capacity}});
        return false;
    }

    m_queue.push_back(std::move(batch));
    lock.unlock();
    m_notEmpty.notify_one();
    return true;
}

bool MatchRecorder::waitForIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, timeout, [this]() {
        return m_queue.empty() && !m_busy;
    });
}

void MatchRecorder::run()
{
    KWLOG_INFO(QStringLiteral("MatchRecorder"),
               QStringLiteral("run"),
               QStringLiteral("recorder_started"),
               QStringLiteral("engine_start"),
               QStringLiteral("dedicated_thread"),
               ::killwatch::logging::defaultWho(),
               QString(),
               nlohmann::json{{"capacity", m_capacity}});

    while (true) {
        MatchBatch batch;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notEmpty.wait(lock, [this]() { return !m_queue.empty() || m_stopping; });
            if (m_queue.empty()) {
                // Only reached when stopping with nothing left to write.
                m_idle.notify_all();
                break;
            }
            batch = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy = true;
        }
        m_notFull.notify_one();

        persistBatch(batch);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idle.notify_all();
    }

    KWLOG_INFO(QStringLiteral("MatchRecorder"),
               QStringLiteral("run"),
               QStringLiteral("recorder_stopped"),
               QStringLiteral("engine_stop"),
               QStringLiteral("queue_drained"),
               ::killwatch::logging::defaultWho(),
               QString(),
               nlohmann::json{{"recorded", m_recorded.load()},
                              {"failed", m_failed.load()},
                              {"droppedBatches", m_dropped.load()}});
}

void MatchRecorder::persistBatch(const MatchBatch &batch)
{
    std::map<std::string, std::vector<MatchRecord>> byProfile;
    for (const auto &pending : batch) {
        byProfile[pending.profileId].push_back(pending.record);
    }

    for (const auto &entry : byProfile) {
        const std::string &profileId = entry.first;
        const std::vector<MatchRecord> &records = entry.second;

        try {
            const std::size_t inserted = m_persistence.addProfileMatches(profileId, records);
            m_recorded.fetch_add(inserted);
            KWLOG_DEBUG(QStringLiteral("MatchRecorder"),
                        QStringLiteral("persistBatch"),
                        QStringLiteral("profile_matches_persisted"),
                        QStringLiteral("batch_flush"),
                        QStringLiteral("bulk_insert"),
                        ::killwatch::logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"profileId", profileId},
                                       {"matches", records.size()},
                                       {"inserted", inserted}});
        } catch (const std::exception &ex) {
            m_failed.fetch_add(records.size());
            KWLOG_ERROR(QStringLiteral("MatchRecorder"),
                        QStringLiteral("persistBatch"),
                        QStringLiteral("profile_matches_lost"),
                        QStringLiteral("persistence_failed"),
                        QStringLiteral("drop_profile_batch"),
                        ::killwatch::logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"profileId", profileId},
                                       {"matches", records.size()},
                                       {"error", ex.what()}});
        }
    }
}

void MatchRecorder::applyFrequencyDecay(FrequencyTable &table, const MatchBatch &batch, double decay)
{
    std::map<std::string, int> counts;
    for (const auto &pending : batch) {
        ++counts[pending.profileId];
    }
    for (const auto &entry : counts) {
        double &frequency = table[entry.first];
        frequency = frequency * decay + static_cast<double>(entry.second);
    }
}

} // namespace killwatch
