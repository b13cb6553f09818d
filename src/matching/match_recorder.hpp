#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/engine_config.hpp"
#include "common/models.hpp"
#include "matching/profile_source.hpp"

class QThread;

namespace killwatch {

struct PendingMatch {
    std::string profileId;
    MatchRecord record;
};

using MatchBatch = std::vector<PendingMatch>;

// MatchRecorder persists drained match batches on one dedicated thread fed
// by a bounded queue. Delivery is at most once: a batch that cannot be queued
// in time, or a profile whose write fails, is logged and dropped.
class MatchRecorder {
public:
    MatchRecorder(MatchPersistence &persistence, const EngineConfig &config);
    ~MatchRecorder();

    MatchRecorder(const MatchRecorder &) = delete;
    MatchRecorder &operator=(const MatchRecorder &) = delete;

    void start();

    // Persists whatever is still queued, then joins the worker.
    void stop();

    bool isRunning() const;

    // Queues a batch, waiting up to the submit timeout for room. Returns
    // false when the batch was dropped. Without a running worker the batch
    // is persisted on the calling thread.
    bool submit(MatchBatch batch);

    // Blocks until the queue is empty and no batch is in progress.
    bool waitForIdle(std::chrono::milliseconds timeout);

    void persistBatch(const MatchBatch &batch);

    // new = old * decay + matches in batch, for profiles present in the batch.
    static void applyFrequencyDecay(FrequencyTable &table, const MatchBatch &batch, double decay);

    uint64_t recordedMatches() const { return m_recorded.load(); }
    uint64_t failedMatchRecords() const { return m_failed.load(); }
    uint64_t droppedBatches() const { return m_dropped.load(); }
    std::size_t queuedBatches() const;

private:
    void run();

    MatchPersistence &m_persistence;
    std::size_t m_capacity;
    std::chrono::milliseconds m_submitTimeout;

    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    std::condition_variable m_idle;
    std::deque<MatchBatch> m_queue;
    bool m_stopping = false;
    bool m_busy = false;

    std::unique_ptr<QThread> m_thread;

    std::atomic<uint64_t> m_recorded{0};
    std::atomic<uint64_t> m_failed{0};
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace killwatch
