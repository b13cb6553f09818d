#include "matching/evaluator.hpp"

#include <QThreadPool>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>

#include "common/logging.hpp"

namespace killwatch {

namespace {

enum class Outcome {
    NoMatch,
    Match,
    Failed,
    Slow
};

// Predicates cannot be interrupted; a candidate that overruns its budget is
// discarded once it returns.
Outcome runCandidate(const CompiledProfile &profile,
                     const Killmail &killmail,
                     std::chrono::milliseconds budget)
{
    const auto started = std::chrono::steady_clock::now();
    bool matched = false;
    try {
        matched = profile.predicate(killmail);
    } catch (const std::exception &ex) {
        KWLOG_WARN(QStringLiteral("Evaluator"),
                   QStringLiteral("runCandidate"),
                   QStringLiteral("candidate_failed"),
                   QStringLiteral("predicate_error"),
                   QStringLiteral("treat_as_no_match"),
                   ::killwatch::logging::defaultWho(),
                   ::killwatch::logging::currentCorrelationId(),
                   nlohmann::json{{"profileId", profile.id},
                                  {"killmailId", killmail.killmailId},
                                  {"error", ex.what()}});
        return Outcome::Failed;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > budget) {
        KWLOG_WARN(QStringLiteral("Evaluator"),
                   QStringLiteral("runCandidate"),
                   QStringLiteral("candidate_timeout"),
                   QStringLiteral("predicate_too_slow"),
                   QStringLiteral("treat_as_no_match"),
                   ::killwatch::logging::defaultWho(),
                   ::killwatch::logging::currentCorrelationId(),
                   nlohmann::json{{"profileId", profile.id},
                                  {"killmailId", killmail.killmailId},
                                  {"elapsedMs", std::chrono::duration_cast<std::chrono::milliseconds>(
                                                    elapsed).count()},
                                  {"budgetMs", budget.count()}});
        return Outcome::Slow;
    }
    return matched ? Outcome::Match : Outcome::NoMatch;
}

void tally(Outcome outcome, const CompiledProfile &profile, EvaluationResult &result)
{
    ++result.evaluated;
    switch (outcome) {
    case Outcome::Match:
        result.matched.push_back(profile.id);
        break;
    case Outcome::Failed:
        ++result.failed;
        break;
    case Outcome::Slow:
        ++result.slow;
        break;
    case Outcome::NoMatch:
        break;
    }
}

void logDeadline(const Killmail &killmail, std::size_t candidates, std::size_t evaluated)
{
    KWLOG_WARN(QStringLiteral("Evaluator"),
               QStringLiteral("evaluate"),
               QStringLiteral("match_deadline_exceeded"),
               QStringLiteral("evaluation_too_slow"),
               QStringLiteral("return_empty"),
               ::killwatch::logging::defaultWho(),
               ::killwatch::logging::currentCorrelationId(),
               nlohmann::json{{"killmailId", killmail.killmailId},
                              {"candidates", candidates},
                              {"evaluated", evaluated}});
}

// Shared between the caller and the pool tasks. The caller may give up at
// the deadline while tasks are still running, so the tasks keep it alive.
struct ParallelBatch {
    std::shared_ptr<const ProfileGeneration> generation;
    Killmail killmail;
    std::vector<std::size_t> slots;
    std::chrono::milliseconds candidateTimeout{0};

    std::vector<Outcome> outcomes;
    std::atomic<std::size_t> next{0};
    std::atomic<bool> cancelled{false};

    std::mutex mutex;
    std::condition_variable finished;
    int activeWorkers = 0;
};

void drainBatch(const std::shared_ptr<ParallelBatch> &batch)
{
    while (!batch->cancelled.load()) {
        const std::size_t index = batch->next.fetch_add(1);
        if (index >= batch->slots.size()) {
            break;
        }
        const CompiledProfile &profile = batch->generation->profiles[batch->slots[index]];
        batch->outcomes[index] = runCandidate(profile, batch->killmail, batch->candidateTimeout);
    }

    std::lock_guard<std::mutex> lock(batch->mutex);
    --batch->activeWorkers;
    if (batch->activeWorkers == 0) {
        batch->finished.notify_all();
    }
}

} // namespace

Evaluator::Evaluator(const EngineConfig &config)
    : m_sequentialThreshold(config.sequentialThreshold)
    , m_maxWorkers(std::max(1, config.maxWorkers))
    , m_candidateTimeout(config.candidateTimeout)
    , m_pool(std::make_unique<QThreadPool>())
{
    m_pool->setMaxThreadCount(m_maxWorkers);
}

Evaluator::~Evaluator()
{
    m_pool->waitForDone();
}

EvaluationResult Evaluator::evaluate(const std::shared_ptr<const ProfileGeneration> &generation,
                                     const std::vector<std::size_t> &slots,
                                     const Killmail &killmail,
                                     std::chrono::steady_clock::time_point deadline)
{
    EvaluationResult result;
    if (!generation || slots.empty()) {
        return result;
    }

    if (slots.size() <= m_sequentialThreshold) {
        result = evaluateSequential(*generation, slots, killmail, deadline);
    } else {
        result = evaluateParallel(generation, slots, killmail, deadline);
    }

    if (result.timedOut) {
        result.matched.clear();
    } else {
        std::sort(result.matched.begin(), result.matched.end());
    }
    return result;
}

EvaluationResult Evaluator::evaluateSequential(const ProfileGeneration &generation,
                                               const std::vector<std::size_t> &slots,
                                               const Killmail &killmail,
                                               std::chrono::steady_clock::time_point deadline)
{
    EvaluationResult result;
    for (std::size_t slot : slots) {
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            logDeadline(killmail, slots.size(), result.evaluated);
            break;
        }
        const CompiledProfile &profile = generation.profiles[slot];
        tally(runCandidate(profile, killmail, m_candidateTimeout), profile, result);
    }
    return result;
}

EvaluationResult Evaluator::evaluateParallel(const std::shared_ptr<const ProfileGeneration> &generation,
                                             const std::vector<std::size_t> &slots,
                                             const Killmail &killmail,
                                             std::chrono::steady_clock::time_point deadline)
{
    auto batch = std::make_shared<ParallelBatch>();
    batch->generation = generation;
    batch->killmail = killmail;
    batch->slots = slots;
    batch->candidateTimeout = m_candidateTimeout;
    batch->outcomes.assign(slots.size(), Outcome::NoMatch);

    const int workers = static_cast<int>(
        std::min<std::size_t>(slots.size(), static_cast<std::size_t>(m_maxWorkers)));
    batch->activeWorkers = workers;
    const QString corrId = ::killwatch::logging::currentCorrelationId();
    for (int i = 0; i < workers; ++i) {
        m_pool->start([batch, corrId]() {
            ::killwatch::logging::CorrelationScope scope(corrId);
            drainBatch(batch);
        });
    }

    EvaluationResult result;
    {
        std::unique_lock<std::mutex> lock(batch->mutex);
        const bool done = batch->finished.wait_until(lock, deadline, [&batch]() {
            return batch->activeWorkers == 0;
        });
        if (!done) {
            batch->cancelled.store(true);
            result.timedOut = true;
        }
    }

    if (result.timedOut) {
        logDeadline(killmail, slots.size(),
                    std::min(batch->next.load(), slots.size()));
        return result;
    }

    for (std::size_t i = 0; i < slots.size(); ++i) {
        tally(batch->outcomes[i], generation->profiles[slots[i]], result);
    }
    return result;
}

} // namespace killwatch
