#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "common/engine_config.hpp"
#include "common/models.hpp"
#include "matching/profile_generation.hpp"

class QThreadPool;

namespace killwatch {

struct EvaluationResult {
    // Sorted profile ids. Empty when timedOut is set.
    std::vector<std::string> matched;
    bool timedOut = false;

    std::size_t evaluated = 0;
    std::size_t failed = 0;
    std::size_t slow = 0;
};

// Evaluator runs candidate predicates against one killmail. Small candidate
// sets run on the calling thread; larger ones are spread over a bounded
// worker pool owned by the evaluator.
class Evaluator
{
public:
    explicit Evaluator(const EngineConfig &config);
    ~Evaluator();

    Evaluator(const Evaluator &) = delete;
    Evaluator &operator=(const Evaluator &) = delete;

    EvaluationResult evaluate(const std::shared_ptr<const ProfileGeneration> &generation,
                              const std::vector<std::size_t> &slots,
                              const Killmail &killmail,
                              std::chrono::steady_clock::time_point deadline);

private:
    EvaluationResult evaluateSequential(const ProfileGeneration &generation,
                                        const std::vector<std::size_t> &slots,
                                        const Killmail &killmail,
                                        std::chrono::steady_clock::time_point deadline);
    EvaluationResult evaluateParallel(const std::shared_ptr<const ProfileGeneration> &generation,
                                      const std::vector<std::size_t> &slots,
                                      const Killmail &killmail,
                                      std::chrono::steady_clock::time_point deadline);

    std::size_t m_sequentialThreshold;
    int m_maxWorkers;
    std::chrono::milliseconds m_candidateTimeout;
    std::unique_ptr<QThreadPool> m_pool;
};

} // namespace killwatch
