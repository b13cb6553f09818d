#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace killwatch {

struct EngineConfig {
    // Cap on the full-scan and union fallback candidate sets.
    std::size_t maxCandidates = 100;

    // Candidate sets at or below this size are evaluated on the calling thread.
    std::size_t sequentialThreshold = 10;
    int maxWorkers = 4;
    std::chrono::milliseconds candidateTimeout{1000};
    std::chrono::milliseconds matchTimeout{10000};

    // A zero TTL disables the match cache.
    std::chrono::milliseconds cacheTtl{60000};

    std::chrono::milliseconds flushInterval{5000};
    double frequencyDecay = 0.9;
    std::size_t recorderQueueCapacity = 64;
    std::chrono::milliseconds recorderSubmitTimeout{1000};
    std::size_t maxPendingMatches = 10000;
};

// Defaults overridden by KILLWATCH_* environment variables.
EngineConfig loadEngineConfig();

// Applies camelCase keys from a JSON object; unknown keys are ignored.
// Returns false and fills error when a known key carries the wrong type.
bool applyEngineConfigJson(const nlohmann::json &config, EngineConfig &out, std::string *error);

// Reads and applies a JSON config file.
bool loadEngineConfigFile(const std::string &path, EngineConfig &out, std::string *error);

nlohmann::json engineConfigToJson(const EngineConfig &config);

std::string defaultDatabasePath();

} // namespace killwatch
