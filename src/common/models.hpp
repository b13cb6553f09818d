#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace killwatch {

// Ids are EVE entity ids; 0 means "not present on this killmail".
struct Victim {
    int64_t characterId = 0;
    int64_t corporationId = 0;
    int64_t allianceId = 0;
    int64_t shipTypeId = 0;

    std::string characterName;
    std::string corporationName;
    std::string allianceName;
    std::string shipName;
};

struct Attacker {
    int64_t characterId = 0;
    int64_t corporationId = 0;
    int64_t allianceId = 0;
    int64_t shipTypeId = 0;
    bool finalBlow = false;
};

// Projection of a killmail as delivered by the ingestion pipeline.
struct Killmail {
    int64_t killmailId = 0;
    std::chrono::system_clock::time_point killmailTime;

    int64_t solarSystemId = 0;
    std::string solarSystemName;

    Victim victim;
    std::vector<Attacker> attackers;

    double totalValue = 0.0;
    double shipValue = 0.0;
    double fittedValue = 0.0;

    // Explicit count from the feed; falls back to attackers.size() when unset.
    std::optional<int> attackerCount;

    std::vector<std::string> moduleTags;
};

// A filter tree node: either a comparison rule or a boolean group.
struct FilterNode {
    enum class Kind {
        Rule,
        Group
    };

    Kind kind = Kind::Rule;

    std::string field;
    FilterOperator op = FilterOperator::Eq;
    nlohmann::json value;

    GroupCombinator combinator = GroupCombinator::And;
    std::vector<FilterNode> children;
};

struct SurveillanceProfile {
    std::string id;
    std::string name;
    std::string description;

    // Raw definition as stored: { "condition": "and"|"or", "rules": [...] }.
    nlohmann::json filterTree;

    bool active = true;
    int64_t matchCount = 0;
    std::chrono::system_clock::time_point lastMatchAt;
};

struct MatchRecord {
    std::string profileId;
    int64_t killmailId = 0;
    std::chrono::system_clock::time_point killmailTime;

    std::string victimCharacterName;
    std::string victimShipName;
    std::string solarSystemName;
    double totalValue = 0.0;

    std::chrono::system_clock::time_point matchedAt;
};

// Decayed recent-match counter per profile id.
using FrequencyTable = std::unordered_map<std::string, double>;

struct IndexCardinalities {
    std::size_t tags = 0;
    std::size_t systems = 0;
    std::size_t ships = 0;
    std::size_t iskThresholds = 0;
};

struct EngineStats {
    uint64_t generation = 0;
    std::size_t profilesLoaded = 0;
    std::size_t compiledProfiles = 0;
    std::vector<std::string> failedProfileIds;
    std::size_t indexedProfiles = 0;
    std::size_t unindexedProfiles = 0;

    uint64_t matchesProcessed = 0;
    uint64_t totalMatches = 0;
    uint64_t timedOutMatches = 0;
    std::size_t pendingMatches = 0;

    IndexCardinalities indexes;

    std::size_t cacheSize = 0;
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;

    uint64_t recordedMatches = 0;
    uint64_t failedMatchRecords = 0;
    uint64_t droppedBatches = 0;
    uint64_t failedReloads = 0;

    std::chrono::system_clock::time_point lastReload;
    std::chrono::system_clock::time_point lastFlush;
};

} // namespace killwatch
