#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace killwatch {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

// Unset time points are serialized as null rather than the epoch.
inline nlohmann::json optionalIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    if (timestamp == std::chrono::system_clock::time_point{}) {
        return nullptr;
    }
    return toIso8601Utc(timestamp);
}

inline std::string toOperatorString(FilterOperator op)
{
    switch (op) {
    case FilterOperator::Eq:
        return "eq";
    case FilterOperator::Ne:
        return "ne";
    case FilterOperator::Gt:
        return "gt";
    case FilterOperator::Lt:
        return "lt";
    case FilterOperator::Gte:
        return "gte";
    case FilterOperator::Lte:
        return "lte";
    case FilterOperator::In:
        return "in";
    case FilterOperator::NotIn:
        return "not_in";
    case FilterOperator::ContainsAny:
        return "contains_any";
    case FilterOperator::ContainsAll:
        return "contains_all";
    case FilterOperator::NotContains:
        return "not_contains";
    }
    return "eq";
}

inline std::optional<FilterOperator> parseOperatorString(const std::string &value)
{
    if (value == "eq") {
        return FilterOperator::Eq;
    }
    if (value == "ne") {
        return FilterOperator::Ne;
    }
    if (value == "gt") {
        return FilterOperator::Gt;
    }
    if (value == "lt") {
        return FilterOperator::Lt;
    }
    if (value == "gte") {
        return FilterOperator::Gte;
    }
    if (value == "lte") {
        return FilterOperator::Lte;
    }
    if (value == "in") {
        return FilterOperator::In;
    }
    if (value == "not_in") {
        return FilterOperator::NotIn;
    }
    if (value == "contains_any") {
        return FilterOperator::ContainsAny;
    }
    if (value == "contains_all") {
        return FilterOperator::ContainsAll;
    }
    if (value == "not_contains") {
        return FilterOperator::NotContains;
    }
    return std::nullopt;
}

inline std::string toCombinatorString(GroupCombinator combinator)
{
    return combinator == GroupCombinator::And ? "and" : "or";
}

namespace detail {

// NaN fails both comparisons. 2^63 is exact as a double, INT64_MAX is not.
inline bool inInt64Range(double number)
{
    return number >= -9223372036854775808.0 && number < 9223372036854775808.0;
}

inline bool fitsInt64(const nlohmann::json &value)
{
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>()
            <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return value.is_number_integer();
}

// Ids outside the int64 range read as 0, like a missing id.
inline int64_t idField(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return 0;
    }
    if (it->is_number_integer()) {
        return fitsInt64(*it) ? it->get<int64_t>() : 0;
    }
    if (it->is_number_float()) {
        const double number = it->get<double>();
        return inInt64Range(number) ? static_cast<int64_t>(number) : 0;
    }
    return 0;
}

inline std::string stringField(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

inline std::optional<double> numberField(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    const double value = it->get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// Value fields come either at the top level or inside the zkb block.
inline double valueField(const nlohmann::json &j, const char *key, const char *zkbKey)
{
    if (auto direct = numberField(j, key)) {
        return *direct;
    }
    auto zkb = j.find("zkb");
    if (zkb != j.end() && zkb->is_object()) {
        if (auto fallback = numberField(*zkb, zkbKey)) {
            return *fallback;
        }
    }
    return 0.0;
}

} // namespace detail

inline void to_json(nlohmann::json &j, const Victim &victim)
{
    j = nlohmann::json{
        {"character_id", victim.characterId},
        {"corporation_id", victim.corporationId},
        {"alliance_id", victim.allianceId},
        {"ship_type_id", victim.shipTypeId},
        {"character_name", victim.characterName},
        {"corporation_name", victim.corporationName},
        {"alliance_name", victim.allianceName},
        {"ship_name", victim.shipName}
    };
}

inline void from_json(const nlohmann::json &j, Victim &victim)
{
    if (!j.is_object()) {
        victim = Victim{};
        return;
    }
    victim.characterId = detail::idField(j, "character_id");
    victim.corporationId = detail::idField(j, "corporation_id");
    victim.allianceId = detail::idField(j, "alliance_id");
    victim.shipTypeId = detail::idField(j, "ship_type_id");
    victim.characterName = detail::stringField(j, "character_name");
    victim.corporationName = detail::stringField(j, "corporation_name");
    victim.allianceName = detail::stringField(j, "alliance_name");
    victim.shipName = detail::stringField(j, "ship_name");
}

inline void to_json(nlohmann::json &j, const Attacker &attacker)
{
    j = nlohmann::json{
        {"character_id", attacker.characterId},
        {"corporation_id", attacker.corporationId},
        {"alliance_id", attacker.allianceId},
        {"ship_type_id", attacker.shipTypeId},
        {"final_blow", attacker.finalBlow}
    };
}

inline void from_json(const nlohmann::json &j, Attacker &attacker)
{
    if (!j.is_object()) {
        attacker = Attacker{};
        return;
    }
    attacker.characterId = detail::idField(j, "character_id");
    attacker.corporationId = detail::idField(j, "corporation_id");
    attacker.allianceId = detail::idField(j, "alliance_id");
    attacker.shipTypeId = detail::idField(j, "ship_type_id");
    auto it = j.find("final_blow");
    attacker.finalBlow = it != j.end() && it->is_boolean() && it->get<bool>();
}

inline void to_json(nlohmann::json &j, const Killmail &killmail)
{
    j = nlohmann::json{
        {"killmail_id", killmail.killmailId},
        {"killmail_time", optionalIso8601Utc(killmail.killmailTime)},
        {"solar_system_id", killmail.solarSystemId},
        {"solar_system_name", killmail.solarSystemName},
        {"victim", killmail.victim},
        {"attackers", killmail.attackers},
        {"total_value", killmail.totalValue},
        {"ship_value", killmail.shipValue},
        {"fitted_value", killmail.fittedValue},
        {"module_tags", killmail.moduleTags}
    };
    if (killmail.attackerCount.has_value()) {
        j["attacker_count"] = *killmail.attackerCount;
    }
}

inline void from_json(const nlohmann::json &j, Killmail &killmail)
{
    killmail = Killmail{};
    if (!j.is_object()) {
        return;
    }

    killmail.killmailId = detail::idField(j, "killmail_id");

    std::string time = detail::stringField(j, "killmail_time");
    if (time.empty()) {
        time = detail::stringField(j, "kill_time");
    }
    if (time.empty()) {
        time = detail::stringField(j, "timestamp");
    }
    if (!time.empty()) {
        killmail.killmailTime = fromIso8601Utc(time);
    }

    killmail.solarSystemId = detail::idField(j, "solar_system_id");
    if (killmail.solarSystemId == 0) {
        killmail.solarSystemId = detail::idField(j, "system_id");
    }
    killmail.solarSystemName = detail::stringField(j, "solar_system_name");

    if (j.contains("victim")) {
        killmail.victim = j.at("victim").get<Victim>();
    }
    if (j.contains("attackers") && j.at("attackers").is_array()) {
        killmail.attackers = j.at("attackers").get<std::vector<Attacker>>();
    }

    killmail.totalValue = detail::valueField(j, "total_value", "totalValue");
    killmail.shipValue = detail::valueField(j, "ship_value", "destroyedValue");
    killmail.fittedValue = detail::valueField(j, "fitted_value", "fittedValue");

    auto count = j.find("attacker_count");
    if (count != j.end() && count->is_number_integer()) {
        // Negative counts are ignored; oversized ones clamp to INT_MAX.
        const bool negative = !count->is_number_unsigned() && count->get<int64_t>() < 0;
        if (!negative) {
            const uint64_t reported = count->get<uint64_t>();
            const auto limit = static_cast<uint64_t>(std::numeric_limits<int>::max());
            killmail.attackerCount = static_cast<int>(std::min(reported, limit));
        }
    }

    auto tags = j.find("module_tags");
    if (tags == j.end()) {
        tags = j.find("noteworthy_modules");
    }
    if (tags != j.end() && tags->is_array()) {
        for (const auto &tag : *tags) {
            if (tag.is_string()) {
                killmail.moduleTags.push_back(tag.get<std::string>());
            }
        }
    }
}

inline void to_json(nlohmann::json &j, const MatchRecord &record)
{
    j = nlohmann::json{
        {"profileId", record.profileId},
        {"killmailId", record.killmailId},
        {"killmailTime", optionalIso8601Utc(record.killmailTime)},
        {"victimCharacterName", record.victimCharacterName},
        {"victimShipName", record.victimShipName},
        {"solarSystemName", record.solarSystemName},
        {"totalValue", record.totalValue},
        {"matchedAt", optionalIso8601Utc(record.matchedAt)}
    };
}

inline void from_json(const nlohmann::json &j, MatchRecord &record)
{
    record.profileId = j.value("profileId", "");
    record.killmailId = detail::idField(j, "killmailId");
    record.killmailTime = fromIso8601Utc(detail::stringField(j, "killmailTime"));
    record.victimCharacterName = j.value("victimCharacterName", "");
    record.victimShipName = j.value("victimShipName", "");
    record.solarSystemName = j.value("solarSystemName", "");
    record.totalValue = detail::numberField(j, "totalValue").value_or(0.0);
    record.matchedAt = fromIso8601Utc(detail::stringField(j, "matchedAt"));
}

inline void to_json(nlohmann::json &j, const SurveillanceProfile &profile)
{
    j = nlohmann::json{
        {"id", profile.id},
        {"name", profile.name},
        {"description", profile.description},
        {"filterTree", profile.filterTree},
        {"active", profile.active},
        {"matchCount", profile.matchCount},
        {"lastMatchAt", optionalIso8601Utc(profile.lastMatchAt)}
    };
}

inline void from_json(const nlohmann::json &j, SurveillanceProfile &profile)
{
    profile.id = j.value("id", "");
    profile.name = j.value("name", "");
    profile.description = j.value("description", "");
    if (j.contains("filterTree")) {
        profile.filterTree = j.at("filterTree");
    } else {
        profile.filterTree = nlohmann::json::object();
    }
    profile.active = j.value("active", true);
    profile.matchCount = detail::idField(j, "matchCount");
    profile.lastMatchAt = fromIso8601Utc(detail::stringField(j, "lastMatchAt"));
}

inline void to_json(nlohmann::json &j, const EngineStats &stats)
{
    j = nlohmann::json{
        {"generation", stats.generation},
        {"profilesLoaded", stats.profilesLoaded},
        {"compiledProfiles", stats.compiledProfiles},
        {"failedProfileIds", stats.failedProfileIds},
        {"indexedProfiles", stats.indexedProfiles},
        {"unindexedProfiles", stats.unindexedProfiles},
        {"matchesProcessed", stats.matchesProcessed},
        {"totalMatches", stats.totalMatches},
        {"timedOutMatches", stats.timedOutMatches},
        {"pendingMatches", stats.pendingMatches},
        {"indexes", {
            {"tags", stats.indexes.tags},
            {"systems", stats.indexes.systems},
            {"ships", stats.indexes.ships},
            {"iskThresholds", stats.indexes.iskThresholds}
        }},
        {"cache", {
            {"size", stats.cacheSize},
            {"hits", stats.cacheHits},
            {"misses", stats.cacheMisses}
        }},
        {"recorder", {
            {"recordedMatches", stats.recordedMatches},
            {"failedMatchRecords", stats.failedMatchRecords},
            {"droppedBatches", stats.droppedBatches}
        }},
        {"failedReloads", stats.failedReloads},
        {"lastReload", optionalIso8601Utc(stats.lastReload)},
        {"lastFlush", optionalIso8601Utc(stats.lastFlush)}
    };
}

} // namespace killwatch
