#include "matching/field_extractor.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace killwatch {

namespace {

nlohmann::json idOrNull(int64_t id)
{
    if (id == 0) {
        return nullptr;
    }
    return id;
}

nlohmann::json nameOrNull(const std::string &name)
{
    if (name.empty()) {
        return nullptr;
    }
    return name;
}

nlohmann::json finalBlowCharacter(const Killmail &killmail)
{
    for (const auto &attacker : killmail.attackers) {
        if (attacker.finalBlow) {
            return idOrNull(attacker.characterId);
        }
    }
    return nullptr;
}

const std::unordered_map<std::string, FieldAccessor> &accessorTable()
{
    static const std::unordered_map<std::string, FieldAccessor> table = [] {
        std::unordered_map<std::string, FieldAccessor> fields;

        FieldAccessor eventId = [](const Killmail &km) { return idOrNull(km.killmailId); };
        fields["event_id"] = eventId;
        fields["killmail_id"] = eventId;

        FieldAccessor systemId = [](const Killmail &km) { return idOrNull(km.solarSystemId); };
        fields["system_id"] = systemId;
        fields["solar_system_id"] = systemId;

        FieldAccessor systemName = [](const Killmail &km) { return nameOrNull(km.solarSystemName); };
        fields["system_name"] = systemName;
        fields["solar_system_name"] = systemName;

        fields["total_value"] = [](const Killmail &km) { return nlohmann::json(km.totalValue); };
        fields["ship_value"] = [](const Killmail &km) { return nlohmann::json(km.shipValue); };
        fields["fitted_value"] = [](const Killmail &km) { return nlohmann::json(km.fittedValue); };
        fields["attacker_count"] = [](const Killmail &km) {
            return nlohmann::json(FieldExtractor::attackerCount(km));
        };
        fields["final_blow_character_id"] = finalBlowCharacter;
        fields["kill_category"] = [](const Killmail &km) {
            return nlohmann::json(FieldExtractor::classifyKill(FieldExtractor::attackerCount(km)));
        };
        FieldAccessor moduleTags = [](const Killmail &km) { return nlohmann::json(km.moduleTags); };
        fields["module_tags"] = moduleTags;
        fields["noteworthy_modules"] = moduleTags;

        fields["victim_character_id"] = [](const Killmail &km) {
            return idOrNull(km.victim.characterId);
        };
        fields["victim_corporation_id"] = [](const Killmail &km) {
            return idOrNull(km.victim.corporationId);
        };
        fields["victim_alliance_id"] = [](const Killmail &km) {
            return idOrNull(km.victim.allianceId);
        };
        fields["victim_ship_type_id"] = [](const Killmail &km) {
            return idOrNull(km.victim.shipTypeId);
        };
        fields["victim_character_name"] = [](const Killmail &km) {
            return nameOrNull(km.victim.characterName);
        };
        fields["victim_corporation_name"] = [](const Killmail &km) {
            return nameOrNull(km.victim.corporationName);
        };
        fields["victim_alliance_name"] = [](const Killmail &km) {
            return nameOrNull(km.victim.allianceName);
        };
        fields["victim_ship_name"] = [](const Killmail &km) {
            return nameOrNull(km.victim.shipName);
        };
        fields["victim_ship_category"] = [](const Killmail &km) {
            return nlohmann::json(FieldExtractor::classifyShip(km.victim.shipTypeId));
        };

        return fields;
    }();
    return table;
}

} // namespace

nlohmann::json FieldExtractor::resolve(const Killmail &killmail, const std::string &field)
{
    const auto &table = accessorTable();
    auto it = table.find(field);
    if (it == table.end()) {
        return nullptr;
    }
    return it->second(killmail);
}

FieldAccessor FieldExtractor::accessorFor(const std::string &field)
{
    const auto &table = accessorTable();
    auto it = table.find(field);
    if (it == table.end()) {
        return [](const Killmail &) { return nlohmann::json(); };
    }
    return it->second;
}

bool FieldExtractor::isKnownField(const std::string &field)
{
    return accessorTable().count(field) > 0;
}

int FieldExtractor::attackerCount(const Killmail &killmail)
{
    if (killmail.attackerCount.has_value()) {
        return *killmail.attackerCount;
    }
    return static_cast<int>(killmail.attackers.size());
}

std::string FieldExtractor::classifyKill(int attackerCount)
{
    if (attackerCount == 1) {
        return "solo";
    }
    if (attackerCount <= 5) {
        return "small_gang";
    }
    if (attackerCount <= 20) {
        return "fleet";
    }
    return "large_fleet";
}

std::string FieldExtractor::classifyShip(int64_t shipTypeId)
{
    // Coarse heuristic over type id ranges, not an authoritative lookup.
    // Ranges overlap; the first hit wins.
    if (shipTypeId == 0) {
        return "unknown";
    }
    if (shipTypeId >= 580 && shipTypeId <= 650) {
        return "frigate";
    }
    if (shipTypeId >= 16000 && shipTypeId <= 16100) {
        return "destroyer";
    }
    if (shipTypeId >= 620 && shipTypeId <= 650) {
        return "cruiser";
    }
    if (shipTypeId >= 416 && shipTypeId <= 456) {
        return "battlecruiser";
    }
    if (shipTypeId >= 640 && shipTypeId <= 680) {
        return "battleship";
    }
    if (shipTypeId >= 19000 && shipTypeId <= 24000) {
        return "capital";
    }
    return "other";
}

bool FieldExtractor::toNumber(const nlohmann::json &value, double &out)
{
    if (value.is_number()) {
        out = value.get<double>();
        return std::isfinite(out);
    }
    if (!value.is_string()) {
        return false;
    }

    const std::string &text = value.get_ref<const std::string &>();
    if (text.empty()) {
        return false;
    }
    const char *begin = text.c_str();
    char *end = nullptr;
    errno = 0;
    const double parsed = std::strtod(begin, &end);
    if (end != begin + text.size() || errno == ERANGE || !std::isfinite(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace killwatch
