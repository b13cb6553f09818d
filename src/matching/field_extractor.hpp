#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace killwatch {

// Reads one field of a killmail. A null result means the field is absent or unknown.
using FieldAccessor = std::function<nlohmann::json(const Killmail &)>;

// FieldExtractor maps rule field names to killmail values, including the
// derived kill and ship categories. It never throws for unknown fields.
class FieldExtractor
{
public:
    static nlohmann::json resolve(const Killmail &killmail, const std::string &field);

    // Resolves the field name once; the returned accessor is cheap to call per event.
    static FieldAccessor accessorFor(const std::string &field);

    static bool isKnownField(const std::string &field);

    static int attackerCount(const Killmail &killmail);
    static std::string classifyKill(int attackerCount);
    static std::string classifyShip(int64_t shipTypeId);

    // Numbers and fully numeric strings coerce; anything else does not.
    static bool toNumber(const nlohmann::json &value, double &out);
};

} // namespace killwatch
