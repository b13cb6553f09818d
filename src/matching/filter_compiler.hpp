#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace killwatch {

using Predicate = std::function<bool(const Killmail &)>;

struct CompileResult {
    // Always callable. A failed compile yields a predicate that never matches.
    Predicate predicate;
    FilterNode tree;
    std::string error;

    bool ok() const { return error.empty(); }
};

// FilterCompiler turns a stored filter definition into a typed tree and a
// composed predicate. Field names are resolved once here, not per event.
class FilterCompiler
{
public:
    // Parses { "condition": "and"|"or", "rules": [...] } into a tree.
    static bool parse(const nlohmann::json &definition, FilterNode &out, std::string *error);

    static CompileResult compile(const nlohmann::json &definition);

    // Builds the predicate for an already parsed tree. The returned predicate
    // does not guard against exceptions; compile() wraps it.
    static Predicate compileNode(const FilterNode &node);

    // Stricter than parse(): fields must be known, list operators need a
    // non-empty list, ordering operators need a number, groups need rules.
    static bool validate(const nlohmann::json &definition, std::string *error);
};

} // namespace killwatch
