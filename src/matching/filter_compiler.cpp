#include "matching/filter_compiler.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "matching/field_extractor.hpp"

namespace killwatch {

namespace {

bool fail(std::string *error, const std::string &message)
{
    if (error) {
        *error = message;
    }
    return false;
}

bool isListOperator(FilterOperator op)
{
    switch (op) {
    case FilterOperator::In:
    case FilterOperator::NotIn:
    case FilterOperator::ContainsAny:
    case FilterOperator::ContainsAll:
    case FilterOperator::NotContains:
        return true;
    default:
        return false;
    }
}

bool isOrderingOperator(FilterOperator op)
{
    return op == FilterOperator::Gt || op == FilterOperator::Lt
        || op == FilterOperator::Gte || op == FilterOperator::Lte;
}

bool isGroupDefinition(const nlohmann::json &node)
{
    return node.contains("rules") || node.contains("condition");
}

bool parseNode(const nlohmann::json &node, FilterNode &out, const std::string &path,
               std::string *error);

bool parseGroup(const nlohmann::json &node, FilterNode &out, const std::string &path,
                std::string *error)
{
    auto condition = node.find("condition");
    if (condition == node.end() || !condition->is_string()) {
        return fail(error, path + ": group is missing a condition");
    }
    const std::string combinator = condition->get<std::string>();
    if (combinator != "and" && combinator != "or") {
        return fail(error, path + ": unknown condition '" + combinator + "'");
    }

    auto rules = node.find("rules");
    if (rules == node.end() || !rules->is_array()) {
        return fail(error, path + ": group rules must be a list");
    }

    out = FilterNode{};
    out.kind = FilterNode::Kind::Group;
    out.combinator = combinator == "and" ? GroupCombinator::And : GroupCombinator::Or;
    out.children.reserve(rules->size());
    for (std::size_t i = 0; i < rules->size(); ++i) {
        FilterNode child;
        if (!parseNode(rules->at(i), child, path + ".rules[" + std::to_string(i) + "]", error)) {
            return false;
        }
        out.children.push_back(std::move(child));
    }
    return true;
}

bool parseRule(const nlohmann::json &node, FilterNode &out, const std::string &path,
               std::string *error)
{
    auto field = node.find("field");
    if (field == node.end() || !field->is_string()) {
        return fail(error, path + ": rule is missing a field");
    }
    auto op = node.find("operator");
    if (op == node.end() || !op->is_string()) {
        return fail(error, path + ": rule is missing an operator");
    }
    auto value = node.find("value");
    if (value == node.end()) {
        return fail(error, path + ": rule is missing a value");
    }

    const auto parsedOp = parseOperatorString(op->get<std::string>());
    if (!parsedOp) {
        return fail(error, path + ": unknown operator '" + op->get<std::string>() + "'");
    }
    if (isListOperator(*parsedOp) && !value->is_array()) {
        return fail(error, path + ": operator '" + op->get<std::string>()
                               + "' requires a list value");
    }

    out = FilterNode{};
    out.kind = FilterNode::Kind::Rule;
    out.field = field->get<std::string>();
    out.op = *parsedOp;
    out.value = *value;
    return true;
}

bool parseNode(const nlohmann::json &node, FilterNode &out, const std::string &path,
               std::string *error)
{
    if (!node.is_object()) {
        return fail(error, path + ": filter node must be an object");
    }
    if (isGroupDefinition(node)) {
        return parseGroup(node, out, path, error);
    }
    return parseRule(node, out, path, error);
}

bool listContains(const nlohmann::json &list, const nlohmann::json &item)
{
    return std::find(list.begin(), list.end(), item) != list.end();
}

Predicate never()
{
    return [](const Killmail &) { return false; };
}

Predicate compileOrdering(FieldAccessor accessor, FilterOperator op, const nlohmann::json &value)
{
    double threshold = 0.0;
    if (!FieldExtractor::toNumber(value, threshold)) {
        return never();
    }
    return [accessor = std::move(accessor), op, threshold](const Killmail &killmail) {
        double actual = 0.0;
        if (!FieldExtractor::toNumber(accessor(killmail), actual)) {
            return false;
        }
        switch (op) {
        case FilterOperator::Gt:
            return actual > threshold;
        case FilterOperator::Lt:
            return actual < threshold;
        case FilterOperator::Gte:
            return actual >= threshold;
        case FilterOperator::Lte:
            return actual <= threshold;
        default:
            return false;
        }
    };
}

Predicate compileRule(const FilterNode &rule)
{
    FieldAccessor accessor = FieldExtractor::accessorFor(rule.field);
    const nlohmann::json expected = rule.value;

    switch (rule.op) {
    case FilterOperator::Eq:
        return [accessor, expected](const Killmail &killmail) {
            return accessor(killmail) == expected;
        };
    case FilterOperator::Ne:
        return [accessor, expected](const Killmail &killmail) {
            return accessor(killmail) != expected;
        };
    case FilterOperator::Gt:
    case FilterOperator::Lt:
    case FilterOperator::Gte:
    case FilterOperator::Lte:
        return compileOrdering(accessor, rule.op, expected);
    case FilterOperator::In:
        return [accessor, expected](const Killmail &killmail) {
            return listContains(expected, accessor(killmail));
        };
    case FilterOperator::NotIn:
        return [accessor, expected](const Killmail &killmail) {
            return !listContains(expected, accessor(killmail));
        };
    case FilterOperator::ContainsAny:
        return [accessor, expected](const Killmail &killmail) {
            const nlohmann::json actual = accessor(killmail);
            if (!actual.is_array()) {
                return false;
            }
            return std::any_of(expected.begin(), expected.end(), [&actual](const auto &item) {
                return listContains(actual, item);
            });
        };
    case FilterOperator::ContainsAll:
        return [accessor, expected](const Killmail &killmail) {
            const nlohmann::json actual = accessor(killmail);
            if (!actual.is_array()) {
                return false;
            }
            return std::all_of(expected.begin(), expected.end(), [&actual](const auto &item) {
                return listContains(actual, item);
            });
        };
    case FilterOperator::NotContains:
        return [accessor, expected](const Killmail &killmail) {
            const nlohmann::json actual = accessor(killmail);
            if (!actual.is_array()) {
                return false;
            }
            return std::none_of(expected.begin(), expected.end(), [&actual](const auto &item) {
                return listContains(actual, item);
            });
        };
    }
    return never();
}

bool validateNode(const FilterNode &node, const std::string &path, std::string *error)
{
    if (node.kind == FilterNode::Kind::Group) {
        if (node.children.empty()) {
            return fail(error, path + ": group must contain at least one rule");
        }
        for (std::size_t i = 0; i < node.children.size(); ++i) {
            if (!validateNode(node.children[i], path + ".rules[" + std::to_string(i) + "]",
                              error)) {
                return false;
            }
        }
        return true;
    }

    if (!FieldExtractor::isKnownField(node.field)) {
        return fail(error, path + ": unknown field '" + node.field + "'");
    }
    if (isListOperator(node.op) && node.value.empty()) {
        return fail(error, path + ": operator '" + toOperatorString(node.op)
                               + "' requires a non-empty list");
    }
    double threshold = 0.0;
    if (isOrderingOperator(node.op) && !FieldExtractor::toNumber(node.value, threshold)) {
        return fail(error, path + ": operator '" + toOperatorString(node.op)
                               + "' requires a numeric value");
    }
    return true;
}

} // namespace

bool FilterCompiler::parse(const nlohmann::json &definition, FilterNode &out, std::string *error)
{
    if (!definition.is_object() || !isGroupDefinition(definition)) {
        return fail(error, "filter tree must be a group with a condition and rules");
    }
    return parseGroup(definition, out, "filter", error);
}

Predicate FilterCompiler::compileNode(const FilterNode &node)
{
    if (node.kind == FilterNode::Kind::Rule) {
        return compileRule(node);
    }

    std::vector<Predicate> children;
    children.reserve(node.children.size());
    for (const auto &child : node.children) {
        children.push_back(compileNode(child));
    }

    if (node.combinator == GroupCombinator::And) {
        return [children = std::move(children)](const Killmail &killmail) {
            for (const auto &child : children) {
                if (!child(killmail)) {
                    return false;
                }
            }
            return true;
        };
    }
    return [children = std::move(children)](const Killmail &killmail) {
        for (const auto &child : children) {
            if (child(killmail)) {
                return true;
            }
        }
        return false;
    };
}

CompileResult FilterCompiler::compile(const nlohmann::json &definition)
{
    CompileResult result;
    if (!parse(definition, result.tree, &result.error)) {
        result.tree = FilterNode{};
        result.predicate = never();
        return result;
    }

    Predicate inner = compileNode(result.tree);
    result.predicate = [inner = std::move(inner)](const Killmail &killmail) {
        try {
            return inner(killmail);
        } catch (const std::exception &ex) {
            KWLOG_DEBUG(QStringLiteral("FilterCompiler"),
                        QStringLiteral("predicate"),
                        QStringLiteral("predicate_error"),
                        QStringLiteral("evaluation_failed"),
                        QStringLiteral("treat_as_no_match"),
                        ::killwatch::logging::defaultWho(),
                        ::killwatch::logging::currentCorrelationId(),
                        nlohmann::json{{"killmailId", killmail.killmailId},
                                       {"error", ex.what()}});
            return false;
        }
    };
    return result;
}

bool FilterCompiler::validate(const nlohmann::json &definition, std::string *error)
{
    FilterNode tree;
    if (!parse(definition, tree, error)) {
        return false;
    }
    return validateNode(tree, "filter", error);
}

} // namespace killwatch
