#pragma once

namespace killwatch {

enum class FilterOperator {
    Eq,
    Ne,
    Gt,
    Lt,
    Gte,
    Lte,
    In,
    NotIn,
    ContainsAny,
    ContainsAll,
    NotContains
};

enum class GroupCombinator {
    And,
    Or
};

// Inverted index families probed by the candidate selector.
enum class IndexKind {
    Tag = 0,
    System = 1,
    Ship = 2,
    Isk = 3
};

} // namespace killwatch
