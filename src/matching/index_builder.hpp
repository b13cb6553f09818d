#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common/models.hpp"

namespace killwatch {

struct IskThreshold {
    FilterOperator op = FilterOperator::Gt;
    double threshold = 0.0;
};

// The indexable constraints of one profile. Every entry comes from a direct
// rule child of a top-level AND group, so a matching killmail satisfies all of them.
struct IndexContribution {
    std::vector<std::string> tags;
    std::vector<int64_t> systemIds;
    std::vector<int64_t> shipTypeIds;
    std::vector<IskThreshold> iskThresholds;

    bool empty() const
    {
        return tags.empty() && systemIds.empty() && shipTypeIds.empty() && iskThresholds.empty();
    }

    // Bit per IndexKind the contribution registers in.
    unsigned kindMask() const;
};

constexpr unsigned indexKindBit(IndexKind kind)
{
    return 1u << static_cast<unsigned>(kind);
}

class IndexBuilder
{
public:
    static IndexContribution build(const FilterNode &tree);
};

// Inverted indexes of one generation, keyed by profile slot (position in the
// generation's profile list). Built once, then only probed.
class ProfileIndexes {
public:
    void add(std::size_t slot, const IndexContribution &contribution);

    // Sorts the threshold lists; call once after the last add().
    void finalize();

    // Probes append matching slots; a slot may appear more than once.
    void probeTags(const std::vector<std::string> &tags, std::vector<std::size_t> &out) const;
    void probeSystem(int64_t systemId, std::vector<std::size_t> &out) const;
    void probeShip(int64_t shipTypeId, std::vector<std::size_t> &out) const;
    void probeIsk(double totalValue, std::vector<std::size_t> &out) const;

    unsigned kindMask(std::size_t slot) const;
    const std::vector<std::size_t> &unindexed() const { return m_unindexed; }
    std::size_t indexedCount() const { return m_indexedCount; }
    IndexCardinalities cardinalities() const;

private:
    using ThresholdList = std::vector<std::pair<double, std::size_t>>;

    std::unordered_map<std::string, std::vector<std::size_t>> m_tags;
    std::unordered_map<int64_t, std::vector<std::size_t>> m_systems;
    std::unordered_map<int64_t, std::vector<std::size_t>> m_ships;

    ThresholdList m_gt;
    ThresholdList m_gte;
    ThresholdList m_lt;
    ThresholdList m_lte;

    std::vector<unsigned> m_kindMasks;
    std::vector<std::size_t> m_unindexed;
    std::size_t m_indexedCount = 0;
};

} // namespace killwatch
