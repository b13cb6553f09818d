#include "matching/index_builder.hpp"

#include <algorithm>
#include <cmath>

#include "common/json_utils.hpp"
#include "matching/field_extractor.hpp"

namespace killwatch {

namespace {

// Integral JSON numbers only. 670.0 counts, "670" does not: the membership
// test compares JSON values and a string never equals a numeric id.
bool integralValue(const nlohmann::json &value, int64_t &out)
{
    if (value.is_number_integer()) {
        if (!detail::fitsInt64(value)) {
            return false;
        }
        out = value.get<int64_t>();
        return true;
    }
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (detail::inInt64Range(number) && std::floor(number) == number) {
            out = static_cast<int64_t>(number);
            return true;
        }
    }
    return false;
}

// All-or-nothing: a list with any non-integral entry (a null, say) could
// match killmails that no id probe would find, so the rule is left unindexed.
void appendIntegralList(const nlohmann::json &values, std::vector<int64_t> &out)
{
    std::vector<int64_t> ids;
    ids.reserve(values.size());
    for (const auto &value : values) {
        int64_t id = 0;
        if (!integralValue(value, id)) {
            return;
        }
        ids.push_back(id);
    }
    out.insert(out.end(), ids.begin(), ids.end());
}

bool isSystemField(const std::string &field)
{
    return field == "system_id" || field == "solar_system_id";
}

bool isTagField(const std::string &field)
{
    return field == "module_tags" || field == "noteworthy_modules";
}

using ThresholdIterator = std::vector<std::pair<double, std::size_t>>::const_iterator;

void collectRange(ThresholdIterator first, ThresholdIterator last, std::vector<std::size_t> &out)
{
    for (auto it = first; it != last; ++it) {
        out.push_back(it->second);
    }
}

} // namespace

unsigned IndexContribution::kindMask() const
{
    unsigned mask = 0;
    if (!tags.empty()) {
        mask |= indexKindBit(IndexKind::Tag);
    }
    if (!systemIds.empty()) {
        mask |= indexKindBit(IndexKind::System);
    }
    if (!shipTypeIds.empty()) {
        mask |= indexKindBit(IndexKind::Ship);
    }
    if (!iskThresholds.empty()) {
        mask |= indexKindBit(IndexKind::Isk);
    }
    return mask;
}

IndexContribution IndexBuilder::build(const FilterNode &tree)
{
    IndexContribution contribution;
    if (tree.kind != FilterNode::Kind::Group || tree.combinator != GroupCombinator::And) {
        return contribution;
    }

    for (const auto &child : tree.children) {
        if (child.kind != FilterNode::Kind::Rule) {
            continue;
        }

        if (isTagField(child.field)
            && (child.op == FilterOperator::ContainsAny || child.op == FilterOperator::ContainsAll)
            && child.value.is_array()) {
            for (const auto &tag : child.value) {
                if (tag.is_string()) {
                    contribution.tags.push_back(tag.get<std::string>());
                }
            }
        } else if (isSystemField(child.field) && child.op == FilterOperator::In
                   && child.value.is_array()) {
            appendIntegralList(child.value, contribution.systemIds);
        } else if (child.field == "victim_ship_type_id" && child.op == FilterOperator::In
                   && child.value.is_array()) {
            appendIntegralList(child.value, contribution.shipTypeIds);
        } else if (child.field == "total_value"
                   && (child.op == FilterOperator::Gt || child.op == FilterOperator::Gte
                       || child.op == FilterOperator::Lt || child.op == FilterOperator::Lte)) {
            double threshold = 0.0;
            if (FieldExtractor::toNumber(child.value, threshold)) {
                contribution.iskThresholds.push_back(IskThreshold{child.op, threshold});
            }
        }
    }
    return contribution;
}

void ProfileIndexes::add(std::size_t slot, const IndexContribution &contribution)
{
    if (slot >= m_kindMasks.size()) {
        m_kindMasks.resize(slot + 1, 0);
    }

    const unsigned mask = contribution.kindMask();
    m_kindMasks[slot] = mask;
    if (mask == 0) {
        m_unindexed.push_back(slot);
        return;
    }
    ++m_indexedCount;

    for (const auto &tag : contribution.tags) {
        m_tags[tag].push_back(slot);
    }
    for (int64_t systemId : contribution.systemIds) {
        m_systems[systemId].push_back(slot);
    }
    for (int64_t shipTypeId : contribution.shipTypeIds) {
        m_ships[shipTypeId].push_back(slot);
    }
    for (const auto &entry : contribution.iskThresholds) {
        switch (entry.op) {
        case FilterOperator::Gt:
            m_gt.emplace_back(entry.threshold, slot);
            break;
        case FilterOperator::Gte:
            m_gte.emplace_back(entry.threshold, slot);
            break;
        case FilterOperator::Lt:
            m_lt.emplace_back(entry.threshold, slot);
            break;
        case FilterOperator::Lte:
            m_lte.emplace_back(entry.threshold, slot);
            break;
        default:
            break;
        }
    }
}

void ProfileIndexes::finalize()
{
    std::sort(m_gt.begin(), m_gt.end());
    std::sort(m_gte.begin(), m_gte.end());
    std::sort(m_lt.begin(), m_lt.end());
    std::sort(m_lte.begin(), m_lte.end());
}

void ProfileIndexes::probeTags(const std::vector<std::string> &tags,
                               std::vector<std::size_t> &out) const
{
    for (const auto &tag : tags) {
        auto it = m_tags.find(tag);
        if (it != m_tags.end()) {
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
}

void ProfileIndexes::probeSystem(int64_t systemId, std::vector<std::size_t> &out) const
{
    auto it = m_systems.find(systemId);
    if (it != m_systems.end()) {
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
}

void ProfileIndexes::probeShip(int64_t shipTypeId, std::vector<std::size_t> &out) const
{
    auto it = m_ships.find(shipTypeId);
    if (it != m_ships.end()) {
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
}

void ProfileIndexes::probeIsk(double totalValue, std::vector<std::size_t> &out) const
{
    const auto byThreshold = [](const std::pair<double, std::size_t> &entry, double value) {
        return entry.first < value;
    };
    const auto byValue = [](double value, const std::pair<double, std::size_t> &entry) {
        return value < entry.first;
    };

    // gt: threshold < value
    collectRange(m_gt.begin(),
                 std::lower_bound(m_gt.begin(), m_gt.end(), totalValue, byThreshold), out);
    // gte: threshold <= value
    collectRange(m_gte.begin(),
                 std::upper_bound(m_gte.begin(), m_gte.end(), totalValue, byValue), out);
    // lt: threshold > value
    collectRange(std::upper_bound(m_lt.begin(), m_lt.end(), totalValue, byValue),
                 m_lt.end(), out);
    // lte: threshold >= value
    collectRange(std::lower_bound(m_lte.begin(), m_lte.end(), totalValue, byThreshold),
                 m_lte.end(), out);
}

unsigned ProfileIndexes::kindMask(std::size_t slot) const
{
    if (slot >= m_kindMasks.size()) {
        return 0;
    }
    return m_kindMasks[slot];
}

IndexCardinalities ProfileIndexes::cardinalities() const
{
    IndexCardinalities result;
    result.tags = m_tags.size();
    result.systems = m_systems.size();
    result.ships = m_ships.size();
    result.iskThresholds = m_gt.size() + m_gte.size() + m_lt.size() + m_lte.size();
    return result;
}

} // namespace killwatch
