#include "matching/candidate_selector.hpp"

#include <algorithm>
#include <numeric>

namespace killwatch {

namespace {

double frequencyOf(const ProfileGeneration &generation,
                   const FrequencyTable &frequencies,
                   std::size_t slot)
{
    auto it = frequencies.find(generation.profiles[slot].id);
    return it == frequencies.end() ? 0.0 : it->second;
}

void markHits(const std::vector<std::size_t> &hits, IndexKind kind,
              std::vector<unsigned> &hitMasks, unsigned &kindsHit)
{
    if (hits.empty()) {
        return;
    }
    kindsHit |= indexKindBit(kind);
    for (std::size_t slot : hits) {
        if (slot < hitMasks.size()) {
            hitMasks[slot] |= indexKindBit(kind);
        }
    }
}

} // namespace

std::string toSelectionPathString(SelectionPath path)
{
    switch (path) {
    case SelectionPath::FullScan:
        return "full_scan";
    case SelectionPath::SingleIndex:
        return "single_index";
    case SelectionPath::Intersection:
        return "intersection";
    case SelectionPath::UnionFallback:
        return "union_fallback";
    }
    return "full_scan";
}

std::vector<std::size_t> CandidateSelector::prioritize(std::vector<std::size_t> slots,
                                                       const ProfileGeneration &generation,
                                                       const FrequencyTable &frequencies,
                                                       std::size_t cap)
{
    if (cap > 0 && slots.size() > cap) {
        std::stable_sort(slots.begin(), slots.end(), [&](std::size_t a, std::size_t b) {
            const double fa = frequencyOf(generation, frequencies, a);
            const double fb = frequencyOf(generation, frequencies, b);
            if (fa != fb) {
                return fa > fb;
            }
            return a < b;
        });
        slots.resize(cap);
    }
    std::sort(slots.begin(), slots.end());
    return slots;
}

CandidateSelection CandidateSelector::select(const Killmail &killmail,
                                             const ProfileGeneration &generation,
                                             const FrequencyTable &frequencies,
                                             std::size_t cap)
{
    const ProfileIndexes &indexes = generation.indexes;
    const std::size_t profileCount = generation.profiles.size();

    std::vector<unsigned> hitMasks(profileCount, 0);
    unsigned kindsHit = 0;
    std::vector<std::size_t> hits;

    indexes.probeTags(killmail.moduleTags, hits);
    markHits(hits, IndexKind::Tag, hitMasks, kindsHit);

    hits.clear();
    indexes.probeSystem(killmail.solarSystemId, hits);
    markHits(hits, IndexKind::System, hitMasks, kindsHit);

    hits.clear();
    indexes.probeShip(killmail.victim.shipTypeId, hits);
    markHits(hits, IndexKind::Ship, hitMasks, kindsHit);

    hits.clear();
    indexes.probeIsk(killmail.totalValue, hits);
    markHits(hits, IndexKind::Isk, hitMasks, kindsHit);

    CandidateSelection selection;

    if (kindsHit == 0) {
        std::vector<std::size_t> all(profileCount);
        std::iota(all.begin(), all.end(), std::size_t{0});
        selection.slots = prioritize(std::move(all), generation, frequencies, cap);
        selection.path = SelectionPath::FullScan;
        return selection;
    }

    std::vector<std::size_t> unionSlots;
    std::vector<std::size_t> covered;
    for (std::size_t slot = 0; slot < profileCount; ++slot) {
        if (hitMasks[slot] == 0) {
            continue;
        }
        unionSlots.push_back(slot);
        // Every indexed constraint of a profile comes from one AND, so a
        // matching killmail hits every index kind the profile is registered in.
        if (hitMasks[slot] == indexes.kindMask(slot)) {
            covered.push_back(slot);
        }
    }

    const bool singleKind = (kindsHit & (kindsHit - 1)) == 0;
    if (singleKind) {
        selection.slots = std::move(unionSlots);
        selection.path = SelectionPath::SingleIndex;
        return selection;
    }

    if (!covered.empty()) {
        selection.slots = std::move(covered);
        selection.path = SelectionPath::Intersection;
        return selection;
    }

    selection.slots = prioritize(std::move(unionSlots), generation, frequencies, cap);
    selection.path = SelectionPath::UnionFallback;
    return selection;
}

} // namespace killwatch
