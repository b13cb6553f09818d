#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "matching/profile_generation.hpp"

namespace killwatch {

enum class SelectionPath {
    FullScan,
    SingleIndex,
    Intersection,
    UnionFallback
};

std::string toSelectionPathString(SelectionPath path);

struct CandidateSelection {
    // Profile slots in ascending order, without duplicates.
    std::vector<std::size_t> slots;
    SelectionPath path = SelectionPath::FullScan;
};

// CandidateSelector narrows a generation down to the profiles that can match
// a killmail. Profiles registered in no index are only reached on the full scan.
class CandidateSelector
{
public:
    // cap bounds the full-scan and union results; 0 means no cap.
    static CandidateSelection select(const Killmail &killmail,
                                     const ProfileGeneration &generation,
                                     const FrequencyTable &frequencies,
                                     std::size_t cap);

    // Keeps the cap most frequently matching slots (ties by slot), sorted by slot.
    static std::vector<std::size_t> prioritize(std::vector<std::size_t> slots,
                                               const ProfileGeneration &generation,
                                               const FrequencyTable &frequencies,
                                               std::size_t cap);
};

} // namespace killwatch
