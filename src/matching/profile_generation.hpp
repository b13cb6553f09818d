#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "matching/filter_compiler.hpp"
#include "matching/index_builder.hpp"

namespace killwatch {

struct CompiledProfile {
    std::string id;
    std::string name;
    FilterNode tree;
    Predicate predicate;
    IndexContribution index;
};

// One immutable set of compiled profiles together with the indexes built
// from them. Replaced as a whole on reload, never modified in place.
struct ProfileGeneration {
    uint64_t number = 0;
    std::size_t profilesLoaded = 0;
    std::vector<CompiledProfile> profiles;
    ProfileIndexes indexes;
    std::vector<std::string> failedProfileIds;
    std::chrono::system_clock::time_point builtAt;
};

// Compiles and indexes every active profile. A profile that fails to compile
// is logged, listed in failedProfileIds and left out; the rest still load.
std::shared_ptr<const ProfileGeneration> buildGeneration(
    const std::vector<SurveillanceProfile> &profiles, uint64_t number);

} // namespace killwatch
