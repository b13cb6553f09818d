#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace killwatch {

// Read side of the profile store. Implementations throw std::runtime_error
// when the store cannot be reached.
class ProfileSource {
public:
    virtual ~ProfileSource() = default;

    virtual std::vector<SurveillanceProfile> listActiveProfiles() = 0;
};

// Write side used by MatchRecorder.
class MatchPersistence {
public:
    virtual ~MatchPersistence() = default;

    // Stores one profile's records and adds the number actually inserted to
    // its match count, all or nothing. Duplicates of an already stored
    // (profile, killmail) pair are skipped and not counted. Throws on failure.
    virtual std::size_t addProfileMatches(const std::string &profileId,
                                          const std::vector<MatchRecord> &records) = 0;
};

} // namespace killwatch
